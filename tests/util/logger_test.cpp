#include "linewire/util/logger.hpp"

#include <gtest/gtest.h>

namespace linewire::util::test {

TEST(LoggerTest, DefaultLevelIsInfo) {
    EXPECT_EQ(Logger::instance().level(), LogLevel::Info);
}

TEST(LoggerTest, SetLevel) {
    Logger::instance().set_level(LogLevel::Debug);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);

    Logger::instance().set_level(LogLevel::Error);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Error);

    // reset to default
    Logger::instance().set_level(LogLevel::Info);
}

TEST(LoggerTest, LogMethods) {
    Logger::instance().set_level(LogLevel::Debug);

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    LOG_DEBUG("macro debug");
    LOG_INFO("macro info");
    LOG_WARN("macro warn");
    LOG_ERROR("macro error");
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(out.find("[DEBUG] macro debug"), std::string::npos);
    EXPECT_NE(out.find("[INFO ] macro info"), std::string::npos);
    EXPECT_NE(err.find("[WARN ] macro warn"), std::string::npos);
    EXPECT_NE(err.find("[ERROR] macro error"), std::string::npos);
    EXPECT_EQ(out.find("macro warn"), std::string::npos);

    Logger::instance().set_level(LogLevel::Info);
}

TEST(LoggerTest, LevelFiltering) {
    Logger::instance().set_level(LogLevel::Warn);

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    Logger::instance().debug("filtered debug");
    Logger::instance().info("filtered info");
    Logger::instance().warn("visible warn");
    Logger::instance().error("visible error");
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty());
    EXPECT_NE(err.find("visible warn"), std::string::npos);
    EXPECT_NE(err.find("visible error"), std::string::npos);

    Logger::instance().set_level(LogLevel::Info);
}

TEST(LoggerTest, NoneSilencesEverything) {
    Logger::instance().set_level(LogLevel::None);

    testing::internal::CaptureStderr();
    Logger::instance().error("silenced");
    Logger::instance().log(LogLevel::None, "also silenced");
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());

    Logger::instance().set_level(LogLevel::Info);
}

}  // namespace linewire::util::test
