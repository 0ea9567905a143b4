#include "linewire/net/command.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace linewire::net::test {

namespace {

struct Dummy {};

Handler<Dummy> replying(int code, const std::string& message) {
    return [code, message](const std::vector<std::string>&, Session<Dummy>&) {
        return Reply{code, message};
    };
}

}  // namespace

TEST(TokenizeTest, SplitsOnWhitespace) {
    auto tokens = tokenize("HOW is  \tbob\r\n");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "HOW");
    EXPECT_EQ(tokens[1], "is");
    EXPECT_EQ(tokens[2], "bob");
}

TEST(TokenizeTest, BlankLinesHaveNoTokens) {
    EXPECT_TRUE(tokenize("").empty());
    EXPECT_TRUE(tokenize("\r\n").empty());
    EXPECT_TRUE(tokenize("  \t \n").empty());
}

TEST(TokenizeTest, LeadingWhitespaceIsIgnored) {
    auto tokens = tokenize("   quit\n");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], "quit");
}

TEST(ToLowerTest, AsciiOnly) {
    EXPECT_EQ(to_lower("HeLo"), "helo");
    EXPECT_EQ(to_lower("MAIL-FROM:"), "mail-from:");
}

// bytes outside ASCII are compared verbatim, so "HÉLO" and "hélo" are different commands
TEST(ToLowerTest, NonAsciiBytesAreLeftAlone) {
    EXPECT_EQ(to_lower("H\xC3\x89LO"), "h\xC3\x89lo");
    EXPECT_EQ(to_lower("\xC3\xA9t\xC3\xA9"), "\xC3\xA9t\xC3\xA9");

    ProtocolTable<Dummy> table{{"h\xC3\xA9lo", replying(250, "hi")}};
    EXPECT_EQ(table.find("H\xC3\xA9LO"), &table.entries()[0]);
    EXPECT_EQ(table.find("H\xC3\x89LO"), nullptr);
}

TEST(TokenizeTest, OnlyAsciiWhitespaceSeparates) {
    // U+00A0 NO-BREAK SPACE stays inside the token
    auto tokens = tokenize("tell\xC2\xA0" "bob\r\n");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], "tell\xC2\xA0" "bob");
}

TEST(ProtocolTableTest, FindIsCaseInsensitive) {
    ProtocolTable<Dummy> table{
        {"helo", replying(250, "hi")},
        {"quit", replying(221, "bye")},
    };

    ASSERT_NE(table.find("HELO"), nullptr);
    EXPECT_EQ(table.find("HELO")->token, "helo");
    EXPECT_EQ(table.find("Quit"), &table.entries()[1]);
    EXPECT_EQ(table.find("help"), nullptr);
}

TEST(ProtocolTableTest, RegisteredTokensAreLowercased) {
    ProtocolTable<Dummy> table{{"EHLO", replying(250, "hi")}};
    EXPECT_EQ(table.entries()[0].token, "ehlo");
    EXPECT_NE(table.find("ehlo"), nullptr);
}

TEST(ProtocolTableTest, GreetingIsNotMatchable) {
    ProtocolTable<Dummy> table{
        {"", replying(220, "hello")},
        {"quit", replying(221, "bye")},
    };

    ASSERT_NE(table.greeting(), nullptr);
    EXPECT_EQ(table.greeting(), &table.entries()[0]);
    EXPECT_EQ(table.find(""), nullptr);
}

TEST(ProtocolTableTest, NoGreeting) {
    ProtocolTable<Dummy> table{{"quit", replying(221, "bye")}};
    EXPECT_EQ(table.greeting(), nullptr);

    ProtocolTable<Dummy> empty(std::vector<CommandEntry<Dummy>>{});
    EXPECT_EQ(empty.greeting(), nullptr);
    EXPECT_EQ(empty.size(), 0u);
}

TEST(ProtocolTableTest, FirstDuplicateWins) {
    ProtocolTable<Dummy> table{
        {"noop", replying(250, "first")},
        {"help", replying(214, "help")},
        {"NOOP", replying(250, "second")},
    };

    EXPECT_EQ(table.size(), 3u);
    EXPECT_EQ(table.find("noop"), &table.entries()[0]);
}

TEST(ProtocolTableTest, RejectsEmptyTokenAfterFirstEntry) {
    std::vector<CommandEntry<Dummy>> entries{
        {"helo", replying(250, "hi")},
        {"", replying(220, "late greeting")},
    };
    EXPECT_THROW(ProtocolTable<Dummy>{entries}, std::invalid_argument);
}

TEST(ProtocolTableTest, RejectsTokenWithWhitespace) {
    std::vector<CommandEntry<Dummy>> entries{{"how are", replying(200, "fine")}};
    EXPECT_THROW(ProtocolTable<Dummy>{entries}, std::invalid_argument);
}

TEST(ProtocolTableTest, RejectsMissingHandler) {
    std::vector<CommandEntry<Dummy>> entries{{"helo", nullptr}};
    EXPECT_THROW(ProtocolTable<Dummy>{entries}, std::invalid_argument);
}

}  // namespace linewire::net::test
