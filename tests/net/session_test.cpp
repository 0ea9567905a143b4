#include "linewire/net/session.hpp"

#include <gtest/gtest.h>

#include <cerrno>

#include "net/scripted_stream.hpp"

namespace linewire::net::test {

namespace {

struct Mailbox {
    std::vector<std::string> stored;
};

}  // namespace

class ReadBodyTest : public ::testing::Test {
   protected:
    Mailbox mailbox_;
};

TEST_F(ReadBodyTest, CollectsRawLinesUntilTerminator) {
    ScriptedStream stream("line1\r\nline2\r\n.\r\n");
    Session<Mailbox> session(stream, mailbox_);

    auto body = session.read_body(354, "go ahead", ".");
    ASSERT_TRUE(body.ok());
    ASSERT_EQ(body.lines.size(), 2u);
    EXPECT_EQ(body.lines[0], "line1\r\n");
    EXPECT_EQ(body.lines[1], "line2\r\n");
    EXPECT_EQ(stream.output(), "354 go ahead\r\n");
    EXPECT_FALSE(session.failure().has_value());
}

TEST_F(ReadBodyTest, AnnouncesBeforeReading) {
    ScriptedStream stream(".\r\n");
    Session<Mailbox> session(stream, mailbox_);

    auto body = session.read_body(354, "What should I tell them?\nterminate with \".\"", ".");
    ASSERT_TRUE(body.ok());
    EXPECT_TRUE(body.lines.empty());
    EXPECT_EQ(stream.written_before_first_read(),
              "354-What should I tell them?\r\n354 terminate with \".\"\r\n");
}

TEST_F(ReadBodyTest, TerminatorMatchesWithOrWithoutCarriageReturn) {
    ScriptedStream stream("a\n.\n");
    Session<Mailbox> session(stream, mailbox_);

    auto body = session.read_body(354, "go", ".");
    ASSERT_TRUE(body.ok());
    ASSERT_EQ(body.lines.size(), 1u);
    EXPECT_EQ(body.lines[0], "a\n");
}

TEST_F(ReadBodyTest, TerminatorMustMatchExactly) {
    ScriptedStream stream(" .\r\n..\r\n.x\r\nEND\r\n");
    Session<Mailbox> session(stream, mailbox_);

    auto body = session.read_body(354, "go", "END");
    ASSERT_TRUE(body.ok());
    ASSERT_EQ(body.lines.size(), 3u);
    EXPECT_EQ(body.lines[0], " .\r\n");
    EXPECT_EQ(body.lines[1], "..\r\n");
    EXPECT_EQ(body.lines[2], ".x\r\n");
}

TEST_F(ReadBodyTest, LeavesFollowingInputForTheNextRead) {
    ScriptedStream stream("body\r\n.\r\nquit\r\n");
    Session<Mailbox> session(stream, mailbox_);

    auto first = session.read_body(354, "go", ".");
    ASSERT_TRUE(first.ok());
    ASSERT_EQ(first.lines.size(), 1u);

    auto second = session.read_body(354, "again", "quit");
    ASSERT_TRUE(second.ok());
    EXPECT_TRUE(second.lines.empty());
}

TEST_F(ReadBodyTest, EmptyTerminatorStopsAtBlankLine) {
    ScriptedStream stream("Header: x\r\n\r\nrest\r\n");
    Session<Mailbox> session(stream, mailbox_);

    auto body = session.read_body(354, "headers", "");
    ASSERT_TRUE(body.ok());
    ASSERT_EQ(body.lines.size(), 1u);
    EXPECT_EQ(body.lines[0], "Header: x\r\n");
}

TEST_F(ReadBodyTest, ReadFailureKeepsCollectedLinesAndIsRecorded) {
    IoError reset{IoErrorKind::Read, ECONNRESET, "Connection reset by peer"};
    ScriptedStream stream("one\r\ntwo\r\nthr", reset);
    Session<Mailbox> session(stream, mailbox_);

    auto body = session.read_body(354, "go", ".");
    ASSERT_FALSE(body.ok());
    EXPECT_EQ(*body.error, reset);
    ASSERT_EQ(body.lines.size(), 2u);
    EXPECT_EQ(body.lines[1], "two\r\n");
    ASSERT_TRUE(session.failure().has_value());
    EXPECT_EQ(*session.failure(), reset);
}

TEST_F(ReadBodyTest, AnnounceFailureReadsNothing) {
    IoError broken{IoErrorKind::Write, EPIPE, "Broken pipe"};
    ScriptedStream stream("never read\r\n.\r\n");
    stream.fail_write(1, broken);
    Session<Mailbox> session(stream, mailbox_);

    auto body = session.read_body(354, "go", ".");
    ASSERT_FALSE(body.ok());
    EXPECT_EQ(*body.error, broken);
    EXPECT_TRUE(body.lines.empty());
    EXPECT_EQ(stream.reads(), 0u);
    EXPECT_EQ(*session.failure(), broken);
}

TEST_F(ReadBodyTest, FirstFailureIsKept) {
    ScriptedStream stream("");
    Session<Mailbox> session(stream, mailbox_);

    auto first = session.read_body(354, "go", ".");
    ASSERT_FALSE(first.ok());
    EXPECT_EQ(first.error->kind, IoErrorKind::Eof);

    stream.fail_write(1, IoError{IoErrorKind::Write, EPIPE, "Broken pipe"});
    auto second = session.read_body(354, "go", ".");
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.error->kind, IoErrorKind::Write);

    EXPECT_EQ(session.failure()->kind, IoErrorKind::Eof);
}

TEST_F(ReadBodyTest, ContextIsTheApplicationObject) {
    ScriptedStream stream;
    Session<Mailbox> session(stream, mailbox_);
    session.context().stored.push_back("x");
    EXPECT_EQ(mailbox_.stored.size(), 1u);
}

TEST(SessionTest, DestructorClosesStream) {
    ScriptedStream stream;
    int context = 0;
    {
        Session<int> session(stream, context);
        EXPECT_EQ(stream.closes(), 0u);
    }
    EXPECT_EQ(stream.closes(), 1u);
}

}  // namespace linewire::net::test
