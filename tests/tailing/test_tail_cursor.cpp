#include <gtest/gtest.h>
#include "tailing/tail_cursor.h"
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace mcpaudit;

class TailCursorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "mcpaudit_tail_cursor_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    void write_file(const fs::path& path, const std::string& content) {
        std::ofstream file(path, std::ios::trunc);
        file << content;
    }

    void append_file(const fs::path& path, const std::string& content) {
        std::ofstream file(path, std::ios::app);
        file << content;
    }

    // Filesystem timestamps can be coarse; force a visible change.
    void bump_mtime(const fs::path& path) {
        fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(1));
    }

    fs::path test_dir_;
};

TEST_F(TailCursorTest, ReadsAllLinesOnFirstPoll) {
    fs::path path = test_dir_ / "session.jsonl";
    write_file(path, "{\"a\": 1}\n{\"a\": 2}\n");

    LineCursor cursor;
    auto result = cursor.poll(path);
    EXPECT_EQ(result.status, PollStatus::Updated);
    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[1]["a"], 2);
    EXPECT_EQ(cursor.consumed_lines(), 2u);
}

TEST_F(TailCursorTest, UnchangedMtimeIsNoOp) {
    fs::path path = test_dir_ / "session.jsonl";
    write_file(path, "{\"a\": 1}\n");

    LineCursor cursor;
    cursor.poll(path);
    auto again = cursor.poll(path);
    EXPECT_EQ(again.status, PollStatus::Unchanged);
    EXPECT_TRUE(again.records.empty());
}

TEST_F(TailCursorTest, OnlyNewLinesAfterAppend) {
    fs::path path = test_dir_ / "session.jsonl";
    write_file(path, "{\"a\": 1}\n");

    LineCursor cursor;
    cursor.poll(path);

    append_file(path, "{\"a\": 2}\n{\"a\": 3}\n");
    bump_mtime(path);

    auto result = cursor.poll(path);
    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[0]["a"], 2);
    EXPECT_EQ(result.records[1]["a"], 3);
    EXPECT_EQ(cursor.consumed_lines(), 3u);
}

TEST_F(TailCursorTest, TouchWithoutNewLinesYieldsNothing) {
    fs::path path = test_dir_ / "session.jsonl";
    write_file(path, "{\"a\": 1}\n");

    LineCursor cursor;
    cursor.poll(path);
    bump_mtime(path);

    auto result = cursor.poll(path);
    EXPECT_EQ(result.status, PollStatus::Updated);
    EXPECT_TRUE(result.records.empty());
    EXPECT_EQ(cursor.consumed_lines(), 1u);
}

TEST_F(TailCursorTest, MalformedLineRecordedAndSkipped) {
    fs::path path = test_dir_ / "session.jsonl";
    write_file(path, "{\"a\": 1}\nnot json\n{\"a\": 3}\n");

    LineCursor cursor;
    auto result = cursor.poll(path);
    ASSERT_EQ(result.records.size(), 2u);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].kind, DiagnosticKind::ParseError);
    EXPECT_EQ(result.diagnostics[0].line, 2u);
    EXPECT_EQ(cursor.consumed_lines(), 3u);
}

TEST_F(TailCursorTest, PartialLastLineRetried) {
    fs::path path = test_dir_ / "session.jsonl";
    write_file(path, "{\"a\": 1}\n{\"a\": ");

    LineCursor cursor;
    auto first = cursor.poll(path);
    ASSERT_EQ(first.records.size(), 1u);
    EXPECT_TRUE(first.diagnostics.empty());
    EXPECT_EQ(cursor.consumed_lines(), 1u);

    append_file(path, "2}\n");
    bump_mtime(path);

    auto second = cursor.poll(path);
    ASSERT_EQ(second.records.size(), 1u);
    EXPECT_EQ(second.records[0]["a"], 2);
    EXPECT_EQ(cursor.consumed_lines(), 2u);
}

TEST_F(TailCursorTest, CompleteUnterminatedLineConsumed) {
    fs::path path = test_dir_ / "session.jsonl";
    write_file(path, "{\"a\": 1}");

    LineCursor cursor;
    auto result = cursor.poll(path);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(cursor.consumed_lines(), 1u);
}

TEST_F(TailCursorTest, MissingFileIsUnavailable) {
    LineCursor cursor;
    auto result = cursor.poll(test_dir_ / "missing.jsonl");
    EXPECT_EQ(result.status, PollStatus::Unavailable);
    EXPECT_EQ(cursor.consumed_lines(), 0u);

    MessageCursor messages;
    EXPECT_EQ(messages.poll(test_dir_ / "missing.json").status, PollStatus::Unavailable);
}

TEST_F(TailCursorTest, MessageCursorForwardsEachIdOnce) {
    fs::path path = test_dir_ / "session.json";
    write_file(path, R"({"sessionId": "s1", "messages": [
        {"id": "m1", "type": "user"},
        {"id": "m2", "type": "gemini"}
    ]})");

    MessageCursor cursor;
    auto first = cursor.poll(path);
    EXPECT_EQ(first.status, PollStatus::Updated);
    ASSERT_EQ(first.messages.size(), 2u);
    EXPECT_EQ(first.header["sessionId"], "s1");
    EXPECT_FALSE(first.header.contains("messages"));

    write_file(path, R"({"sessionId": "s1", "messages": [
        {"id": "m1", "type": "user"},
        {"id": "m2", "type": "gemini"},
        {"id": "m3", "type": "gemini"}
    ]})");
    bump_mtime(path);

    auto second = cursor.poll(path);
    ASSERT_EQ(second.messages.size(), 1u);
    EXPECT_EQ(second.messages[0]["id"], "m3");
    EXPECT_EQ(cursor.seen_count(), 3u);
}

TEST_F(TailCursorTest, MessageCursorRereadWithoutNewMessages) {
    fs::path path = test_dir_ / "session.json";
    write_file(path, R"({"messages": [{"id": "m1", "type": "gemini"}]})");

    MessageCursor cursor;
    cursor.poll(path);
    bump_mtime(path);

    auto result = cursor.poll(path);
    EXPECT_EQ(result.status, PollStatus::Updated);
    EXPECT_TRUE(result.messages.empty());
}

TEST_F(TailCursorTest, MessagesWithoutIdUseIndex) {
    EXPECT_EQ(MessageCursor::message_id(nlohmann::json::parse(R"({"type": "gemini"})"), 4), "@4");
    EXPECT_EQ(MessageCursor::message_id(nlohmann::json::parse(R"({"id": 17})"), 0), "17");
    EXPECT_EQ(MessageCursor::message_id(nlohmann::json::parse(R"({"id": "abc"})"), 0), "abc");
}

TEST_F(TailCursorTest, MessageCursorRetriesAfterBrokenDocument) {
    fs::path path = test_dir_ / "session.json";
    write_file(path, R"({"messages": [{"id": "m1")");

    MessageCursor cursor;
    auto broken = cursor.poll(path);
    ASSERT_EQ(broken.diagnostics.size(), 1u);
    EXPECT_EQ(broken.diagnostics[0].kind, DiagnosticKind::ParseError);
    EXPECT_TRUE(broken.messages.empty());

    write_file(path, R"({"messages": [{"id": "m1", "type": "gemini"}]})");
    auto fixed = cursor.poll(path);
    EXPECT_EQ(fixed.messages.size(), 1u);
}
