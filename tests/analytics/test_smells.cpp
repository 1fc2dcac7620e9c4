#include <gtest/gtest.h>
#include "analytics/smells.h"
#include <algorithm>

using namespace mcpaudit;

namespace {

void add_calls(SessionSnapshot& s, const std::string& server, const std::string& tool,
               const std::vector<uint64_t>& tokens, const std::string& signature = "") {
    auto& stats = s.server_sessions[server].tools[tool];
    for (uint64_t t : tokens) {
        CallRecord record;
        record.total_tokens = t;
        if (!signature.empty()) {
            record.content_signature = signature;
        }
        stats.call_history.push_back(record);
        stats.calls += 1;
        stats.total_tokens += t;
    }
}

bool has_pattern(const std::vector<Smell>& smells, const std::string& pattern) {
    return std::any_of(smells.begin(), smells.end(), [&](const Smell& s) { return s.pattern == pattern; });
}

}

TEST(SmellsTest, CleanSessionHasNone) {
    SessionSnapshot s;
    add_calls(s, "zen", "chat", {100, 120, 110});
    EXPECT_TRUE(detect_smells(s).empty());
}

TEST(SmellsTest, ChattyAboveThreshold) {
    SessionSnapshot quiet;
    add_calls(quiet, "zen", "chat", std::vector<uint64_t>(20, 10));
    EXPECT_FALSE(has_pattern(detect_smells(quiet), kSmellChatty));

    SessionSnapshot chatty;
    add_calls(chatty, "zen", "chat", std::vector<uint64_t>(21, 10));
    auto smells = detect_smells(chatty);
    ASSERT_TRUE(has_pattern(smells, kSmellChatty));
    EXPECT_EQ(smells[0].server, "zen");
    EXPECT_EQ(smells[0].tool, "chat");
}

TEST(SmellsTest, RedundantCallsBySignature) {
    SessionSnapshot s;
    add_calls(s, "zen", "chat", {10, 10}, "abcdef0123456789");
    add_calls(s, "fs", "read", {10});
    auto smells = detect_smells(s);
    ASSERT_EQ(smells.size(), 1u);
    EXPECT_EQ(smells[0].pattern, kSmellRedundantCalls);
    EXPECT_EQ(smells[0].server, "zen");
}

TEST(SmellsTest, HighVarianceNeedsFiveCalls) {
    SessionSnapshot few;
    add_calls(few, "zen", "chat", {1, 1, 1, 100});
    EXPECT_FALSE(has_pattern(detect_smells(few), kSmellHighVariance));

    SessionSnapshot many;
    add_calls(many, "zen", "chat", {1, 1, 1, 1, 100});
    EXPECT_TRUE(has_pattern(detect_smells(many), kSmellHighVariance));
}

TEST(SmellsTest, LowCacheHit) {
    SessionSnapshot s;
    s.token_usage.input_tokens = 10000;
    s.token_usage.recompute();
    auto smells = detect_smells(s);
    ASSERT_TRUE(has_pattern(smells, kSmellLowCacheHit));
    EXPECT_TRUE(smells.back().server.empty());

    SessionSnapshot small;
    small.token_usage.input_tokens = 5000;
    small.token_usage.recompute();
    EXPECT_FALSE(has_pattern(detect_smells(small), kSmellLowCacheHit));

    SessionSnapshot cached;
    cached.token_usage.input_tokens = 8000;
    cached.token_usage.cache_read_tokens = 2000;
    cached.token_usage.recompute();
    EXPECT_FALSE(has_pattern(detect_smells(cached), kSmellLowCacheHit));
}

TEST(SmellsTest, CustomThresholds) {
    SessionSnapshot s;
    add_calls(s, "zen", "chat", {1, 1, 1});
    SmellThresholds thresholds;
    thresholds.chatty_calls = 2;
    EXPECT_TRUE(has_pattern(detect_smells(s, thresholds), kSmellChatty));
}

TEST(SmellsTest, JsonFields) {
    Smell smell;
    smell.pattern = kSmellChatty;
    smell.server = "zen";
    smell.tool = "chat";
    smell.description = "Called 30 times";

    nlohmann::json j = smell;
    EXPECT_EQ(j["pattern"], "CHATTY");
    Smell back = j.get<Smell>();
    EXPECT_EQ(back.tool, "chat");
    EXPECT_EQ(back.description, "Called 30 times");
}
