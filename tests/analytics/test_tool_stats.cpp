#include <gtest/gtest.h>
#include "analytics/tool_stats.h"

using namespace mcpaudit;

TEST(PercentileTest, NearestRank) {
    std::vector<uint64_t> values = {10, 9, 8, 7, 6, 5, 4, 3, 2, 1};
    EXPECT_EQ(percentile(values, 50), 5u);
    EXPECT_EQ(percentile(values, 95), 10u);
    EXPECT_EQ(percentile(values, 90), 9u);
    EXPECT_EQ(percentile(values, 100), 10u);
    EXPECT_EQ(percentile(values, 0), 1u);
}

TEST(PercentileTest, EdgeCases) {
    EXPECT_EQ(percentile({}, 50), 0u);
    EXPECT_EQ(percentile({42}, 50), 42u);
    EXPECT_EQ(percentile({42}, 95), 42u);
    // rank ceil(0.5 * 2) = 1 picks the lower value
    EXPECT_EQ(percentile({100, 200}, 50), 100u);
}

TEST(HistogramTest, EmptyInput) {
    EXPECT_EQ(render_histogram({}), "");
}

TEST(HistogramTest, FullestBinIsFullBlock) {
    std::string expected = "█" + std::string(8, ' ') + "▃";
    EXPECT_EQ(render_histogram({1, 1, 1, 10}), expected);
}

TEST(HistogramTest, IdenticalValuesFillFirstBin) {
    std::string expected = "█" + std::string(4, ' ');
    EXPECT_EQ(render_histogram({7, 7, 7}, 5), expected);
}

TEST(HistogramTest, EvenSpread) {
    EXPECT_EQ(render_histogram({0, 1, 2, 3}, 4), "████");
}

class ToolDetailTest : public ::testing::Test {
protected:
    void SetUp() override {
        SessionAggregate agg("codex-cli", "demo");
        for (uint64_t tokens : {100, 200, 300, 400, 1000}) {
            ToolCallEvent e = make_tool_call_event("mcp__zen__chat", nlohmann::json::object());
            e.tokens.output_tokens = tokens;
            agg.apply(e);
        }
        ToolCallEvent other = make_tool_call_event("mcp__fs__read", nlohmann::json::object());
        agg.apply(other);
        snapshot_ = agg.snapshot();
    }

    SessionSnapshot snapshot_;
};

TEST_F(ToolDetailTest, ComputesStatistics) {
    auto detail = compute_tool_detail(snapshot_, "zen", "chat");
    ASSERT_TRUE(detail.has_value());
    EXPECT_EQ(detail->calls, 5u);
    EXPECT_EQ(detail->total_tokens, 2000u);
    EXPECT_DOUBLE_EQ(detail->avg_tokens, 400.0);
    EXPECT_EQ(detail->min_tokens, 100u);
    EXPECT_EQ(detail->max_tokens, 1000u);
    EXPECT_EQ(detail->p50_tokens, 300u);
    EXPECT_EQ(detail->p95_tokens, 1000u);
    EXPECT_EQ(detail->call_history.size(), 5u);
    EXPECT_FALSE(detail->histogram.empty());
}

TEST_F(ToolDetailTest, UnknownToolReturnsNothing) {
    EXPECT_FALSE(compute_tool_detail(snapshot_, "zen", "missing").has_value());
    EXPECT_FALSE(compute_tool_detail(snapshot_, "nope", "chat").has_value());
}

TEST_F(ToolDetailTest, ZeroTokenCalls) {
    auto detail = compute_tool_detail(snapshot_, "fs", "read");
    ASSERT_TRUE(detail.has_value());
    EXPECT_EQ(detail->calls, 1u);
    EXPECT_EQ(detail->p50_tokens, 0u);
    EXPECT_EQ(detail->max_tokens, 0u);
}
