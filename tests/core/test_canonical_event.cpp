#include <gtest/gtest.h>
#include "core/canonical_event.h"

using namespace mcpaudit;

TEST(McpToolNameTest, SplitsServerAndTool) {
    auto name = split_mcp_tool_name("mcp__zen__chat");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name->server, "zen");
    EXPECT_EQ(name->tool, "chat");
}

TEST(McpToolNameTest, ToolKeepsRemainingSeparators) {
    auto name = split_mcp_tool_name("mcp__brave-search__web__search");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name->server, "brave-search");
    EXPECT_EQ(name->tool, "web__search");
}

TEST(McpToolNameTest, RejectsNonMcpNames) {
    EXPECT_FALSE(split_mcp_tool_name("shell").has_value());
    EXPECT_FALSE(split_mcp_tool_name("read_file").has_value());
    EXPECT_FALSE(split_mcp_tool_name("mcp_zen_chat").has_value());
    EXPECT_FALSE(split_mcp_tool_name("mcp__").has_value());
    EXPECT_FALSE(split_mcp_tool_name("mcp____chat").has_value());
    EXPECT_FALSE(split_mcp_tool_name("mcp__zen").has_value());
    EXPECT_FALSE(split_mcp_tool_name("mcp__zen__").has_value());
    EXPECT_FALSE(split_mcp_tool_name(kSessionSentinel).has_value());
}

TEST(CanonicalEventTest, SentinelNameForTokenDeltas) {
    CanonicalEvent delta = SessionTokenDelta{};
    EXPECT_EQ(event_tool_name(delta), "__session__");

    CanonicalEvent call = make_tool_call_event("mcp__zen__chat", nlohmann::json::object());
    EXPECT_EQ(event_tool_name(call), "mcp__zen__chat");
}

TEST(CanonicalEventTest, TokenCountsTotal) {
    TokenCounts t;
    t.input_tokens = 1;
    t.output_tokens = 2;
    t.cache_created_tokens = 3;
    t.cache_read_tokens = 4;
    EXPECT_EQ(t.total(), 10u);
}

TEST(ContentSignatureTest, IndependentOfKeyOrder) {
    auto a = nlohmann::json::parse(R"({"prompt": "hi", "model": "x", "n": 1})");
    auto b = nlohmann::json::parse(R"({"n": 1, "model": "x", "prompt": "hi"})");
    EXPECT_EQ(compute_content_signature(a), compute_content_signature(b));
}

TEST(ContentSignatureTest, DiffersForDifferentArguments) {
    auto a = nlohmann::json::parse(R"({"prompt": "hi"})");
    auto b = nlohmann::json::parse(R"({"prompt": "hello"})");
    EXPECT_NE(compute_content_signature(a), compute_content_signature(b));
}

TEST(ContentSignatureTest, SixteenHexDigits) {
    std::string sig = compute_content_signature(nlohmann::json::parse(R"({"a": [1, 2, 3]})"));
    ASSERT_EQ(sig.size(), 16u);
    for (char c : sig) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << sig;
    }
}

TEST(MakeToolCallEventTest, DerivesServerAndSignature) {
    auto event = make_tool_call_event("mcp__zen__chat", nlohmann::json{{"prompt", "hi"}});
    EXPECT_EQ(event.server, "zen");
    ASSERT_TRUE(event.content_signature.has_value());
    EXPECT_EQ(*event.content_signature, compute_content_signature(nlohmann::json{{"prompt", "hi"}}));
}

TEST(MakeToolCallEventTest, NoSignatureWithoutArguments) {
    auto event = make_tool_call_event("mcp__zen__listmodels", nlohmann::json::object());
    EXPECT_FALSE(event.content_signature.has_value());
    EXPECT_EQ(event.tokens.total(), 0u);
}
