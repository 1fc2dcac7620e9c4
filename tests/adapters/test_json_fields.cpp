#include <gtest/gtest.h>
#include "adapters/json_fields.h"

using namespace mcpaudit;

TEST(JsonFieldsTest, CountsAreNonNegativeIntegers) {
    auto obj = nlohmann::json::parse(R"({"a": 12, "b": -3, "c": "7", "d": 1.5, "e": null})");
    EXPECT_EQ(get_count(obj, "a"), 12u);
    EXPECT_EQ(get_count(obj, "b"), 0u);
    EXPECT_EQ(get_count(obj, "c"), 0u);
    EXPECT_EQ(get_count(obj, "d"), 0u);
    EXPECT_EQ(get_count(obj, "e"), 0u);
    EXPECT_EQ(get_count(obj, "missing"), 0u);
    EXPECT_EQ(get_count(nlohmann::json::array({1, 2}), "a"), 0u);
}

TEST(JsonFieldsTest, LargeUnsignedCountKept) {
    nlohmann::json obj = {{"n", uint64_t{1} << 40}};
    EXPECT_EQ(get_count(obj, "n"), uint64_t{1} << 40);
}

TEST(JsonFieldsTest, StringsOnlyFromStringValues) {
    auto obj = nlohmann::json::parse(R"({"type": "token_count", "n": 3})");
    EXPECT_EQ(get_string(obj, "type"), "token_count");
    EXPECT_EQ(get_string(obj, "n"), "");
    EXPECT_EQ(get_string(obj, "missing"), "");
    EXPECT_EQ(get_string(nlohmann::json(nullptr), "type"), "");
}
