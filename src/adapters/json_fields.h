#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpaudit {

// Non-negative integer field, 0 when missing, negative or not a number.
uint64_t get_count(const nlohmann::json& obj, const char* key);

// String field, empty when missing or not a string.
std::string get_string(const nlohmann::json& obj, const char* key);

}
