#include "adapters/json_fields.h"

namespace mcpaudit {

uint64_t get_count(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) {
        return 0;
    }
    const auto& v = obj[key];
    if (v.is_number_unsigned()) {
        return v.get<uint64_t>();
    }
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        return n > 0 ? static_cast<uint64_t>(n) : 0;
    }
    return 0;
}

std::string get_string(const nlohmann::json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return {};
}

}
