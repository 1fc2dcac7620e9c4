#pragma once

#include "metrics/session_aggregate.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpaudit {

// A detected inefficiency pattern. server/tool are empty for session-wide
// patterns.
struct Smell {
    std::string pattern;
    std::string server;
    std::string tool;
    std::string description;
};

struct SmellThresholds {
    uint64_t chatty_calls = 20;            // more calls than this
    uint64_t high_variance_min_calls = 5;
    double high_variance_cv = 1.0;         // coefficient of variation above this
    uint64_t low_cache_min_input = 10000;  // input-side tokens needed to judge
    double low_cache_efficiency = 0.2;
};

inline constexpr const char* kSmellChatty = "CHATTY";
inline constexpr const char* kSmellRedundantCalls = "REDUNDANT_CALLS";
inline constexpr const char* kSmellHighVariance = "HIGH_VARIANCE";
inline constexpr const char* kSmellLowCacheHit = "LOW_CACHE_HIT";

std::vector<Smell> detect_smells(const SessionSnapshot& snapshot,
                                 const SmellThresholds& thresholds = SmellThresholds{});

void to_json(nlohmann::json& j, const Smell& s);
void from_json(const nlohmann::json& j, Smell& s);

}
