#pragma once

#include "metrics/session_aggregate.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace mcpaudit {

inline constexpr double kSpikeZScore = 2.0;

// Server name whose calls count as built-in rather than MCP tokens.
inline constexpr const char* kBuiltinServer = "builtin";

struct TimelineBucket {
    size_t index = 0;
    double start_seconds = 0.0;
    double duration_seconds = 0.0;
    uint64_t total_tokens = 0;
    uint64_t mcp_tokens = 0;
    uint64_t builtin_tokens = 0;
    uint64_t call_count = 0;
    bool is_spike = false;
    double z_score = 0.0;
};

struct Timeline {
    double duration_seconds = 0.0;
    double bucket_seconds = 0.0;
    std::vector<TimelineBucket> buckets;
    std::vector<size_t> spikes;  // bucket indices
    bool degraded = false;       // no call carried a timestamp

    double mean_tokens = 0.0;
    double std_dev = 0.0;
    uint64_t max_tokens_per_bucket = 0;
    uint64_t total_tokens = 0;
    uint64_t total_mcp_tokens = 0;
    uint64_t total_builtin_tokens = 0;
};

// 30 s under 10 minutes, 60 s under an hour, 5 minutes under 4 hours,
// 15 minutes beyond.
double bucket_width_for(double duration_seconds);

// ceil(duration / width) + 1
size_t bucket_count_for(double duration_seconds, double width);

// Offsets before the start land in bucket 0, past the end in the last one.
size_t bucket_index_for(double offset_seconds, double width, size_t count);

// Returns nullopt when the session has no positive duration.
std::optional<Timeline> compute_timeline(const SessionSnapshot& snapshot);

}
