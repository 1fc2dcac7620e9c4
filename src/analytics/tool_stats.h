#pragma once

#include "analytics/smells.h"
#include "metrics/session_aggregate.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcpaudit {

inline constexpr size_t kDefaultHistogramBins = 10;

struct ToolDetail {
    std::string server;
    std::string tool;
    uint64_t calls = 0;
    uint64_t total_tokens = 0;
    double avg_tokens = 0.0;
    uint64_t min_tokens = 0;
    uint64_t max_tokens = 0;
    uint64_t p50_tokens = 0;
    uint64_t p95_tokens = 0;
    std::string histogram;
    std::vector<CallRecord> call_history;
    std::vector<Smell> smells;
};

// Nearest-rank percentile: rank = ceil(p/100 * n) on the sorted values.
// Returns 0 for an empty input.
uint64_t percentile(std::vector<uint64_t> values, double p);

// One glyph per bin; bins span [min, max] of the values. Empty bins render
// as a space, the fullest bin as a full block.
std::string render_histogram(const std::vector<uint64_t>& values, size_t bins = kDefaultHistogramBins);

std::optional<ToolDetail> compute_tool_detail(const SessionSnapshot& snapshot,
                                              const std::string& server,
                                              const std::string& tool,
                                              size_t histogram_bins = kDefaultHistogramBins);

}
