#pragma once

#include "metrics/session_aggregate.h"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpaudit {

inline constexpr size_t kTopToolChanges = 5;

struct ToolChange {
    std::string key;  // "server.tool"
    int64_t token_delta = 0;
};

struct Comparison {
    SessionSnapshot baseline;
    std::vector<SessionSnapshot> comparisons;

    // One entry per comparison session, in selection order.
    std::vector<int64_t> token_deltas;
    std::vector<double> mcp_share_deltas;

    // Summed over all comparison sessions, largest absolute change first.
    std::vector<ToolChange> tool_changes;

    // pattern -> presence in [baseline, comparisons...]
    std::map<std::string, std::vector<bool>> smell_matrix;
};

// MCP tokens as a percentage of all tokens, 0 when the session has none.
double mcp_share_pct(const SessionSnapshot& snapshot);

// The first selected session is the baseline. Needs at least two sessions.
std::optional<Comparison> compare_sessions(const std::vector<SessionSnapshot>& selected);

}
