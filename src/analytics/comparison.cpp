#include "analytics/comparison.h"
#include "analytics/smells.h"
#include "analytics/timeline.h"
#include <algorithm>
#include <cstdlib>
#include <set>

namespace mcpaudit {

namespace {

std::map<std::string, int64_t> tool_tokens(const SessionSnapshot& snapshot) {
    std::map<std::string, int64_t> tokens;
    for (const auto& [server_name, server] : snapshot.server_sessions) {
        if (server_name == kBuiltinServer) continue;
        for (const auto& [tool_name, stats] : server.tools) {
            tokens[server_name + "." + tool_name] = static_cast<int64_t>(stats.total_tokens);
        }
    }
    return tokens;
}

std::set<std::string> smell_patterns(const SessionSnapshot& snapshot) {
    std::set<std::string> patterns;
    for (const auto& smell : detect_smells(snapshot)) {
        if (!smell.pattern.empty()) {
            patterns.insert(smell.pattern);
        }
    }
    return patterns;
}

}

double mcp_share_pct(const SessionSnapshot& snapshot) {
    const uint64_t total = snapshot.token_usage.total_tokens;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(snapshot.mcp_summary.total_tokens) / static_cast<double>(total) * 100.0;
}

std::optional<Comparison> compare_sessions(const std::vector<SessionSnapshot>& selected) {
    if (selected.size() < 2) {
        return std::nullopt;
    }

    Comparison result;
    result.baseline = selected.front();
    result.comparisons.assign(selected.begin() + 1, selected.end());

    const auto baseline_total = static_cast<int64_t>(result.baseline.token_usage.total_tokens);
    const double baseline_share = mcp_share_pct(result.baseline);
    const auto baseline_tools = tool_tokens(result.baseline);

    std::map<std::string, int64_t> change_sum;
    for (const auto& comparison : result.comparisons) {
        result.token_deltas.push_back(static_cast<int64_t>(comparison.token_usage.total_tokens) - baseline_total);
        result.mcp_share_deltas.push_back(mcp_share_pct(comparison) - baseline_share);

        for (const auto& [key, tokens] : tool_tokens(comparison)) {
            auto base = baseline_tools.find(key);
            int64_t base_tokens = base != baseline_tools.end() ? base->second : 0;
            change_sum[key] += tokens - base_tokens;
        }
    }

    for (const auto& [key, delta] : change_sum) {
        result.tool_changes.push_back({key, delta});
    }
    std::stable_sort(result.tool_changes.begin(), result.tool_changes.end(),
        [](const ToolChange& a, const ToolChange& b) {
            return std::llabs(a.token_delta) > std::llabs(b.token_delta);
        });
    if (result.tool_changes.size() > kTopToolChanges) {
        result.tool_changes.resize(kTopToolChanges);
    }

    std::vector<std::set<std::string>> per_session;
    per_session.push_back(smell_patterns(result.baseline));
    for (const auto& comparison : result.comparisons) {
        per_session.push_back(smell_patterns(comparison));
    }

    std::set<std::string> all_patterns;
    for (const auto& patterns : per_session) {
        all_patterns.insert(patterns.begin(), patterns.end());
    }
    for (const auto& pattern : all_patterns) {
        std::vector<bool> row;
        for (const auto& patterns : per_session) {
            row.push_back(patterns.count(pattern) > 0);
        }
        result.smell_matrix[pattern] = std::move(row);
    }

    return result;
}

}
