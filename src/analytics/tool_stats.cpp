#include "analytics/tool_stats.h"
#include <algorithm>
#include <cmath>

namespace mcpaudit {

namespace {

const char* const kBlocks[] = {
    "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█",
};

}

uint64_t percentile(std::vector<uint64_t> values, double p) {
    if (values.empty()) {
        return 0;
    }
    std::sort(values.begin(), values.end());

    const size_t n = values.size();
    auto rank = static_cast<size_t>(std::ceil(p / 100.0 * static_cast<double>(n)));
    size_t index = std::max<size_t>(rank, 1) - 1;
    return values[std::min(index, n - 1)];
}

std::string render_histogram(const std::vector<uint64_t>& values, size_t bins) {
    if (values.empty() || bins == 0) {
        return {};
    }

    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    const double lo = static_cast<double>(*min_it);
    const double range = static_cast<double>(*max_it) - lo;

    std::vector<size_t> counts(bins, 0);
    for (uint64_t v : values) {
        size_t bin = 0;
        if (range > 0.0) {
            bin = static_cast<size_t>((static_cast<double>(v) - lo) / range * static_cast<double>(bins));
            bin = std::min(bin, bins - 1);
        }
        counts[bin] += 1;
    }

    const size_t peak = *std::max_element(counts.begin(), counts.end());
    std::string out;
    for (size_t count : counts) {
        if (count == 0) {
            out += ' ';
            continue;
        }
        auto level = static_cast<size_t>(std::ceil(static_cast<double>(count) * 8.0 / static_cast<double>(peak)));
        level = std::clamp<size_t>(level, 1, 8);
        out += kBlocks[level - 1];
    }
    return out;
}

std::optional<ToolDetail> compute_tool_detail(const SessionSnapshot& snapshot,
                                              const std::string& server,
                                              const std::string& tool,
                                              size_t histogram_bins) {
    const ToolStats* stats = snapshot.find_tool(server, tool);
    if (!stats) {
        return std::nullopt;
    }

    ToolDetail detail;
    detail.server = server;
    detail.tool = tool;
    detail.calls = stats->calls;
    detail.total_tokens = stats->total_tokens;
    detail.avg_tokens = stats->avg_tokens;
    detail.call_history.assign(stats->call_history.begin(), stats->call_history.end());

    std::vector<uint64_t> values;
    values.reserve(stats->call_history.size());
    for (const auto& record : stats->call_history) {
        values.push_back(record.total_tokens);
    }

    if (!values.empty()) {
        auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
        detail.min_tokens = *min_it;
        detail.max_tokens = *max_it;
    }
    detail.p50_tokens = percentile(values, 50);
    detail.p95_tokens = percentile(values, 95);
    detail.histogram = render_histogram(values, histogram_bins);

    for (auto& smell : detect_smells(snapshot)) {
        if (smell.server == server && smell.tool == tool) {
            detail.smells.push_back(std::move(smell));
        }
    }
    return detail;
}

}
