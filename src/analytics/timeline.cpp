#include "analytics/timeline.h"
#include "core/time_utils.h"
#include <algorithm>
#include <cmath>

namespace mcpaudit {

double bucket_width_for(double duration_seconds) {
    if (duration_seconds < 600.0) return 30.0;
    if (duration_seconds < 3600.0) return 60.0;
    if (duration_seconds < 14400.0) return 300.0;
    return 900.0;
}

size_t bucket_count_for(double duration_seconds, double width) {
    if (duration_seconds <= 0.0 || width <= 0.0) {
        return 1;
    }
    return static_cast<size_t>(std::ceil(duration_seconds / width)) + 1;
}

size_t bucket_index_for(double offset_seconds, double width, size_t count) {
    if (count == 0) return 0;
    if (offset_seconds <= 0.0 || width <= 0.0) return 0;
    auto index = static_cast<size_t>(offset_seconds / width);
    return std::min(index, count - 1);
}

std::optional<Timeline> compute_timeline(const SessionSnapshot& snapshot) {
    const double duration = snapshot.duration_seconds;
    if (!(duration > 0.0)) {
        return std::nullopt;
    }

    Timeline timeline;
    timeline.duration_seconds = duration;
    timeline.bucket_seconds = bucket_width_for(duration);

    const size_t count = bucket_count_for(duration, timeline.bucket_seconds);
    timeline.buckets.resize(count);
    for (size_t i = 0; i < count; ++i) {
        timeline.buckets[i].index = i;
        timeline.buckets[i].start_seconds = static_cast<double>(i) * timeline.bucket_seconds;
        timeline.buckets[i].duration_seconds = timeline.bucket_seconds;
    }

    bool any_timestamp = false;
    for (const auto& [server_name, server] : snapshot.server_sessions) {
        const bool builtin = server_name == kBuiltinServer;
        for (const auto& [tool_name, stats] : server.tools) {
            for (const auto& record : stats.call_history) {
                if (!record.timestamp) continue;
                any_timestamp = true;

                double offset = seconds_between(snapshot.start_time, *record.timestamp);
                auto& bucket = timeline.buckets[bucket_index_for(offset, timeline.bucket_seconds, count)];
                bucket.total_tokens += record.total_tokens;
                bucket.call_count += 1;
                if (builtin) {
                    bucket.builtin_tokens += record.total_tokens;
                } else {
                    bucket.mcp_tokens += record.total_tokens;
                }
            }
        }
    }

    if (!any_timestamp) {
        timeline.degraded = true;
        uint64_t per_bucket = snapshot.token_usage.total_tokens / count;
        for (auto& bucket : timeline.buckets) {
            bucket.total_tokens = per_bucket;
            bucket.builtin_tokens = per_bucket;
        }
    }

    std::vector<double> active;
    for (const auto& bucket : timeline.buckets) {
        if (bucket.total_tokens > 0) {
            active.push_back(static_cast<double>(bucket.total_tokens));
        }
    }
    if (!active.empty()) {
        double sum = 0.0;
        for (double v : active) sum += v;
        timeline.mean_tokens = sum / static_cast<double>(active.size());

        double variance = 0.0;
        for (double v : active) {
            double d = v - timeline.mean_tokens;
            variance += d * d;
        }
        variance /= static_cast<double>(active.size());
        timeline.std_dev = variance > 0.0 ? std::sqrt(variance) : 0.0;
    }

    for (auto& bucket : timeline.buckets) {
        if (timeline.std_dev > 0.0) {
            bucket.z_score = (static_cast<double>(bucket.total_tokens) - timeline.mean_tokens) / timeline.std_dev;
            if (bucket.z_score > kSpikeZScore) {
                bucket.is_spike = true;
                timeline.spikes.push_back(bucket.index);
            }
        }
        timeline.max_tokens_per_bucket = std::max(timeline.max_tokens_per_bucket, bucket.total_tokens);
        timeline.total_tokens += bucket.total_tokens;
        timeline.total_mcp_tokens += bucket.mcp_tokens;
        timeline.total_builtin_tokens += bucket.builtin_tokens;
    }

    return timeline;
}

}
