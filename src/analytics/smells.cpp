#include "analytics/smells.h"
#include <cmath>
#include <cstdio>
#include <map>

namespace mcpaudit {

namespace {

std::string format(const char* fmt, double a, double b = 0.0) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), fmt, a, b);
    return buf;
}

Smell make_smell(const char* pattern, const std::string& server, const std::string& tool, std::string description) {
    Smell s;
    s.pattern = pattern;
    s.server = server;
    s.tool = tool;
    s.description = std::move(description);
    return s;
}

size_t duplicate_calls(const ToolStats& stats) {
    std::map<std::string, size_t> seen;
    size_t duplicates = 0;
    for (const auto& record : stats.call_history) {
        if (!record.content_signature) continue;
        if (seen[*record.content_signature]++ > 0) {
            ++duplicates;
        }
    }
    return duplicates;
}

// Coefficient of variation of the recorded call tokens, 0 when the mean is 0.
double coefficient_of_variation(const ToolStats& stats) {
    const size_t n = stats.call_history.size();
    if (n == 0) return 0.0;

    double sum = 0.0;
    for (const auto& record : stats.call_history) {
        sum += static_cast<double>(record.total_tokens);
    }
    double mean = sum / static_cast<double>(n);
    if (mean <= 0.0) return 0.0;

    double variance = 0.0;
    for (const auto& record : stats.call_history) {
        double d = static_cast<double>(record.total_tokens) - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(n);
    return std::sqrt(variance) / mean;
}

}

std::vector<Smell> detect_smells(const SessionSnapshot& snapshot, const SmellThresholds& thresholds) {
    std::vector<Smell> smells;

    for (const auto& [server_name, server] : snapshot.server_sessions) {
        for (const auto& [tool_name, stats] : server.tools) {
            if (stats.calls > thresholds.chatty_calls) {
                smells.push_back(make_smell(kSmellChatty, server_name, tool_name,
                    format("Called %.0f times (threshold %.0f)",
                           static_cast<double>(stats.calls),
                           static_cast<double>(thresholds.chatty_calls))));
            }

            size_t duplicates = duplicate_calls(stats);
            if (duplicates > 0) {
                smells.push_back(make_smell(kSmellRedundantCalls, server_name, tool_name,
                    format("%.0f calls repeated identical arguments", static_cast<double>(duplicates))));
            }

            if (stats.call_history.size() >= thresholds.high_variance_min_calls) {
                double cv = coefficient_of_variation(stats);
                if (cv > thresholds.high_variance_cv) {
                    smells.push_back(make_smell(kSmellHighVariance, server_name, tool_name,
                        format("Token usage varies widely between calls (CV %.2f)", cv)));
                }
            }
        }
    }

    const auto& tokens = snapshot.token_usage;
    uint64_t input_side = tokens.input_tokens + tokens.cache_created_tokens + tokens.cache_read_tokens;
    if (input_side >= thresholds.low_cache_min_input && tokens.cache_efficiency < thresholds.low_cache_efficiency) {
        smells.push_back(make_smell(kSmellLowCacheHit, "", "",
            format("Cache efficiency %.1f%% (threshold %.1f%%)",
                   tokens.cache_efficiency * 100.0, thresholds.low_cache_efficiency * 100.0)));
    }

    return smells;
}

void to_json(nlohmann::json& j, const Smell& s) {
    j = nlohmann::json{
        {"pattern", s.pattern},
        {"server", s.server},
        {"tool", s.tool},
        {"description", s.description},
    };
}

void from_json(const nlohmann::json& j, Smell& s) {
    auto get = [&](const char* key) -> std::string {
        if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
        return {};
    };
    s.pattern = get("pattern");
    s.server = get("server");
    s.tool = get("tool");
    s.description = get("description");
}

}
