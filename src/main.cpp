#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "adapters/adapter_factory.h"
#include "analytics/comparison.h"
#include "analytics/smells.h"
#include "analytics/timeline.h"
#include "analytics/tool_stats.h"
#include "config/tracker_config.h"
#include "core/time_utils.h"
#include "session/session_lifecycle.h"
#include "session/session_tracker.h"
#include "storage/session_store.h"

namespace fs = std::filesystem;
using namespace mcpaudit;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

struct CollectOptions {
    std::string platform = "codex-cli";
    std::string file;
    std::string project;
    std::string output;
    std::string config;
    bool batch = false;
};

}

static void print_usage() {
    fprintf(stderr,
        "usage: mcpaudit collect [--platform codex-cli|gemini-cli] [--file PATH] [--project NAME]\n"
        "                        [--output DIR] [--config PATH] [--batch]\n"
        "       mcpaudit timeline <session.json>\n"
        "       mcpaudit tool <session.json> <server> <tool>\n"
        "       mcpaudit compare <baseline.json> <session.json>...\n"
        "       mcpaudit smells <session.json>\n");
}

static std::string format_count(uint64_t n) {
    std::string digits = std::to_string(n);
    std::string out;
    int since_sep = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (since_sep == 3) {
            out.insert(out.begin(), ',');
            since_sep = 0;
        }
        out.insert(out.begin(), *it);
        ++since_sep;
    }
    return out;
}

static std::string format_offset(double seconds) {
    auto total = static_cast<long>(seconds);
    char buf[32];
    snprintf(buf, sizeof(buf), "%02ld:%02ld:%02ld", total / 3600, (total / 60) % 60, total % 60);
    return buf;
}

static void print_summary(const SessionSnapshot& s) {
    printf("Platform:         %s\n", s.platform.c_str());
    printf("Project:          %s\n", s.project.c_str());
    printf("Model:            %s\n", s.model.empty() ? "unknown" : s.model.c_str());
    printf("Duration:         %s\n", format_offset(s.duration_seconds).c_str());
    printf("Messages:         %s\n", format_count(s.message_count).c_str());
    printf("Input tokens:     %s\n", format_count(s.token_usage.input_tokens).c_str());
    printf("Output tokens:    %s\n", format_count(s.token_usage.output_tokens).c_str());
    printf("Cache created:    %s\n", format_count(s.token_usage.cache_created_tokens).c_str());
    printf("Cache read:       %s\n", format_count(s.token_usage.cache_read_tokens).c_str());
    printf("Total tokens:     %s\n", format_count(s.token_usage.total_tokens).c_str());
    printf("Cache efficiency: %.1f%%\n", s.token_usage.cache_efficiency * 100.0);
    printf("MCP calls:        %s (%s unique tools)\n",
           format_count(s.mcp_summary.total_calls).c_str(),
           format_count(s.mcp_summary.unique_tools).c_str());
    for (const auto& [server_name, server] : s.server_sessions) {
        printf("  %s: %s calls, %s tokens\n", server_name.c_str(),
               format_count(server.total_calls).c_str(), format_count(server.total_tokens).c_str());
        for (const auto& [tool_name, stats] : server.tools) {
            printf("    %-32s %6s calls  avg %.0f\n", tool_name.c_str(),
                   format_count(stats.calls).c_str(), stats.avg_tokens);
        }
    }
}

static std::optional<StoredSession> load_or_report(const std::string& path) {
    auto stored = SessionStore::load(path);
    if (!stored) {
        fprintf(stderr, "[mcpaudit] Cannot read session file %s\n", path.c_str());
    }
    return stored;
}

static std::string default_project_name() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        return "session";
    }
    return detect_project_name(cwd);
}

static int run_collect(const CollectOptions& opts) {
    auto platform = parse_platform(opts.platform);
    if (!platform) {
        fprintf(stderr, "[mcpaudit] Unknown platform: %s\n", opts.platform.c_str());
        return kExitUsage;
    }

    TrackerConfig config = load_tracker_config(opts.config.empty() ? default_config_path() : opts.config);
    std::string project = !opts.project.empty() ? opts.project
                        : !config.project.empty() ? config.project
                        : default_project_name();
    std::string output = opts.output.empty() ? config.output_dir : expand_home(opts.output);

    auto adapter = create_adapter(*platform);
    const std::string label = *platform == Platform::CodexCli ? "Codex CLI" : "Gemini CLI";
    SessionTracker tracker(std::move(adapter), project, config.call_history_limit);
    SessionStore store(output);
    SessionLifecycle lifecycle(tracker, store);

    printf("[%s] Initializing tracker for: %s\n", label.c_str(), project.c_str());

    if (!opts.file.empty()) {
        tracker.add_source(opts.file);
    } else {
        fs::path root = *platform == Platform::CodexCli ? config.codex_dir : config.gemini_dir;
        if (!tracker.add_latest_source(root)) {
            fprintf(stderr, "[%s] No session files found under %s\n", label.c_str(), root.string().c_str());
            return kExitFatal;
        }
    }

    ShutdownResult result;
    try {
        SignalWatcher watcher([&lifecycle](int sig) { lifecycle.request_stop(sig); });
        if (opts.batch) {
            PollReport report = tracker.run_batch();
            printf("[%s] Processed %zu records, %zu events\n", label.c_str(), report.records, report.events_applied);
            Timestamp end = tracker.last_event_time().value_or(std::chrono::system_clock::now());
            result = lifecycle.shutdown(end);
        } else {
            printf("[%s] Tracking started. Press Ctrl+C to stop.\n", label.c_str());
            fflush(stdout);
            result = lifecycle.run(config.poll_interval);
            printf("\n[%s] Stopping tracker...\n", label.c_str());
        }
    } catch (const StoreError& e) {
        fprintf(stderr, "[mcpaudit] Failed to save session: %s\n", e.what());
        return kExitFatal;
    }

    if (tracker.diagnostic_count() > 0) {
        fprintf(stderr, "[%s] Skipped %zu malformed records\n", label.c_str(), tracker.diagnostic_count());
    }

    if (result.outcome == ShutdownOutcome::Saved && result.snapshot) {
        print_summary(*result.snapshot);
        printf("Saved: %s\n", result.saved_path->string().c_str());
    }

    int sig = lifecycle.stop_signal();
    return sig != 0 ? 128 + sig : kExitOk;
}

static int run_timeline(const std::string& path) {
    auto stored = load_or_report(path);
    if (!stored) return kExitFatal;

    auto timeline = compute_timeline(stored->snapshot);
    if (!timeline) {
        printf("Session has no duration; no timeline available.\n");
        return kExitOk;
    }

    printf("Duration %s, %zu buckets of %.0fs%s\n", format_offset(timeline->duration_seconds).c_str(),
           timeline->buckets.size(), timeline->bucket_seconds,
           timeline->degraded ? " (no call timestamps, tokens spread evenly)" : "");
    for (const auto& bucket : timeline->buckets) {
        printf("%s  %10s  mcp %10s  builtin %10s  calls %4llu%s\n",
               format_offset(bucket.start_seconds).c_str(),
               format_count(bucket.total_tokens).c_str(),
               format_count(bucket.mcp_tokens).c_str(),
               format_count(bucket.builtin_tokens).c_str(),
               static_cast<unsigned long long>(bucket.call_count),
               bucket.is_spike ? "  SPIKE" : "");
    }
    printf("Spikes: %zu  mean %.1f  std-dev %.1f\n", timeline->spikes.size(), timeline->mean_tokens, timeline->std_dev);
    return kExitOk;
}

static int run_tool(const std::string& path, const std::string& server, const std::string& tool) {
    auto stored = load_or_report(path);
    if (!stored) return kExitFatal;

    TrackerConfig config = load_tracker_config(default_config_path());
    auto detail = compute_tool_detail(stored->snapshot, server, tool, config.histogram_bins);
    if (!detail) {
        fprintf(stderr, "[mcpaudit] No tool %s on server %s\n", tool.c_str(), server.c_str());
        return kExitFatal;
    }

    printf("%s.%s\n", detail->server.c_str(), detail->tool.c_str());
    printf("Calls: %s  Total: %s  Avg: %.1f\n", format_count(detail->calls).c_str(),
           format_count(detail->total_tokens).c_str(), detail->avg_tokens);
    printf("Min: %s  Max: %s  P50: %s  P95: %s\n", format_count(detail->min_tokens).c_str(),
           format_count(detail->max_tokens).c_str(), format_count(detail->p50_tokens).c_str(),
           format_count(detail->p95_tokens).c_str());
    printf("Histogram: [%s]\n", detail->histogram.c_str());
    for (const auto& smell : detail->smells) {
        printf("  %s: %s\n", smell.pattern.c_str(), smell.description.c_str());
    }
    return kExitOk;
}

static int run_compare(const std::vector<std::string>& paths) {
    std::vector<SessionSnapshot> selected;
    for (const auto& path : paths) {
        auto stored = load_or_report(path);
        if (!stored) return kExitFatal;
        selected.push_back(std::move(stored->snapshot));
    }

    auto comparison = compare_sessions(selected);
    if (!comparison) {
        fprintf(stderr, "[mcpaudit] Select at least two sessions to compare\n");
        return kExitUsage;
    }

    printf("Baseline: %s (%s tokens, MCP %.1f%%)\n", paths.front().c_str(),
           format_count(comparison->baseline.token_usage.total_tokens).c_str(),
           mcp_share_pct(comparison->baseline));
    for (size_t i = 0; i < comparison->comparisons.size(); ++i) {
        printf("  %s: %+lld tokens, MCP share %+.1f pts\n", paths[i + 1].c_str(),
               static_cast<long long>(comparison->token_deltas[i]), comparison->mcp_share_deltas[i]);
    }
    if (!comparison->tool_changes.empty()) {
        printf("Top tool changes:\n");
        for (const auto& change : comparison->tool_changes) {
            printf("  %-40s %+lld\n", change.key.c_str(), static_cast<long long>(change.token_delta));
        }
    }
    if (!comparison->smell_matrix.empty()) {
        printf("Smells:\n");
        for (const auto& [pattern, row] : comparison->smell_matrix) {
            std::string cells;
            for (bool present : row) {
                cells += present ? " x" : " .";
            }
            printf("  %-16s%s\n", pattern.c_str(), cells.c_str());
        }
    }
    return kExitOk;
}

static int run_smells(const std::string& path) {
    auto stored = load_or_report(path);
    if (!stored) return kExitFatal;

    std::vector<Smell> smells = !stored->detected_smells.empty() ? stored->detected_smells
                                                                : detect_smells(stored->snapshot);
    if (smells.empty()) {
        printf("No smells detected.\n");
    }
    for (const auto& smell : smells) {
        if (smell.server.empty()) {
            printf("%-16s %s\n", smell.pattern.c_str(), smell.description.c_str());
        } else {
            printf("%-16s %s.%s: %s\n", smell.pattern.c_str(), smell.server.c_str(),
                   smell.tool.c_str(), smell.description.c_str());
        }
    }
    return kExitOk;
}

static bool parse_collect_args(int argc, char** argv, CollectOptions& opts) {
    for (int i = 2; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                fprintf(stderr, "[mcpaudit] %s needs a value\n", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (std::strcmp(arg, "--platform") == 0) {
            if (!next(opts.platform)) return false;
        } else if (std::strcmp(arg, "--file") == 0) {
            if (!next(opts.file)) return false;
        } else if (std::strcmp(arg, "--project") == 0) {
            if (!next(opts.project)) return false;
        } else if (std::strcmp(arg, "--output") == 0) {
            if (!next(opts.output)) return false;
        } else if (std::strcmp(arg, "--config") == 0) {
            if (!next(opts.config)) return false;
        } else if (std::strcmp(arg, "--batch") == 0) {
            opts.batch = true;
        } else {
            fprintf(stderr, "[mcpaudit] Unknown option: %s\n", arg);
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return kExitUsage;
    }

    const std::string command = argv[1];

    if (command == "collect") {
        CollectOptions opts;
        if (!parse_collect_args(argc, argv, opts)) {
            print_usage();
            return kExitUsage;
        }
        return run_collect(opts);
    }
    if (command == "timeline" && argc == 3) {
        return run_timeline(argv[2]);
    }
    if (command == "tool" && argc == 5) {
        return run_tool(argv[2], argv[3], argv[4]);
    }
    if (command == "compare" && argc >= 4) {
        return run_compare(std::vector<std::string>(argv + 2, argv + argc));
    }
    if (command == "smells" && argc == 3) {
        return run_smells(argv[2]);
    }

    print_usage();
    return kExitUsage;
}
