#include "config/tracker_config.h"
#include <toml++/toml.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace mcpaudit {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) : std::string();
}

std::string read_path(const toml::table& tbl, const char* section, const char* key, const std::string& fallback) {
    if (auto val = tbl[section][key].value<std::string>()) {
        if (!val->empty()) {
            return expand_home(*val);
        }
    }
    return fallback;
}

}

TrackerConfig TrackerConfig::defaults() {
    TrackerConfig config;
    config.output_dir = expand_home("~/.mcp-audit/sessions");
    config.codex_dir = expand_home("~/.codex");
    config.gemini_dir = expand_home("~/.gemini");
    return config;
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;
    }
    std::string home = get_home_dir();
    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

std::string detect_project_name(const std::filesystem::path& dir) {
    namespace fs = std::filesystem;
    static const std::array<const char*, 6> kWorktreeNames = {
        "main", "master", "develop", "dev", "staging", "production",
    };

    fs::path cwd = dir.filename().empty() ? dir.parent_path() : dir;
    std::string name = cwd.filename().string();
    if (name.empty()) {
        return "session";
    }

    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    bool branch_dir = std::find(kWorktreeNames.begin(), kWorktreeNames.end(), lower) != kWorktreeNames.end();
    fs::path parent = cwd.parent_path();
    if (!branch_dir || parent.filename().empty()) {
        return name;
    }

    std::error_code ec;
    if (fs::is_directory(parent / ".bare", ec) || fs::is_regular_file(cwd / ".git", ec)) {
        return parent.filename().string();
    }
    return name;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/mcpaudit/config.toml";
    }
    std::string home = get_home_dir();
    return home.empty() ? "" : home + "/.config/mcpaudit/config.toml";
}

TrackerConfig load_tracker_config(const std::string& path) {
    TrackerConfig config = TrackerConfig::defaults();

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return config;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        std::cerr << "[mcpaudit] Ignoring " << path << ": " << err.description()
                  << " (line " << err.source().begin.line << ")" << std::endl;
        return config;
    }

    if (auto val = tbl["tracking"]["poll_interval_ms"].value<int64_t>()) {
        if (*val > 0) {
            config.poll_interval = std::chrono::milliseconds(*val);
        }
    }
    if (auto val = tbl["tracking"]["call_history_limit"].value<int64_t>()) {
        if (*val > 0) {
            config.call_history_limit = static_cast<size_t>(*val);
        }
    }
    config.output_dir = read_path(tbl, "tracking", "output_dir", config.output_dir);
    if (auto val = tbl["tracking"]["project"].value<std::string>()) {
        config.project = *val;
    }

    config.codex_dir = read_path(tbl, "platforms", "codex_dir", config.codex_dir);
    config.gemini_dir = read_path(tbl, "platforms", "gemini_dir", config.gemini_dir);

    if (auto val = tbl["analytics"]["histogram_bins"].value<int64_t>()) {
        if (*val > 0) {
            config.histogram_bins = static_cast<size_t>(*val);
        }
    }

    return config;
}

}
