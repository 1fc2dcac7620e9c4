#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace mcpaudit {

struct TrackerConfig {
    std::chrono::milliseconds poll_interval{500};
    size_t call_history_limit = 1000;
    std::string output_dir;  // "~" already expanded
    std::string project;     // empty: name of the current directory
    std::string codex_dir;
    std::string gemini_dir;
    size_t histogram_bins = 10;

    static TrackerConfig defaults();
};

// Replaces a leading "~" with $HOME.
std::string expand_home(const std::string& path);

// $XDG_CONFIG_HOME/mcpaudit/config.toml, else ~/.config/mcpaudit/config.toml
std::string default_config_path();

// Project name for a working directory. Inside a git worktree checkout
// named after a branch (main, master, develop, ...) whose parent holds a
// .bare repository, or whose .git is a file, the parent's name is used.
std::string detect_project_name(const std::filesystem::path& dir);

// A missing file yields the defaults. A malformed file is reported on
// stderr and also yields the defaults.
TrackerConfig load_tracker_config(const std::string& path);

}
