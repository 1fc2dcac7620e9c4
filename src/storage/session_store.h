#pragma once

#include "analytics/smells.h"
#include "metrics/session_aggregate.h"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpaudit {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct StoredSession {
    std::filesystem::path path;
    SessionSnapshot snapshot;
    std::vector<Smell> detected_smells;
};

// Finalized sessions live under <root>/<YYYY-MM-DD>/<project>-<YYYYMMDDTHHMMSS>.json,
// the live snapshot of a running tracker under <root>/active/<platform>.json.
// Every file is written to a temp file first and renamed into place.
class SessionStore {
public:
    explicit SessionStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    // Throws StoreError when the location cannot be created or written.
    std::filesystem::path save(const SessionSnapshot& snapshot, const std::vector<Smell>& smells);

    bool write_active(const SessionSnapshot& snapshot);
    void remove_active(const std::string& platform);
    std::filesystem::path active_path(const std::string& platform) const;

    // Finalized session files, newest first.
    std::vector<std::filesystem::path> list_sessions() const;

    static std::optional<StoredSession> load(const std::filesystem::path& path);

private:
    std::filesystem::path root_;
};

// Replaces characters unsafe in file names; empty names become "session".
std::string sanitize_file_component(const std::string& name);

}
