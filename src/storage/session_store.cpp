#include "storage/session_store.h"
#include "core/time_utils.h"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>

namespace mcpaudit {

namespace {

bool write_json_atomically(const std::filesystem::path& path, const nlohmann::json& doc) {
    std::string target = path.string();
    std::string temp_path = target + ".tmp";
    std::ofstream file(temp_path);
    if (!file.is_open()) {
        return false;
    }

    file << doc.dump(2) << "\n";
    file.close();

    if (!file.good()) {
        std::remove(temp_path.c_str());
        return false;
    }

    if (std::rename(temp_path.c_str(), target.c_str()) != 0) {
        std::remove(temp_path.c_str());
        return false;
    }
    return true;
}

bool is_date_dir(const std::string& name) {
    if (name.size() != 10 || name[4] != '-' || name[7] != '-') return false;
    for (size_t i = 0; i < name.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (name[i] < '0' || name[i] > '9') return false;
    }
    return true;
}

}

std::string sanitize_file_component(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                 || c == '-' || c == '_' || c == '.';
        out.push_back(safe ? c : '-');
    }
    if (out.empty() || out == "." || out == "..") {
        return "session";
    }
    return out;
}

SessionStore::SessionStore(std::filesystem::path root)
    : root_(std::move(root))
{
}

std::filesystem::path SessionStore::save(const SessionSnapshot& snapshot, const std::vector<Smell>& smells) {
    namespace fs = std::filesystem;

    fs::path day_dir = root_ / format_iso8601_utc(snapshot.start_time).substr(0, 10);
    std::error_code ec;
    fs::create_directories(day_dir, ec);
    if (ec) {
        throw StoreError("cannot create " + day_dir.string() + ": " + ec.message());
    }

    std::string stem = sanitize_file_component(snapshot.project) + "-" + format_compact_utc(snapshot.start_time);
    fs::path path = day_dir / (stem + ".json");
    for (int n = 1; fs::exists(path, ec); ++n) {
        path = day_dir / (stem + "-" + std::to_string(n) + ".json");
    }

    nlohmann::json doc = snapshot;
    doc["detected_smells"] = smells;

    if (!write_json_atomically(path, doc)) {
        throw StoreError("cannot write " + path.string());
    }
    return path;
}

std::filesystem::path SessionStore::active_path(const std::string& platform) const {
    return root_ / "active" / (sanitize_file_component(platform) + ".json");
}

bool SessionStore::write_active(const SessionSnapshot& snapshot) {
    std::filesystem::path path = active_path(snapshot.platform);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return false;
    }
    return write_json_atomically(path, snapshot);
}

void SessionStore::remove_active(const std::string& platform) {
    std::error_code ec;
    std::filesystem::remove(active_path(platform), ec);
}

std::vector<std::filesystem::path> SessionStore::list_sessions() const {
    namespace fs = std::filesystem;
    std::vector<fs::path> result;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return result;
    }

    for (const auto& day : fs::directory_iterator(root_, ec)) {
        if (!day.is_directory() || !is_date_dir(day.path().filename().string())) continue;
        for (const auto& entry : fs::directory_iterator(day.path(), ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                result.push_back(entry.path());
            }
        }
    }

    // Day directory first, then modification time within the day.
    std::vector<std::pair<fs::path, fs::file_time_type>> keyed;
    for (auto& path : result) {
        std::error_code mtime_ec;
        auto mtime = fs::last_write_time(path, mtime_ec);
        keyed.emplace_back(std::move(path), mtime_ec ? fs::file_time_type::min() : mtime);
    }
    std::sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        auto day_a = a.first.parent_path().filename();
        auto day_b = b.first.parent_path().filename();
        if (day_a != day_b) return day_a > day_b;
        if (a.second != b.second) return a.second > b.second;
        return a.first > b.first;
    });

    result.clear();
    for (auto& [path, mtime] : keyed) {
        result.push_back(std::move(path));
    }
    return result;
}

std::optional<StoredSession> SessionStore::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto doc = nlohmann::json::parse(content, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }

    StoredSession stored;
    stored.path = path;
    try {
        stored.snapshot = doc.get<SessionSnapshot>();
        if (doc.contains("detected_smells") && doc["detected_smells"].is_array()) {
            for (const auto& smell : doc["detected_smells"]) {
                if (smell.is_object()) {
                    stored.detected_smells.push_back(smell.get<Smell>());
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[mcpaudit] " << path.string() << ": " << e.what() << std::endl;
        return std::nullopt;
    }
    return stored;
}

}
