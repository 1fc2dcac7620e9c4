#include "core/time_utils.h"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcpaudit {

namespace {

std::tm to_utc_tm(Timestamp ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    return tm;
}

bool parse_epoch_timestamp(double value, Timestamp& out) {
    if (value <= 0.0) {
        return false;
    }
    double ms_value = 0.0;
    if (value > 1e12) {
        ms_value = value;
    } else if (value > 1e6) {
        ms_value = value * 1000.0;
    } else {
        return false;
    }
    out = Timestamp{std::chrono::milliseconds(static_cast<int64_t>(ms_value))};
    return true;
}

}

bool parse_iso8601_utc(const std::string& ts, Timestamp& out) {
    if (ts.size() < 19) {
        return false;
    }
    std::tm tm{};
    std::istringstream ss(ts.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return false;
    }
#if defined(__APPLE__) || defined(__linux__)
    std::time_t t = timegm(&tm);
#else
    std::time_t t = std::mktime(&tm);
#endif
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }
    out = std::chrono::system_clock::from_time_t(t);

    size_t pos = 19;
    if (pos < ts.size() && ts[pos] == '.') {
        size_t end = pos + 1;
        while (end < ts.size() && std::isdigit(static_cast<unsigned char>(ts[end]))) {
            end++;
        }
        std::string frac = ts.substr(pos + 1, end - pos - 1);
        if (!frac.empty()) {
            while (frac.size() < 3) {
                frac.push_back('0');
            }
            out += std::chrono::milliseconds(std::stoi(frac.substr(0, 3)));
        }
        pos = end;
    }

    if (pos + 6 <= ts.size() && (ts[pos] == '+' || ts[pos] == '-') && ts[pos + 3] == ':') {
        int hours = std::atoi(ts.substr(pos + 1, 2).c_str());
        int minutes = std::atoi(ts.substr(pos + 4, 2).c_str());
        auto offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
        if (ts[pos] == '+') {
            out -= offset;
        } else {
            out += offset;
        }
    }
    return true;
}

std::optional<Timestamp> parse_timestamp_value(const nlohmann::json& value) {
    Timestamp out;
    if (value.is_number()) {
        if (parse_epoch_timestamp(value.get<double>(), out)) {
            return out;
        }
        return std::nullopt;
    }
    if (value.is_string()) {
        if (parse_iso8601_utc(value.get<std::string>(), out)) {
            return out;
        }
    }
    return std::nullopt;
}

std::string format_iso8601_utc(Timestamp ts) {
    std::tm tm = to_utc_tm(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count() % 1000;
    if (ms < 0) {
        ms += 1000;
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::string format_compact_utc(Timestamp ts) {
    std::tm tm = to_utc_tm(ts);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%S");
    return oss.str();
}

double seconds_between(Timestamp from, Timestamp to) {
    return std::chrono::duration<double>(to - from).count();
}

}
