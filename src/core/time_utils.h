#pragma once

#include "core/canonical_event.h"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpaudit {

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]". Without an offset
// the time is taken as UTC.
bool parse_iso8601_utc(const std::string& ts, Timestamp& out);

// Strings are parsed as ISO-8601, numbers as epoch seconds or milliseconds.
std::optional<Timestamp> parse_timestamp_value(const nlohmann::json& value);

// "2025-11-04T11:38:25.072Z"
std::string format_iso8601_utc(Timestamp ts);

// "20251104T113825", used in file names.
std::string format_compact_utc(Timestamp ts);

double seconds_between(Timestamp from, Timestamp to);

}
