#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace bitcache::timeutil {

// "2024-05-01T12:34:56Z"
auto format_iso8601_utc(std::time_t when) -> std::string;

// Current wall-clock time in the format above
auto now_iso8601_utc() -> std::string;

// Parse an RFC 3339 timestamp ("...Z", "...+02:00", optional fractional seconds)
// to seconds since the epoch. Returns std::nullopt if malformed.
auto parse_iso8601(std::string_view text) -> std::optional<std::time_t>;

} // namespace bitcache::timeutil
