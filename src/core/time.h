#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace core {

/// Returns current Unix timestamp in seconds since epoch.
int64_t get_time();

/// Formats a Unix timestamp (seconds) as ISO 8601: "2026-02-03T00:00:00Z".
std::string format_iso8601(int64_t timestamp);

/// Parses "YYYY-MM-DDTHH:MM:SS[.f{1,9}]Z" into microseconds since epoch.
/// Digits beyond the sixth fractional digit are truncated, missing ones
/// are zero. Node debug logs carry exactly six
/// ("2025-06-25T20:15:37.882709Z").
std::optional<int64_t> parse_iso8601_micros(std::string_view str);

/// True if @p ts lies inside the optional, inclusive [from, to] window.
/// Comparison is lexical: ISO 8601 timestamps of one fixed shape sort
/// the same way as the instants they denote.
[[nodiscard]] bool in_time_window(std::string_view ts,
                                  const std::optional<std::string>& from,
                                  const std::optional<std::string>& to);

} // namespace core
