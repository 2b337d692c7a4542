#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace talekeeper::common {

/// Produces RFC 3339 UTC timestamps; injectable so tests can pin the clock.
using TimestampFn = std::function<std::string()>;

/// "2026-10-18T12:00:00.000Z". Fixed width, so timestamps order lexicographically.
[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point when);

/// "20261018_120000" from an RFC 3339 timestamp; used to derive session ids.
[[nodiscard]] std::string compact_timestamp(const std::string &rfc3339);

[[nodiscard]] TimestampFn system_clock_fn();

} // namespace talekeeper::common
