#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace adapt {

using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

TimePoint system_now();

// "YYYY-MM-DDTHH:MM:SS.ffffff" (UTC, no offset suffix).
std::string format_iso8601(TimePoint time);

// Accepts an optional fractional part (up to microseconds) and an optional
// "Z" or "+HH:MM"/"-HH:MM" suffix. Naive timestamps are read as UTC.
std::optional<TimePoint> parse_iso8601(const std::string& text);

} // namespace adapt
