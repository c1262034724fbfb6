#pragma once
#include <chrono>
#include <string>

namespace asap::util {

using Timestamp = std::chrono::system_clock::time_point;

// Wire timestamps carry microseconds
Timestamp truncate_to_micros(Timestamp tp);

// "2024-05-01T12:30:45.123456Z"
std::string format_iso8601(Timestamp tp);

// Accepts "Z", "+HH:MM", "-HH:MM" or no offset (taken as UTC), with an
// optional fraction of up to nanosecond precision. Result is normalized to
// UTC and truncated to microseconds.
// Throws std::invalid_argument on malformed input.
Timestamp parse_iso8601(const std::string& text);

} // namespace asap::util
