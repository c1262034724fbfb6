#pragma once
#include <chrono>
#include <string>

namespace asap::util {

constexpr size_t ULID_LENGTH = 26;

// 48-bit millisecond timestamp + 80 random bits, Crockford base32.
// Lexicographic order follows creation time at millisecond resolution.
std::string generate_ulid();

bool is_valid_ulid(const std::string& id);

// Creation time encoded in the first 10 characters.
// Throws std::invalid_argument for malformed ids.
std::chrono::system_clock::time_point ulid_timestamp(const std::string& id);

} // namespace asap::util
