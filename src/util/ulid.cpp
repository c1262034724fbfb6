#include "util/ulid.hpp"
#include <cstdint>
#include <random>
#include <stdexcept>

namespace asap::util {

namespace {

constexpr const char* CROCKFORD = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

int decode_char(char c) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    for (int i = 0; i < 32; i++) {
        if (CROCKFORD[i] == c) return i;
    }
    return -1;
}

std::mt19937_64& rng() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

} // namespace

std::string generate_ulid() {
    std::string out(ULID_LENGTH, '0');

    uint64_t ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    for (int i = 9; i >= 0; i--) {
        out[i] = CROCKFORD[ms & 0x1F];
        ms >>= 5;
    }

    // 16 characters x 5 bits = 80 random bits
    uint64_t hi = rng()();
    uint64_t lo = rng()();
    for (int i = 10; i < 22; i++) {
        out[i] = CROCKFORD[hi & 0x1F];
        hi >>= 5;
    }
    for (int i = 22; i < 26; i++) {
        out[i] = CROCKFORD[lo & 0x1F];
        lo >>= 5;
    }
    return out;
}

bool is_valid_ulid(const std::string& id) {
    if (id.size() != ULID_LENGTH) return false;
    // 130 bits of characters carry 128 bits; the first char tops out at '7'
    if (decode_char(id[0]) < 0 || decode_char(id[0]) > 7) return false;
    for (char c : id) {
        if (decode_char(c) < 0) return false;
    }
    return true;
}

std::chrono::system_clock::time_point ulid_timestamp(const std::string& id) {
    if (!is_valid_ulid(id)) {
        throw std::invalid_argument("Invalid ULID: " + id);
    }
    uint64_t ms = 0;
    for (int i = 0; i < 10; i++) {
        ms = (ms << 5) | static_cast<uint64_t>(decode_char(id[i]));
    }
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(ms)));
}

} // namespace asap::util
