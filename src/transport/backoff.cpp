#include "transport/backoff.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace asap::transport {

namespace {

double uniform(double lo, double hi) {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(engine);
}

} // namespace

double calculate_backoff(int attempt, double base_delay, double max_delay, bool jitter) {
    if (attempt < 0) {
        attempt = 0;
    }
    // ldexp keeps large attempts at +inf instead of overflowing an integer
    // shift, and 0 * 2^n stays 0
    double delay = std::min(max_delay, std::ldexp(base_delay, attempt));

    if (jitter && delay > 0.0) {
        delay += uniform(0.0, 0.1 * delay);
    }
    return delay;
}

} // namespace asap::transport
