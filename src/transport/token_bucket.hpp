#pragma once
#include <optional>
#include "transport/clock.hpp"

namespace asap::transport {

constexpr double DEFAULT_MESSAGES_PER_SECOND = 10.0;

// Per-connection rate limiter. Not thread-safe: one bucket belongs to one
// connection and is only touched from that connection's thread.
class TokenBucket {
public:
    // Throws std::invalid_argument if rate <= 0 or capacity <= 0.
    // Capacity defaults to rate; the bucket starts full.
    explicit TokenBucket(double rate = DEFAULT_MESSAGES_PER_SECOND,
                         std::optional<double> capacity = std::nullopt,
                         TimeSource now = {});

    // Refill, then take n tokens if available. n <= 0 always succeeds.
    bool consume(double n = 1.0);

    // Seconds until n tokens would be available (0 if they already are,
    // negative if n exceeds capacity and can never be satisfied)
    double seconds_until(double n = 1.0);

    double rate() const { return rate_; }
    double capacity() const { return capacity_; }
    double tokens();

private:
    void refill();

    double rate_;
    double capacity_;
    double tokens_;
    TimeSource now_;
    SteadyClock::time_point last_refill_;
};

} // namespace asap::transport
