#include "transport/token_bucket.hpp"
#include <algorithm>
#include <stdexcept>

namespace asap::transport {

TokenBucket::TokenBucket(double rate, std::optional<double> capacity, TimeSource now)
    : rate_(rate)
    , capacity_(capacity.value_or(rate))
    , tokens_(0.0)
    , now_(std::move(now))
{
    if (rate_ <= 0.0) {
        throw std::invalid_argument("Token bucket rate must be positive");
    }
    if (capacity_ <= 0.0) {
        throw std::invalid_argument("Token bucket capacity must be positive");
    }
    tokens_ = capacity_;
    last_refill_ = read_clock(now_);
}

void TokenBucket::refill() {
    auto now = read_clock(now_);
    double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    if (elapsed > 0.0) {
        tokens_ = std::min(capacity_, tokens_ + elapsed * rate_);
    }
    last_refill_ = now;
}

bool TokenBucket::consume(double n) {
    if (n <= 0.0) {
        return true;
    }
    refill();
    if (tokens_ >= n) {
        tokens_ -= n;
        return true;
    }
    return false;
}

double TokenBucket::seconds_until(double n) {
    if (n > capacity_) {
        return -1.0;
    }
    refill();
    if (tokens_ >= n) {
        return 0.0;
    }
    return (n - tokens_) / rate_;
}

double TokenBucket::tokens() {
    refill();
    return tokens_;
}

} // namespace asap::transport
