#pragma once

namespace asap::transport {

struct BackoffPolicy {
    double base_delay = 1.0;    // seconds
    double max_delay = 60.0;    // seconds
    bool jitter = true;         // add up to 10% on top
};

// min(max_delay, base_delay * 2^attempt), plus jitter in [0, 0.1 * delay].
// base_delay = 0 always yields 0. A negative base_delay is passed through
// unclamped (and without jitter).
double calculate_backoff(int attempt, double base_delay, double max_delay, bool jitter);

class Backoff {
public:
    explicit Backoff(BackoffPolicy policy = {}) : policy_(policy) {}

    double delay_for(int attempt) const {
        return calculate_backoff(attempt, policy_.base_delay, policy_.max_delay, policy_.jitter);
    }

    const BackoffPolicy& policy() const { return policy_; }

private:
    BackoffPolicy policy_;
};

} // namespace asap::transport
