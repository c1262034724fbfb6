#include "transport/circuit_breaker.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace asap::transport {

// ============================================================================
// CircuitBreaker
// ============================================================================

CircuitBreaker::CircuitBreaker(int threshold, std::chrono::milliseconds timeout,
                               TimeSource now, std::string name)
    : threshold_(threshold)
    , timeout_(timeout)
    , now_(std::move(now))
    , name_(std::move(name))
{
    if (threshold_ < 1) {
        throw std::invalid_argument("Circuit breaker threshold must be >= 1, got " +
                                    std::to_string(threshold_));
    }
    if (timeout_.count() < 0) {
        throw std::invalid_argument("Circuit breaker timeout must be non-negative");
    }
}

void CircuitBreaker::transition_locked(CircuitState next) {
    if (state_ == next) {
        return;
    }
    if (next == CircuitState::OPEN) {
        spdlog::warn("Circuit breaker {}: {} -> OPEN after {} consecutive failures",
            name_.empty() ? "<anonymous>" : name_,
            circuit_state_to_string(state_), consecutive_failures_);
    } else {
        spdlog::info("Circuit breaker {}: {} -> {}",
            name_.empty() ? "<anonymous>" : name_,
            circuit_state_to_string(state_), circuit_state_to_string(next));
    }
    state_ = next;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_ = 0;
    if (state_ == CircuitState::HALF_OPEN) {
        transition_locked(CircuitState::CLOSED);
    }
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_++;
    last_failure_time_ = read_clock(now_);

    if (state_ == CircuitState::HALF_OPEN) {
        // Failed probe, restart the timeout
        transition_locked(CircuitState::OPEN);
    } else if (state_ == CircuitState::CLOSED && consecutive_failures_ >= threshold_) {
        transition_locked(CircuitState::OPEN);
    }
}

bool CircuitBreaker::can_attempt() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case CircuitState::CLOSED:
            return true;

        case CircuitState::OPEN: {
            if (!last_failure_time_) {
                transition_locked(CircuitState::HALF_OPEN);
                return true;
            }
            auto elapsed = read_clock(now_) - *last_failure_time_;
            if (elapsed >= timeout_) {
                transition_locked(CircuitState::HALF_OPEN);
                return true;
            }
            return false;
        }

        case CircuitState::HALF_OPEN:
            return false;
    }
    return false;
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int CircuitBreaker::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

std::optional<SteadyClock::time_point> CircuitBreaker::last_failure_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_failure_time_;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_ = 0;
    last_failure_time_.reset();
    transition_locked(CircuitState::CLOSED);
}

// ============================================================================
// CircuitBreakerRegistry
// ============================================================================

CircuitBreakerRegistry::CircuitBreakerRegistry(TimeSource now)
    : now_(std::move(now)) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get_or_create(
    const std::string& base_url, int threshold, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(base_url);
    if (it != breakers_.end()) {
        return it->second;
    }

    auto breaker = std::make_shared<CircuitBreaker>(threshold, timeout, now_, base_url);
    breakers_.emplace(base_url, breaker);
    spdlog::info("Created circuit breaker for {} (threshold={}, timeout={}ms)",
        base_url, threshold, timeout.count());
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& base_url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(base_url);
    if (it == breakers_.end()) {
        return nullptr;
    }
    return it->second;
}

void CircuitBreakerRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    breakers_.clear();
}

size_t CircuitBreakerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return breakers_.size();
}

} // namespace asap::transport
