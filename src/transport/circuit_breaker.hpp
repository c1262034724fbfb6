/**
 * ASAP Circuit Breaker
 *
 * Per-target failure gate. After `threshold` consecutive failures the circuit
 * opens and callers fail fast; once `timeout` has elapsed a single probe call
 * is let through (HALF_OPEN) and its outcome decides whether the circuit
 * closes again or re-opens.
 *
 * Breakers are shared through a CircuitBreakerRegistry keyed by base URL so
 * every client talking to the same target sees the same state.
 */
#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "transport/clock.hpp"

namespace asap::transport {

enum class CircuitState {
    CLOSED,     // Calls flow normally
    OPEN,       // Calls are rejected until the timeout elapses
    HALF_OPEN   // One probe call is in flight
};

inline std::string circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "CLOSED";
        case CircuitState::OPEN:      return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

constexpr int DEFAULT_CIRCUIT_THRESHOLD = 5;
constexpr std::chrono::milliseconds DEFAULT_CIRCUIT_TIMEOUT{60000};

class CircuitBreaker {
public:
    // Throws std::invalid_argument if threshold < 1 or timeout is negative
    explicit CircuitBreaker(int threshold = DEFAULT_CIRCUIT_THRESHOLD,
                            std::chrono::milliseconds timeout = DEFAULT_CIRCUIT_TIMEOUT,
                            TimeSource now = {},
                            std::string name = "");

    // Non-copyable
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Resets the failure count; closes the circuit from HALF_OPEN
    void record_success();

    // Opens the circuit on the threshold-th consecutive failure, or
    // immediately when the probe in HALF_OPEN fails
    void record_failure();

    // CLOSED: always true. OPEN: true only once timeout has elapsed since the
    // last failure, moving to HALF_OPEN and handing out the single probe.
    // HALF_OPEN: false while the probe is outstanding.
    bool can_attempt();

    CircuitState state() const;
    int consecutive_failures() const;
    std::optional<SteadyClock::time_point> last_failure_time() const;

    int threshold() const { return threshold_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    const std::string& name() const { return name_; }

    // Back to CLOSED with no failures
    void reset();

private:
    void transition_locked(CircuitState next);

    const int threshold_;
    const std::chrono::milliseconds timeout_;
    TimeSource now_;
    std::string name_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    int consecutive_failures_ = 0;
    std::optional<SteadyClock::time_point> last_failure_time_;
};

// Process-wide table of breakers, one per target base URL. Owned by the
// application root and handed to every client by reference.
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(TimeSource now = {});

    // Non-copyable
    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    // Existing entries are returned as-is; threshold and timeout only apply
    // when the breaker is created
    std::shared_ptr<CircuitBreaker> get_or_create(
        const std::string& base_url,
        int threshold = DEFAULT_CIRCUIT_THRESHOLD,
        std::chrono::milliseconds timeout = DEFAULT_CIRCUIT_TIMEOUT);

    std::shared_ptr<CircuitBreaker> find(const std::string& base_url) const;

    // Drop every breaker (test isolation)
    void clear();

    size_t size() const;

private:
    TimeSource now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace asap::transport
