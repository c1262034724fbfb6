/**
 * ASAP Retry Engine
 *
 * Drives an attempt function until it succeeds, fails fatally, or the retry
 * budget runs out. Each attempt reports an explicit outcome instead of
 * throwing, so the loop owns every retry and circuit-breaker decision.
 */
#pragma once
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include "transport/backoff.hpp"
#include "transport/circuit_breaker.hpp"
#include "transport/clock.hpp"

namespace asap::transport {

template <typename T>
struct Success {
    T value;
};

// Worth another attempt; retry_after overrides the computed backoff
struct Retryable {
    std::exception_ptr error;
    std::optional<double> retry_after;
};

// Surface immediately
struct Fatal {
    std::exception_ptr error;
};

template <typename T>
using AttemptOutcome = std::variant<Success<T>, Retryable, Fatal>;

using Sleeper = std::function<void(std::chrono::duration<double>)>;

// Blocks the calling thread
void thread_sleep(std::chrono::duration<double> delay);

class RetryEngine {
public:
    // max_retries is the total number of attempts (at least one is made)
    RetryEngine(int max_retries, BackoffPolicy policy,
                std::shared_ptr<CircuitBreaker> breaker = nullptr,
                std::string target = "");

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_time_source(TimeSource now) { now_ = std::move(now); }

    int max_attempts() const { return max_attempts_; }
    const Backoff& backoff() const { return backoff_; }

    // Runs attempt_fn(attempt_index) until a terminal outcome.
    //
    // - Circuit open before the first attempt (or opened by another caller
    //   between attempts): throws CircuitOpenError, nothing is reported.
    // - Success: reports success, returns the value.
    // - Fatal: the peer answered, so reports success, rethrows the error.
    // - Retryable on the last attempt: reports failure, rethrows the error.
    // - Deadline reached: reports failure, throws TimeoutError.
    template <typename T>
    T run(const std::function<AttemptOutcome<T>(int)>& attempt_fn,
          std::optional<SteadyClock::time_point> deadline = std::nullopt);

private:
    void ensure_can_start() const;
    void ensure_still_closed() const;
    void report_success() const;
    void report_failure() const;
    [[noreturn]] void fail_deadline(std::optional<SteadyClock::time_point> deadline) const;
    bool past(std::optional<SteadyClock::time_point> deadline, double extra_seconds) const;
    void log_retry(int attempt, double delay, std::exception_ptr error) const;
    void pause(double seconds) const;

    int max_attempts_;
    Backoff backoff_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::string target_;
    Sleeper sleeper_ = thread_sleep;
    TimeSource now_;
};

template <typename T>
T RetryEngine::run(const std::function<AttemptOutcome<T>(int)>& attempt_fn,
                   std::optional<SteadyClock::time_point> deadline) {
    ensure_can_start();

    std::exception_ptr last_error;
    for (int attempt = 0; attempt < max_attempts_; attempt++) {
        if (attempt > 0) {
            ensure_still_closed();
        }
        if (past(deadline, 0.0)) {
            fail_deadline(deadline);
        }

        AttemptOutcome<T> outcome = [&]() -> AttemptOutcome<T> {
            try {
                return attempt_fn(attempt);
            } catch (...) {
                // An attempt function that throws is treated as a failed call
                report_failure();
                throw;
            }
        }();

        if (auto* ok = std::get_if<Success<T>>(&outcome)) {
            report_success();
            return std::move(ok->value);
        }

        if (auto* fatal = std::get_if<Fatal>(&outcome)) {
            report_success();
            std::rethrow_exception(fatal->error);
        }

        auto& retry = std::get<Retryable>(outcome);
        last_error = retry.error;
        if (attempt + 1 >= max_attempts_) {
            break;
        }

        double delay = retry.retry_after ? *retry.retry_after : backoff_.delay_for(attempt);
        if (past(deadline, delay)) {
            fail_deadline(deadline);
        }
        log_retry(attempt, delay, last_error);
        pause(delay);
    }

    report_failure();
    std::rethrow_exception(last_error);
}

} // namespace asap::transport
