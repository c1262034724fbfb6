#include "transport/retry.hpp"
#include "wire/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace asap::transport {

void thread_sleep(std::chrono::duration<double> delay) {
    if (delay.count() > 0.0) {
        std::this_thread::sleep_for(delay);
    }
}

RetryEngine::RetryEngine(int max_retries, BackoffPolicy policy,
                         std::shared_ptr<CircuitBreaker> breaker, std::string target)
    : max_attempts_(std::max(1, max_retries))
    , backoff_(policy)
    , breaker_(std::move(breaker))
    , target_(std::move(target)) {}

void RetryEngine::ensure_can_start() const {
    if (breaker_ && !breaker_->can_attempt()) {
        throw wire::CircuitOpenError(target_, breaker_->consecutive_failures());
    }
}

void RetryEngine::ensure_still_closed() const {
    // Another caller may have tripped the shared breaker while we slept
    if (breaker_ && breaker_->state() == CircuitState::OPEN) {
        throw wire::CircuitOpenError(target_, breaker_->consecutive_failures());
    }
}

void RetryEngine::report_success() const {
    if (breaker_) breaker_->record_success();
}

void RetryEngine::report_failure() const {
    if (breaker_) breaker_->record_failure();
}

bool RetryEngine::past(std::optional<SteadyClock::time_point> deadline, double extra_seconds) const {
    if (!deadline) {
        return false;
    }
    auto at = read_clock(now_) + std::chrono::duration_cast<SteadyClock::duration>(
        std::chrono::duration<double>(std::max(0.0, extra_seconds)));
    return at >= *deadline;
}

void RetryEngine::fail_deadline(std::optional<SteadyClock::time_point> deadline) const {
    report_failure();
    double budget = 0.0;
    if (deadline) {
        budget = std::chrono::duration<double>(*deadline - read_clock(now_)).count();
    }
    throw wire::TimeoutError("Deadline exceeded calling " + target_, std::max(0.0, budget));
}

void RetryEngine::log_retry(int attempt, double delay, std::exception_ptr error) const {
    std::string reason = "unknown error";
    try {
        if (error) std::rethrow_exception(error);
    } catch (const std::exception& e) {
        reason = e.what();
    } catch (...) {
        reason = "non-standard exception";
    }
    spdlog::info("Retrying {} (attempt {}/{}) in {:.3f}s: {}",
        target_, attempt + 2, max_attempts_, delay, reason);
}

void RetryEngine::pause(double seconds) const {
    sleeper_(std::chrono::duration<double>(std::max(0.0, seconds)));
}

} // namespace asap::transport
