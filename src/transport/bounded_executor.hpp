/**
 * ASAP Bounded Executor
 *
 * Fixed pool of worker threads guarded by a counting permit. submit() never
 * queues beyond the pool size: when every permit is taken the call is
 * rejected on the spot with ThreadPoolExhaustedError.
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace asap::transport {

// min(32, hardware threads + 4)
int default_max_threads();

class BoundedExecutor {
public:
    // Throws std::invalid_argument if max_threads < 1
    explicit BoundedExecutor(int max_threads = default_max_threads());
    ~BoundedExecutor();

    // Non-copyable
    BoundedExecutor(const BoundedExecutor&) = delete;
    BoundedExecutor& operator=(const BoundedExecutor&) = delete;

    // Throws ThreadPoolExhaustedError when all permits are in use, and
    // std::runtime_error after shutdown. The permit is released when fn
    // returns or throws, before the future becomes ready.
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    // Stop accepting work, let accepted tasks finish, join the workers
    void shutdown();

    int max_threads() const { return max_threads_; }
    int active_threads() const;
    int available_permits() const;
    uint64_t exhausted_count() const { return exhausted_count_.load(); }

private:
    class PermitGuard {
    public:
        explicit PermitGuard(BoundedExecutor* owner) : owner_(owner) {}
        ~PermitGuard() { owner_->release_permit(); }
        PermitGuard(const PermitGuard&) = delete;
        PermitGuard& operator=(const PermitGuard&) = delete;

    private:
        BoundedExecutor* owner_;
    };

    void acquire_permit();
    void release_permit();
    void enqueue(std::function<void()> task);
    void worker_loop();

    const int max_threads_;

    mutable std::mutex permit_mutex_;
    int in_use_ = 0;
    std::atomic<uint64_t> exhausted_count_{0};

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

template <typename F>
auto BoundedExecutor::submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;

    acquire_permit();

    auto task = std::make_shared<std::packaged_task<Result()>>(
        [this, f = std::forward<F>(fn)]() mutable -> Result {
            PermitGuard guard(this);
            return f();
        });
    std::future<Result> result = task->get_future();

    try {
        enqueue([task]() { (*task)(); });
    } catch (...) {
        // Never reached the queue, so the guard inside the task never runs
        release_permit();
        throw;
    }
    return result;
}

} // namespace asap::transport
