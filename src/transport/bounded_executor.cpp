#include "transport/bounded_executor.hpp"
#include "wire/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace asap::transport {

int default_max_threads() {
    int cpus = static_cast<int>(std::thread::hardware_concurrency());
    if (cpus <= 0) {
        cpus = 1;
    }
    return std::min(32, cpus + 4);
}

BoundedExecutor::BoundedExecutor(int max_threads)
    : max_threads_(max_threads)
{
    if (max_threads_ < 1) {
        throw std::invalid_argument("max_threads must be >= 1, got " +
                                    std::to_string(max_threads_));
    }

    workers_.reserve(max_threads_);
    for (int i = 0; i < max_threads_; i++) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    spdlog::info("Bounded executor started (max_threads={})", max_threads_);
}

BoundedExecutor::~BoundedExecutor() {
    shutdown();
}

void BoundedExecutor::acquire_permit() {
    std::lock_guard<std::mutex> lock(permit_mutex_);
    if (in_use_ >= max_threads_) {
        exhausted_count_++;
        spdlog::warn("Thread pool exhausted: {}/{} threads in use (rejections={})",
            in_use_, max_threads_, exhausted_count_.load());
        throw wire::ThreadPoolExhaustedError(max_threads_, in_use_);
    }
    in_use_++;
}

void BoundedExecutor::release_permit() {
    std::lock_guard<std::mutex> lock(permit_mutex_);
    if (in_use_ > 0) {
        in_use_--;
    }
}

int BoundedExecutor::active_threads() const {
    std::lock_guard<std::mutex> lock(permit_mutex_);
    return in_use_;
}

int BoundedExecutor::available_permits() const {
    std::lock_guard<std::mutex> lock(permit_mutex_);
    return max_threads_ - in_use_;
}

void BoundedExecutor::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            throw std::runtime_error("Bounded executor is shut down");
        }
        queue_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
}

void BoundedExecutor::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        // packaged_task stores exceptions in the future
        task();
    }
}

void BoundedExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    spdlog::info("Bounded executor stopped");
}

} // namespace asap::transport
