#include <gtest/gtest.h>
#include "transport/bounded_executor.hpp"
#include "wire/errors.hpp"
#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

using namespace asap::transport;
using asap::wire::ThreadPoolExhaustedError;

TEST(BoundedExecutorTest, DefaultSizeIsCapped) {
    int n = default_max_threads();
    EXPECT_GE(n, 5);
    EXPECT_LE(n, 32);
}

TEST(BoundedExecutorTest, RejectsZeroThreads) {
    EXPECT_THROW(BoundedExecutor(0), std::invalid_argument);
}

TEST(BoundedExecutorTest, RunsTasksAndReturnsValues) {
    BoundedExecutor executor(2);
    auto a = executor.submit([] { return 21 * 2; });
    auto b = executor.submit([] { return std::string("done"); });
    EXPECT_EQ(a.get(), 42);
    EXPECT_EQ(b.get(), "done");
}

TEST(BoundedExecutorTest, ExceptionsReachTheFuture) {
    BoundedExecutor executor(1);
    auto f = executor.submit([]() -> int { throw std::runtime_error("handler failed"); });
    EXPECT_THROW(f.get(), std::runtime_error);
    EXPECT_EQ(executor.active_threads(), 0);
}

TEST(BoundedExecutorTest, RejectsWhenSaturated) {
    constexpr int N = 3;
    BoundedExecutor executor(N);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::vector<std::future<void>> running;
    for (int i = 0; i < N; i++) {
        running.push_back(executor.submit([gate] { gate.wait(); }));
    }
    EXPECT_EQ(executor.active_threads(), N);
    EXPECT_EQ(executor.available_permits(), 0);

    try {
        executor.submit([] {});
        FAIL() << "expected ThreadPoolExhaustedError";
    } catch (const ThreadPoolExhaustedError& e) {
        EXPECT_EQ(e.max_threads(), N);
        EXPECT_EQ(e.active_threads(), N);
    }
    EXPECT_EQ(executor.exhausted_count(), 1u);

    release.set_value();
    for (auto& f : running) f.get();
    EXPECT_EQ(executor.active_threads(), 0);

    // Capacity is back
    EXPECT_NO_THROW(executor.submit([] {}).get());
}

TEST(BoundedExecutorTest, PermitReleasedBeforeFutureReady) {
    BoundedExecutor executor(1);
    executor.submit([] { return 1; }).get();
    EXPECT_EQ(executor.available_permits(), 1);
    EXPECT_NO_THROW(executor.submit([] { return 2; }).get());
}

TEST(BoundedExecutorTest, SubmitAfterShutdownThrows) {
    BoundedExecutor executor(2);
    executor.shutdown();
    EXPECT_THROW(executor.submit([] {}), std::runtime_error);
    EXPECT_EQ(executor.available_permits(), 2);
}

TEST(BoundedExecutorTest, ShutdownDrainsAcceptedWork) {
    BoundedExecutor executor(2);
    auto f = executor.submit([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return 5;
    });
    executor.shutdown();
    EXPECT_EQ(f.get(), 5);
}
