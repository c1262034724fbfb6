#include <gtest/gtest.h>
#include "transport/token_bucket.hpp"
#include <stdexcept>

using namespace asap::transport;
using namespace std::chrono_literals;

namespace {

class TokenBucketTest : public ::testing::Test {
protected:
    TimeSource clock() {
        return [this] { return now; };
    }

    SteadyClock::time_point now = SteadyClock::time_point{} + 1h;
};

} // namespace

TEST_F(TokenBucketTest, StartsFull) {
    TokenBucket bucket(5.0, std::nullopt, clock());
    EXPECT_DOUBLE_EQ(bucket.capacity(), 5.0);
    for (int i = 0; i < 5; i++) {
        EXPECT_TRUE(bucket.consume());
    }
    EXPECT_FALSE(bucket.consume());
}

TEST_F(TokenBucketTest, RefillsOverTime) {
    TokenBucket bucket(10.0, std::nullopt, clock());
    for (int i = 0; i < 10; i++) bucket.consume();
    EXPECT_FALSE(bucket.consume());

    now += 100ms;
    EXPECT_TRUE(bucket.consume());
    EXPECT_FALSE(bucket.consume());

    now += 500ms;
    EXPECT_NEAR(bucket.tokens(), 5.0, 1e-9);
}

TEST_F(TokenBucketTest, NeverExceedsCapacity) {
    TokenBucket bucket(10.0, 3.0, clock());
    now += 1h;
    EXPECT_DOUBLE_EQ(bucket.tokens(), 3.0);
}

TEST_F(TokenBucketTest, RequestAboveCapacityNeverSucceeds) {
    TokenBucket bucket(2.0, 4.0, clock());
    EXPECT_FALSE(bucket.consume(5.0));

    now += 24h * 365;
    EXPECT_FALSE(bucket.consume(5.0));
    EXPECT_DOUBLE_EQ(bucket.tokens(), 4.0);
    EXPECT_TRUE(bucket.consume(4.0));
}

TEST_F(TokenBucketTest, SucceedsOnceEnoughTimePassed) {
    TokenBucket bucket(2.0, 4.0, clock());
    EXPECT_TRUE(bucket.consume(4.0));
    EXPECT_FALSE(bucket.consume(3.0));

    now += 1s;
    EXPECT_FALSE(bucket.consume(3.0));
    now += 500ms;
    EXPECT_TRUE(bucket.consume(3.0));
}

TEST_F(TokenBucketTest, NonPositiveConsumeAlwaysSucceeds) {
    TokenBucket bucket(1.0, std::nullopt, clock());
    bucket.consume();
    EXPECT_TRUE(bucket.consume(0));
    EXPECT_TRUE(bucket.consume(-2));
    EXPECT_FALSE(bucket.consume());
}

TEST_F(TokenBucketTest, SecondsUntil) {
    TokenBucket bucket(2.0, std::nullopt, clock());
    EXPECT_DOUBLE_EQ(bucket.seconds_until(1), 0.0);
    bucket.consume(2);
    EXPECT_NEAR(bucket.seconds_until(1), 0.5, 1e-9);
    EXPECT_LT(bucket.seconds_until(5), 0.0);
}

TEST_F(TokenBucketTest, RejectsBadParameters) {
    EXPECT_THROW(TokenBucket(0.0), std::invalid_argument);
    EXPECT_THROW(TokenBucket(-1.0), std::invalid_argument);
    EXPECT_THROW(TokenBucket(1.0, 0.0), std::invalid_argument);
}
