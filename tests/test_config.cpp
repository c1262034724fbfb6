#include <gtest/gtest.h>
#include "transport/bounded_executor.hpp"
#include "transport/config.hpp"
#include <cstdlib>

using namespace asap::transport;
using json = nlohmann::json;

namespace {

// Unsets the listed variables on both ends of a test
class ScopedEnv {
public:
    explicit ScopedEnv(std::vector<std::string> keys) : keys_(std::move(keys)) { clear(); }
    ~ScopedEnv() { clear(); }

    void set(const std::string& key, const std::string& value) {
        setenv(key.c_str(), value.c_str(), 1);
    }

private:
    void clear() {
        for (const auto& k : keys_) unsetenv(k.c_str());
    }
    std::vector<std::string> keys_;
};

} // namespace

TEST(ClientConfigTest, Defaults) {
    ClientConfig c;
    EXPECT_DOUBLE_EQ(c.timeout_seconds, 60.0);
    EXPECT_EQ(c.max_retries, 3);
    EXPECT_TRUE(c.circuit_breaker_enabled);
    EXPECT_EQ(c.circuit_breaker_threshold, 5);
    EXPECT_EQ(c.timeout(), std::chrono::milliseconds(60000));
    EXPECT_EQ(c.breaker_timeout(), std::chrono::milliseconds(60000));

    BackoffPolicy p = c.backoff_policy();
    EXPECT_DOUBLE_EQ(p.base_delay, 1.0);
    EXPECT_DOUBLE_EQ(p.max_delay, 60.0);
    EXPECT_TRUE(p.jitter);
}

TEST(ClientConfigTest, ReadsEnvironment) {
    ScopedEnv env({"ASAP_CLIENT_TIMEOUT", "ASAP_CLIENT_MAX_RETRIES",
                   "ASAP_CLIENT_CIRCUIT_BREAKER", "ASAP_CLIENT_BASE_DELAY"});
    env.set("ASAP_CLIENT_TIMEOUT", "2.5");
    env.set("ASAP_CLIENT_MAX_RETRIES", "7");
    env.set("ASAP_CLIENT_CIRCUIT_BREAKER", "false");
    env.set("ASAP_CLIENT_BASE_DELAY", "not-a-number");

    ClientConfig c = ClientConfig::from_env();
    EXPECT_EQ(c.timeout(), std::chrono::milliseconds(2500));
    EXPECT_EQ(c.max_retries, 7);
    EXPECT_FALSE(c.circuit_breaker_enabled);
    EXPECT_DOUBLE_EQ(c.base_delay, 1.0);
}

TEST(ClientConfigTest, JsonOverridesOnlyGivenKeys) {
    ClientConfig c = ClientConfig::from_json(json{{"max_retries", 1}, {"jitter", false}});
    EXPECT_EQ(c.max_retries, 1);
    EXPECT_FALSE(c.jitter);
    EXPECT_DOUBLE_EQ(c.max_delay, 60.0);

    ClientConfig again = ClientConfig::from_json(c.to_json());
    EXPECT_EQ(again.to_json(), c.to_json());

    EXPECT_THROW(ClientConfig::from_json(json::array()), std::invalid_argument);
}

TEST(ServerConfigTest, Defaults) {
    ServerConfig c;
    EXPECT_EQ(c.host, "0.0.0.0");
    EXPECT_EQ(c.port, 8000);
    EXPECT_EQ(c.max_request_size, 10u * 1024 * 1024);
    EXPECT_EQ(c.effective_max_threads(), default_max_threads());

    c.max_threads = 3;
    EXPECT_EQ(c.effective_max_threads(), 3);
}

TEST(ServerConfigTest, ReadsEnvironment) {
    ScopedEnv env({"ASAP_SERVER_HOST", "ASAP_SERVER_PORT", "ASAP_SERVER_MAX_THREADS",
                   "ASAP_SERVER_MESSAGE_RATE", "ASAP_LOG_LEVEL"});
    env.set("ASAP_SERVER_HOST", "127.0.0.1");
    env.set("ASAP_SERVER_PORT", "9100");
    env.set("ASAP_SERVER_MAX_THREADS", "4");
    env.set("ASAP_SERVER_MESSAGE_RATE", "10");
    env.set("ASAP_LOG_LEVEL", "debug");

    ServerConfig c = ServerConfig::from_env();
    EXPECT_EQ(c.host, "127.0.0.1");
    EXPECT_EQ(c.port, 9100);
    EXPECT_EQ(c.max_threads, 4);
    EXPECT_DOUBLE_EQ(c.connection_message_rate, 10.0);
    EXPECT_EQ(c.log_level, "debug");
}

TEST(ServerConfigTest, OutOfRangePortFallsBack) {
    ScopedEnv env({"ASAP_SERVER_PORT"});
    env.set("ASAP_SERVER_PORT", "70000");
    EXPECT_EQ(ServerConfig::from_env().port, 8000);

    EXPECT_THROW(ServerConfig::from_json(json{{"port", 70000}}), std::invalid_argument);
}
