#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "transport/backoff.hpp"

namespace asap::transport {

// Client configuration
struct ClientConfig {
    double timeout_seconds = 60.0;            // Per-attempt HTTP timeout
    int max_retries = 3;                      // Total attempts per send()
    double base_delay = 1.0;                  // Backoff base (seconds)
    double max_delay = 60.0;                  // Backoff ceiling (seconds)
    bool jitter = true;
    bool circuit_breaker_enabled = true;
    int circuit_breaker_threshold = 5;        // Consecutive failures to open
    double circuit_breaker_timeout = 60.0;    // Seconds before a probe
    double manifest_ttl_seconds = 300.0;      // Used when the peer sends no max-age

    BackoffPolicy backoff_policy() const { return {base_delay, max_delay, jitter}; }
    std::chrono::milliseconds timeout() const;
    std::chrono::milliseconds breaker_timeout() const;

    // ASAP_CLIENT_TIMEOUT, ASAP_CLIENT_MAX_RETRIES, ASAP_CLIENT_BASE_DELAY,
    // ASAP_CLIENT_MAX_DELAY, ASAP_CLIENT_JITTER, ASAP_CLIENT_CIRCUIT_BREAKER,
    // ASAP_CLIENT_CIRCUIT_THRESHOLD, ASAP_CLIENT_CIRCUIT_TIMEOUT,
    // ASAP_CLIENT_MANIFEST_TTL
    static ClientConfig from_env();
    static ClientConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Server configuration
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;                           // 0 picks an ephemeral port
    int max_threads = 0;                            // 0 = min(32, cpus + 4)
    size_t max_request_size = 10 * 1024 * 1024;     // 10MB
    double connection_message_rate = 0.0;           // Requests/s per connection, 0 = off
    int manifest_max_age = 300;                     // Cache-Control max-age (seconds)
    std::string log_level = "info";

    int effective_max_threads() const;

    // ASAP_SERVER_HOST, ASAP_SERVER_PORT, ASAP_SERVER_MAX_THREADS,
    // ASAP_SERVER_MAX_REQUEST_SIZE, ASAP_SERVER_MESSAGE_RATE,
    // ASAP_SERVER_MANIFEST_MAX_AGE, ASAP_LOG_LEVEL
    static ServerConfig from_env();
    static ServerConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

} // namespace asap::transport
