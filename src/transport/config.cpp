#include "transport/config.hpp"
#include "transport/bounded_executor.hpp"
#include "util/env.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace asap::transport {

namespace {

std::chrono::milliseconds to_ms(double secs) {
    return std::chrono::milliseconds(static_cast<long long>(secs * 1000.0));
}

} // namespace

// ============================================================================
// ClientConfig
// ============================================================================

std::chrono::milliseconds ClientConfig::timeout() const {
    return to_ms(timeout_seconds);
}

std::chrono::milliseconds ClientConfig::breaker_timeout() const {
    return to_ms(circuit_breaker_timeout);
}

ClientConfig ClientConfig::from_env() {
    ClientConfig c;
    c.timeout_seconds = util::env_double("ASAP_CLIENT_TIMEOUT", c.timeout_seconds);
    c.max_retries = util::env_int("ASAP_CLIENT_MAX_RETRIES", c.max_retries);
    c.base_delay = util::env_double("ASAP_CLIENT_BASE_DELAY", c.base_delay);
    c.max_delay = util::env_double("ASAP_CLIENT_MAX_DELAY", c.max_delay);
    c.jitter = util::env_bool("ASAP_CLIENT_JITTER", c.jitter);
    c.circuit_breaker_enabled = util::env_bool("ASAP_CLIENT_CIRCUIT_BREAKER",
                                               c.circuit_breaker_enabled);
    c.circuit_breaker_threshold = util::env_int("ASAP_CLIENT_CIRCUIT_THRESHOLD",
                                                c.circuit_breaker_threshold);
    c.circuit_breaker_timeout = util::env_double("ASAP_CLIENT_CIRCUIT_TIMEOUT",
                                                 c.circuit_breaker_timeout);
    c.manifest_ttl_seconds = util::env_double("ASAP_CLIENT_MANIFEST_TTL", c.manifest_ttl_seconds);
    return c;
}

ClientConfig ClientConfig::from_json(const json& j) {
    ClientConfig c;
    if (!j.is_object()) {
        throw std::invalid_argument("client config must be a JSON object");
    }
    c.timeout_seconds = j.value("timeout_seconds", c.timeout_seconds);
    c.max_retries = j.value("max_retries", c.max_retries);
    c.base_delay = j.value("base_delay", c.base_delay);
    c.max_delay = j.value("max_delay", c.max_delay);
    c.jitter = j.value("jitter", c.jitter);
    c.circuit_breaker_enabled = j.value("circuit_breaker_enabled", c.circuit_breaker_enabled);
    c.circuit_breaker_threshold = j.value("circuit_breaker_threshold",
                                          c.circuit_breaker_threshold);
    c.circuit_breaker_timeout = j.value("circuit_breaker_timeout", c.circuit_breaker_timeout);
    c.manifest_ttl_seconds = j.value("manifest_ttl_seconds", c.manifest_ttl_seconds);
    return c;
}

json ClientConfig::to_json() const {
    return {
        {"timeout_seconds", timeout_seconds},
        {"max_retries", max_retries},
        {"base_delay", base_delay},
        {"max_delay", max_delay},
        {"jitter", jitter},
        {"circuit_breaker_enabled", circuit_breaker_enabled},
        {"circuit_breaker_threshold", circuit_breaker_threshold},
        {"circuit_breaker_timeout", circuit_breaker_timeout},
        {"manifest_ttl_seconds", manifest_ttl_seconds}
    };
}

// ============================================================================
// ServerConfig
// ============================================================================

int ServerConfig::effective_max_threads() const {
    return max_threads > 0 ? max_threads : default_max_threads();
}

ServerConfig ServerConfig::from_env() {
    ServerConfig c;
    c.host = util::env_string("ASAP_SERVER_HOST", c.host);

    int port = util::env_int("ASAP_SERVER_PORT", c.port);
    if (port < 0 || port > 65535) {
        spdlog::warn("Ignoring ASAP_SERVER_PORT={}: out of range", port);
    } else {
        c.port = static_cast<uint16_t>(port);
    }

    c.max_threads = util::env_int("ASAP_SERVER_MAX_THREADS", c.max_threads);

    int max_request = util::env_int("ASAP_SERVER_MAX_REQUEST_SIZE",
                                    static_cast<int>(c.max_request_size));
    if (max_request > 0) {
        c.max_request_size = static_cast<size_t>(max_request);
    }

    c.connection_message_rate = util::env_double("ASAP_SERVER_MESSAGE_RATE",
                                                 c.connection_message_rate);
    c.manifest_max_age = util::env_int("ASAP_SERVER_MANIFEST_MAX_AGE", c.manifest_max_age);
    c.log_level = util::env_string("ASAP_LOG_LEVEL", c.log_level);
    return c;
}

ServerConfig ServerConfig::from_json(const json& j) {
    ServerConfig c;
    if (!j.is_object()) {
        throw std::invalid_argument("server config must be a JSON object");
    }
    c.host = j.value("host", c.host);
    int port = j.value("port", static_cast<int>(c.port));
    if (port < 0 || port > 65535) {
        throw std::invalid_argument("port out of range: " + std::to_string(port));
    }
    c.port = static_cast<uint16_t>(port);
    c.max_threads = j.value("max_threads", c.max_threads);
    c.max_request_size = j.value("max_request_size", c.max_request_size);
    c.connection_message_rate = j.value("connection_message_rate", c.connection_message_rate);
    c.manifest_max_age = j.value("manifest_max_age", c.manifest_max_age);
    c.log_level = j.value("log_level", c.log_level);
    return c;
}

json ServerConfig::to_json() const {
    return {
        {"host", host},
        {"port", port},
        {"max_threads", max_threads},
        {"max_request_size", max_request_size},
        {"connection_message_rate", connection_message_rate},
        {"manifest_max_age", manifest_max_age},
        {"log_level", log_level}
    };
}

} // namespace asap::transport
