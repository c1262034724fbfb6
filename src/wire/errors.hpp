/**
 * ASAP Error Taxonomy
 *
 * Every failure the transport raises is an asap::wire::Error carrying a
 * protocol code ("asap:<area>/<name>"), a message, structured details and a
 * kind tag. The kind tag is what travels in JSON-RPC error.data.kind.
 */
#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace asap::wire {

enum class ErrorKind {
    VALIDATION_FAILED,
    MALFORMED_ENVELOPE,
    HANDLER_NOT_FOUND,
    THREAD_POOL_EXHAUSTED,
    CIRCUIT_OPEN,
    CONNECTION_ERROR,
    TIMEOUT,
    REMOTE_ERROR,
    MANIFEST_VALIDATION_FAILED
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION_FAILED:          return "validation_failed";
        case ErrorKind::MALFORMED_ENVELOPE:         return "malformed_envelope";
        case ErrorKind::HANDLER_NOT_FOUND:          return "handler_not_found";
        case ErrorKind::THREAD_POOL_EXHAUSTED:      return "thread_pool_exhausted";
        case ErrorKind::CIRCUIT_OPEN:               return "circuit_open";
        case ErrorKind::CONNECTION_ERROR:           return "connection_error";
        case ErrorKind::TIMEOUT:                    return "timeout";
        case ErrorKind::REMOTE_ERROR:               return "remote_error";
        case ErrorKind::MANIFEST_VALIDATION_FAILED: return "manifest_validation_failed";
        default: return "unknown";
    }
}

inline std::optional<ErrorKind> error_kind_from_string(const std::string& str) {
    if (str == "validation_failed")          return ErrorKind::VALIDATION_FAILED;
    if (str == "malformed_envelope")         return ErrorKind::MALFORMED_ENVELOPE;
    if (str == "handler_not_found")          return ErrorKind::HANDLER_NOT_FOUND;
    if (str == "thread_pool_exhausted")      return ErrorKind::THREAD_POOL_EXHAUSTED;
    if (str == "circuit_open")               return ErrorKind::CIRCUIT_OPEN;
    if (str == "connection_error")           return ErrorKind::CONNECTION_ERROR;
    if (str == "timeout")                    return ErrorKind::TIMEOUT;
    if (str == "remote_error")               return ErrorKind::REMOTE_ERROR;
    if (str == "manifest_validation_failed") return ErrorKind::MANIFEST_VALIDATION_FAILED;
    return std::nullopt;
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string code, const std::string& message,
          nlohmann::json details = nlohmann::json::object());

    ErrorKind kind() const { return kind_; }
    const std::string& code() const { return code_; }
    const nlohmann::json& details() const { return details_; }

    // {"code", "message", "kind", "details"}
    nlohmann::json to_json() const;

private:
    ErrorKind kind_;
    std::string code_;
    nlohmann::json details_;
};

// Envelope or message shape rejected; carries every failed rule
class ValidationError : public Error {
public:
    explicit ValidationError(std::vector<std::string> reasons);

    const std::vector<std::string>& reasons() const { return reasons_; }

private:
    std::vector<std::string> reasons_;
};

// Bytes that are not an envelope at all (bad JSON, wrong top-level type)
class MalformedEnvelopeError : public Error {
public:
    explicit MalformedEnvelopeError(const std::string& reason);
};

class HandlerNotFoundError : public Error {
public:
    explicit HandlerNotFoundError(std::string payload_type);

    const std::string& payload_type() const { return payload_type_; }

private:
    std::string payload_type_;
};

class ThreadPoolExhaustedError : public Error {
public:
    ThreadPoolExhaustedError(int max_threads, int active_threads);

    int max_threads() const { return max_threads_; }
    int active_threads() const { return active_threads_; }

private:
    int max_threads_;
    int active_threads_;
};

class CircuitOpenError : public Error {
public:
    CircuitOpenError(std::string base_url, int consecutive_failures);

    const std::string& base_url() const { return base_url_; }
    int consecutive_failures() const { return consecutive_failures_; }

private:
    std::string base_url_;
    int consecutive_failures_;
};

class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string& message,
                             std::optional<int> http_status = std::nullopt);

    std::optional<int> http_status() const { return http_status_; }

private:
    std::optional<int> http_status_;
};

class TimeoutError : public Error {
public:
    TimeoutError(const std::string& message, double timeout_seconds);

    double timeout_seconds() const { return timeout_seconds_; }

private:
    double timeout_seconds_;
};

// Peer answered with a JSON-RPC error object
class RemoteError : public Error {
public:
    RemoteError(int rpc_code, const std::string& message,
                nlohmann::json data = nlohmann::json());

    int rpc_code() const { return rpc_code_; }
    const nlohmann::json& data() const { return data_; }

    // Kind tag the peer put in error.data, if any
    std::optional<ErrorKind> remote_kind() const;

    // Internal errors and server-side admission rejections are worth retrying
    bool retryable() const;

private:
    int rpc_code_;
    nlohmann::json data_;
};

class ManifestValidationError : public Error {
public:
    explicit ManifestValidationError(std::vector<std::string> reasons);

    const std::vector<std::string>& reasons() const { return reasons_; }

private:
    std::vector<std::string> reasons_;
};

} // namespace asap::wire
