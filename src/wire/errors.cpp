#include "wire/errors.hpp"
#include "wire/jsonrpc.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

using json = nlohmann::json;

namespace asap::wire {

// ============================================================================
// Error
// ============================================================================

Error::Error(ErrorKind kind, std::string code, const std::string& message, json details)
    : std::runtime_error(message)
    , kind_(kind)
    , code_(std::move(code))
    , details_(std::move(details)) {}

json Error::to_json() const {
    json j;
    j["code"] = code_;
    j["message"] = what();
    j["kind"] = error_kind_to_string(kind_);
    j["details"] = details_;
    return j;
}

// ============================================================================
// Concrete errors
// ============================================================================

ValidationError::ValidationError(std::vector<std::string> reasons)
    : Error(ErrorKind::VALIDATION_FAILED, "asap:protocol/validation_failed",
            fmt::format("Envelope validation failed: {}", fmt::join(reasons, "; ")),
            json{{"validation_errors", reasons}})
    , reasons_(std::move(reasons)) {}

MalformedEnvelopeError::MalformedEnvelopeError(const std::string& reason)
    : Error(ErrorKind::MALFORMED_ENVELOPE, "asap:protocol/malformed_envelope",
            fmt::format("Malformed envelope: {}", reason),
            json{{"reason", reason}}) {}

HandlerNotFoundError::HandlerNotFoundError(std::string payload_type)
    : Error(ErrorKind::HANDLER_NOT_FOUND, "asap:transport/handler_not_found",
            fmt::format("No handler registered for payload type: {}", payload_type),
            json{{"payload_type", payload_type}})
    , payload_type_(std::move(payload_type)) {}

ThreadPoolExhaustedError::ThreadPoolExhaustedError(int max_threads, int active_threads)
    : Error(ErrorKind::THREAD_POOL_EXHAUSTED, "asap:transport/thread_pool_exhausted",
            fmt::format("Thread pool exhausted: {}/{} threads in use. "
                        "Service temporarily unavailable.", active_threads, max_threads),
            json{{"max_threads", max_threads}, {"active_threads", active_threads}})
    , max_threads_(max_threads)
    , active_threads_(active_threads) {}

CircuitOpenError::CircuitOpenError(std::string base_url, int consecutive_failures)
    : Error(ErrorKind::CIRCUIT_OPEN, "asap:transport/circuit_open",
            fmt::format("Circuit breaker is OPEN for {} after {} consecutive failures. "
                        "Service temporarily unavailable.", base_url, consecutive_failures),
            json{{"base_url", base_url}, {"consecutive_failures", consecutive_failures}})
    , base_url_(std::move(base_url))
    , consecutive_failures_(consecutive_failures) {}

ConnectionError::ConnectionError(const std::string& message, std::optional<int> http_status)
    : Error(ErrorKind::CONNECTION_ERROR, "asap:transport/connection_error", message,
            http_status ? json{{"http_status", *http_status}} : json::object())
    , http_status_(http_status) {}

TimeoutError::TimeoutError(const std::string& message, double timeout_seconds)
    : Error(ErrorKind::TIMEOUT, "asap:transport/timeout", message,
            json{{"timeout", timeout_seconds}})
    , timeout_seconds_(timeout_seconds) {}

RemoteError::RemoteError(int rpc_code, const std::string& message, json data)
    : Error(ErrorKind::REMOTE_ERROR, "asap:transport/remote_error",
            fmt::format("Remote error {}: {}", rpc_code, message),
            json{{"rpc_code", rpc_code}, {"rpc_message", message}, {"data", data}})
    , rpc_code_(rpc_code)
    , data_(std::move(data)) {}

std::optional<ErrorKind> RemoteError::remote_kind() const {
    if (data_.is_object() && data_.contains("kind") && data_["kind"].is_string()) {
        return error_kind_from_string(data_["kind"].get<std::string>());
    }
    return std::nullopt;
}

bool RemoteError::retryable() const {
    if (rpc_code_ == INTERNAL_ERROR) {
        return true;
    }
    return remote_kind() == ErrorKind::THREAD_POOL_EXHAUSTED;
}

ManifestValidationError::ManifestValidationError(std::vector<std::string> reasons)
    : Error(ErrorKind::MANIFEST_VALIDATION_FAILED, "asap:protocol/manifest_validation_failed",
            fmt::format("Manifest validation failed: {}", fmt::join(reasons, "; ")),
            json{{"validation_errors", reasons}})
    , reasons_(std::move(reasons)) {}

} // namespace asap::wire
