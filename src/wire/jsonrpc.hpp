/**
 * ASAP JSON-RPC Framing
 *
 * JSON-RPC 2.0 request/response wrappers for carrying envelopes over HTTP.
 * There is exactly one method, "asap.send". Application errors carry a kind
 * tag in error.data so callers can branch without knowing vendor codes.
 */
#pragma once
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "wire/envelope.hpp"

namespace asap::wire {

class Error;

// Standard JSON-RPC 2.0 codes
constexpr int PARSE_ERROR      = -32700;
constexpr int INVALID_REQUEST  = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS   = -32602;
constexpr int INTERNAL_ERROR   = -32603;

// Application codes (data.kind is authoritative)
constexpr int CIRCUIT_OPEN_ERROR               = 1001;
constexpr int THREAD_POOL_EXHAUSTED_ERROR      = 1002;
constexpr int MANIFEST_VALIDATION_FAILED_ERROR = 1004;

constexpr const char* JSONRPC_VERSION = "2.0";
constexpr const char* ASAP_METHOD = "asap.send";

std::string error_message_for_code(int code);

struct JsonRpcError {
    int code = INTERNAL_ERROR;
    std::string message;
    std::optional<nlohmann::json> data;

    static JsonRpcError from_code(int code, std::optional<nlohmann::json> data = std::nullopt);
    static JsonRpcError from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // data.kind, when present
    std::optional<std::string> kind() const;
};

struct JsonRpcRequest {
    std::string method = ASAP_METHOD;
    nlohmann::json params = nlohmann::json::object();
    nlohmann::json id;   // string or integer

    nlohmann::json to_json() const;
};

struct JsonRpcResponse {
    nlohmann::json result;
    nlohmann::json id;

    nlohmann::json to_json() const;
};

struct JsonRpcErrorResponse {
    JsonRpcError error;
    nlohmann::json id;   // null when the request id could not be read

    nlohmann::json to_json() const;
};

// A decoded asap.send call
struct SendCall {
    Envelope envelope;
    std::optional<std::string> idempotency_key;
    nlohmann::json id;
};

JsonRpcRequest make_send_request(const Envelope& envelope,
                                 const std::string& idempotency_key,
                                 const std::string& request_id);

JsonRpcResponse make_send_response(const Envelope& envelope, const nlohmann::json& id);

// Decode an HTTP body into an asap.send call, or the JSON-RPC error the
// server should answer with
std::variant<SendCall, JsonRpcErrorResponse> parse_send_request(const std::string& body);

// Map a transport error onto its JSON-RPC error object, tagging data.kind
JsonRpcError error_from_exception(const Error& err);

// Extract the response envelope from a decoded response body.
// Throws RemoteError for error responses or a result without an envelope.
Envelope unwrap_send_response(const nlohmann::json& body);

} // namespace asap::wire
