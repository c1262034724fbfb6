#include "wire/jsonrpc.hpp"
#include "wire/errors.hpp"

using json = nlohmann::json;

namespace asap::wire {

std::string error_message_for_code(int code) {
    switch (code) {
        case PARSE_ERROR:      return "Parse error";
        case INVALID_REQUEST:  return "Invalid request";
        case METHOD_NOT_FOUND: return "Method not found";
        case INVALID_PARAMS:   return "Invalid params";
        case INTERNAL_ERROR:   return "Internal error";
        case CIRCUIT_OPEN_ERROR:               return "Circuit open";
        case THREAD_POOL_EXHAUSTED_ERROR:      return "Service temporarily unavailable";
        case MANIFEST_VALIDATION_FAILED_ERROR: return "Manifest validation failed";
        default: return "Unknown error";
    }
}

// ============================================================================
// Wrappers
// ============================================================================

JsonRpcError JsonRpcError::from_code(int code, std::optional<json> data) {
    JsonRpcError e;
    e.code = code;
    e.message = error_message_for_code(code);
    e.data = std::move(data);
    return e;
}

JsonRpcError JsonRpcError::from_json(const json& j) {
    JsonRpcError e;
    if (!j.is_object()) {
        e.code = INTERNAL_ERROR;
        e.message = "Malformed error object";
        return e;
    }
    e.code = j.contains("code") && j["code"].is_number_integer()
        ? j["code"].get<int>() : INTERNAL_ERROR;
    e.message = j.contains("message") && j["message"].is_string()
        ? j["message"].get<std::string>() : error_message_for_code(e.code);
    if (j.contains("data") && !j["data"].is_null()) {
        e.data = j["data"];
    }
    return e;
}

json JsonRpcError::to_json() const {
    json j;
    j["code"] = code;
    j["message"] = message;
    if (data) {
        j["data"] = *data;
    }
    return j;
}

std::optional<std::string> JsonRpcError::kind() const {
    if (data && data->is_object() && data->contains("kind") && (*data)["kind"].is_string()) {
        return (*data)["kind"].get<std::string>();
    }
    return std::nullopt;
}

json JsonRpcRequest::to_json() const {
    return {{"jsonrpc", JSONRPC_VERSION}, {"method", method}, {"params", params}, {"id", id}};
}

json JsonRpcResponse::to_json() const {
    return {{"jsonrpc", JSONRPC_VERSION}, {"result", result}, {"id", id}};
}

json JsonRpcErrorResponse::to_json() const {
    return {{"jsonrpc", JSONRPC_VERSION}, {"error", error.to_json()}, {"id", id}};
}

// ============================================================================
// asap.send
// ============================================================================

JsonRpcRequest make_send_request(const Envelope& envelope,
                                 const std::string& idempotency_key,
                                 const std::string& request_id) {
    JsonRpcRequest req;
    req.method = ASAP_METHOD;
    req.params = {{"envelope", envelope.to_json()}, {"idempotency_key", idempotency_key}};
    req.id = request_id;
    return req;
}

JsonRpcResponse make_send_response(const Envelope& envelope, const json& id) {
    JsonRpcResponse resp;
    resp.result = {{"envelope", envelope.to_json()}};
    resp.id = id;
    return resp;
}

std::variant<SendCall, JsonRpcErrorResponse> parse_send_request(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return JsonRpcErrorResponse{
            JsonRpcError::from_code(PARSE_ERROR, json{{"error", "Invalid JSON"}}), nullptr};
    }

    if (!j.is_object()) {
        return JsonRpcErrorResponse{
            JsonRpcError::from_code(INVALID_REQUEST,
                json{{"error", "Request must be a JSON object"}}), nullptr};
    }

    // Echo the id back whenever it is well-formed
    json id = nullptr;
    std::vector<std::string> problems;
    if (!j.contains("id")) {
        problems.push_back("id: is required");
    } else if (j["id"].is_string() || j["id"].is_number_integer()) {
        id = j["id"];
    } else {
        problems.push_back("id: must be a string or integer");
    }

    if (!j.contains("jsonrpc") || j["jsonrpc"] != JSONRPC_VERSION) {
        problems.push_back("jsonrpc: must be \"2.0\"");
    }
    if (!j.contains("method") || !j["method"].is_string()) {
        problems.push_back("method: is required and must be a string");
    }
    if (!j.contains("params") || !j["params"].is_object()) {
        problems.push_back("params: is required and must be an object");
    }

    if (!problems.empty()) {
        return JsonRpcErrorResponse{
            JsonRpcError::from_code(INVALID_REQUEST,
                json{{"error", "Invalid JSON-RPC request"}, {"validation_errors", problems}}),
            id};
    }

    std::string method = j["method"].get<std::string>();
    if (method != ASAP_METHOD) {
        return JsonRpcErrorResponse{
            JsonRpcError::from_code(METHOD_NOT_FOUND, json{{"method", method}}), id};
    }

    const json& params = j["params"];
    if (!params.contains("envelope") || params["envelope"].is_null()) {
        return JsonRpcErrorResponse{
            JsonRpcError::from_code(INVALID_PARAMS,
                json{{"error", "Missing 'envelope' in params"},
                     {"kind", error_kind_to_string(ErrorKind::MALFORMED_ENVELOPE)}}),
            id};
    }

    std::optional<std::string> idempotency_key;
    if (params.contains("idempotency_key") && params["idempotency_key"].is_string()) {
        idempotency_key = params["idempotency_key"].get<std::string>();
    }

    try {
        Envelope env = Envelope::from_json(params["envelope"]);
        return SendCall{std::move(env), std::move(idempotency_key), id};
    } catch (const ValidationError& e) {
        return JsonRpcErrorResponse{
            JsonRpcError::from_code(INVALID_PARAMS,
                json{{"error", "Invalid envelope"},
                     {"validation_errors", e.reasons()},
                     {"kind", error_kind_to_string(e.kind())}}),
            id};
    } catch (const MalformedEnvelopeError& e) {
        return JsonRpcErrorResponse{
            JsonRpcError::from_code(INVALID_PARAMS,
                json{{"error", e.what()},
                     {"kind", error_kind_to_string(e.kind())}}),
            id};
    }
}

JsonRpcError error_from_exception(const Error& err) {
    int code = INTERNAL_ERROR;
    switch (err.kind()) {
        case ErrorKind::VALIDATION_FAILED:
        case ErrorKind::MALFORMED_ENVELOPE:
            code = INVALID_PARAMS;
            break;
        case ErrorKind::HANDLER_NOT_FOUND:
            code = METHOD_NOT_FOUND;
            break;
        case ErrorKind::THREAD_POOL_EXHAUSTED:
            code = THREAD_POOL_EXHAUSTED_ERROR;
            break;
        case ErrorKind::CIRCUIT_OPEN:
            code = CIRCUIT_OPEN_ERROR;
            break;
        case ErrorKind::MANIFEST_VALIDATION_FAILED:
            code = MANIFEST_VALIDATION_FAILED_ERROR;
            break;
        default:
            code = INTERNAL_ERROR;
            break;
    }

    json data = err.details().is_object() ? err.details() : json::object();
    data["error"] = err.what();
    data["kind"] = error_kind_to_string(err.kind());
    return JsonRpcError::from_code(code, data);
}

Envelope unwrap_send_response(const json& body) {
    if (!body.is_object()) {
        throw RemoteError(INTERNAL_ERROR, "Response is not a JSON object");
    }

    if (body.contains("error") && !body["error"].is_null()) {
        JsonRpcError err = JsonRpcError::from_json(body["error"]);
        throw RemoteError(err.code, err.message, err.data ? *err.data : json());
    }

    if (!body.contains("result") || !body["result"].is_object() ||
        !body["result"].contains("envelope")) {
        throw RemoteError(INTERNAL_ERROR, "Missing envelope in response");
    }

    try {
        return Envelope::from_json(body["result"]["envelope"]);
    } catch (const Error& e) {
        throw RemoteError(INVALID_PARAMS,
                          std::string("Invalid envelope in response: ") + e.what(),
                          e.details());
    }
}

} // namespace asap::wire
