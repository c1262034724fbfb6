#include <gtest/gtest.h>
#include "wire/errors.hpp"
#include "wire/jsonrpc.hpp"

using namespace asap::wire;
using json = nlohmann::json;

namespace {

Envelope make_request() {
    EnvelopeFields f;
    f.sender = "urn:asap:agent:client";
    f.recipient = "urn:asap:agent:echo";
    f.payload_type = "task.request";
    f.payload = {{"conversation_id", "c1"}, {"skill_id", "echo"}, {"input", {{"msg", "hi"}}}};
    return Envelope(f);
}

const JsonRpcErrorResponse& as_error(const std::variant<SendCall, JsonRpcErrorResponse>& v) {
    return std::get<JsonRpcErrorResponse>(v);
}

} // namespace

TEST(JsonRpcTest, SendRequestShape) {
    Envelope env = make_request();
    json j = make_send_request(env, "key-1", "req-1").to_json();
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "asap.send");
    EXPECT_EQ(j["id"], "req-1");
    EXPECT_EQ(j["params"]["idempotency_key"], "key-1");
    EXPECT_EQ(j["params"]["envelope"]["id"], env.id());
}

TEST(JsonRpcTest, ParsesValidCall) {
    Envelope env = make_request();
    std::string body = make_send_request(env, "key-1", "req-7").to_json().dump();

    auto parsed = parse_send_request(body);
    ASSERT_TRUE(std::holds_alternative<SendCall>(parsed));
    const auto& call = std::get<SendCall>(parsed);
    EXPECT_EQ(call.envelope, env);
    EXPECT_EQ(call.idempotency_key, std::optional<std::string>("key-1"));
    EXPECT_EQ(call.id, "req-7");
}

TEST(JsonRpcTest, InvalidJsonIsParseError) {
    auto parsed = parse_send_request("{not json");
    const auto& err = as_error(parsed);
    EXPECT_EQ(err.error.code, PARSE_ERROR);
    EXPECT_TRUE(err.id.is_null());
}

TEST(JsonRpcTest, BadStructureIsInvalidRequest) {
    auto parsed = parse_send_request(R"({"jsonrpc":"1.0","method":"asap.send","params":{},"id":5})");
    const auto& err = as_error(parsed);
    EXPECT_EQ(err.error.code, INVALID_REQUEST);
    EXPECT_EQ(err.id, 5);
    ASSERT_TRUE(err.error.data.has_value());
    EXPECT_TRUE(err.error.data->contains("validation_errors"));

    EXPECT_EQ(as_error(parse_send_request("[1,2]")).error.code, INVALID_REQUEST);
}

TEST(JsonRpcTest, UnknownMethodIsMethodNotFound) {
    auto parsed = parse_send_request(R"({"jsonrpc":"2.0","method":"asap.other","params":{},"id":"a"})");
    const auto& err = as_error(parsed);
    EXPECT_EQ(err.error.code, METHOD_NOT_FOUND);
    EXPECT_EQ((*err.error.data)["method"], "asap.other");
    EXPECT_EQ(err.id, "a");
}

TEST(JsonRpcTest, MissingEnvelopeIsInvalidParams) {
    auto parsed = parse_send_request(R"({"jsonrpc":"2.0","method":"asap.send","params":{},"id":"a"})");
    const auto& err = as_error(parsed);
    EXPECT_EQ(err.error.code, INVALID_PARAMS);
    EXPECT_EQ((*err.error.data)["error"], "Missing 'envelope' in params");
    EXPECT_EQ(err.error.kind(), std::optional<std::string>("malformed_envelope"));
}

TEST(JsonRpcTest, InvalidEnvelopeListsReasons) {
    json body = {
        {"jsonrpc", "2.0"}, {"method", "asap.send"}, {"id", "a"},
        {"params", {{"envelope", {{"asap_version", "0.1"}, {"sender", "bad"},
                                   {"recipient", "urn:asap:agent:echo"},
                                   {"payload_type", "task.request"}, {"payload", json::object()}}}}}
    };
    auto parsed = parse_send_request(body.dump());
    const auto& err = as_error(parsed);
    EXPECT_EQ(err.error.code, INVALID_PARAMS);
    EXPECT_EQ(err.id, json("a"));
    ASSERT_TRUE(err.error.data.has_value());
    const json& data = *err.error.data;
    EXPECT_EQ(data.at("error"), "Invalid envelope");
    ASSERT_TRUE(data.at("validation_errors").is_array());
    EXPECT_FALSE(data.at("validation_errors").empty());
    EXPECT_EQ(err.error.kind(), std::optional<std::string>("validation_failed"));
}

TEST(JsonRpcTest, ErrorFromExceptionCodes) {
    EXPECT_EQ(error_from_exception(ValidationError({"x"})).code, INVALID_PARAMS);
    EXPECT_EQ(error_from_exception(HandlerNotFoundError("foo.bar")).code, METHOD_NOT_FOUND);
    EXPECT_EQ(error_from_exception(ThreadPoolExhaustedError(2, 2)).code, THREAD_POOL_EXHAUSTED_ERROR);
    EXPECT_EQ(error_from_exception(CircuitOpenError("http://x", 5)).code, CIRCUIT_OPEN_ERROR);
    EXPECT_EQ(error_from_exception(ManifestValidationError({"x"})).code,
              MANIFEST_VALIDATION_FAILED_ERROR);
    EXPECT_EQ(error_from_exception(TimeoutError("slow", 1.0)).code, INTERNAL_ERROR);

    auto e = error_from_exception(HandlerNotFoundError("foo.bar"));
    EXPECT_EQ((*e.data)["payload_type"], "foo.bar");
    EXPECT_EQ(e.kind(), std::optional<std::string>("handler_not_found"));
}

TEST(JsonRpcTest, UnwrapResponse) {
    Envelope env = make_request();
    json ok = make_send_response(env, "req-1").to_json();
    EXPECT_EQ(unwrap_send_response(ok), env);

    json failed = JsonRpcErrorResponse{
        JsonRpcError::from_code(THREAD_POOL_EXHAUSTED_ERROR, json{{"kind", "thread_pool_exhausted"}}),
        "req-1"}.to_json();
    try {
        unwrap_send_response(failed);
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.rpc_code(), THREAD_POOL_EXHAUSTED_ERROR);
        EXPECT_TRUE(e.retryable());
    }

    try {
        unwrap_send_response(json{{"jsonrpc", "2.0"}, {"result", json::object()}, {"id", 1}});
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.rpc_code(), INTERNAL_ERROR);
    }
}
