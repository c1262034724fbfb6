#include <gtest/gtest.h>
#include "transport/client.hpp"
#include "transport/server.hpp"
#include "wire/errors.hpp"
#include "wire/jsonrpc.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <future>
#include <thread>

using namespace asap::transport;
using namespace asap::wire;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

Manifest echo_manifest() {
    Manifest m;
    m.id = "urn:asap:agent:echo";
    m.name = "Echo";
    m.version = "1.0.0";
    m.description = "Echo agent";
    m.capabilities.skills.push_back({"echo", "Echo input", std::nullopt, std::nullopt});
    m.endpoints.asap = "http://127.0.0.1/asap";
    return m;
}

Envelope make_envelope(const std::string& payload_type, json payload) {
    EnvelopeFields f;
    f.sender = "urn:asap:agent:client";
    f.recipient = "urn:asap:agent:echo";
    f.payload_type = payload_type;
    f.payload = std::move(payload);
    return Envelope(f);
}

Envelope task_request() {
    return make_envelope("task.request",
        json{{"conversation_id", "c1"}, {"skill_id", "echo"}, {"input", {{"msg", "ping"}}}});
}

HttpRequest asap_post(const std::string& body) {
    HttpRequest req;
    req.method = "POST";
    req.target = ASAP_PATH;
    req.headers["Content-Type"] = "application/json";
    req.body = body;
    return req;
}

HttpRequest asap_post(const Envelope& env, const std::string& id = "req-1") {
    return asap_post(make_send_request(env, "idem-1", id).to_json().dump());
}

HttpRequest get(const std::string& target) {
    HttpRequest req;
    req.method = "GET";
    req.target = target;
    return req;
}

// Routes one request and waits for the (possibly off-thread) response
HttpResponse call(AsapServer& server, const HttpRequest& request) {
    auto promise = std::make_shared<std::promise<HttpResponse>>();
    auto future = promise->get_future();
    server.handle_request(request, [promise](HttpResponse resp) {
        promise->set_value(std::move(resp));
    });
    if (future.wait_for(5s) != std::future_status::ready) {
        ADD_FAILURE() << "no response for " << request.method << " " << request.target;
        return HttpResponse{};
    }
    return future.get();
}

// Writes raw bytes to the server (optionally closing the write side after)
// and reads until it closes the connection
std::string raw_exchange(uint16_t port, const std::string& bytes, bool half_close = false) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        ADD_FAILURE() << "socket() failed";
        return "";
    }
    struct timeval tv{5, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        ADD_FAILURE() << "connect() failed";
        close(fd);
        return "";
    }

    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::send(fd, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += static_cast<size_t>(n);
    }
    if (half_close) {
        shutdown(fd, SHUT_WR);
    }

    std::string out;
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    close(fd);
    return out;
}

class AsapServerTest : public ::testing::Test {
protected:
    AsapServerTest() : registry(make_default_registry()) {
        config.host = "127.0.0.1";
        config.port = 0;
        config.max_threads = 2;
    }

    std::unique_ptr<HandlerRegistry> registry;
    ServerConfig config;
};

} // namespace

// ============================================================================
// Routing
// ============================================================================

TEST_F(AsapServerTest, ServesManifestWithCachingHeaders) {
    AsapServer server(echo_manifest(), *registry, config);
    HttpResponse resp = call(server, get(MANIFEST_PATH));

    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.header("Cache-Control"), std::optional<std::string>("public, max-age=300"));
    EXPECT_EQ(resp.header("ETag"), std::optional<std::string>(server.manifest_etag()));
    EXPECT_EQ(Manifest::from_json(json::parse(resp.body)).id, "urn:asap:agent:echo");

    HttpRequest conditional = get(MANIFEST_PATH);
    conditional.headers["If-None-Match"] = server.manifest_etag();
    HttpResponse not_modified = call(server, conditional);
    EXPECT_EQ(not_modified.status, 304);
    EXPECT_TRUE(not_modified.body.empty());
}

TEST_F(AsapServerTest, ServesHealth) {
    AsapServer server(echo_manifest(), *registry, config);
    HttpResponse resp = call(server, get(HEALTH_PATH));
    ASSERT_EQ(resp.status, 200);

    json body = json::parse(resp.body);
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["agent_id"], "urn:asap:agent:echo");
    EXPECT_EQ(body["load"]["max_threads"], 2);
    EXPECT_GE(body["uptime_seconds"].get<double>(), 0.0);
}

TEST_F(AsapServerTest, UnknownRoutesAndMethods) {
    AsapServer server(echo_manifest(), *registry, config);
    EXPECT_EQ(call(server, get("/nope")).status, 404);

    HttpResponse wrong_method = call(server, get(ASAP_PATH));
    EXPECT_EQ(wrong_method.status, 405);
    EXPECT_EQ(wrong_method.header("Allow"), std::optional<std::string>("POST"));
}

// ============================================================================
// asap.send
// ============================================================================

TEST_F(AsapServerTest, EchoesTaskRequest) {
    AsapServer server(echo_manifest(), *registry, config);
    Envelope request = task_request();
    HttpResponse resp = call(server, asap_post(request, "req-42"));
    ASSERT_EQ(resp.status, 200);

    json body = json::parse(resp.body);
    EXPECT_EQ(body["id"], "req-42");
    Envelope reply = unwrap_send_response(body);
    EXPECT_EQ(reply.sender(), "urn:asap:agent:echo");
    EXPECT_EQ(reply.correlation_id(), std::optional<std::string>(request.id()));
    EXPECT_EQ(reply.payload()["result"]["echoed"], json({{"msg", "ping"}}));
}

TEST_F(AsapServerTest, InvalidJsonIsParseError) {
    AsapServer server(echo_manifest(), *registry, config);
    HttpResponse resp = call(server, asap_post("{oops"));
    EXPECT_EQ(resp.status, 200);

    json body = json::parse(resp.body);
    EXPECT_EQ(body["error"]["code"], PARSE_ERROR);
    EXPECT_TRUE(body["id"].is_null());
}

TEST_F(AsapServerTest, UnknownPayloadTypeIsMethodNotFound) {
    AsapServer server(echo_manifest(), *registry, config);
    HttpResponse resp = call(server, asap_post(make_envelope("acme.unknown", json::object()), "r-9"));

    json body = json::parse(resp.body);
    EXPECT_EQ(body["error"]["code"], METHOD_NOT_FOUND);
    EXPECT_EQ(body["error"]["data"]["kind"], "handler_not_found");
    EXPECT_EQ(body["error"]["data"]["payload_type"], "acme.unknown");
    EXPECT_EQ(body["id"], "r-9");
}

TEST_F(AsapServerTest, HandlerValidationFailureIsInvalidParams) {
    AsapServer server(echo_manifest(), *registry, config);
    HttpResponse resp = call(server, asap_post(make_envelope("task.request", json{{"x", 1}})));

    json body = json::parse(resp.body);
    EXPECT_EQ(body["error"]["code"], INVALID_PARAMS);
    EXPECT_EQ(body["error"]["data"]["kind"], "validation_failed");
}

TEST_F(AsapServerTest, HandlerCrashIsInternalError) {
    registry->register_handler("task.request", [](const Envelope&, const HandlerContext&) -> Envelope {
        throw std::runtime_error("database unavailable");
    });
    AsapServer server(echo_manifest(), *registry, config);
    HttpResponse resp = call(server, asap_post(task_request()));

    json body = json::parse(resp.body);
    EXPECT_EQ(body["error"]["code"], INTERNAL_ERROR);
    EXPECT_EQ(body["error"]["data"]["error"], "database unavailable");
    EXPECT_EQ(body["id"], "req-1");
}

TEST_F(AsapServerTest, SaturatedPoolAnswers503) {
    config.max_threads = 1;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    auto started = std::make_shared<std::promise<void>>();
    registry->register_handler("task.request",
        [gate, started](const Envelope& env, const HandlerContext& ctx) {
            started->set_value();
            gate.wait();
            return make_echo_handler()(env, ctx);
        });
    AsapServer server(echo_manifest(), *registry, config);

    auto first = std::make_shared<std::promise<HttpResponse>>();
    auto first_done = first->get_future();
    server.handle_request(asap_post(task_request()), [first](HttpResponse r) {
        first->set_value(std::move(r));
    });
    started->get_future().wait();

    HttpResponse busy = call(server, asap_post(task_request(), "req-2"));
    EXPECT_EQ(busy.status, 503);
    EXPECT_EQ(busy.header("Retry-After"), std::optional<std::string>("1"));
    json body = json::parse(busy.body);
    EXPECT_EQ(body["error"]["code"], THREAD_POOL_EXHAUSTED_ERROR);
    EXPECT_EQ(body["error"]["data"]["kind"], "thread_pool_exhausted");
    EXPECT_EQ(body["id"], "req-2");

    release.set_value();
    ASSERT_EQ(first_done.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(first_done.get().status, 200);
}

TEST_F(AsapServerTest, HooksSeeEveryCall) {
    AsapServer server(echo_manifest(), *registry, config);
    std::atomic<int> observed{0};
    server.add_after_dispatch_hook([&observed](const Envelope& req, const Envelope& resp) {
        if (resp.correlation_id() == std::optional<std::string>(req.id())) observed++;
    });
    server.add_before_dispatch_hook([](const Envelope& env, const HttpRequest&)
                                        -> std::optional<JsonRpcError> {
        if (env.sender() == "urn:asap:agent:blocked") {
            return JsonRpcError::from_code(INVALID_REQUEST, json{{"error", "sender blocked"}});
        }
        return std::nullopt;
    });

    EXPECT_EQ(call(server, asap_post(task_request())).status, 200);
    EXPECT_EQ(observed.load(), 1);

    EnvelopeFields blocked = task_request().fields();
    blocked.id.reset();
    blocked.sender = "urn:asap:agent:blocked";
    json body = json::parse(call(server, asap_post(Envelope(blocked))).body);
    EXPECT_EQ(body["error"]["code"], INVALID_REQUEST);
    EXPECT_EQ(observed.load(), 1);
}

// ============================================================================
// Over the wire
// ============================================================================

TEST_F(AsapServerTest, LoopbackRoundTrip) {
    AsapServer server(echo_manifest(), *registry, config);
    ASSERT_TRUE(server.init());
    ASSERT_NE(server.port(), 0);

    std::thread loop([&server] { server.run(); });

    std::string base = "http://127.0.0.1:" + std::to_string(server.port());
    CircuitBreakerRegistry breakers;
    ClientConfig client_config;
    client_config.timeout_seconds = 5.0;
    client_config.max_retries = 1;
    ManifestCache cache;
    AsapClient client(base, breakers, client_config, nullptr, &cache);

    Envelope request = task_request();
    Envelope reply = client.send(request);
    EXPECT_EQ(reply.correlation_id(), std::optional<std::string>(request.id()));

    // One connection per exchange
    for (int i = 0; i < 3; i++) {
        EXPECT_NO_THROW(client.send(task_request()));
    }

    auto manifest = client.discover();
    EXPECT_EQ(manifest->id, "urn:asap:agent:echo");
    EXPECT_EQ(cache.size(), 1u);

    TcpHttpTransport raw;
    HttpRequest health = get(HEALTH_PATH);
    health.headers["Host"] = "127.0.0.1";
    HttpResponse health_resp = raw.send(parse_url(base), health, 5000ms);
    EXPECT_EQ(health_resp.status, 200);

    server.shutdown();
    loop.join();
    EXPECT_FALSE(server.is_running());
}

TEST_F(AsapServerTest, ShutdownBeforeRunReturnsImmediately) {
    AsapServer server(echo_manifest(), *registry, config);
    ASSERT_TRUE(server.init());
    server.shutdown();
    server.run();
    EXPECT_FALSE(server.is_running());
}

// ============================================================================
// Connection-level limits
// ============================================================================

TEST_F(AsapServerTest, OversizedRequestIs413) {
    config.max_request_size = 64;
    AsapServer server(echo_manifest(), *registry, config);
    ASSERT_TRUE(server.init());
    std::thread loop([&server] { server.run(); });

    std::string reply = raw_exchange(server.port(),
        "POST /asap HTTP/1.1\r\nHost: 127.0.0.1\r\n"
        "Content-Type: application/json\r\nContent-Length: 1000\r\n\r\n");
    EXPECT_EQ(reply.rfind("HTTP/1.1 413", 0), 0u) << reply;

    server.shutdown();
    loop.join();
}

TEST_F(AsapServerTest, PipelinedRequestsOverRateAre429) {
    config.connection_message_rate = 0.01;
    AsapServer server(echo_manifest(), *registry, config);
    ASSERT_TRUE(server.init());
    std::thread loop([&server] { server.run(); });

    std::string reply = raw_exchange(server.port(),
        "GET /.well-known/asap/health HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n"
        "GET /.well-known/asap/health HTTP/1.1\r\nHost: 127.0.0.1\r\n"
        "Connection: close\r\n\r\n");
    EXPECT_EQ(reply.rfind("HTTP/1.1 200", 0), 0u) << reply;
    EXPECT_NE(reply.find("HTTP/1.1 429"), std::string::npos) << reply;
    EXPECT_NE(reply.find("Retry-After: "), std::string::npos) << reply;

    server.shutdown();
    loop.join();
}

TEST_F(AsapServerTest, HalfClosedClientStillGetsAnswer) {
    AsapServer server(echo_manifest(), *registry, config);
    ASSERT_TRUE(server.init());
    std::thread loop([&server] { server.run(); });

    std::string body = make_send_request(task_request(), "idem-1", "req-9").to_json().dump();
    std::string reply = raw_exchange(server.port(),
        "POST /asap HTTP/1.1\r\nHost: 127.0.0.1\r\nContent-Type: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body,
        true);
    EXPECT_EQ(reply.rfind("HTTP/1.1 200", 0), 0u) << reply;
    EXPECT_NE(reply.find("\"req-9\""), std::string::npos) << reply;
    EXPECT_NE(reply.find("task.response"), std::string::npos) << reply;

    server.shutdown();
    loop.join();
}
