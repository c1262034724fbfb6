#include <gtest/gtest.h>
#include "transport/handler_registry.hpp"
#include "wire/task.hpp"
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <atomic>
#include <future>
#include <thread>

using namespace asap::transport;
using namespace asap::wire;
using json = nlohmann::json;

namespace {

Envelope make_envelope(const std::string& payload_type, json payload = json::object()) {
    EnvelopeFields f;
    f.sender = "urn:asap:agent:client";
    f.recipient = "urn:asap:agent:echo";
    f.payload_type = payload_type;
    f.payload = std::move(payload);
    return Envelope(f);
}

Envelope task_request() {
    return make_envelope("task.request",
        json{{"conversation_id", "c1"}, {"skill_id", "echo"}, {"input", {{"msg", "hello"}}}});
}

std::shared_ptr<const Manifest> echo_manifest() {
    auto m = std::make_shared<Manifest>();
    m->id = "urn:asap:agent:echo";
    m->name = "Echo";
    m->version = "1.0.0";
    m->description = "Echo agent";
    m->endpoints.asap = "http://localhost/asap";
    return m;
}

HandlerFn reply_with(const std::string& tag) {
    return [tag](const Envelope& env, const HandlerContext&) {
        EnvelopeFields f;
        f.sender = env.recipient();
        f.recipient = env.sender();
        f.payload_type = "message.ack";
        f.payload = json{{"handled_by", tag}};
        return Envelope(f);
    };
}

} // namespace

// ============================================================================
// Registry
// ============================================================================

TEST(HandlerRegistryTest, RegisterAndFind) {
    HandlerRegistry registry;
    EXPECT_FALSE(registry.has_handler("task.request"));

    registry.register_handler("task.request", reply_with("a"));
    EXPECT_TRUE(registry.has_handler("task.request"));
    EXPECT_TRUE(registry.has_handler("TaskRequest"));
    EXPECT_FALSE(registry.has_handler("task.cancel"));
}

TEST(HandlerRegistryTest, LastRegistrationWins) {
    HandlerRegistry registry;
    registry.register_handler("task.request", reply_with("first"));
    registry.register_handler("task_request", reply_with("second"), HandlerMode::INLINE);

    auto handler = registry.find("task.request");
    ASSERT_TRUE(handler.has_value());
    EXPECT_EQ(handler->payload_type, "task_request");
    EXPECT_EQ(handler->mode, HandlerMode::INLINE);
    EXPECT_EQ(registry.list_handlers().size(), 1u);
}

TEST(HandlerRegistryTest, CustomKindsUseExactString) {
    HandlerRegistry registry;
    registry.register_handler("acme.audit", reply_with("audit"));
    EXPECT_TRUE(registry.has_handler("acme.audit"));
    EXPECT_FALSE(registry.has_handler("acme_audit"));
}

TEST(HandlerRegistryTest, ListIsSorted) {
    HandlerRegistry registry;
    registry.register_handler("task.request", reply_with("a"));
    registry.register_handler("acme.zeta", reply_with("z"));
    registry.register_handler("acme.alpha", reply_with("x"));
    EXPECT_EQ(registry.list_handlers(),
              (std::vector<std::string>{"acme.alpha", "acme.zeta", "task.request"}));
}

TEST(HandlerRegistryTest, RejectsEmptyRegistration) {
    HandlerRegistry registry;
    EXPECT_THROW(registry.register_handler("", reply_with("a")), std::invalid_argument);
    EXPECT_THROW(registry.register_handler("task.request", HandlerFn{}), std::invalid_argument);
}

// ============================================================================
// Dispatcher
// ============================================================================

TEST(DispatcherTest, MissingHandlerIsReturnedNotThrown) {
    HandlerRegistry registry;
    Dispatcher dispatcher(registry, nullptr);

    auto result = dispatcher.dispatch(make_envelope("task.cancel"), HandlerContext{});
    ASSERT_TRUE(std::holds_alternative<HandlerNotFoundError>(result));
    EXPECT_EQ(std::get<HandlerNotFoundError>(result).payload_type(), "task.cancel");
}

TEST(DispatcherTest, RunsBlockingHandlersOnExecutor) {
    HandlerRegistry registry;
    std::thread::id handler_thread;
    registry.register_handler("task.request",
        [&handler_thread](const Envelope& env, const HandlerContext& ctx) {
            handler_thread = std::this_thread::get_id();
            return make_echo_handler()(env, ctx);
        });

    BoundedExecutor executor(2);
    Dispatcher dispatcher(registry, &executor);
    auto result = dispatcher.dispatch(task_request(), HandlerContext{echo_manifest(), std::nullopt});

    ASSERT_TRUE(std::holds_alternative<Envelope>(result));
    EXPECT_NE(handler_thread, std::this_thread::get_id());
}

TEST(DispatcherTest, HandlerExceptionsPropagate) {
    HandlerRegistry registry;
    registry.register_handler("task.request", [](const Envelope&, const HandlerContext&) -> Envelope {
        throw std::runtime_error("handler blew up");
    });
    BoundedExecutor executor(1);
    Dispatcher dispatcher(registry, &executor);
    EXPECT_THROW(dispatcher.dispatch(task_request(), HandlerContext{}), std::runtime_error);
    EXPECT_EQ(executor.active_threads(), 0);
}

TEST(DispatcherTest, SaturatedExecutorRejects) {
    HandlerRegistry registry;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;
    registry.register_handler("task.request", [gate, &started](const Envelope& env,
                                                               const HandlerContext& ctx) {
        started.set_value();
        gate.wait();
        return make_echo_handler()(env, ctx);
    });

    BoundedExecutor executor(1);
    Dispatcher dispatcher(registry, &executor);

    std::promise<HandlerResult> first;
    auto first_result = first.get_future();
    HandlerContext ctx{echo_manifest(), std::nullopt};
    auto missing = dispatcher.dispatch_async(task_request(), ctx,
        [&first](HandlerResult r) { first.set_value(std::move(r)); });
    EXPECT_FALSE(missing.has_value());
    started.get_future().wait();

    EXPECT_THROW(dispatcher.dispatch_async(task_request(), ctx, [](HandlerResult) {}),
                 ThreadPoolExhaustedError);

    release.set_value();
    HandlerResult r = first_result.get();
    EXPECT_TRUE(std::holds_alternative<Envelope>(r));
}

TEST(DispatcherTest, InlineHandlersCompleteOnCallingThread) {
    HandlerRegistry registry;
    registry.register_handler("message.send", reply_with("inline"), HandlerMode::INLINE);
    BoundedExecutor executor(1);
    Dispatcher dispatcher(registry, &executor);

    bool called = false;
    std::thread::id caller = std::this_thread::get_id();
    std::thread::id completed_on;
    auto missing = dispatcher.dispatch_async(make_envelope("message.send"), HandlerContext{},
        [&](HandlerResult r) {
            called = true;
            completed_on = std::this_thread::get_id();
            EXPECT_TRUE(std::holds_alternative<Envelope>(r));
        });
    EXPECT_FALSE(missing.has_value());
    EXPECT_TRUE(called);
    EXPECT_EQ(completed_on, caller);
}

TEST(DispatcherTest, AsyncMissingHandlerSkipsCompletion) {
    HandlerRegistry registry;
    Dispatcher dispatcher(registry, nullptr);
    bool called = false;
    auto missing = dispatcher.dispatch_async(make_envelope("acme.unknown"), HandlerContext{},
        [&called](HandlerResult) { called = true; });
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->kind(), ErrorKind::HANDLER_NOT_FOUND);
    EXPECT_FALSE(called);
}

TEST(DispatcherTest, ThrowingCompletionIsLogged) {
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32);
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));

    HandlerRegistry registry;
    registry.register_handler("task.request", make_echo_handler());
    BoundedExecutor executor(1);
    Dispatcher dispatcher(registry, &executor);

    std::atomic<int> calls{0};
    dispatcher.dispatch_async(task_request(), HandlerContext{echo_manifest(), std::nullopt},
        [&calls](HandlerResult) {
            calls++;
            throw std::runtime_error("response queue unavailable");
        });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while ((calls == 0 || executor.active_threads() > 0) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    spdlog::set_default_logger(previous);

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(executor.active_threads(), 0);

    bool logged = false;
    for (const auto& line : sink->last_formatted()) {
        if (line.find("response queue unavailable") != std::string::npos) {
            logged = true;
        }
    }
    EXPECT_TRUE(logged);

    // The permit came back; the next call goes through
    std::promise<HandlerResult> next;
    auto next_result = next.get_future();
    dispatcher.dispatch_async(task_request(), HandlerContext{echo_manifest(), std::nullopt},
        [&next](HandlerResult r) { next.set_value(std::move(r)); });
    ASSERT_EQ(next_result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(std::holds_alternative<Envelope>(next_result.get()));
}

// ============================================================================
// Echo handler
// ============================================================================

TEST(EchoHandlerTest, EchoesInputAsCompletedTask) {
    auto registry = make_default_registry();
    Dispatcher dispatcher(*registry, nullptr);

    EnvelopeFields f = task_request().fields();
    f.trace_id = "trace-1";
    Envelope request(f);

    auto result = dispatcher.dispatch(request, HandlerContext{echo_manifest(), std::nullopt});
    const auto& reply = std::get<Envelope>(result);

    EXPECT_EQ(reply.payload_type(), "task.response");
    EXPECT_EQ(reply.sender(), "urn:asap:agent:echo");
    EXPECT_EQ(reply.recipient(), "urn:asap:agent:client");
    EXPECT_EQ(reply.correlation_id(), std::optional<std::string>(request.id()));
    EXPECT_EQ(reply.trace_id(), std::optional<std::string>("trace-1"));

    TaskResponse task = TaskResponse::from_json(reply.payload());
    EXPECT_EQ(task.status, TaskStatus::COMPLETED);
    EXPECT_EQ(task.task_id.rfind("task_", 0), 0u);
    EXPECT_EQ((*task.result)["echoed"], json({{"msg", "hello"}}));
}

TEST(EchoHandlerTest, RejectsMalformedTaskPayload) {
    auto registry = make_default_registry();
    Dispatcher dispatcher(*registry, nullptr);
    EXPECT_THROW(dispatcher.dispatch(make_envelope("task.request", json{{"nope", 1}}),
                                     HandlerContext{}),
                 ValidationError);
}
