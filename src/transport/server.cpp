#include "transport/server.hpp"
#include "transport/client.hpp"
#include "wire/errors.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cmath>
#include <cstring>

using json = nlohmann::json;

namespace asap::transport {

namespace {

HttpResponse json_response(int status, const json& body) {
    HttpResponse resp;
    resp.status = status;
    resp.headers["Content-Type"] = "application/json";
    resp.body = body.dump();
    return resp;
}

HttpResponse rpc_error_response(int status, const wire::JsonRpcError& error, const json& id) {
    return json_response(status, wire::JsonRpcErrorResponse{error, id}.to_json());
}

} // namespace

AsapServer::AsapServer(wire::Manifest manifest, const HandlerRegistry& registry,
                       ServerConfig config)
    : config_(std::move(config))
    , manifest_(std::make_shared<const wire::Manifest>(std::move(manifest)))
    , executor_(std::make_unique<BoundedExecutor>(config_.effective_max_threads()))
    , dispatcher_(registry, executor_.get())
    , reactor_(std::make_unique<Reactor>())
    , socket_server_(std::make_unique<SocketServer>(
          config_.host, config_.port, config_.max_request_size,
          config_.connection_message_rate))
    , started_at_(std::chrono::steady_clock::now())
{
    manifest_body_ = manifest_->to_json().dump();
    manifest_etag_ = fmt::format("\"{:016x}\"", std::hash<std::string>{}(manifest_body_));
}

AsapServer::~AsapServer() {
    // Workers may still post completions that reference this server
    executor_->shutdown();
    socket_server_->stop();
    if (wake_fd_ >= 0) {
        close(wake_fd_);
        wake_fd_ = -1;
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool AsapServer::init() {
    spdlog::info("Initializing ASAP server for {}...", manifest_->id);

    if (!reactor_->init()) {
        spdlog::error("Failed to initialize reactor");
        return false;
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        spdlog::error("Failed to create eventfd: {}", strerror(errno));
        return false;
    }
    reactor_->add(wake_fd_, EPOLLIN, [this](int, uint32_t) {
        on_wakeup();
    });

    socket_server_->set_handler([this](uint64_t connection_id, HttpRequest request) {
        bool close_after = !request.keep_alive();
        handle_request(request, [this, connection_id, close_after](HttpResponse response) {
            post_completion(Completion{connection_id, std::move(response), close_after});
        });
    });

    if (!socket_server_->init()) {
        spdlog::error("Failed to initialize socket server");
        return false;
    }

    reactor_->add(socket_server_->get_server_fd(), EPOLLIN, [this](int fd, uint32_t events) {
        on_server_event(fd, events);
    });

    spdlog::info("ASAP server initialized (max_threads={}, max_request_size={}, rate={}/s)",
        executor_->max_threads(), config_.max_request_size,
        config_.connection_message_rate > 0 ? fmt::format("{}", config_.connection_message_rate)
                                            : std::string("unlimited"));
    return true;
}

void AsapServer::run() {
    running_ = true;
    spdlog::info("ASAP agent {} v{} running", manifest_->name, manifest_->version);
    spdlog::info("Listening on: {}:{}", config_.host, port());

    while (!stop_requested_) {
        int n = reactor_->poll(100);
        if (n < 0) {
            spdlog::error("Reactor error, exiting");
            break;
        }
    }

    running_ = false;
    spdlog::info("ASAP server shutting down...");
    socket_server_->stop();
    spdlog::info("ASAP server stopped");
}

void AsapServer::shutdown() {
    stop_requested_ = true;
    wake();
}

uint16_t AsapServer::port() const {
    return socket_server_->bound_port();
}

void AsapServer::add_before_dispatch_hook(BeforeDispatchHook hook) {
    before_hooks_.push_back(std::move(hook));
}

void AsapServer::add_after_dispatch_hook(AfterDispatchHook hook) {
    after_hooks_.push_back(std::move(hook));
}

// ============================================================================
// Routing
// ============================================================================

void AsapServer::handle_request(const HttpRequest& request, Responder respond) {
    std::string path = request.path();

    if (path == ASAP_PATH) {
        if (request.method != "POST") {
            HttpResponse resp = json_response(405, json{{"error", "Method not allowed"}});
            resp.headers["Allow"] = "POST";
            respond(std::move(resp));
            return;
        }
        handle_asap(request, std::move(respond));
        return;
    }

    if (path == MANIFEST_PATH) {
        if (request.method != "GET" && request.method != "HEAD") {
            HttpResponse resp = json_response(405, json{{"error", "Method not allowed"}});
            resp.headers["Allow"] = "GET, HEAD";
            respond(std::move(resp));
            return;
        }
        HttpResponse resp = manifest_response(request);
        if (request.method == "HEAD") {
            resp.body.clear();
        }
        respond(std::move(resp));
        return;
    }

    if (path == HEALTH_PATH) {
        if (request.method != "GET") {
            HttpResponse resp = json_response(405, json{{"error", "Method not allowed"}});
            resp.headers["Allow"] = "GET";
            respond(std::move(resp));
            return;
        }
        respond(health_response());
        return;
    }

    respond(json_response(404, json{{"error", "Not found"}, {"path", path}}));
}

HttpResponse AsapServer::manifest_response(const HttpRequest& request) const {
    HttpResponse resp;
    resp.headers["ETag"] = manifest_etag_;
    resp.headers["Cache-Control"] = fmt::format("public, max-age={}", config_.manifest_max_age);

    if (auto inm = request.header("If-None-Match")) {
        if (*inm == manifest_etag_ || *inm == "*") {
            resp.status = 304;
            return resp;
        }
    }

    resp.status = 200;
    resp.headers["Content-Type"] = "application/json";
    resp.body = manifest_body_;
    return resp;
}

HttpResponse AsapServer::health_response() const {
    double uptime = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started_at_).count();
    json body = {
        {"status", "healthy"},
        {"agent_id", manifest_->id},
        {"version", manifest_->version},
        {"asap_version", manifest_->capabilities.asap_version},
        {"uptime_seconds", std::round(uptime * 100.0) / 100.0},
        {"load", {
            {"active_threads", executor_->active_threads()},
            {"max_threads", executor_->max_threads()}
        }}
    };
    return json_response(200, body);
}

// ============================================================================
// asap.send
// ============================================================================

void AsapServer::handle_asap(const HttpRequest& request, Responder respond) {
    auto parsed = wire::parse_send_request(request.body);
    if (auto* rejected = std::get_if<wire::JsonRpcErrorResponse>(&parsed)) {
        spdlog::warn("Rejected asap.send: {} ({})", rejected->error.message,
            rejected->error.data ? rejected->error.data->dump() : "");
        respond(json_response(200, rejected->to_json()));
        return;
    }

    auto& call = std::get<wire::SendCall>(parsed);
    spdlog::debug("asap.send {} {} from {}",
        call.envelope.payload_type(), call.envelope.id(), call.envelope.sender());

    for (const auto& hook : before_hooks_) {
        std::optional<wire::JsonRpcError> rejection;
        try {
            rejection = hook(call.envelope, request);
        } catch (const std::exception& e) {
            spdlog::error("Before-dispatch hook failed: {}", e.what());
            rejection = wire::JsonRpcError::from_code(wire::INTERNAL_ERROR,
                                                      json{{"error", e.what()}});
        }
        if (rejection) {
            respond(rpc_error_response(200, *rejection, call.id));
            return;
        }
    }

    HandlerContext ctx{manifest_, call.idempotency_key};
    try {
        auto missing = dispatcher_.dispatch_async(call.envelope, std::move(ctx),
            [this, envelope = call.envelope, id = call.id, respond](HandlerResult result) {
                finish_call(envelope, id, std::move(result), respond);
            });
        if (missing) {
            spdlog::warn("{}", missing->what());
            respond(rpc_error_response(200, wire::error_from_exception(*missing), call.id));
        }
    } catch (const wire::ThreadPoolExhaustedError& e) {
        HttpResponse resp = rpc_error_response(503, wire::error_from_exception(e), call.id);
        resp.headers["Retry-After"] = "1";
        respond(std::move(resp));
    } catch (const std::runtime_error& e) {
        // Executor already shut down
        spdlog::error("Dispatch failed: {}", e.what());
        HttpResponse resp = rpc_error_response(503,
            wire::JsonRpcError::from_code(wire::INTERNAL_ERROR, json{{"error", e.what()}}),
            call.id);
        resp.headers["Retry-After"] = "1";
        respond(std::move(resp));
    }
}

void AsapServer::finish_call(const wire::Envelope& request, const json& rpc_id,
                             HandlerResult result, const Responder& respond) const {
    if (auto* reply = std::get_if<wire::Envelope>(&result)) {
        for (const auto& hook : after_hooks_) {
            try {
                hook(request, *reply);
            } catch (const std::exception& e) {
                spdlog::error("After-dispatch hook failed: {}", e.what());
            }
        }
        respond(json_response(200, wire::make_send_response(*reply, rpc_id).to_json()));
        return;
    }

    wire::JsonRpcError error;
    try {
        std::rethrow_exception(std::get<std::exception_ptr>(result));
    } catch (const wire::Error& e) {
        spdlog::warn("Handler for {} failed: {}", request.payload_type(), e.what());
        error = wire::error_from_exception(e);
    } catch (const std::exception& e) {
        spdlog::error("Handler for {} threw: {}", request.payload_type(), e.what());
        error = wire::JsonRpcError::from_code(wire::INTERNAL_ERROR,
            json{{"error", e.what()}, {"payload_type", request.payload_type()}});
    } catch (...) {
        spdlog::error("Handler for {} threw a non-standard exception", request.payload_type());
        error = wire::JsonRpcError::from_code(wire::INTERNAL_ERROR,
            json{{"error", "unknown exception"}, {"payload_type", request.payload_type()}});
    }
    respond(rpc_error_response(200, error, rpc_id));
}

// ============================================================================
// Event loop
// ============================================================================

void AsapServer::on_server_event(int fd, uint32_t events) {
    (void)fd;
    if (events & EPOLLIN) {
        // Accept new connections
        while (true) {
            int client_fd = socket_server_->accept_connection();
            if (client_fd < 0) {
                break;
            }

            reactor_->add(client_fd, EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR,
                [this](int cfd, uint32_t ev) {
                    on_client_event(cfd, ev);
                });
        }
    }
}

void AsapServer::on_client_event(int fd, uint32_t events) {
    // Handle errors and hangups
    if (events & (EPOLLHUP | EPOLLERR)) {
        reactor_->remove(fd);
        socket_server_->remove_client(fd);
        return;
    }

    // Handle readable
    if (events & (EPOLLIN | EPOLLRDHUP)) {
        if (!socket_server_->handle_client(fd)) {
            reactor_->remove(fd);
            socket_server_->remove_client(fd);
            return;
        }
    }

    // Handle writable
    if (events & EPOLLOUT) {
        if (!socket_server_->flush_client(fd)) {
            reactor_->remove(fd);
            socket_server_->remove_client(fd);
            return;
        }
    }

    update_client_events(fd);
}

void AsapServer::update_client_events(int fd) {
    if (socket_server_->client_should_close(fd)) {
        reactor_->remove(fd);
        socket_server_->remove_client(fd);
        return;
    }

    uint32_t events = EPOLLHUP | EPOLLERR;
    if (socket_server_->client_wants_read(fd)) {
        events |= EPOLLIN | EPOLLRDHUP;
    }
    if (socket_server_->client_wants_write(fd)) {
        events |= EPOLLOUT;
    }
    reactor_->modify(fd, events);
}

void AsapServer::wake() {
    if (wake_fd_ >= 0) {
        uint64_t one = 1;
        ssize_t n = write(wake_fd_, &one, sizeof(one));
        (void)n;   // counter saturation still leaves the fd readable
    }
}

void AsapServer::post_completion(Completion completion) {
    {
        std::lock_guard<std::mutex> lock(completions_mutex_);
        completions_.push_back(std::move(completion));
    }
    wake();
}

void AsapServer::on_wakeup() {
    uint64_t count = 0;
    while (read(wake_fd_, &count, sizeof(count)) > 0) {
    }

    std::deque<Completion> ready;
    {
        std::lock_guard<std::mutex> lock(completions_mutex_);
        ready.swap(completions_);
    }

    for (auto& c : ready) {
        int fd = socket_server_->queue_response(c.connection_id, c.response, c.close_after);
        if (fd < 0) {
            spdlog::debug("Dropping response for closed connection {}", c.connection_id);
            continue;
        }
        if (!socket_server_->flush_client(fd)) {
            reactor_->remove(fd);
            socket_server_->remove_client(fd);
            continue;
        }
        update_client_events(fd);
    }
}

} // namespace asap::transport
