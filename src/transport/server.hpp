/**
 * ASAP Server
 *
 * Serves one agent over HTTP:
 * - POST /asap                          JSON-RPC asap.send
 * - GET  /.well-known/asap/manifest.json  manifest with ETag / Cache-Control
 * - GET  /.well-known/asap/health         liveness
 *
 * Sockets are driven by a single epoll loop. Blocking handlers run on the
 * BoundedExecutor; their results are handed back to the loop through a
 * completion queue and an eventfd wakeup.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "transport/bounded_executor.hpp"
#include "transport/config.hpp"
#include "transport/handler_registry.hpp"
#include "transport/http.hpp"
#include "transport/reactor.hpp"
#include "transport/socket_server.hpp"
#include "wire/jsonrpc.hpp"
#include "wire/manifest.hpp"

namespace asap::transport {

// Runs before dispatch; returning an error rejects the call with it
using BeforeDispatchHook = std::function<std::optional<wire::JsonRpcError>(
    const wire::Envelope& envelope, const HttpRequest& request)>;

// Observes each successful exchange
using AfterDispatchHook = std::function<void(
    const wire::Envelope& request, const wire::Envelope& response)>;

// Delivers an HTTP response; callable from any thread, exactly once
using Responder = std::function<void(HttpResponse)>;

class AsapServer {
public:
    AsapServer(wire::Manifest manifest, const HandlerRegistry& registry,
               ServerConfig config = {});
    ~AsapServer();

    // Non-copyable
    AsapServer(const AsapServer&) = delete;
    AsapServer& operator=(const AsapServer&) = delete;

    // Bind the listener and set up the event loop
    bool init();

    // Serve until shutdown() (blocks)
    void run();

    // Safe from signal handlers and other threads
    void shutdown();

    bool is_running() const { return running_; }
    uint16_t port() const;

    void add_before_dispatch_hook(BeforeDispatchHook hook);
    void add_after_dispatch_hook(AfterDispatchHook hook);

    // Route one request. respond may run on a worker thread.
    void handle_request(const HttpRequest& request, Responder respond);

    const ServerConfig& config() const { return config_; }
    const wire::Manifest& manifest() const { return *manifest_; }
    const std::string& manifest_etag() const { return manifest_etag_; }
    BoundedExecutor& executor() { return *executor_; }

private:
    struct Completion {
        uint64_t connection_id;
        HttpResponse response;
        bool close_after;
    };

    void handle_asap(const HttpRequest& request, Responder respond);
    void finish_call(const wire::Envelope& request, const nlohmann::json& rpc_id,
                     HandlerResult result, const Responder& respond) const;
    HttpResponse manifest_response(const HttpRequest& request) const;
    HttpResponse health_response() const;

    void on_server_event(int fd, uint32_t events);
    void on_client_event(int fd, uint32_t events);
    void on_wakeup();
    void update_client_events(int fd);
    void post_completion(Completion completion);
    void wake();

    ServerConfig config_;
    std::shared_ptr<const wire::Manifest> manifest_;
    std::string manifest_body_;
    std::string manifest_etag_;
    std::unique_ptr<BoundedExecutor> executor_;
    Dispatcher dispatcher_;
    std::unique_ptr<Reactor> reactor_;
    std::unique_ptr<SocketServer> socket_server_;
    std::vector<BeforeDispatchHook> before_hooks_;
    std::vector<AfterDispatchHook> after_hooks_;
    std::chrono::steady_clock::time_point started_at_;

    int wake_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex completions_mutex_;
    std::deque<Completion> completions_;
};

} // namespace asap::transport
