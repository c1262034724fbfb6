/**
 * ASAP Handler Registry & Dispatcher
 *
 * Handlers are looked up by payload kind. Known kinds share one slot however
 * they are spelled ("task.request", "TaskRequest"); custom kinds are routed
 * by their exact string. Blocking handlers run on the BoundedExecutor so a
 * slow handler never stalls the server's event loop.
 */
#pragma once
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include "transport/bounded_executor.hpp"
#include "wire/envelope.hpp"
#include "wire/errors.hpp"
#include "wire/manifest.hpp"

namespace asap::transport {

enum class HandlerMode {
    INLINE,     // Non-blocking; runs on the dispatching thread
    BLOCKING    // May block; runs on the bounded executor
};

// What a handler gets to know about the local agent and the call
struct HandlerContext {
    std::shared_ptr<const wire::Manifest> manifest;
    std::optional<std::string> idempotency_key;
};

using HandlerFn = std::function<wire::Envelope(const wire::Envelope&, const HandlerContext&)>;

struct Handler {
    std::string payload_type;   // as registered
    HandlerFn fn;
    HandlerMode mode = HandlerMode::BLOCKING;
};

class HandlerRegistry {
public:
    HandlerRegistry() = default;

    // Non-copyable
    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;

    // Last registration for a payload type wins
    void register_handler(const std::string& payload_type, HandlerFn fn,
                          HandlerMode mode = HandlerMode::BLOCKING);

    bool has_handler(const std::string& payload_type) const;

    // Registered payload types, sorted
    std::vector<std::string> list_handlers() const;

    std::optional<Handler> find(const std::string& payload_type) const;

private:
    mutable std::mutex mutex_;
    std::map<wire::PayloadKind, Handler> known_;
    std::unordered_map<std::string, Handler> custom_;
};

// A handler's reply, or the exception it raised
using HandlerResult = std::variant<wire::Envelope, std::exception_ptr>;

class Dispatcher {
public:
    using Completion = std::function<void(HandlerResult)>;

    // executor may be null, in which case blocking handlers run inline
    Dispatcher(const HandlerRegistry& registry, BoundedExecutor* executor);

    // Runs the handler and waits for it. Missing handlers come back as a
    // HandlerNotFoundError value; handler exceptions propagate; a saturated
    // executor throws ThreadPoolExhaustedError.
    std::variant<wire::Envelope, wire::HandlerNotFoundError> dispatch(
        const wire::Envelope& envelope, const HandlerContext& ctx) const;

    // Non-blocking form for the server loop. Returns the HandlerNotFoundError
    // when nothing is registered (completion is not called). Otherwise
    // completion runs exactly once: on this thread for inline handlers, on a
    // worker thread for blocking ones. Throws ThreadPoolExhaustedError when the
    // executor rejects the work (completion is not called).
    std::optional<wire::HandlerNotFoundError> dispatch_async(
        const wire::Envelope& envelope, HandlerContext ctx, Completion completion) const;

private:
    static HandlerResult invoke(const Handler& handler, const wire::Envelope& envelope,
                                const HandlerContext& ctx);

    const HandlerRegistry& registry_;
    BoundedExecutor* executor_;
};

// Answers task.request with a completed task.response echoing the input
HandlerFn make_echo_handler();

// Registry with the echo handler on task.request
std::unique_ptr<HandlerRegistry> make_default_registry();

} // namespace asap::transport
