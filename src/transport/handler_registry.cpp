#include "transport/handler_registry.hpp"
#include "util/ulid.hpp"
#include "wire/task.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace asap::transport {

// ============================================================================
// HandlerRegistry
// ============================================================================

void HandlerRegistry::register_handler(const std::string& payload_type, HandlerFn fn,
                                       HandlerMode mode) {
    if (payload_type.empty()) {
        throw std::invalid_argument("payload_type must not be empty");
    }
    if (!fn) {
        throw std::invalid_argument("handler for " + payload_type + " is empty");
    }

    Handler handler{payload_type, std::move(fn), mode};
    auto kind = wire::payload_kind_from_string(payload_type);

    std::lock_guard<std::mutex> lock(mutex_);
    if (kind == wire::PayloadKind::CUSTOM) {
        custom_[payload_type] = std::move(handler);
    } else {
        known_[kind] = std::move(handler);
    }
    spdlog::debug("Registered {} handler for {}",
        mode == HandlerMode::INLINE ? "inline" : "blocking", payload_type);
}

std::optional<Handler> HandlerRegistry::find(const std::string& payload_type) const {
    auto kind = wire::payload_kind_from_string(payload_type);

    std::lock_guard<std::mutex> lock(mutex_);
    if (kind == wire::PayloadKind::CUSTOM) {
        auto it = custom_.find(payload_type);
        if (it != custom_.end()) return it->second;
        return std::nullopt;
    }
    auto it = known_.find(kind);
    if (it != known_.end()) return it->second;
    return std::nullopt;
}

bool HandlerRegistry::has_handler(const std::string& payload_type) const {
    return find(payload_type).has_value();
}

std::vector<std::string> HandlerRegistry::list_handlers() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [kind, handler] : known_) {
            out.push_back(handler.payload_type);
        }
        for (const auto& [type, handler] : custom_) {
            out.push_back(type);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

// ============================================================================
// Dispatcher
// ============================================================================

Dispatcher::Dispatcher(const HandlerRegistry& registry, BoundedExecutor* executor)
    : registry_(registry)
    , executor_(executor) {}

HandlerResult Dispatcher::invoke(const Handler& handler, const wire::Envelope& envelope,
                                 const HandlerContext& ctx) {
    try {
        return handler.fn(envelope, ctx);
    } catch (...) {
        return std::current_exception();
    }
}

std::variant<wire::Envelope, wire::HandlerNotFoundError> Dispatcher::dispatch(
    const wire::Envelope& envelope, const HandlerContext& ctx) const {
    auto handler = registry_.find(envelope.payload_type());
    if (!handler) {
        return wire::HandlerNotFoundError(envelope.payload_type());
    }

    HandlerResult result = [&]() -> HandlerResult {
        if (handler->mode == HandlerMode::BLOCKING && executor_) {
            auto future = executor_->submit([h = *handler, envelope, ctx]() {
                return invoke(h, envelope, ctx);
            });
            return future.get();
        }
        return invoke(*handler, envelope, ctx);
    }();

    if (auto* err = std::get_if<std::exception_ptr>(&result)) {
        std::rethrow_exception(*err);
    }
    return std::get<wire::Envelope>(std::move(result));
}

std::optional<wire::HandlerNotFoundError> Dispatcher::dispatch_async(
    const wire::Envelope& envelope, HandlerContext ctx, Completion completion) const {
    auto handler = registry_.find(envelope.payload_type());
    if (!handler) {
        return wire::HandlerNotFoundError(envelope.payload_type());
    }

    if (handler->mode == HandlerMode::INLINE || !executor_) {
        completion(invoke(*handler, envelope, ctx));
        return std::nullopt;
    }

    // The future is not needed; completion carries the result. A throwing
    // completion would otherwise vanish into the discarded future.
    executor_->submit([h = std::move(*handler), envelope, ctx = std::move(ctx),
                       done = std::move(completion)]() {
        try {
            done(invoke(h, envelope, ctx));
        } catch (const std::exception& e) {
            spdlog::error("Completion for {} ({}) failed: {}", h.payload_type, envelope.id(),
                e.what());
        }
    });
    return std::nullopt;
}

// ============================================================================
// Built-in handlers
// ============================================================================

HandlerFn make_echo_handler() {
    return [](const wire::Envelope& envelope, const HandlerContext& ctx) {
        auto request = wire::TaskRequest::from_json(envelope.payload());

        wire::TaskResponse response;
        response.task_id = "task_" + util::generate_ulid();
        response.status = wire::TaskStatus::COMPLETED;
        response.result = json{{"echoed", request.input}};

        wire::EnvelopeFields fields;
        fields.asap_version = envelope.asap_version();
        fields.sender = ctx.manifest ? ctx.manifest->id : envelope.recipient();
        fields.recipient = envelope.sender();
        fields.payload_type = "task.response";
        fields.payload = response.to_json();
        fields.correlation_id = envelope.id();
        fields.trace_id = envelope.trace_id();
        return wire::Envelope(std::move(fields));
    };
}

std::unique_ptr<HandlerRegistry> make_default_registry() {
    auto registry = std::make_unique<HandlerRegistry>();
    registry->register_handler("task.request", make_echo_handler(), HandlerMode::BLOCKING);
    return registry;
}

} // namespace asap::transport
