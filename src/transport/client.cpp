#include "transport/client.hpp"
#include "util/ulid.hpp"
#include "wire/errors.hpp"
#include "wire/jsonrpc.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace asap::transport {

namespace {

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string snippet(const std::string& body) {
    constexpr size_t limit = 200;
    return body.size() <= limit ? body : body.substr(0, limit) + "...";
}

} // namespace

AsapClient::AsapClient(const std::string& base_url,
                       CircuitBreakerRegistry& breakers,
                       ClientConfig config,
                       std::shared_ptr<HttpTransport> transport,
                       ManifestCache* manifest_cache)
    : base_url_(strip_trailing_slash(base_url))
    , url_(parse_url(base_url_))
    , config_(std::move(config))
    , transport_(transport ? std::move(transport) : std::make_shared<TcpHttpTransport>())
    , manifest_cache_(manifest_cache)
{
    if (config_.circuit_breaker_enabled) {
        breaker_ = breakers.get_or_create(base_url_, config_.circuit_breaker_threshold,
                                          config_.breaker_timeout());
    }
}

HttpRequest AsapClient::build_request(const std::string& method, const std::string& path) const {
    HttpRequest req;
    req.method = method;
    req.target = url_.path + path;
    req.headers["Accept"] = "application/json";
    req.headers["User-Agent"] = "asap-cpp/0.1";
    return req;
}

RetryEngine AsapClient::make_engine() const {
    RetryEngine engine(config_.max_retries, config_.backoff_policy(), breaker_, base_url_);
    engine.set_sleeper(sleeper_);
    return engine;
}

// ============================================================================
// One HTTP exchange, classified for the retry loop
// ============================================================================

AsapClient::Exchange AsapClient::exchange(const HttpRequest& request,
                                          std::optional<SteadyClock::time_point> deadline) const {
    auto timeout = config_.timeout();
    if (deadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline - SteadyClock::now());
        timeout = std::max(std::chrono::milliseconds(1), std::min(timeout, left));
    }

    HttpResponse resp;
    try {
        resp = transport_->send(url_, request, timeout);
    } catch (const wire::ConnectionError& e) {
        spdlog::warn("Request to {} failed: {}", base_url_, e.what());
        return Retryable{std::current_exception(), std::nullopt};
    } catch (const wire::TimeoutError& e) {
        spdlog::warn("Request to {} timed out: {}", base_url_, e.what());
        return Retryable{std::current_exception(), std::nullopt};
    } catch (const std::exception& e) {
        return Retryable{
            std::make_exception_ptr(wire::ConnectionError(
                std::string("Unexpected transport error: ") + e.what())),
            std::nullopt};
    }

    if (resp.status >= 500 || resp.status == 429) {
        std::optional<double> retry_after;
        if (auto value = resp.header("Retry-After")) {
            retry_after = parse_retry_after(*value);
            if (retry_after) {
                *retry_after = std::min(*retry_after, config_.max_delay);
            }
        }
        spdlog::warn("{} answered HTTP {}", base_url_, resp.status);
        return Retryable{
            std::make_exception_ptr(wire::ConnectionError(
                "HTTP error " + std::to_string(resp.status) + ": " + snippet(resp.body),
                resp.status)),
            retry_after};
    }

    if (resp.status >= 400) {
        return Fatal{std::make_exception_ptr(wire::ConnectionError(
            "HTTP error " + std::to_string(resp.status) + ": " + snippet(resp.body),
            resp.status))};
    }
    return resp;
}

// ============================================================================
// send
// ============================================================================

wire::Envelope AsapClient::send(const wire::Envelope& envelope,
                                std::optional<std::chrono::milliseconds> deadline) {
    std::string idempotency_key = util::generate_ulid();
    std::string request_id = "req-" + std::to_string(++request_counter_);

    HttpRequest req = build_request("POST", ASAP_PATH);
    req.headers["Content-Type"] = "application/json";
    req.headers["X-Idempotency-Key"] = idempotency_key;
    req.body = wire::make_send_request(envelope, idempotency_key, request_id).to_json().dump();
    for (const auto& hook : hooks_) {
        hook(req);
    }

    std::optional<SteadyClock::time_point> deadline_at;
    if (deadline) {
        deadline_at = SteadyClock::now() + *deadline;
    }

    spdlog::debug("Sending {} {} to {} ({})",
        envelope.payload_type(), envelope.id(), base_url_, request_id);

    RetryEngine engine = make_engine();
    return engine.run<wire::Envelope>([&](int) -> AttemptOutcome<wire::Envelope> {
        Exchange ex = exchange(req, deadline_at);
        if (auto* retry = std::get_if<Retryable>(&ex)) return *retry;
        if (auto* fatal = std::get_if<Fatal>(&ex)) return *fatal;
        const HttpResponse& resp = std::get<HttpResponse>(ex);

        json body = json::parse(resp.body, nullptr, false);
        if (body.is_discarded()) {
            return Fatal{std::make_exception_ptr(wire::RemoteError(
                wire::PARSE_ERROR, "Invalid JSON response: " + snippet(resp.body)))};
        }

        try {
            return Success<wire::Envelope>{wire::unwrap_send_response(body)};
        } catch (const wire::RemoteError& e) {
            if (e.retryable()) {
                spdlog::warn("{} returned retryable error {}: {}", base_url_, e.rpc_code(), e.what());
                return Retryable{std::current_exception(), std::nullopt};
            }
            return Fatal{std::current_exception()};
        }
    }, deadline_at);
}

// ============================================================================
// discover
// ============================================================================

std::shared_ptr<const wire::Manifest> AsapClient::discover(bool force_refresh) {
    std::string key = base_url_ + MANIFEST_PATH;

    if (manifest_cache_ && !force_refresh) {
        if (auto cached = manifest_cache_->get(key)) {
            spdlog::debug("Manifest cache hit for {}", key);
            return cached;
        }
    }

    HttpRequest req = build_request("GET", MANIFEST_PATH);
    for (const auto& hook : hooks_) {
        hook(req);
    }

    std::optional<std::chrono::milliseconds> ttl;
    RetryEngine engine = make_engine();
    auto manifest = engine.run<std::shared_ptr<const wire::Manifest>>(
        [&](int) -> AttemptOutcome<std::shared_ptr<const wire::Manifest>> {
            Exchange ex = exchange(req, std::nullopt);
            if (auto* retry = std::get_if<Retryable>(&ex)) return *retry;
            if (auto* fatal = std::get_if<Fatal>(&ex)) return *fatal;
            const HttpResponse& resp = std::get<HttpResponse>(ex);

            json body = json::parse(resp.body, nullptr, false);
            if (body.is_discarded()) {
                return Fatal{std::make_exception_ptr(wire::ManifestValidationError(
                    {"manifest response is not valid JSON"}))};
            }
            try {
                auto m = std::make_shared<const wire::Manifest>(wire::Manifest::from_json(body));
                if (auto cc = resp.header("Cache-Control")) {
                    if (auto max_age = parse_max_age(*cc)) {
                        ttl = std::chrono::seconds(*max_age);
                    }
                }
                return Success<std::shared_ptr<const wire::Manifest>>{std::move(m)};
            } catch (const wire::ManifestValidationError&) {
                return Fatal{std::current_exception()};
            }
        });

    if (manifest_cache_) {
        auto effective_ttl = ttl.value_or(std::chrono::milliseconds(
            static_cast<long long>(config_.manifest_ttl_seconds * 1000.0)));
        manifest_cache_->set(key, manifest, effective_ttl);
    }
    spdlog::info("Discovered {} ({} v{}) at {}",
        manifest->id, manifest->name, manifest->version, base_url_);
    return manifest;
}

} // namespace asap::transport
