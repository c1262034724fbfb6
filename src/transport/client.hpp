/**
 * ASAP Client
 *
 * Sends envelopes to one peer agent. Every send() goes through the shared
 * circuit breaker for the peer's base URL and the retry engine; discover()
 * fetches the peer manifest through the same path and caches it.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "transport/circuit_breaker.hpp"
#include "transport/config.hpp"
#include "transport/http.hpp"
#include "transport/http_transport.hpp"
#include "transport/manifest_cache.hpp"
#include "transport/retry.hpp"
#include "wire/envelope.hpp"
#include "wire/manifest.hpp"

namespace asap::transport {

constexpr const char* ASAP_PATH = "/asap";
constexpr const char* MANIFEST_PATH = "/.well-known/asap/manifest.json";
constexpr const char* HEALTH_PATH = "/.well-known/asap/health";

// Runs on every outgoing request before it is sent (auth headers etc.)
using RequestHook = std::function<void(HttpRequest&)>;

class AsapClient {
public:
    // Throws std::invalid_argument for a base URL that is not http://host[:port][/path].
    // transport defaults to TcpHttpTransport; manifest_cache may be null.
    AsapClient(const std::string& base_url,
               CircuitBreakerRegistry& breakers,
               ClientConfig config = {},
               std::shared_ptr<HttpTransport> transport = nullptr,
               ManifestCache* manifest_cache = nullptr);

    // Non-copyable
    AsapClient(const AsapClient&) = delete;
    AsapClient& operator=(const AsapClient&) = delete;

    // Sends the envelope and returns the peer's response envelope.
    // Throws CircuitOpenError, ConnectionError, TimeoutError or RemoteError.
    // deadline bounds the whole call, retries included.
    wire::Envelope send(const wire::Envelope& envelope,
                        std::optional<std::chrono::milliseconds> deadline = std::nullopt);

    // Peer manifest, from the cache unless force_refresh. Cache-Control
    // max-age from the peer sets the cache TTL.
    std::shared_ptr<const wire::Manifest> discover(bool force_refresh = false);

    void add_request_hook(RequestHook hook) { hooks_.push_back(std::move(hook)); }
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    const std::string& base_url() const { return base_url_; }
    const ClientConfig& config() const { return config_; }

    // Null when the circuit breaker is disabled
    std::shared_ptr<CircuitBreaker> circuit_breaker() const { return breaker_; }

private:
    using Exchange = std::variant<HttpResponse, Retryable, Fatal>;

    HttpRequest build_request(const std::string& method, const std::string& path) const;
    Exchange exchange(const HttpRequest& request,
                      std::optional<SteadyClock::time_point> deadline) const;
    RetryEngine make_engine() const;

    std::string base_url_;
    Url url_;
    ClientConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    ManifestCache* manifest_cache_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::vector<RequestHook> hooks_;
    Sleeper sleeper_ = thread_sleep;
    std::atomic<uint64_t> request_counter_{0};
};

} // namespace asap::transport
