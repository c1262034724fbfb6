#pragma once
#include <chrono>
#include "transport/http.hpp"

namespace asap::transport {

constexpr size_t DEFAULT_MAX_RESPONSE_BYTES = 10 * 1024 * 1024;

// One HTTP exchange. Implementations throw wire::ConnectionError for
// DNS/connect/reset/malformed-response failures and wire::TimeoutError when
// the exchange does not finish within timeout. Non-2xx statuses are returned,
// not thrown.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse send(const Url& url, const HttpRequest& request,
                              std::chrono::milliseconds timeout) = 0;
};

// Blocking POSIX socket transport, one connection per exchange
class TcpHttpTransport : public HttpTransport {
public:
    explicit TcpHttpTransport(size_t max_response_bytes = DEFAULT_MAX_RESPONSE_BYTES)
        : max_response_bytes_(max_response_bytes) {}

    HttpResponse send(const Url& url, const HttpRequest& request,
                      std::chrono::milliseconds timeout) override;

private:
    size_t max_response_bytes_;
};

} // namespace asap::transport
