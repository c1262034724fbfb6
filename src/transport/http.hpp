/**
 * Minimal HTTP/1.1 message codec
 *
 * Incremental parsing over a receive buffer: a parse either completes and
 * reports how many bytes it consumed, needs more data, or rejects the input.
 * Bodies are framed by Content-Length only.
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace asap::transport {

constexpr size_t MAX_HTTP_HEADER_BYTES = 64 * 1024;

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

struct HttpRequest {
    std::string method;
    std::string target;             // path plus optional query
    std::string version = "HTTP/1.1";
    HttpHeaders headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
    std::string path() const;       // target without the query string
    bool keep_alive() const;
    std::string serialize() const;  // fills in Content-Length
};

struct HttpResponse {
    int status = 200;
    std::string version = "HTTP/1.1";
    HttpHeaders headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
    bool keep_alive() const;
    std::string serialize() const;  // fills in Content-Length
};

enum class ParseStatus {
    COMPLETE,
    INCOMPLETE,
    INVALID,
    TOO_LARGE
};

template <typename Message>
struct ParseResult {
    ParseStatus status = ParseStatus::INCOMPLETE;
    Message message;
    size_t consumed = 0;
    std::string error;
};

ParseResult<HttpRequest> parse_request(const char* data, size_t len, size_t max_body);

// Without Content-Length the body runs to end of stream, so at_eof must be
// set once the peer has closed
ParseResult<HttpResponse> parse_response(const char* data, size_t len, size_t max_body,
                                         bool at_eof);

std::string reason_phrase(int status);

struct Url {
    std::string scheme;   // "http"
    std::string host;
    uint16_t port = 80;
    std::string path;     // base path without trailing slash, may be empty
};

// Throws std::invalid_argument for anything but http://host[:port][/path]
Url parse_url(const std::string& url);

// Numeric "Retry-After" in seconds; HTTP-dates and garbage give nullopt
std::optional<double> parse_retry_after(const std::string& value);

// "max-age=N" from a Cache-Control value
std::optional<long> parse_max_age(const std::string& cache_control);

} // namespace asap::transport
