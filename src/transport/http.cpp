#include "transport/http.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <strings.h>
#include <vector>

namespace asap::transport {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> find_header(const HttpHeaders& headers, const std::string& name) {
    auto it = headers.find(name);
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

bool wants_keep_alive(const std::string& version, const std::optional<std::string>& connection) {
    if (connection) {
        std::string c = lower(*connection);
        if (c.find("close") != std::string::npos) return false;
        if (c.find("keep-alive") != std::string::npos) return true;
    }
    return version == "HTTP/1.1";
}

void write_headers(std::ostringstream& out, const HttpHeaders& headers, size_t body_size) {
    for (const auto& [name, value] : headers) {
        if (strcasecmp(name.c_str(), "Content-Length") == 0) continue;
        out << name << ": " << value << "\r\n";
    }
    out << "Content-Length: " << body_size << "\r\n\r\n";
}

// Split the head into the start line and headers; returns false on bad syntax
bool parse_head(const std::string& head, std::string& start_line, HttpHeaders& headers,
                std::string& error) {
    std::istringstream in(head);
    std::string line;
    if (!std::getline(in, line)) {
        error = "empty message head";
        return false;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    start_line = line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            error = "malformed header line";
            return false;
        }
        std::string name = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        auto it = headers.find(name);
        if (it != headers.end()) {
            it->second += ", " + value;
        } else {
            headers.emplace(std::move(name), std::move(value));
        }
    }
    return true;
}

// Locates the end of the head and parses Content-Length. Shared by both
// directions.
template <typename Message>
bool locate_body(const char* data, size_t len, size_t max_body, ParseResult<Message>& result,
                 std::string& start_line, size_t& head_len, std::optional<size_t>& content_length) {
    static const char* terminator = "\r\n\r\n";
    const char* end = std::search(data, data + len, terminator, terminator + 4);
    if (end == data + len) {
        if (len > MAX_HTTP_HEADER_BYTES) {
            result.status = ParseStatus::TOO_LARGE;
            result.error = "header section too large";
        } else {
            result.status = ParseStatus::INCOMPLETE;
        }
        return false;
    }

    head_len = static_cast<size_t>(end - data) + 4;
    std::string head(data, end - data);
    if (!parse_head(head, start_line, result.message.headers, result.error)) {
        result.status = ParseStatus::INVALID;
        return false;
    }

    if (auto te = find_header(result.message.headers, "Transfer-Encoding")) {
        if (lower(*te) != "identity") {
            result.status = ParseStatus::INVALID;
            result.error = "unsupported transfer encoding: " + *te;
            return false;
        }
    }

    if (auto cl = find_header(result.message.headers, "Content-Length")) {
        if (cl->empty() || !std::all_of(cl->begin(), cl->end(),
                [](unsigned char c) { return std::isdigit(c); }) || cl->size() > 18) {
            result.status = ParseStatus::INVALID;
            result.error = "invalid Content-Length";
            return false;
        }
        content_length = static_cast<size_t>(std::stoull(*cl));
        if (*content_length > max_body) {
            result.status = ParseStatus::TOO_LARGE;
            result.error = "body exceeds " + std::to_string(max_body) + " bytes";
            return false;
        }
    }
    return true;
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return strcasecmp(a.c_str(), b.c_str()) < 0;
}

// ============================================================================
// Requests
// ============================================================================

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    return find_header(headers, name);
}

std::string HttpRequest::path() const {
    size_t q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

bool HttpRequest::keep_alive() const {
    return wants_keep_alive(version, header("Connection"));
}

std::string HttpRequest::serialize() const {
    std::ostringstream out;
    out << method << ' ' << (target.empty() ? "/" : target) << ' ' << version << "\r\n";
    write_headers(out, headers, body.size());
    out << body;
    return out.str();
}

ParseResult<HttpRequest> parse_request(const char* data, size_t len, size_t max_body) {
    ParseResult<HttpRequest> result;
    std::string start_line;
    size_t head_len = 0;
    std::optional<size_t> content_length;
    if (!locate_body(data, len, max_body, result, start_line, head_len, content_length)) {
        return result;
    }

    std::istringstream sl(start_line);
    std::string extra;
    if (!(sl >> result.message.method >> result.message.target >> result.message.version) ||
        (sl >> extra) || result.message.version.rfind("HTTP/1.", 0) != 0 ||
        result.message.target.empty() || result.message.target[0] != '/') {
        result.status = ParseStatus::INVALID;
        result.error = "malformed request line";
        return result;
    }

    size_t body_len = content_length.value_or(0);
    if (len < head_len + body_len) {
        result.status = ParseStatus::INCOMPLETE;
        return result;
    }

    result.message.body.assign(data + head_len, body_len);
    result.consumed = head_len + body_len;
    result.status = ParseStatus::COMPLETE;
    return result;
}

// ============================================================================
// Responses
// ============================================================================

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    return find_header(headers, name);
}

bool HttpResponse::keep_alive() const {
    return wants_keep_alive(version, header("Connection"));
}

std::string HttpResponse::serialize() const {
    std::ostringstream out;
    out << version << ' ' << status << ' ' << reason_phrase(status) << "\r\n";
    write_headers(out, headers, body.size());
    out << body;
    return out.str();
}

ParseResult<HttpResponse> parse_response(const char* data, size_t len, size_t max_body,
                                         bool at_eof) {
    ParseResult<HttpResponse> result;
    std::string start_line;
    size_t head_len = 0;
    std::optional<size_t> content_length;
    if (!locate_body(data, len, max_body, result, start_line, head_len, content_length)) {
        if (result.status == ParseStatus::INCOMPLETE && at_eof) {
            result.status = ParseStatus::INVALID;
            result.error = "connection closed before response head";
        }
        return result;
    }

    std::istringstream sl(start_line);
    std::string status_text;
    if (!(sl >> result.message.version >> status_text) ||
        result.message.version.rfind("HTTP/1.", 0) != 0 ||
        status_text.size() != 3 ||
        !std::all_of(status_text.begin(), status_text.end(),
            [](unsigned char c) { return std::isdigit(c); })) {
        result.status = ParseStatus::INVALID;
        result.error = "malformed status line";
        return result;
    }
    result.message.status = std::stoi(status_text);

    if (content_length) {
        if (len < head_len + *content_length) {
            result.status = at_eof ? ParseStatus::INVALID : ParseStatus::INCOMPLETE;
            if (at_eof) result.error = "connection closed mid-body";
            return result;
        }
        result.message.body.assign(data + head_len, *content_length);
        result.consumed = head_len + *content_length;
        result.status = ParseStatus::COMPLETE;
        return result;
    }

    // 1xx, 204 and 304 never carry a body
    int s = result.message.status;
    if ((s >= 100 && s < 200) || s == 204 || s == 304) {
        result.consumed = head_len;
        result.status = ParseStatus::COMPLETE;
        return result;
    }

    if (!at_eof) {
        if (len - head_len > max_body) {
            result.status = ParseStatus::TOO_LARGE;
            result.error = "body exceeds " + std::to_string(max_body) + " bytes";
        } else {
            result.status = ParseStatus::INCOMPLETE;
        }
        return result;
    }
    result.message.body.assign(data + head_len, len - head_len);
    result.consumed = len;
    result.status = ParseStatus::COMPLETE;
    return result;
}

// ============================================================================
// Helpers
// ============================================================================

std::string reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

Url parse_url(const std::string& url) {
    const std::string scheme_sep = "://";
    size_t pos = url.find(scheme_sep);
    if (pos == std::string::npos) {
        throw std::invalid_argument("URL has no scheme: " + url);
    }

    Url out;
    out.scheme = lower(url.substr(0, pos));
    if (out.scheme != "http") {
        throw std::invalid_argument("Unsupported URL scheme: " + out.scheme);
    }

    std::string rest = url.substr(pos + scheme_sep.size());
    size_t slash = rest.find('/');
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "" : rest.substr(slash);

    if (authority.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }

    // [v6]:port, host:port or host
    std::string port_text;
    if (authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Unterminated IPv6 literal: " + url);
        }
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw std::invalid_argument("Invalid authority: " + authority);
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            out.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        } else {
            out.host = authority;
        }
    }

    if (out.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }

    if (!port_text.empty()) {
        if (!std::all_of(port_text.begin(), port_text.end(),
                [](unsigned char c) { return std::isdigit(c); }) || port_text.size() > 5) {
            throw std::invalid_argument("Invalid port: " + port_text);
        }
        int port = std::stoi(port_text);
        if (port <= 0 || port > 65535) {
            throw std::invalid_argument("Port out of range: " + port_text);
        }
        out.port = static_cast<uint16_t>(port);
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    out.path = path;
    return out;
}

std::optional<double> parse_retry_after(const std::string& value) {
    std::string v = trim(value);
    if (v.empty()) return std::nullopt;
    try {
        size_t pos = 0;
        double seconds = std::stod(v, &pos);
        if (pos != v.size() || !std::isfinite(seconds) || seconds < 0.0) {
            return std::nullopt;
        }
        return seconds;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<long> parse_max_age(const std::string& cache_control) {
    std::string cc = lower(cache_control);
    std::istringstream in(cc);
    std::string directive;
    while (std::getline(in, directive, ',')) {
        directive = trim(directive);
        if (directive.rfind("max-age=", 0) == 0) {
            std::string n = directive.substr(8);
            if (!n.empty() && std::all_of(n.begin(), n.end(),
                    [](unsigned char c) { return std::isdigit(c); }) && n.size() < 12) {
                return std::stol(n);
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace asap::transport
