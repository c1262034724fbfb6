#include "transport/http_transport.hpp"
#include "wire/errors.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace asap::transport {

namespace {

using Deadline = std::chrono::steady_clock::time_point;

// Closes the socket on every exit path
struct FdGuard {
    int fd = -1;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() { if (fd >= 0) close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

// Frees a getaddrinfo() result list
struct AddrInfoGuard {
    struct addrinfo* list = nullptr;
    ~AddrInfoGuard() { if (list) freeaddrinfo(list); }
    AddrInfoGuard() = default;
    AddrInfoGuard(const AddrInfoGuard&) = delete;
    AddrInfoGuard& operator=(const AddrInfoGuard&) = delete;
};

double seconds(std::chrono::milliseconds ms) {
    return std::chrono::duration<double>(ms).count();
}

int remaining_ms(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Waits for `events` on fd; false on timeout
bool wait_for(int fd, short events, Deadline deadline, const std::string& target) {
    while (true) {
        int left = remaining_ms(deadline);
        if (left <= 0) {
            return false;
        }
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        int n = ::poll(&pfd, 1, left);
        if (n > 0) {
            return true;
        }
        if (n == 0) {
            return false;
        }
        if (errno != EINTR) {
            throw wire::ConnectionError("poll failed for " + target + ": " + strerror(errno));
        }
    }
}

int connect_with_deadline(const Url& url, Deadline deadline, std::chrono::milliseconds timeout) {
    std::string target = url.host + ":" + std::to_string(url.port);

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    AddrInfoGuard results;
    int rc = getaddrinfo(url.host.c_str(), std::to_string(url.port).c_str(), &hints,
                         &results.list);
    if (rc != 0) {
        throw wire::ConnectionError("Failed to resolve " + url.host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no addresses";
    for (struct addrinfo* ai = results.list; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = strerror(errno);
            continue;
        }
        FdGuard guard(fd);

        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        if (connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                last_error = strerror(errno);
                continue;
            }
            if (!wait_for(fd, POLLOUT, deadline, target)) {
                throw wire::TimeoutError("Connect to " + target + " timed out", seconds(timeout));
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                last_error = strerror(so_error);
                continue;
            }
        }

        guard.fd = -1;
        return fd;
    }

    throw wire::ConnectionError("Connection to " + target + " failed: " + last_error);
}

} // namespace

HttpResponse TcpHttpTransport::send(const Url& url, const HttpRequest& request,
                                    std::chrono::milliseconds timeout) {
    Deadline deadline = std::chrono::steady_clock::now() + timeout;
    std::string target = url.host + ":" + std::to_string(url.port);

    FdGuard sock(connect_with_deadline(url, deadline, timeout));

    HttpRequest req = request;
    if (!req.header("Host")) {
        req.headers["Host"] = url.port == 80 ? url.host : target;
    }
    req.headers["Connection"] = "close";
    std::string wire_bytes = req.serialize();

    size_t sent = 0;
    while (sent < wire_bytes.size()) {
        ssize_t n = ::send(sock.fd, wire_bytes.data() + sent, wire_bytes.size() - sent,
                           MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!wait_for(sock.fd, POLLOUT, deadline, target)) {
                throw wire::TimeoutError("Sending to " + target + " timed out", seconds(timeout));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        throw wire::ConnectionError("Write to " + target + " failed: " + strerror(errno));
    }

    std::vector<char> buffer;
    char chunk[8192];
    bool at_eof = false;
    while (true) {
        auto parsed = parse_response(buffer.data(), buffer.size(), max_response_bytes_, at_eof);
        if (parsed.status == ParseStatus::COMPLETE) {
            spdlog::debug("{} {} -> {}", req.method, target, parsed.message.status);
            return std::move(parsed.message);
        }
        if (parsed.status == ParseStatus::INVALID || parsed.status == ParseStatus::TOO_LARGE) {
            throw wire::ConnectionError("Bad response from " + target + ": " + parsed.error);
        }
        if (at_eof) {
            throw wire::ConnectionError("Connection to " + target + " closed early");
        }

        ssize_t n = recv(sock.fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer.insert(buffer.end(), chunk, chunk + n);
        } else if (n == 0) {
            at_eof = true;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (!wait_for(sock.fd, POLLIN, deadline, target)) {
                throw wire::TimeoutError("Response from " + target + " timed out",
                                         seconds(timeout));
            }
        } else if (errno != EINTR) {
            throw wire::ConnectionError("Read from " + target + " failed: " + strerror(errno));
        }
    }
}

} // namespace asap::transport
