#include "transport/socket_server.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>

namespace asap::transport {

SocketServer::SocketServer(std::string host, uint16_t port, size_t max_request_size,
                           double message_rate)
    : host_(std::move(host))
    , port_(port)
    , max_request_size_(max_request_size)
    , message_rate_(message_rate) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::init() {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    struct addrinfo* addrs = nullptr;
    int rc = getaddrinfo(host_.empty() ? nullptr : host_.c_str(),
                         std::to_string(port_).c_str(), &hints, &addrs);
    if (rc != 0) {
        spdlog::error("Failed to resolve listen address {}: {}", host_, gai_strerror(rc));
        return false;
    }

    // Create TCP socket
    server_fd_ = socket(addrs->ai_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        freeaddrinfo(addrs);
        return false;
    }

    int reuse = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    // Set non-blocking
    int flags = fcntl(server_fd_, F_GETFL, 0);
    if (fcntl(server_fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        spdlog::error("Failed to set non-blocking: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        freeaddrinfo(addrs);
        return false;
    }

    if (bind(server_fd_, addrs->ai_addr, addrs->ai_addrlen) < 0) {
        spdlog::error("Failed to bind {}:{}: {}", host_, port_, strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        freeaddrinfo(addrs);
        return false;
    }
    freeaddrinfo(addrs);

    if (listen(server_fd_, 128) < 0) {
        spdlog::error("Failed to listen: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Resolve the real port when 0 was requested
    struct sockaddr_storage bound;
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
        if (bound.ss_family == AF_INET) {
            bound_port_ = ntohs(reinterpret_cast<struct sockaddr_in*>(&bound)->sin_port);
        } else if (bound.ss_family == AF_INET6) {
            bound_port_ = ntohs(reinterpret_cast<struct sockaddr_in6*>(&bound)->sin6_port);
        }
    }

    spdlog::info("Socket server listening on {}:{}", host_, bound_port_);
    return true;
}

void SocketServer::set_handler(RequestHandler handler) {
    handler_ = std::move(handler);
}

int SocketServer::accept_connection() {
    struct sockaddr_storage client_addr;
    socklen_t client_len = sizeof(client_addr);

    int client_fd = accept4(server_fd_, reinterpret_cast<struct sockaddr*>(&client_addr),
                            &client_len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::error("Failed to accept: {}", strerror(errno));
        }
        return -1;
    }

    char host[NI_MAXHOST] = "?";
    char serv[NI_MAXSERV] = "?";
    getnameinfo(reinterpret_cast<struct sockaddr*>(&client_addr), client_len,
                host, sizeof(host), serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV);

    uint64_t id = next_connection_id_++;
    auto conn = std::make_unique<ClientConnection>(client_fd, id,
                                                   std::string(host) + ":" + serv);
    if (message_rate_ > 0.0) {
        // At least one whole request must fit in the bucket
        conn->limiter = std::make_unique<TokenBucket>(message_rate_,
                                                      std::max(1.0, message_rate_));
    }
    fd_by_id_[id] = client_fd;
    clients_[client_fd] = std::move(conn);

    spdlog::debug("Connection {} from {}:{} (fd={})", id, host, serv, client_fd);
    return client_fd;
}

bool SocketServer::handle_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }

    auto& client = *it->second;
    uint8_t buffer[8192];

    // Read available data. Nothing is read while a request is in flight, and
    // anything past one maximal request stays in the socket until framing
    // catches up.
    while (!client.in_flight && !client.peer_closed && !client.close_after_flush &&
           client.recv_buffer.size() <= input_limit()) {
        ssize_t n = read(client_fd, buffer, sizeof(buffer));
        if (n > 0) {
            client.recv_buffer.insert(client.recv_buffer.end(), buffer, buffer + n);
        } else if (n == 0) {
            spdlog::debug("Connection {} closed by peer", client.id);
            client.peer_closed = true;
        } else {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("Read error on connection {}: {}", client.id, strerror(errno));
            return false;
        }
    }

    process_requests(client);
    return true;
}

void SocketServer::append_response(ClientConnection& client, const HttpResponse& response,
                                   bool close_after) {
    HttpResponse out = response;
    out.headers["Connection"] = close_after ? "close" : "keep-alive";
    std::string serialized = out.serialize();
    client.send_buffer.insert(client.send_buffer.end(), serialized.begin(), serialized.end());
    client.want_write = true;
    if (close_after) {
        client.close_after_flush = true;
    }
}

void SocketServer::reject(ClientConnection& client, int status, const std::string& message,
                          bool close_after, const HttpHeaders& extra) {
    HttpResponse resp;
    resp.status = status;
    resp.headers = extra;
    resp.headers["Content-Type"] = "application/json";
    resp.body = nlohmann::json{{"error", message}}.dump();
    append_response(client, resp, close_after);
    spdlog::warn("Connection {} ({}): {} {}", client.id, client.peer, status, message);
}

void SocketServer::process_requests(ClientConnection& client) {
    while (!client.in_flight && !client.close_after_flush && !client.recv_buffer.empty()) {
        auto parsed = parse_request(
            reinterpret_cast<const char*>(client.recv_buffer.data()),
            client.recv_buffer.size(),
            max_request_size_);

        if (parsed.status == ParseStatus::INCOMPLETE) {
            break;
        }
        if (parsed.status == ParseStatus::TOO_LARGE) {
            reject(client, 413, "Request too large: " + parsed.error, true);
            client.recv_buffer.clear();
            return;
        }
        if (parsed.status == ParseStatus::INVALID) {
            reject(client, 400, "Malformed HTTP request: " + parsed.error, true);
            client.recv_buffer.clear();
            return;
        }

        // Remove processed request from buffer
        client.recv_buffer.erase(
            client.recv_buffer.begin(),
            client.recv_buffer.begin() + parsed.consumed);

        if (client.limiter && !client.limiter->consume()) {
            double wait = client.limiter->seconds_until();
            long retry_after = std::max(1L, static_cast<long>(std::ceil(wait)));
            reject(client, 429, "Rate limit exceeded", !parsed.message.keep_alive(),
                   HttpHeaders{{"Retry-After", std::to_string(retry_after)}});
            continue;
        }

        spdlog::debug("Connection {} -> {} {} ({}B body)",
            client.id, parsed.message.method, parsed.message.target,
            parsed.message.body.size());

        if (!handler_) {
            reject(client, 503, "No request handler installed", true);
            return;
        }

        client.in_flight = true;
        handler_(client.id, std::move(parsed.message));
    }
}

int SocketServer::queue_response(uint64_t connection_id, const HttpResponse& response,
                                 bool close_after) {
    auto id_it = fd_by_id_.find(connection_id);
    if (id_it == fd_by_id_.end()) {
        return -1;
    }
    auto it = clients_.find(id_it->second);
    if (it == clients_.end()) {
        return -1;
    }

    auto& client = *it->second;
    client.in_flight = false;
    append_response(client, response, close_after);

    spdlog::debug("Connection {} <- {} ({}B body)", client.id, response.status,
        response.body.size());

    // Resume pipelined requests
    process_requests(client);
    return client.fd;
}

bool SocketServer::flush_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }

    auto& client = *it->second;

    while (!client.send_buffer.empty()) {
        ssize_t n = ::send(client_fd,
            client.send_buffer.data(),
            client.send_buffer.size(),
            MSG_NOSIGNAL);

        if (n > 0) {
            client.send_buffer.erase(
                client.send_buffer.begin(),
                client.send_buffer.begin() + n);
        } else if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("Write error on connection {}: {}", client.id, strerror(errno));
            return false;
        }
    }

    client.want_write = !client.send_buffer.empty();
    return true;
}

bool SocketServer::client_wants_read(int client_fd) const {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }
    const auto& client = *it->second;
    return !client.in_flight && !client.peer_closed && !client.close_after_flush;
}

size_t SocketServer::buffered_input(int client_fd) const {
    auto it = clients_.find(client_fd);
    return it == clients_.end() ? 0 : it->second->recv_buffer.size();
}

bool SocketServer::client_wants_write(int client_fd) const {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }
    return it->second->want_write;
}

bool SocketServer::client_should_close(int client_fd) const {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return true;
    }
    const auto& client = *it->second;
    if (!client.send_buffer.empty()) {
        return false;
    }
    // After EOF nothing more can arrive; close once the last answer is out
    return client.close_after_flush || (client.peer_closed && !client.in_flight);
}

void SocketServer::remove_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it != clients_.end()) {
        fd_by_id_.erase(it->second->id);
        close(client_fd);
        clients_.erase(it);
    }
}

void SocketServer::stop() {
    // Close all clients
    for (auto& [fd, client] : clients_) {
        close(fd);
    }
    clients_.clear();
    fd_by_id_.clear();

    // Close server socket
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        spdlog::info("Socket server stopped");
    }
}

} // namespace asap::transport
