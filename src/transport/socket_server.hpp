#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "transport/http.hpp"
#include "transport/token_bucket.hpp"

namespace asap::transport {

// Per-connection state
struct ClientConnection {
    int fd;
    uint64_t id;
    std::string peer;
    std::vector<uint8_t> recv_buffer;
    std::vector<uint8_t> send_buffer;
    bool want_write = false;
    bool in_flight = false;          // Request handed off, response pending
    bool close_after_flush = false;
    bool peer_closed = false;        // Read side hit EOF; answer what was sent, then close
    std::unique_ptr<TokenBucket> limiter;

    ClientConnection(int f, uint64_t i, std::string p)
        : fd(f), id(i), peer(std::move(p)) {}
};

// Non-blocking TCP listener that frames HTTP/1.1 requests. One request per
// connection is outstanding at a time; pipelined requests wait in the
// receive buffer until the previous response is queued.
class SocketServer {
public:
    // Called on the event-loop thread for each complete request; the
    // response comes back later through queue_response()
    using RequestHandler = std::function<void(uint64_t connection_id, HttpRequest request)>;

    SocketServer(std::string host, uint16_t port, size_t max_request_size,
                 double message_rate = 0.0);
    ~SocketServer();

    // Non-copyable
    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    bool init();
    void set_handler(RequestHandler handler);

    int get_server_fd() const { return server_fd_; }
    uint16_t bound_port() const { return bound_port_; }

    // Returns the new client fd, or -1 when nothing is pending
    int accept_connection();

    // Read and frame what is available, up to one request's worth of buffered
    // input. False means drop the client.
    bool handle_client(int client_fd);

    // Write as much of the send buffer as the socket takes. False means drop.
    bool flush_client(int client_fd);

    // False while a request is in flight or after the peer's EOF; the
    // caller stops polling for input so unread data stays in the kernel.
    bool client_wants_read(int client_fd) const;
    bool client_wants_write(int client_fd) const;
    bool client_should_close(int client_fd) const;

    // Append a response for the connection (if it is still open) and resume
    // framing pipelined requests. Returns the fd, or -1 if the connection is gone.
    int queue_response(uint64_t connection_id, const HttpResponse& response, bool close_after);

    void remove_client(int client_fd);
    void stop();

    size_t client_count() const { return clients_.size(); }
    size_t buffered_input(int client_fd) const;

private:
    void process_requests(ClientConnection& client);
    void reject(ClientConnection& client, int status, const std::string& message,
                bool close_after, const HttpHeaders& extra = {});
    void append_response(ClientConnection& client, const HttpResponse& response, bool close_after);
    size_t input_limit() const { return max_request_size_ + MAX_HTTP_HEADER_BYTES; }

    std::string host_;
    uint16_t port_;
    uint16_t bound_port_ = 0;
    size_t max_request_size_;
    double message_rate_;
    int server_fd_ = -1;
    RequestHandler handler_;
    uint64_t next_connection_id_ = 1;
    std::unordered_map<int, std::unique_ptr<ClientConnection>> clients_;
    std::unordered_map<uint64_t, int> fd_by_id_;
};

} // namespace asap::transport
