#pragma once
#include <cstdint>
#include <functional>
#include <unordered_map>

namespace asap::transport {

// Single-threaded epoll event loop. Callbacks run on the thread calling poll().
class Reactor {
public:
    using Callback = std::function<void(int fd, uint32_t events)>;

    Reactor() = default;
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    bool init();

    bool add(int fd, uint32_t events, Callback callback);
    bool modify(int fd, uint32_t events);
    bool remove(int fd);

    // Waits up to timeout_ms and dispatches ready callbacks.
    // Returns the number of events handled, or -1 on error.
    int poll(int timeout_ms);

    bool watching(int fd) const { return callbacks_.count(fd) > 0; }

private:
    int epoll_fd_ = -1;
    std::unordered_map<int, Callback> callbacks_;
};

} // namespace asap::transport
