#include "transport/reactor.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace asap::transport {

constexpr int MAX_EVENTS = 64;

Reactor::~Reactor() {
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
        epoll_fd_ = -1;
    }
}

bool Reactor::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("Failed to create epoll instance: {}", strerror(errno));
        return false;
    }
    return true;
}

bool Reactor::add(int fd, uint32_t events, Callback callback) {
    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("epoll_ctl ADD failed for fd={}: {}", fd, strerror(errno));
        return false;
    }
    callbacks_[fd] = std::move(callback);
    return true;
}

bool Reactor::modify(int fd, uint32_t events) {
    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        spdlog::error("epoll_ctl MOD failed for fd={}: {}", fd, strerror(errno));
        return false;
    }
    return true;
}

bool Reactor::remove(int fd) {
    callbacks_.erase(fd);
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        if (errno != EBADF && errno != ENOENT) {
            spdlog::warn("epoll_ctl DEL failed for fd={}: {}", fd, strerror(errno));
        }
        return false;
    }
    return true;
}

int Reactor::poll(int timeout_ms) {
    struct epoll_event events[MAX_EVENTS];
    int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            return 0;
        }
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return -1;
    }

    for (int i = 0; i < n; i++) {
        int fd = events[i].data.fd;
        auto it = callbacks_.find(fd);
        if (it == callbacks_.end()) {
            continue;   // removed by an earlier callback in this batch
        }
        // Copy so the callback may remove itself
        Callback cb = it->second;
        cb(fd, events[i].events);
    }
    return n;
}

} // namespace asap::transport
