// src/policy/event.hpp
// Event notification policy (Linux epoll)
//
// Readiness for the single socket a connection owns. Interface used by the
// transport policy:
//   - void init()
//   - void add_read(int fd)
//   - void remove(int fd)
//   - void set_wait_timeout(int ms)     // -1 = infinite, 0 = poll
//   - int wait_with_timeout()           // >0 ready, 0 timeout, -1 error
//   - int get_ready_fd() const
//
// Namespace: tinyws::event_policies

#pragma once

#include <cerrno>
#include <cstdint>
#include <stdexcept>

#include <sys/epoll.h>
#include <unistd.h>

#include "../ws_policies.hpp"

namespace tinyws {
namespace event_policies {

/**
 * EpollPolicy - edge-triggered epoll over one registered socket
 *
 * Edge-triggered: after a readiness report the owner must drain the socket
 * until EAGAIN before waiting again.
 *
 * Thread safety: Not thread-safe (used by the connection's loop thread only)
 */
struct EpollPolicy {
    EpollPolicy() = default;

    ~EpollPolicy() {
        cleanup();
    }

    EpollPolicy(const EpollPolicy&) = delete;
    EpollPolicy& operator=(const EpollPolicy&) = delete;

    EpollPolicy(EpollPolicy&& other) noexcept
        : epfd_(other.epfd_)
        , ready_fd_(other.ready_fd_)
        , ready_events_(other.ready_events_)
        , timeout_ms_(other.timeout_ms_)
    {
        other.epfd_ = -1;
        other.ready_fd_ = -1;
        other.ready_events_ = 0;
    }

    EpollPolicy& operator=(EpollPolicy&& other) noexcept {
        if (this != &other) {
            cleanup();
            epfd_ = other.epfd_;
            ready_fd_ = other.ready_fd_;
            ready_events_ = other.ready_events_;
            timeout_ms_ = other.timeout_ms_;
            other.epfd_ = -1;
            other.ready_fd_ = -1;
            other.ready_events_ = 0;
        }
        return *this;
    }

    /**
     * Create the epoll instance (idempotent)
     *
     * @throws std::runtime_error if epoll_create1() fails
     */
    void init() {
        if (epfd_ >= 0) return;
        epfd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epfd_ < 0) {
            throw std::runtime_error("epoll_create1() failed");
        }
    }

    /**
     * Register fd for read events (EPOLLIN | EPOLLRDHUP, edge-triggered)
     *
     * @throws std::runtime_error if epoll_ctl() fails
     */
    void add_read(int fd) {
        struct epoll_event ev = {};
        ev.events = EPOLLIN | EPOLLRDHUP | EPOLLET;
        ev.data.fd = fd;

        if (epoll_ctl(epfd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            throw std::runtime_error("epoll_ctl(ADD, EPOLLIN) failed");
        }
    }

    void remove(int fd) {
        if (epfd_ < 0 || fd < 0) return;
        epoll_ctl(epfd_, EPOLL_CTL_DEL, fd, nullptr);
    }

    /**
     * Set timeout for the following wait_with_timeout() calls
     *
     * @param timeout_ms Milliseconds (-1 = infinite, 0 = poll)
     */
    void set_wait_timeout(int timeout_ms) {
        timeout_ms_ = timeout_ms;
    }

    /**
     * Wait for readiness with the configured timeout
     *
     * EINTR is reported as a timeout so callers re-check their deadline.
     *
     * @return Number of ready fds (0 = timeout, -1 = error)
     */
    int wait_with_timeout() {
        struct epoll_event events[MAX_EVENTS];
        int n = epoll_wait(epfd_, events, MAX_EVENTS, timeout_ms_);

        if (n > 0) {
            ready_fd_ = events[0].data.fd;
            ready_events_ = events[0].events;
            return n;
        }
        if (n == 0 || errno == EINTR) {
            return 0;
        }
        return -1;
    }

    int get_ready_fd() const {
        return ready_fd_;
    }

    bool is_readable() const {
        return ready_events_ & EPOLLIN;
    }

    // Peer hung up or socket error; pending bytes may still be readable
    bool has_error() const {
        return ready_events_ & (EPOLLERR | EPOLLHUP | EPOLLRDHUP);
    }

    static constexpr const char* name() {
        return "epoll";
    }

    static constexpr int MAX_EVENTS = 8;

private:
    void cleanup() {
        if (epfd_ >= 0) {
            ::close(epfd_);
            epfd_ = -1;
        }
    }

    int epfd_ = -1;
    int ready_fd_ = -1;
    uint32_t ready_events_ = 0;
    int timeout_ms_ = -1;
};

} // namespace event_policies

static_assert(EventPolicyConcept<event_policies::EpollPolicy>);

} // namespace tinyws
