// src/policy/transport.hpp
// Transport Layer Policy - kernel TCP sockets
//
//   - BSDSocketTransport<EventPolicy>: BSD socket + event policy readiness
//
// TransportPolicy concept:
//   - void init()
//   - void connect(const char* host, uint16_t port, int timeout_ms, bool tcp_nodelay)
//   - ssize_t send(const void* buf, size_t len)   // MSG_NOSIGNAL, non-blocking
//   - ssize_t recv(void* buf, size_t len)
//   - void close()
//   - void shutdown()                             // SHUT_RDWR, fd stays valid
//   - bool is_connected() const
//   - void start_event_loop()                     // Register fd for read events
//   - void set_wait_timeout(int timeout_ms)
//   - int wait()                                  // >0 readable, 0 timeout, -1 error
//   - int wait_writable(int timeout_ms)           // >0 writable, 0 timeout, -1 error
//   - int get_fd() const
//
// Namespace: tinyws::transport

#pragma once

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include "../core/debug.hpp"
#include "../ws_policies.hpp"
#include "event.hpp"

namespace tinyws {
namespace transport {

/**
 * BSD Socket Transport Policy (Templated on EventPolicy)
 *
 * IPv4 TCP over the kernel stack. The socket is non-blocking from connect()
 * on; the TLS and HTTP handshakes wait for readiness themselves.
 *
 * Template parameter:
 *   EventPolicy - EpollPolicy
 */
template<typename EventPolicy>
class BSDSocketTransport {
public:
    BSDSocketTransport() : fd_(-1), connected_(false) {}

    ~BSDSocketTransport() {
        close();
    }

    BSDSocketTransport(const BSDSocketTransport&) = delete;
    BSDSocketTransport& operator=(const BSDSocketTransport&) = delete;

    BSDSocketTransport(BSDSocketTransport&& other) noexcept
        : fd_(other.fd_)
        , connected_(other.connected_)
        , event_(std::move(other.event_))
    {
        other.fd_ = -1;
        other.connected_ = false;
    }

    BSDSocketTransport& operator=(BSDSocketTransport&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            connected_ = other.connected_;
            event_ = std::move(other.event_);
            other.fd_ = -1;
            other.connected_ = false;
        }
        return *this;
    }

    void init() {
        event_.init();
    }

    /**
     * Resolve host (IPv4) and connect with a timeout
     *
     * @param host Host name or dotted quad
     * @param port TCP port
     * @param timeout_ms Upper bound for the TCP connect
     * @param tcp_nodelay Disable Nagle (failure is only warned about)
     * @throws std::runtime_error on resolution failure, refusal or timeout
     */
    void connect(const char* host, uint16_t port, int timeout_ms, bool tcp_nodelay = true) {
        if (connected_) {
            throw std::runtime_error("Already connected");
        }

        struct addrinfo hints = {};
        struct addrinfo* result = nullptr;
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        int ret = getaddrinfo(host, nullptr, &hints, &result);
        if (ret != 0) {
            throw std::runtime_error(std::string("getaddrinfo() failed: ") + gai_strerror(ret));
        }
        if (!result || !result->ai_addr) {
            if (result) freeaddrinfo(result);
            throw std::runtime_error("getaddrinfo() returned no addresses");
        }

        struct sockaddr_in addr;
        std::memcpy(&addr, result->ai_addr, sizeof(addr));
        addr.sin_port = htons(port);
        freeaddrinfo(result);

        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) {
            throw std::runtime_error(std::string("socket() failed: ") + strerror(errno));
        }

        if (tcp_nodelay) {
            int flag = 1;
            if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
                TINYWS_WARN("Failed to set TCP_NODELAY: %s\n", strerror(errno));
            }
        }

        set_nonblocking();

        ret = ::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
        if (ret < 0 && errno != EINPROGRESS) {
            int saved = errno;
            close();
            throw std::runtime_error(std::string("connect() failed: ") + strerror(saved));
        }

        if (ret < 0) {
            struct pollfd pfd = {fd_, POLLOUT, 0};
            do {
                ret = ::poll(&pfd, 1, timeout_ms);
            } while (ret < 0 && errno == EINTR);

            if (ret == 0) {
                close();
                throw std::runtime_error("Connection timeout");
            }
            if (ret < 0) {
                int saved = errno;
                close();
                throw std::runtime_error(std::string("poll() failed: ") + strerror(saved));
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
                close();
                throw std::runtime_error(std::string("Connection failed: ") + strerror(so_error));
            }
        }

        connected_ = true;
        TINYWS_DEBUG_PRINT("[BSD] Connected to %s:%u (fd=%d)\n", host, port, fd_);
    }

    ssize_t send(const void* buf, size_t len) {
        if (!connected_ || fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }
        return ::send(fd_, buf, len, MSG_NOSIGNAL);
    }

    ssize_t recv(void* buf, size_t len) {
        if (!connected_ || fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }
        return ::recv(fd_, buf, len, 0);
    }

    void close() {
        if (fd_ >= 0) {
            event_.remove(fd_);
            ::close(fd_);
            fd_ = -1;
        }
        connected_ = false;
    }

    /**
     * Shut down both directions without releasing the fd. Safe while another
     * thread waits on the socket: the waiter sees EOF.
     */
    void shutdown() {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

    bool is_connected() const { return connected_; }

    // =========================================================================
    // Event waiting
    // =========================================================================

    /**
     * Register the socket with the event policy for read events
     */
    void start_event_loop() {
        if (fd_ < 0) {
            throw std::runtime_error("start_event_loop() without a socket");
        }
        event_.add_read(fd_);
    }

    /**
     * @param timeout_ms Timeout in milliseconds (-1 = infinite)
     */
    void set_wait_timeout(int timeout_ms) {
        event_.set_wait_timeout(timeout_ms);
    }

    /**
     * Wait for readability (edge-triggered: drain before calling again)
     * @return >0 if data ready, 0 on timeout, -1 on error
     */
    int wait() {
        return event_.wait_with_timeout();
    }

    /**
     * Wait until the send buffer has room
     * @return >0 if writable, 0 on timeout, -1 on error
     */
    int wait_writable(int timeout_ms) {
        if (fd_ < 0) return -1;
        struct pollfd pfd = {fd_, POLLOUT, 0};
        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) return 0;
        if (ret > 0 && (pfd.revents & (POLLERR | POLLNVAL))) return -1;
        return ret;
    }

    int get_fd() const { return fd_; }

    static constexpr const char* event_policy_name() {
        return EventPolicy::name();
    }

private:
    void set_nonblocking() {
        int flags = fcntl(fd_, F_GETFL, 0);
        if (flags < 0) {
            throw std::runtime_error("fcntl(F_GETFL) failed");
        }
        if (fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
            throw std::runtime_error("fcntl(F_SETFL) failed");
        }
    }

    int fd_;
    bool connected_;
    EventPolicy event_;
};

} // namespace transport

static_assert(TransportPolicyConcept<transport::BSDSocketTransport<event_policies::EpollPolicy>>);

} // namespace tinyws
