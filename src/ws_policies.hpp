// src/ws_policies.hpp
// Policy interface documentation and requirements
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/types.h>

// Policy-based design interfaces for the WebSocket connection.
// Each policy supplies one compile-time behavioral aspect.

// ============================================================================
// SSLPolicy: TLS layer over a connected socket
// ============================================================================
// Required members:
//   static constexpr bool is_tls
//     - false routes all I/O straight to the transport
//
//   void init(bool verify_peer)
//     - Create the TLS context
//
//   void handshake(int fd, const std::string& server_name, int timeout_ms)
//     - Client handshake with SNI, bounded by timeout_ms
//
//   ssize_t read(void* buf, size_t len)
//   ssize_t write(const void* buf, size_t len)
//     - Non-blocking; -1 with errno = EAGAIN on would-block
//
//   int get_fd() const
//   void shutdown()
//
// Implementations:
//   - OpenSSLPolicy: OpenSSL TLS 1.2+
//   - NoSSLPolicy: plaintext

// ============================================================================
// EventPolicy: readiness notification
// ============================================================================
// Required methods:
//   void init()
//   void add_read(int fd)
//   void remove(int fd)
//   void set_wait_timeout(int timeout_ms)
//   int wait_with_timeout()
//     - >0 ready, 0 timeout, -1 error
//   int get_ready_fd() const
//
// Implementations:
//   - EpollPolicy: Linux epoll (edge-triggered)

// ============================================================================
// TransportPolicy: byte stream + event waiting
// ============================================================================
// Required methods:
//   void init()
//   void connect(const char* host, uint16_t port, int timeout_ms, bool tcp_nodelay)
//   ssize_t send(const void* buf, size_t len)
//   ssize_t recv(void* buf, size_t len)
//     - Non-blocking; 0 on EOF, -1 with errno = EAGAIN on would-block
//   void close()
//   void shutdown()
//     - Wake a waiting reader without releasing the fd
//   bool is_connected() const
//   void start_event_loop()
//   void set_wait_timeout(int timeout_ms)
//   int wait()
//   int wait_writable(int timeout_ms)
//   int get_fd() const
//
// Implementations:
//   - BSDSocketTransport<EventPolicy>: kernel TCP sockets
//   - MockTransport (tests): scripted reads, recorded writes

namespace tinyws {

template<typename T>
concept SSLPolicyConcept = requires(T ssl, int fd, const std::string& server_name,
                                    void* buf, const void* cbuf, size_t len, int timeout_ms) {
    { T::is_tls } -> std::convertible_to<bool>;
    { T::name() } -> std::convertible_to<const char*>;
    { ssl.init(true) } -> std::same_as<void>;
    { ssl.handshake(fd, server_name, timeout_ms) } -> std::same_as<void>;
    { ssl.read(buf, len) } -> std::convertible_to<ssize_t>;
    { ssl.write(cbuf, len) } -> std::convertible_to<ssize_t>;
    { ssl.get_fd() } -> std::convertible_to<int>;
    { ssl.shutdown() } -> std::same_as<void>;
};

template<typename T>
concept EventPolicyConcept = requires(T event, int fd, int timeout) {
    { event.init() } -> std::same_as<void>;
    { event.add_read(fd) } -> std::same_as<void>;
    { event.remove(fd) } -> std::same_as<void>;
    { event.set_wait_timeout(timeout) } -> std::same_as<void>;
    { event.wait_with_timeout() } -> std::convertible_to<int>;
    { event.get_ready_fd() } -> std::convertible_to<int>;
};

template<typename T>
concept TransportPolicyConcept = requires(T transport, const char* host, uint16_t port,
                                          const void* buf, void* recv_buf, size_t len,
                                          int timeout_ms, bool flag) {
    // Connection lifecycle
    { transport.init() } -> std::same_as<void>;
    { transport.connect(host, port, timeout_ms, flag) } -> std::same_as<void>;
    { transport.close() } -> std::same_as<void>;
    { transport.shutdown() } -> std::same_as<void>;
    { transport.is_connected() } -> std::convertible_to<bool>;

    // Data transfer
    { transport.send(buf, len) } -> std::convertible_to<ssize_t>;
    { transport.recv(recv_buf, len) } -> std::convertible_to<ssize_t>;

    // Event loop integration
    { transport.start_event_loop() } -> std::same_as<void>;
    { transport.set_wait_timeout(timeout_ms) } -> std::same_as<void>;
    { transport.wait() } -> std::convertible_to<int>;
    { transport.wait_writable(timeout_ms) } -> std::convertible_to<int>;

    { transport.get_fd() } -> std::convertible_to<int>;
};

} // namespace tinyws
