// src/websocket.hpp
// Client-side WebSocket connection using policy-based design
//
// WebSocketConnection<SSLPolicy, TransportPolicy>:
//   - SSLPolicy: OpenSSLPolicy (ws:// and wss://) or NoSSLPolicy (ws:// only)
//   - TransportPolicy: BSDSocketTransport<EpollPolicy>, or a scripted transport in tests
//
// Lifecycle (single-use):
//   Connecting --upgrade ok--> Open --close frame | EOF | error | close()--> Closed
//   Connecting --handshake error | timeout--> Closed
//
// Threading:
//   - connect(), poll_once(), run(), close(): loop thread only
//   - send(): any thread; every socket write (text, pong, close) goes through
//     one mutex so frames never interleave
//   - state()/is_open(): any thread
//
// Errors:
//   - send() throws WebSocketError (NotConnected, TransportError)
//   - everything else reports through the error/close callbacks; policies throw
//     std::runtime_error, which is converted here and never escapes
//
#pragma once

#include "ws_policies.hpp"
#include "core/debug.hpp"
#include "core/error.hpp"
#include "core/frame_codec.hpp"
#include "core/handshake.hpp"
#include "core/url.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tinyws {

enum class ConnectionState : uint8_t {
    Connecting,
    Open,
    Closing,    // Close frame being written; only the close frame may go out
    Closed,
};

inline const char* state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Open:       return "Open";
        case ConnectionState::Closing:    return "Closing";
        case ConnectionState::Closed:     return "Closed";
    }
    return "Unknown";
}

/**
 * Runtime configuration, fixed at construction
 */
struct ConnectionConfig {
    int handshake_timeout_ms = 10000;                 // TCP connect + TLS + upgrade
    uint64_t max_frame_size = 16 * 1024 * 1024;       // Largest accepted payload
    size_t max_handshake_response = 16 * 1024;        // Largest accepted response head
    bool verify_accept = true;                        // Check Sec-WebSocket-Accept
    bool tcp_nodelay = true;
    bool verify_peer = false;                         // TLS certificate + hostname check
    handshake::HeaderMap custom_headers;              // Extra upgrade request headers
};

template<
    typename SSLPolicy_,
    typename TransportPolicy_
>
class WebSocketConnection {
public:
    using SSLPolicy = SSLPolicy_;
    using TransportPolicy = TransportPolicy_;

    static_assert(SSLPolicyConcept<SSLPolicy_>, "SSLPolicy must satisfy SSLPolicyConcept");
    static_assert(TransportPolicyConcept<TransportPolicy_>,
                  "TransportPolicy must satisfy TransportPolicyConcept");

    using OpenCallback = std::function<void()>;
    using MessageCallback = std::function<void(const std::string&)>;
    using CloseCallback = std::function<void(uint16_t code, const std::string& reason)>;
    using ErrorCallback = std::function<void(const WebSocketError&)>;

    static constexpr size_t READ_CHUNK_SIZE = 64 * 1024;
    static constexpr int RUN_WAIT_TIMEOUT_MS = 1000;
    static constexpr int WRITE_WAIT_SLICE_MS = 100;   // Re-check state while blocked on POLLOUT

    explicit WebSocketConnection(ConnectionConfig config = {})
        : config_(std::move(config))
        , read_chunk_(READ_CHUNK_SIZE)
    {}

    /**
     * Tear down without events. An Open connection still sends a
     * best-effort close frame.
     */
    ~WebSocketConnection() {
        if (state_.load() == ConnectionState::Open) {
            state_.store(ConnectionState::Closing);
            send_close_frame_best_effort();
        }
        teardown();
    }

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    // =========================================================================
    // Callbacks (set before connect())
    // =========================================================================

    void set_on_open(OpenCallback cb) { on_open_ = std::move(cb); }
    void set_on_message(MessageCallback cb) { on_message_ = std::move(cb); }
    void set_on_close(CloseCallback cb) { on_close_ = std::move(cb); }
    void set_on_error(ErrorCallback cb) { on_error_ = std::move(cb); }

    // =========================================================================
    // Operations
    // =========================================================================

    /**
     * Connect and perform the upgrade handshake
     *
     * Blocks for at most config.handshake_timeout_ms. On success the open
     * callback fires, then any frames that arrived with the response head
     * are dispatched.
     *
     * @param url ws:// or wss:// URL
     * @return true if the connection reached Open; false otherwise (the error
     *         callback has been invoked)
     */
    bool connect(std::string_view url) {
        if (connect_called_ || state_.load() != ConnectionState::Connecting) {
            emit_error(WebSocketError(ErrorCode::InvalidState,
                std::string("connect() called on a connection in state ") + state_name(state_.load()) +
                (connect_called_ ? " (already used)" : "")));
            return false;
        }
        connect_called_ = true;

        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.handshake_timeout_ms);

        try {
            url_ = parse_url(url);
            if (url_.secure && !SSLPolicy::is_tls) {
                throw WebSocketError(ErrorCode::InvalidUrl,
                    std::string("wss:// needs a TLS-capable SSL policy, have ") + SSLPolicy::name());
            }
            use_tls_ = SSLPolicy::is_tls && url_.secure;

            transport_.init();
            transport_.connect(url_.host.c_str(), url_.port, remaining_ms(deadline), config_.tcp_nodelay);

            if constexpr (SSLPolicy::is_tls) {
                if (use_tls_) {
                    ssl_.init(config_.verify_peer);
                    ssl_.handshake(transport_.get_fd(), url_.host, remaining_ms(deadline));
                    TINYWS_DEBUG_PRINT("[TLS] Handshake complete with %s\n", url_.host.c_str());
                }
            }

            transport_.start_event_loop();
            perform_upgrade(deadline);
        } catch (const WebSocketError& e) {
            fail_handshake(e);
            return false;
        } catch (const std::exception& e) {
            if (remaining_ms(deadline) <= 0) {
                fail_handshake(WebSocketError(ErrorCode::HandshakeTimeout, e.what()));
            } else {
                fail_handshake(WebSocketError(ErrorCode::TransportError, e.what()));
            }
            return false;
        }

        state_.store(ConnectionState::Open);
        TINYWS_DEBUG_PRINT("[WS] Connected to %s:%u%s\n", url_.host.c_str(), url_.port,
                           url_.resource.c_str());

        invoke(on_open_);

        // Frames that arrived in the same reads as the response head
        if (!rx_buffer_.empty() && state_.load() == ConnectionState::Open) {
            guarded_receive([this] { process_rx_buffer(); });
        }
        return true;
    }

    /**
     * Send a text message as one masked frame
     *
     * @throws WebSocketError(NotConnected) unless Open, including when the
     *         connection starts closing while the write waits for the socket
     * @throws WebSocketError(TransportError) if the write fails; the loop
     *         thread then fails the connection on its next poll
     */
    void send(std::string_view text) {
        ConnectionState state = state_.load();
        if (state != ConnectionState::Open) {
            throw WebSocketError(ErrorCode::NotConnected,
                std::string("send() in state ") + state_name(state));
        }
        if (tx_failed_.load()) {
            throw WebSocketError(ErrorCode::TransportError, "connection failed on an earlier write");
        }

        std::vector<uint8_t> frame = codec::encode_text_frame(text);
        try {
            write_all(frame.data(), frame.size(), -1);
        } catch (const WebSocketError&) {
            throw;
        } catch (const std::exception& e) {
            record_tx_failure(e.what());
            throw WebSocketError(ErrorCode::TransportError, e.what());
        }
    }

    /**
     * Wait up to timeout_ms for data, then read and dispatch everything
     * available
     *
     * @param timeout_ms Milliseconds (-1 = infinite, 0 = no wait)
     * @return true while the connection is Open
     */
    bool poll_once(int timeout_ms) {
        if (tx_failed_.load()) {
            fail_connection(tx_failure(), codec::CLOSE_ABNORMAL);
            return false;
        }
        if (state_.load() != ConnectionState::Open) {
            return false;
        }

        guarded_receive([this, timeout_ms] {
            if (!needs_drain_) {
                transport_.set_wait_timeout(timeout_ms);
                int ready = transport_.wait();
                if (ready < 0) {
                    throw std::runtime_error(std::string("event wait failed: ") + strerror(errno));
                }
                if (ready == 0) {
                    return;
                }
            }
            needs_drain_ = false;
            receive_available();
        });

        return state_.load() == ConnectionState::Open;
    }

    /**
     * Run poll_once() until the connection is Closed
     */
    void run() {
        while (poll_once(RUN_WAIT_TIMEOUT_MS)) {
        }
    }

    /**
     * Close the connection
     *
     * Open: sends a close frame (best-effort), closes the socket, fires the
     * close callback with 1000. Connecting: closes silently. Closed: no-op.
     */
    void close() {
        if (tx_failed_.load() && state_.load() == ConnectionState::Open) {
            fail_connection(tx_failure(), codec::CLOSE_ABNORMAL);
            return;
        }

        ConnectionState expected = ConnectionState::Open;
        if (state_.compare_exchange_strong(expected, ConnectionState::Closing)) {
            send_close_frame_best_effort();
            teardown();
            TINYWS_DEBUG_PRINT("[WS] Closed locally\n");
            emit_close(codec::CLOSE_NORMAL, std::string());
            return;
        }

        if (expected == ConnectionState::Connecting) {
            teardown();
        }
    }

    ConnectionState state() const { return state_.load(); }
    bool is_open() const { return state_.load() == ConnectionState::Open; }

    const Url& url() const { return url_; }
    const ConnectionConfig& config() const { return config_; }

    TransportPolicy& transport() { return transport_; }

private:
    // =========================================================================
    // Handshake
    // =========================================================================

    void perform_upgrade(std::chrono::steady_clock::time_point deadline) {
        ws_key_ = handshake::generate_websocket_key();
        std::string request = handshake::build_upgrade_request(url_, ws_key_, config_.custom_headers);
        write_all(reinterpret_cast<const uint8_t*>(request.data()), request.size(), remaining_ms(deadline));

        std::vector<uint8_t> response;
        while (true) {
            ssize_t n = io_read(read_chunk_.data(), read_chunk_.size());

            if (n > 0) {
                response.insert(response.end(), read_chunk_.begin(), read_chunk_.begin() + n);

                size_t head_end = handshake::find_head_end(response.data(), response.size());
                if (head_end > 0) {
                    std::string_view head(reinterpret_cast<const char*>(response.data()), head_end);
                    handshake::UpgradeResponse parsed = handshake::parse_response_head(head);
                    handshake::validate_upgrade_response(parsed, ws_key_, config_.verify_accept);

                    rx_buffer_.assign(response.begin() + head_end, response.end());
                    // Stopped reading before EAGAIN; the edge may already be consumed
                    needs_drain_ = true;
                    return;
                }
                if (response.size() > config_.max_handshake_response) {
                    throw WebSocketError(ErrorCode::HandshakeRejected,
                        "response head exceeds " + std::to_string(config_.max_handshake_response) + " bytes");
                }
                continue;
            }

            if (n == 0) {
                throw WebSocketError(ErrorCode::TransportError, "connection closed during handshake");
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                throw std::runtime_error(std::string("recv() failed: ") + strerror(errno));
            }

            int remaining = remaining_ms(deadline);
            if (remaining <= 0) {
                throw WebSocketError(ErrorCode::HandshakeTimeout,
                    "no upgrade response within " + std::to_string(config_.handshake_timeout_ms) + " ms");
            }
            transport_.set_wait_timeout(remaining);
            if (transport_.wait() < 0) {
                throw std::runtime_error(std::string("event wait failed: ") + strerror(errno));
            }
        }
    }

    void fail_handshake(const WebSocketError& error) {
        TINYWS_DEBUG_PRINT("[WS] Handshake failed: %s\n", error.what());
        teardown();
        emit_error(error);
    }

    // =========================================================================
    // Receive path (loop thread)
    // =========================================================================

    template<typename Fn>
    void guarded_receive(Fn&& fn) {
        try {
            fn();
        } catch (const WebSocketError& e) {
            fail_connection(e, codec::CLOSE_ABNORMAL);
        } catch (const std::exception& e) {
            fail_connection(WebSocketError(ErrorCode::TransportError, e.what()), codec::CLOSE_ABNORMAL);
        }
    }

    // Read until the socket would block (edge-triggered), decoding after every chunk
    void receive_available() {
        while (state_.load() == ConnectionState::Open) {
            ssize_t n = io_read(read_chunk_.data(), read_chunk_.size());

            if (n > 0) {
                rx_buffer_.insert(rx_buffer_.end(), read_chunk_.begin(), read_chunk_.begin() + n);
                process_rx_buffer();
                continue;
            }
            if (n == 0) {
                handle_eof();
                return;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return;
            }
            throw std::runtime_error(std::string("recv() failed: ") + strerror(errno));
        }
    }

    void process_rx_buffer() {
        codec::DecodeResult result = codec::decode_frames(rx_buffer_, config_.max_frame_size);

        for (const codec::Frame& frame : result.frames) {
            if (state_.load() != ConnectionState::Open) {
                return;
            }
            dispatch_frame(frame);
        }
        if (state_.load() != ConnectionState::Open) {
            return;
        }

        rx_buffer_.erase(rx_buffer_.begin(), rx_buffer_.begin() + result.consumed);

        if (result.protocol_error) {
            state_.store(ConnectionState::Closing);
            send_close_frame_best_effort();
            fail_connection(WebSocketError(ErrorCode::ProtocolViolation, result.error),
                            codec::CLOSE_PROTOCOL_ERROR);
        }
    }

    void dispatch_frame(const codec::Frame& frame) {
        if (frame.masked) {
            state_.store(ConnectionState::Closing);
            send_close_frame_best_effort();
            fail_connection(WebSocketError(ErrorCode::ProtocolViolation, "masked frame from server"),
                            codec::CLOSE_PROTOCOL_ERROR);
            return;
        }

        switch (frame.opcode) {
            case codec::Opcode::TEXT:
                if (on_message_) {
                    invoke(on_message_, frame.text());
                }
                break;

            case codec::Opcode::PING: {
                std::vector<uint8_t> pong = codec::encode_pong_frame(frame.payload.data(), frame.payload.size());
                write_all(pong.data(), pong.size(), -1);
                TINYWS_DEBUG_PRINT("[WS] PONG sent (%zu bytes payload)\n", frame.payload.size());
                break;
            }

            case codec::Opcode::CLOSE: {
                auto [code, reason] = codec::parse_close_payload(frame);
                handle_peer_close(code, reason);
                break;
            }

            default:
                TINYWS_DEBUG_PRINT("[WS] Dropped %s frame (%zu bytes)\n",
                                   codec::opcode_name(frame.opcode), frame.payload.size());
                break;
        }
    }

    void handle_peer_close(uint16_t code, const std::string& reason) {
        TINYWS_DEBUG_PRINT("[WS] Peer close (code=%u)\n", code);
        state_.store(ConnectionState::Closing);
        send_close_frame_best_effort();
        teardown();
        emit_close(code, reason);
    }

    void handle_eof() {
        if (tx_failed_.load()) {
            fail_connection(tx_failure(), codec::CLOSE_ABNORMAL);
            return;
        }
        TINYWS_DEBUG_PRINT("[WS] Connection closed by peer without close frame\n");
        teardown();
        emit_close(codec::CLOSE_ABNORMAL, "connection closed without close frame");
    }

    /**
     * Terminal failure of an established connection: one error event, then
     * one close event if it had been Open
     */
    void fail_connection(const WebSocketError& error, uint16_t close_code) {
        ConnectionState previous = state_.load();
        if (previous == ConnectionState::Closed) {
            return;
        }
        teardown();
        emit_error(error);
        if (previous == ConnectionState::Open || previous == ConnectionState::Closing) {
            emit_close(close_code, error.detail());
        }
    }

    // =========================================================================
    // I/O routing (TLS or plain transport)
    // =========================================================================

    ssize_t io_read(void* buf, size_t len) {
        if constexpr (SSLPolicy::is_tls) {
            if (use_tls_) {
                std::lock_guard<std::mutex> lock(io_mutex_);
                return ssl_.read(buf, len);
            }
        }
        return transport_.recv(buf, len);
    }

    ssize_t io_write(const void* buf, size_t len) {
        if constexpr (SSLPolicy::is_tls) {
            if (use_tls_) {
                return ssl_.write(buf, len);
            }
        }
        return transport_.send(buf, len);
    }

    /**
     * Write the whole buffer under the I/O mutex
     *
     * Data writes need Connecting or Open; the close frame also goes out
     * while Closing. The state is checked once the mutex is held and again
     * whenever the socket is full.
     *
     * @param timeout_ms Overall bound (-1 = none)
     * @param close_frame Writing the close frame
     * @throws WebSocketError(NotConnected) if the state no longer allows the write
     * @throws std::runtime_error on socket error or timeout
     */
    void write_all(const uint8_t* data, size_t len, int timeout_ms, bool close_frame = false) {
        std::lock_guard<std::mutex> lock(io_mutex_);

        if (!may_write(close_frame)) {
            throw WebSocketError(ErrorCode::NotConnected,
                std::string("write in state ") + state_name(state_.load()));
        }
        if (close_frame && partial_frame_) {
            throw std::runtime_error("an earlier frame was cut off mid-write");
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        size_t sent = 0;
        while (sent < len) {
            ssize_t n = io_write(data + sent, len - sent);
            if (n > 0) {
                sent += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (!may_write(close_frame)) {
                    partial_frame_ = partial_frame_ || sent > 0;
                    throw WebSocketError(ErrorCode::NotConnected,
                        std::string("connection ") + state_name(state_.load()) + " during write");
                }
                int wait_ms = WRITE_WAIT_SLICE_MS;
                if (timeout_ms >= 0) {
                    int remaining = remaining_ms(deadline);
                    if (remaining <= 0) {
                        throw std::runtime_error("write timeout");
                    }
                    wait_ms = std::min(wait_ms, remaining);
                }
                if (transport_.wait_writable(wait_ms) < 0) {
                    throw std::runtime_error("socket error while waiting to write");
                }
                continue;
            }
            throw std::runtime_error(std::string("send() failed: ") + strerror(n == 0 ? EPIPE : errno));
        }
    }

    bool may_write(bool close_frame) const {
        ConnectionState state = state_.load();
        if (state == ConnectionState::Closing) {
            return close_frame;
        }
        return state != ConnectionState::Closed;
    }

    void send_close_frame_best_effort() {
        try {
            std::vector<uint8_t> frame = codec::encode_close_frame();
            write_all(frame.data(), frame.size(), WRITE_WAIT_SLICE_MS, true);
        } catch (const std::exception& e) {
            TINYWS_WARN("close frame not sent: %s\n", e.what());
        }
    }

    void record_tx_failure(const std::string& detail) {
        {
            std::lock_guard<std::mutex> lock(tx_error_mutex_);
            tx_error_ = detail;
        }
        tx_failed_.store(true);
        // Wakes the loop thread; it reports the failure
        std::lock_guard<std::mutex> lock(io_mutex_);
        transport_.shutdown();
    }

    WebSocketError tx_failure() {
        std::lock_guard<std::mutex> lock(tx_error_mutex_);
        return WebSocketError(ErrorCode::TransportError, tx_error_);
    }

    void teardown() {
        state_.store(ConnectionState::Closed);
        std::lock_guard<std::mutex> lock(io_mutex_);
        if constexpr (SSLPolicy::is_tls) {
            if (use_tls_) {
                ssl_.shutdown();
            }
        }
        transport_.close();
        rx_buffer_.clear();
        needs_drain_ = false;
    }

    // =========================================================================
    // Events
    // =========================================================================

    template<typename Callback, typename... Args>
    void invoke(const Callback& cb, Args&&... args) {
        if (!cb) return;
        try {
            cb(std::forward<Args>(args)...);
        } catch (const std::exception& e) {
            TINYWS_WARN("callback threw: %s\n", e.what());
        }
    }

    void emit_error(const WebSocketError& error) {
        TINYWS_DEBUG_PRINT("[WS] Error: %s\n", error.what());
        invoke(on_error_, error);
    }

    void emit_close(uint16_t code, const std::string& reason) {
        invoke(on_close_, code, reason);
    }

    static int remaining_ms(std::chrono::steady_clock::time_point deadline) {
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        return remaining > 0 ? static_cast<int>(remaining) : 0;
    }

    ConnectionConfig config_;
    SSLPolicy ssl_;
    TransportPolicy transport_;

    std::atomic<ConnectionState> state_{ConnectionState::Connecting};
    bool connect_called_ = false;
    bool use_tls_ = false;
    bool needs_drain_ = false;

    Url url_;
    std::string ws_key_;

    std::vector<uint8_t> rx_buffer_;    // Prefix of at most one incomplete frame between passes
    std::vector<uint8_t> read_chunk_;

    std::mutex io_mutex_;               // Serializes socket writes (and TLS reads)
    bool partial_frame_ = false;        // A write stopped mid-frame (guarded by io_mutex_)
    std::atomic<bool> tx_failed_{false};
    std::mutex tx_error_mutex_;
    std::string tx_error_;

    OpenCallback on_open_;
    MessageCallback on_message_;
    CloseCallback on_close_;
    ErrorCallback on_error_;
};

} // namespace tinyws
