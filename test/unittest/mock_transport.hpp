// test/unittest/mock_transport.hpp
// Scripted transport for driving WebSocketConnection without sockets
//
// - Incoming bytes are queued chunks; recv() hands them out in order, then
//   reports EAGAIN (or EOF once eof() was scripted)
// - Outgoing bytes are recorded: everything up to the end of the HTTP request
//   head is the upgrade request, the rest is frame bytes
// - By default the mock answers a complete upgrade request with a valid
//   101 response computed from the request's Sec-WebSocket-Key
// - block_writes makes every frame write report EAGAIN, like a peer that
//   stopped reading

#pragma once

#include "../../src/ws_policies.hpp"
#include "../../src/core/frame_codec.hpp"
#include "../../src/core/handshake.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <deque>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

enum class MockResponse {
    Accept,     // Valid 101 for the request's key
    Custom,     // custom_response verbatim
    None,       // Never answer
};

struct MockTransport {
    // Script
    MockResponse response_mode = MockResponse::Accept;
    std::string custom_response;
    std::vector<uint8_t> response_suffix;   // Appended to the response in the same chunk
    bool fail_connect = false;
    bool fail_writes = false;
    std::atomic<bool> block_writes{false};

    // Observed
    std::string host;
    uint16_t port = 0;
    int connect_timeout_ms = -1;
    int close_calls = 0;
    int shutdown_calls = 0;
    bool event_loop_started = false;
    std::string request;
    std::vector<uint8_t> written;           // Bytes after the request head

    void push(const std::vector<uint8_t>& bytes) {
        incoming_.push_back(bytes);
    }

    void push(const std::string& bytes) {
        incoming_.emplace_back(bytes.begin(), bytes.end());
    }

    void eof() { eof_ = true; }

    // Client frames written after the handshake, unmasked
    std::vector<tinyws::codec::Frame> sent_frames() const {
        return tinyws::codec::decode_frames(written).frames;
    }

    // =========================================================================
    // TransportPolicyConcept
    // =========================================================================

    void init() {}

    void connect(const char* h, uint16_t p, int timeout_ms, bool) {
        host = h;
        port = p;
        connect_timeout_ms = timeout_ms;
        if (fail_connect) {
            throw std::runtime_error("connect() failed: Connection refused");
        }
        connected_ = true;
    }

    void close() {
        close_calls++;
        connected_ = false;
    }

    void shutdown() {
        shutdown_calls++;
        eof_ = true;
    }

    bool is_connected() const { return connected_; }

    ssize_t send(const void* buf, size_t len) {
        if (!connected_) {
            errno = ENOTCONN;
            return -1;
        }
        if (fail_writes) {
            errno = EPIPE;
            return -1;
        }

        if (request_done_ && block_writes.load()) {
            errno = EAGAIN;
            return -1;
        }

        const char* p = static_cast<const char*>(buf);
        if (!request_done_) {
            request.append(p, len);
            size_t end = request.find("\r\n\r\n");
            if (end != std::string::npos) {
                // Anything past the head belongs to the frame stream
                written.insert(written.end(), request.begin() + end + 4, request.end());
                request.resize(end + 4);
                request_done_ = true;
                answer_request();
            }
        } else {
            written.insert(written.end(), p, p + len);
        }
        return static_cast<ssize_t>(len);
    }

    ssize_t recv(void* buf, size_t len) {
        if (!connected_) {
            errno = ENOTCONN;
            return -1;
        }
        if (incoming_.empty()) {
            if (eof_) return 0;
            errno = EAGAIN;
            return -1;
        }

        std::vector<uint8_t>& front = incoming_.front();
        size_t n = std::min(len, front.size());
        std::memcpy(buf, front.data(), n);
        if (n == front.size()) {
            incoming_.pop_front();
        } else {
            front.erase(front.begin(), front.begin() + n);
        }
        return static_cast<ssize_t>(n);
    }

    void start_event_loop() { event_loop_started = true; }

    void set_wait_timeout(int timeout_ms) { wait_timeout_ms_ = timeout_ms; }

    int wait() {
        if (!incoming_.empty() || eof_) {
            return 1;
        }
        if (wait_timeout_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(wait_timeout_ms_));
        }
        return 0;
    }

    int wait_writable(int timeout_ms) {
        if (block_writes.load()) {
            if (timeout_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            }
            return 0;
        }
        return 1;
    }

    int get_fd() const { return connected_ ? 42 : -1; }

private:
    void answer_request() {
        std::string head;
        if (response_mode == MockResponse::None) {
            return;
        }
        if (response_mode == MockResponse::Custom) {
            head = custom_response;
        } else {
            const std::string marker = "Sec-WebSocket-Key: ";
            size_t pos = request.find(marker);
            if (pos == std::string::npos) {
                throw std::runtime_error("upgrade request without Sec-WebSocket-Key");
            }
            size_t start = pos + marker.size();
            std::string key = request.substr(start, request.find("\r\n", start) - start);
            head = "HTTP/1.1 101 Switching Protocols\r\n"
                   "Upgrade: websocket\r\n"
                   "Connection: Upgrade\r\n"
                   "Sec-WebSocket-Accept: " + tinyws::handshake::compute_accept_key(key) + "\r\n\r\n";
        }

        std::vector<uint8_t> chunk(head.begin(), head.end());
        chunk.insert(chunk.end(), response_suffix.begin(), response_suffix.end());
        incoming_.push_back(std::move(chunk));
    }

    std::deque<std::vector<uint8_t>> incoming_;
    bool eof_ = false;
    bool connected_ = false;
    bool request_done_ = false;
    int wait_timeout_ms_ = -1;
};

static_assert(tinyws::TransportPolicyConcept<MockTransport>);

/**
 * Build an unmasked server frame
 *
 * @param first_byte FIN/RSV/opcode byte as it goes on the wire
 */
inline std::vector<uint8_t> server_frame(uint8_t first_byte, const std::string& payload) {
    std::vector<uint8_t> frame;
    frame.push_back(first_byte);
    if (payload.size() <= 125) {
        frame.push_back(static_cast<uint8_t>(payload.size()));
    } else if (payload.size() <= 0xFFFF) {
        frame.push_back(126);
        frame.push_back(static_cast<uint8_t>(payload.size() >> 8));
        frame.push_back(static_cast<uint8_t>(payload.size() & 0xFF));
    } else {
        frame.push_back(127);
        for (int i = 7; i >= 0; i--) {
            frame.push_back(static_cast<uint8_t>((static_cast<uint64_t>(payload.size()) >> (i * 8)) & 0xFF));
        }
    }
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

inline std::vector<uint8_t> server_text(const std::string& text) {
    return server_frame(0x81, text);
}

inline std::vector<uint8_t> server_close(uint16_t code, const std::string& reason) {
    std::string payload;
    payload.push_back(static_cast<char>(code >> 8));
    payload.push_back(static_cast<char>(code & 0xFF));
    payload += reason;
    return server_frame(0x88, payload);
}

inline std::vector<uint8_t> concat(std::vector<uint8_t> a, const std::vector<uint8_t>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}
