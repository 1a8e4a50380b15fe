// src/core/error.hpp
// Error taxonomy for the WebSocket transport
//
// Policies (transport, SSL, random source) throw std::runtime_error.
// WebSocketConnection converts those at its boundary into WebSocketError,
// which carries one of the codes below:
//   - thrown synchronously from send()
//   - delivered through the error callback for connection lifecycle failures

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tinyws {

enum class ErrorCode : uint8_t {
    HandshakeTimeout,    // No upgrade response before the handshake deadline
    HandshakeRejected,   // Peer answered with something other than a valid 101
    TransportError,      // Socket / TLS level I/O failure
    ProtocolViolation,   // Unparsable or forbidden frame on the wire
    NotConnected,        // Operation attempted outside the Open state
    InvalidUrl,          // connect() given a URL it cannot use
    InvalidState,        // connect() called on an already used connection
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::HandshakeTimeout:  return "HandshakeTimeout";
        case ErrorCode::HandshakeRejected: return "HandshakeRejected";
        case ErrorCode::TransportError:    return "TransportError";
        case ErrorCode::ProtocolViolation: return "ProtocolViolation";
        case ErrorCode::NotConnected:      return "NotConnected";
        case ErrorCode::InvalidUrl:        return "InvalidUrl";
        case ErrorCode::InvalidState:      return "InvalidState";
    }
    return "Unknown";
}

/**
 * WebSocketError - std::runtime_error tagged with an ErrorCode
 *
 * what() is "<CodeName>: <detail>".
 */
class WebSocketError : public std::runtime_error {
public:
    WebSocketError(ErrorCode code, const std::string& detail)
        : std::runtime_error(std::string(error_code_name(code)) + ": " + detail)
        , code_(code)
        , detail_(detail)
    {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorCode code_;
    std::string detail_;
};

} // namespace tinyws
