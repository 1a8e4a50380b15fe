// src/core/handshake.hpp
// HTTP/1.1 Upgrade handshake utilities (RFC 6455 section 4)
//
// Transport-agnostic: builds the client request and validates the server's
// response head. No socket or SSL dependencies; OpenSSL is used only for
// SHA-1, base64 and the nonce.
//
// Key features:
//   - Random 16-byte Sec-WebSocket-Key (base64, 24 chars)
//   - CRLF-injection check on custom headers
//   - Response validation: 101 status, Upgrade, Connection, Sec-WebSocket-Accept

#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <openssl/evp.h>

#include "error.hpp"
#include "random.hpp"
#include "url.hpp"

namespace tinyws {
namespace handshake {

constexpr const char* WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr const char* WEBSOCKET_VERSION = "13";
constexpr size_t KEY_NONCE_SIZE = 16;
constexpr size_t KEY_LENGTH = 24;               // base64 of 16 bytes
constexpr int SWITCHING_PROTOCOLS = 101;

using HeaderMap = std::vector<std::pair<std::string, std::string>>;

// ═══════════════════════════════════════════════════════════════════════════
// Encoding Helpers
// ═══════════════════════════════════════════════════════════════════════════

inline std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                  static_cast<int>(len));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

inline std::string_view trim(std::string_view s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string_view::npos) return {};
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Request
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Validate HTTP header key/value for CRLF injection attacks
 *
 * @return true if safe, false if empty key or contains CR/LF
 */
inline bool is_valid_header(const std::string& key, const std::string& value) {
    if (key.empty()) {
        return false;
    }
    if (key.find_first_of("\r\n:") != std::string::npos) {
        return false;
    }
    if (value.find_first_of("\r\n") != std::string::npos) {
        return false;
    }
    return true;
}

/**
 * Generate random WebSocket key: 16 CSPRNG bytes, base64-encoded
 *
 * @return 24-character key for the Sec-WebSocket-Key header
 */
inline std::string generate_websocket_key() {
    auto nonce = secure_random_array<KEY_NONCE_SIZE>();
    return base64_encode(nonce.data(), nonce.size());
}

/**
 * Expected Sec-WebSocket-Accept for a key: base64(SHA1(key + GUID))
 *
 * @throws std::runtime_error if the digest cannot be computed
 */
inline std::string compute_accept_key(std::string_view key) {
    std::string source(key);
    source += WEBSOCKET_GUID;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(source.data(), source.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(SHA1) failed");
    }
    return base64_encode(digest, digest_len);
}

/**
 * Build HTTP WebSocket upgrade request
 *
 * Custom headers failing is_valid_header() are skipped.
 *
 * @param url Target (Host header and request target)
 * @param ws_key Sec-WebSocket-Key value
 * @param custom_headers Additional headers, sent in order
 * @return Complete request including the terminating blank line
 */
inline std::string build_upgrade_request(const Url& url, const std::string& ws_key,
                                         const HeaderMap& custom_headers = {}) {
    std::string request;
    request.reserve(512);

    request += "GET ";
    request += url.resource;
    request += " HTTP/1.1\r\n";
    request += "Host: ";
    request += url.host_header();
    request += "\r\n";
    request += "Upgrade: websocket\r\n";
    request += "Connection: Upgrade\r\n";
    request += "Sec-WebSocket-Key: ";
    request += ws_key;
    request += "\r\n";
    request += "Sec-WebSocket-Version: ";
    request += WEBSOCKET_VERSION;
    request += "\r\n";

    for (const auto& [key, value] : custom_headers) {
        if (!is_valid_header(key, value)) {
            continue;
        }
        request += key;
        request += ": ";
        request += value;
        request += "\r\n";
    }

    request += "\r\n";
    return request;
}

// ═══════════════════════════════════════════════════════════════════════════
// Response
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Locate the end of the HTTP response head
 *
 * @return Offset just past "\r\n\r\n", or 0 if the head is not complete yet
 */
inline size_t find_head_end(const uint8_t* data, size_t len) {
    for (size_t i = 3; i < len; i++) {
        if (data[i] == '\n' && data[i - 1] == '\r' && data[i - 2] == '\n' && data[i - 3] == '\r') {
            return i + 1;
        }
    }
    return 0;
}

struct UpgradeResponse {
    int status_code = 0;
    std::string status_line;
    HeaderMap headers;    // Names lower-cased

    const std::string* find_header(std::string_view lower_name) const {
        for (const auto& header : headers) {
            if (header.first == lower_name) {
                return &header.second;
            }
        }
        return nullptr;
    }
};

/**
 * Parse an HTTP/1.1 response head (status line + headers)
 *
 * @param head Bytes up to and including the blank line
 * @throws WebSocketError(HandshakeRejected) if the status line is malformed
 */
inline UpgradeResponse parse_response_head(std::string_view head) {
    UpgradeResponse response;

    size_t line_end = head.find("\r\n");
    std::string_view status_line = head.substr(0, line_end);
    response.status_line = std::string(status_line);

    // "HTTP/1.1 101 Switching Protocols"
    if (status_line.size() < 12 || status_line.substr(0, 5) != "HTTP/") {
        throw WebSocketError(ErrorCode::HandshakeRejected,
                             "malformed status line '" + response.status_line + "'");
    }
    size_t space = status_line.find(' ');
    if (space == std::string_view::npos || space + 4 > status_line.size()) {
        throw WebSocketError(ErrorCode::HandshakeRejected,
                             "malformed status line '" + response.status_line + "'");
    }
    std::string_view code = status_line.substr(space + 1, 3);
    if (code.find_first_not_of("0123456789") != std::string_view::npos) {
        throw WebSocketError(ErrorCode::HandshakeRejected,
                             "malformed status code in '" + response.status_line + "'");
    }
    response.status_code = (code[0] - '0') * 100 + (code[1] - '0') * 10 + (code[2] - '0');

    size_t pos = (line_end == std::string_view::npos) ? head.size() : line_end + 2;
    while (pos < head.size()) {
        size_t end = head.find("\r\n", pos);
        if (end == std::string_view::npos) end = head.size();
        std::string_view line = head.substr(pos, end - pos);
        pos = end + 2;

        if (line.empty()) break;
        size_t colon = line.find(':');
        if (colon == std::string_view::npos) continue;

        response.headers.emplace_back(to_lower(trim(line.substr(0, colon))),
                                      std::string(trim(line.substr(colon + 1))));
    }

    return response;
}

inline bool has_token(std::string_view value, std::string_view lower_token) {
    std::string lowered = to_lower(value);
    std::string_view rest = lowered;
    while (!rest.empty()) {
        size_t comma = rest.find(',');
        if (trim(rest.substr(0, comma)) == lower_token) {
            return true;
        }
        if (comma == std::string_view::npos) break;
        rest = rest.substr(comma + 1);
    }
    return false;
}

/**
 * Validate a parsed upgrade response
 *
 * @param response Parsed head
 * @param ws_key Key sent in the request
 * @param verify_accept Check Sec-WebSocket-Accept against ws_key
 * @throws WebSocketError(HandshakeRejected) with the reason
 */
inline void validate_upgrade_response(const UpgradeResponse& response, const std::string& ws_key,
                                      bool verify_accept = true) {
    if (response.status_code != SWITCHING_PROTOCOLS) {
        throw WebSocketError(ErrorCode::HandshakeRejected,
                             "server answered '" + response.status_line + "'");
    }

    const std::string* upgrade = response.find_header("upgrade");
    if (!upgrade || to_lower(*upgrade) != "websocket") {
        throw WebSocketError(ErrorCode::HandshakeRejected, "missing 'Upgrade: websocket'");
    }

    const std::string* connection = response.find_header("connection");
    if (!connection || !has_token(*connection, "upgrade")) {
        throw WebSocketError(ErrorCode::HandshakeRejected, "missing 'Connection: Upgrade'");
    }

    if (response.find_header("sec-websocket-extensions")) {
        throw WebSocketError(ErrorCode::HandshakeRejected, "server selected an extension that was not offered");
    }

    if (verify_accept) {
        const std::string* accept = response.find_header("sec-websocket-accept");
        if (!accept) {
            throw WebSocketError(ErrorCode::HandshakeRejected, "missing Sec-WebSocket-Accept");
        }
        if (*accept != compute_accept_key(ws_key)) {
            throw WebSocketError(ErrorCode::HandshakeRejected, "Sec-WebSocket-Accept mismatch");
        }
    }
}

} // namespace handshake
} // namespace tinyws
