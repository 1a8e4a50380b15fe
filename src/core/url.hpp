// src/core/url.hpp
// WebSocket URL parsing (ws:// and wss://)
//
//   ws://host[:port][/path][?query][#fragment]
//
// Scheme is case-insensitive. Default ports: ws=80, wss=443.
// Resource = path + query ("/" when absent); the fragment is dropped.
// Not supported: userinfo (user@host), IPv6 literals ([::1]).

#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

#include "error.hpp"

namespace tinyws {

struct Url {
    bool secure = false;       // wss://
    std::string host;
    uint16_t port = 0;
    std::string resource = "/";

    uint16_t default_port() const { return secure ? 443 : 80; }

    /**
     * Value for the Host header: port is appended only when non-default
     */
    std::string host_header() const {
        if (port == default_port()) {
            return host;
        }
        return host + ":" + std::to_string(port);
    }
};

namespace detail {

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace detail

/**
 * Parse a WebSocket URL
 *
 * @param url e.g. "ws://127.0.0.1:18789/gateway?token=abc"
 * @return Parsed URL
 * @throws WebSocketError(InvalidUrl) on malformed input
 */
inline Url parse_url(std::string_view url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        throw WebSocketError(ErrorCode::InvalidUrl, "missing scheme in '" + std::string(url) + "'");
    }

    Url out;
    std::string_view scheme = url.substr(0, scheme_end);
    if (detail::iequals(scheme, "ws")) {
        out.secure = false;
    } else if (detail::iequals(scheme, "wss")) {
        out.secure = true;
    } else {
        throw WebSocketError(ErrorCode::InvalidUrl, "scheme must be ws or wss, got '" +
                                                    std::string(scheme) + "'");
    }

    std::string_view rest = url.substr(scheme_end + 3);

    // Fragment is never sent on the wire
    size_t hash = rest.find('#');
    if (hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    size_t authority_end = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, authority_end);
    if (authority_end == std::string_view::npos) {
        out.resource = "/";
    } else if (rest[authority_end] == '?') {
        out.resource = "/" + std::string(rest.substr(authority_end));
    } else {
        out.resource = std::string(rest.substr(authority_end));
    }

    if (authority.find('@') != std::string_view::npos) {
        throw WebSocketError(ErrorCode::InvalidUrl, "userinfo is not supported");
    }
    if (!authority.empty() && authority.front() == '[') {
        throw WebSocketError(ErrorCode::InvalidUrl, "IPv6 literal hosts are not supported");
    }

    size_t colon = authority.find(':');
    std::string_view host = authority.substr(0, colon);
    if (host.empty()) {
        throw WebSocketError(ErrorCode::InvalidUrl, "missing host");
    }
    out.host = std::string(host);

    if (colon == std::string_view::npos) {
        out.port = out.default_port();
    } else {
        std::string_view port = authority.substr(colon + 1);
        if (port.empty() || port.size() > 5 ||
            port.find_first_not_of("0123456789") != std::string_view::npos) {
            throw WebSocketError(ErrorCode::InvalidUrl, "bad port '" + std::string(port) + "'");
        }
        unsigned long value = std::stoul(std::string(port));
        if (value == 0 || value > 65535) {
            throw WebSocketError(ErrorCode::InvalidUrl, "port out of range: " + std::string(port));
        }
        out.port = static_cast<uint16_t>(value);
    }

    return out;
}

} // namespace tinyws
