// src/ws_configs.hpp
// Pre-configured WebSocket connection instantiations
//
// Template parameters:
//   - SSLPolicy: OpenSSLPolicy, NoSSLPolicy
//   - TransportPolicy: BSDSocketTransport<EventPolicy>
//
#pragma once

#include "websocket.hpp"

#include "policy/event.hpp"
#include "policy/ssl.hpp"
#include "policy/transport.hpp"

namespace tinyws {

using DefaultEventPolicy = event_policies::EpollPolicy;
using DefaultTransportPolicy = transport::BSDSocketTransport<DefaultEventPolicy>;

// ============================================================================
// Plaintext: ws:// only
// ============================================================================
// wss:// URLs fail connect() with InvalidUrl.

using WebSocket = WebSocketConnection<ssl::NoSSLPolicy, DefaultTransportPolicy>;

// ============================================================================
// TLS-capable: wss:// over OpenSSL, ws:// in plaintext
// ============================================================================

using SecureWebSocket = WebSocketConnection<ssl::OpenSSLPolicy, DefaultTransportPolicy>;

} // namespace tinyws
