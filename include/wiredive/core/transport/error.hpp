#pragma once

#include <string_view>

namespace wiredive::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Why a connection could not be opened, or why its frame stream ended.

Values are independent of Boost.Beast, Boost.Asio and OpenSSL error codes.
Session::open() returns them when every connect attempt failed, and
FrameQueue::close_reason() carries the one that ended a stream.

Grouping:
  - Caller errors:   InvalidUrl, InvalidState
  - Clean endings:   LocalShutdown, RemoteClosed
  - Connect phase:   Timeout, ConnectionFailed, HandshakeFailed
  - Stream failures: ProtocolError, Backpressure, TransportFailure
===============================================================================
*/

enum class Error {
    None = 0,

    InvalidUrl,       // scheme other than ws/wss, missing host, bad port
    InvalidState,     // connect() on an active transport, open() twice

    LocalShutdown,    // close() on our side
    RemoteClosed,     // CLOSE frame from the server

    Timeout,          // resolve, connect, handshake or write past its deadline
    ConnectionFailed, // resolve or TCP connect refused
    HandshakeFailed,  // TLS failure or upgrade rejected (bad cookie, HTTP 403)

    ProtocolError,    // malformed frame or message above max_message_size
    Backpressure,     // inbound queue full; the owner stopped reading
    TransportFailure, // anything else
};


[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::Backpressure:      return "Backpressure";
    case Error::TransportFailure:  return "TransportFailure";
    }
    return "Unknown";
}

} // namespace transport
} // namespace wiredive::core
