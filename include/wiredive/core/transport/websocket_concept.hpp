/*
===============================================================================
WebSocketConcept (Pull-Based)
===============================================================================

Defines the minimal transport contract required by session::Session.

The WebSocket implementation:

  • Owns its I/O thread
  • Delivers complete inbound messages as transport::Frame values
  • Exposes a blocking, time-bounded pull (wait_frame) instead of callbacks
  • Reports closure through wait_frame() returning WaitStatus::Closed once
    every frame received before the close has been consumed
  • Is constructed with the logger of its owning Session
  • Is fully lifecycle-managed by Session

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

Producer thread:
  - WebSocket I/O thread
  - Reads messages, answers control frames, enqueues Frame values

Consumer thread:
  - The Session owner (exactly one at a time)
  - Calls send() / ping() / wait_frame() / close()

send(), ping() and close() may block until the I/O thread has completed the
corresponding write. None of the operations throw.

===============================================================================
*/
#pragma once

#include <string_view>
#include <optional>
#include <chrono>
#include <concepts>

#include "wiredive/core/transport/error.hpp"
#include "wiredive/core/transport/frame.hpp"
#include "wiredive/core/transport/frame_queue.hpp"
#include "wiredive/core/transport/handshake.hpp"
#include "wiredive/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace wiredive::core::transport {

template<class WS>
concept WebSocketConcept =
    std::constructible_from<WS, lcr::log::Logger&> &&
    requires(
        WS ws,
        const WS& cws,
        const ParsedUrl& url,
        const Handshake& handshake,
        std::chrono::milliseconds timeout,
        std::optional<std::chrono::milliseconds> wait,
        std::string_view payload,
        FrameKind kind,
        Frame& frame
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(url, handshake, timeout) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;
    { cws.is_open() } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(payload, kind) } noexcept -> std::same_as<bool>;
    { ws.ping() } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Receiving
    // ---------------------------------------------------------------------

    { ws.wait_frame(frame, wait) } noexcept -> std::same_as<WaitStatus>;
};

} // namespace wiredive::core::transport
