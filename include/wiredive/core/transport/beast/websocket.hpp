#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "wiredive/core/transport/websocket_concept.hpp"
#include "wiredive/core/transport/frame_queue.hpp"
#include "wiredive/core/transport/error.hpp"
#include "lcr/log/logger.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast + OpenSSL)
================================================================================

Single-connection transport primitive used by session::Session.

Design highlights:
  • No retries, no reconnection logic. Retry and backoff live in Session.
  • One I/O thread per connection runs the io_context. Every socket
    operation (read loop, write, ping, close) executes on that thread;
    send(), ping() and close() post the operation and wait for its
    completion, so callers observe synchronous semantics.
  • Complete messages are copied into transport::Frame values and handed
    to the owner through a bounded FrameQueue.
  • Failure-first signaling. A read error, remote CLOSE or queue overflow
    closes the FrameQueue exactly once with the classified reason.
  • Idempotent close(). The CLOSE handshake is bounded by CLOSE_TIMEOUT,
    after which the socket is torn down regardless.
  • Liveness. Beast keep-alive pings are enabled with IDLE_TIMEOUT, so a
    silent peer is detected even when the owner is not actively pinging.
================================================================================
*/

namespace wiredive::core {
namespace transport {
namespace beast {

class WebSocket {
public:
    static constexpr std::size_t INBOUND_QUEUE_CAPACITY = 4096;
    static constexpr std::chrono::milliseconds WRITE_TIMEOUT{10000};
    static constexpr std::chrono::milliseconds CLOSE_TIMEOUT{2000};
    static constexpr std::chrono::seconds IDLE_TIMEOUT{30};

    explicit WebSocket(lcr::log::Logger& log);
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // -----------------------------------------------------------------
    // Lifecycle
    // -----------------------------------------------------------------

    // Resolve, TCP connect, TLS handshake (wss) and WebSocket upgrade.
    // Each step is bounded by `timeout`.
    [[nodiscard]]
    Error connect(const ParsedUrl& url, const Handshake& handshake, std::chrono::milliseconds timeout) noexcept;

    void close() noexcept;

    [[nodiscard]]
    bool is_open() const noexcept {
        return open_.load(std::memory_order_acquire);
    }

    // -----------------------------------------------------------------
    // Data plane
    // -----------------------------------------------------------------

    [[nodiscard]]
    bool send(std::string_view payload, FrameKind kind) noexcept;

    [[nodiscard]]
    bool ping() noexcept;

    [[nodiscard]]
    WaitStatus wait_frame(Frame& out, std::optional<std::chrono::milliseconds> timeout) noexcept;

    // -----------------------------------------------------------------
    // Diagnostics
    // -----------------------------------------------------------------

    [[nodiscard]]
    Error close_reason() const noexcept {
        return queue_.close_reason();
    }

    [[nodiscard]]
    std::uint64_t rx_messages() const noexcept {
        return rx_messages_.load(std::memory_order_relaxed);
    }

    [[nodiscard]]
    std::uint64_t tx_messages() const noexcept {
        return tx_messages_.load(std::memory_order_relaxed);
    }

    [[nodiscard]]
    std::uint64_t pongs() const noexcept {
        return pongs_.load(std::memory_order_relaxed);
    }

private:
    using tcp_stream = boost::beast::tcp_stream;
    using plain_ws   = boost::beast::websocket::stream<tcp_stream>;
    using tls_ws     = boost::beast::websocket::stream<boost::beast::ssl_stream<tcp_stream>>;

    template <class Stream>
    Error establish_(Stream& ws, const ParsedUrl& url, const Handshake& handshake, std::chrono::milliseconds timeout);

    template <class Stream>
    void read_next_(Stream& ws);

    void on_read_error_(const boost::system::error_code& ec, std::string_view close_reason);

    template <class Op, class Cancel>
    boost::system::error_code await_(Op&& op, std::chrono::milliseconds limit, Cancel&& cancel);

    // Invokes f(stream) on whichever stream is active
    template <class F>
    void visit_(F&& f) {
        if (wss_) {
            f(*wss_);
        } else if (ws_) {
            f(*ws_);
        }
    }

    void cancel_socket_() noexcept;
    void start_io_();
    void stop_io_() noexcept;

private:
    lcr::log::Logger& log_;

    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread io_thread_;

    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::unique_ptr<plain_ws> ws_;
    std::unique_ptr<tls_ws> wss_;

    boost::beast::flat_buffer rx_buffer_;
    FrameQueue queue_{INBOUND_QUEUE_CAPACITY};

    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};

    std::atomic<std::uint64_t> rx_messages_{0};
    std::atomic<std::uint64_t> tx_messages_{0};
    std::atomic<std::uint64_t> pongs_{0};
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace beast
} // namespace transport
} // namespace wiredive::core
