#include <future>
#include <exception>
#include <utility>
#include <type_traits>

#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include "wiredive/core/transport/beast/websocket.hpp"


namespace wiredive::core {
namespace transport {
namespace beast {

namespace net       = boost::asio;
namespace ssl       = boost::asio::ssl;
namespace http      = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp           = boost::asio::ip::tcp;
using error_code    = boost::system::error_code;

namespace {

// Maps a failed step to the transport classification. Timeouts are reported
// as such regardless of the step they interrupted.
[[nodiscard]]
Error classify_(const error_code& ec, Error fallback) noexcept {
    if (ec == boost::beast::error::timeout || ec == net::error::timed_out) {
        return Error::Timeout;
    }
    return fallback;
}

} // namespace


WebSocket::WebSocket(lcr::log::Logger& log)
    : log_(log)
{
}

WebSocket::~WebSocket() {
    close();
}

// -----------------------------------------------------------------------------
// I/O thread
// -----------------------------------------------------------------------------

void WebSocket::start_io_() {
    ioc_.restart();
    work_.emplace(net::make_work_guard(ioc_));
    io_thread_ = std::thread([this] {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            WD_ERROR(log_, "[WS] I/O thread terminated: " << e.what());
            open_.store(false, std::memory_order_release);
            queue_.close(Error::TransportFailure);
        }
    });
}

void WebSocket::stop_io_() noexcept {
    work_.reset();
    if (io_thread_.joinable()) {
        ioc_.stop();
        io_thread_.join();
    }
}

void WebSocket::cancel_socket_() noexcept {
    visit_([](auto& ws) {
        boost::beast::get_lowest_layer(ws).cancel();
    });
}

// Runs `op(handler)` on the I/O thread and waits for the handler.
// When `limit` elapses first, `cancel()` is posted and the aborted
// operation is still awaited so no handler outlives this frame.
template <class Op, class Cancel>
error_code WebSocket::await_(Op&& op, std::chrono::milliseconds limit, Cancel&& cancel) {
    std::promise<error_code> done;
    auto fut = done.get_future();
    net::post(ioc_, [&op, &done] {
        op([&done](error_code ec, auto&&...) { done.set_value(ec); });
    });
    if (fut.wait_for(limit) == std::future_status::ready) {
        return fut.get();
    }
    net::post(ioc_, [&cancel] { cancel(); });
    (void)fut.get();
    return boost::beast::error::timeout;
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

Error WebSocket::connect(const ParsedUrl& url, const Handshake& handshake, std::chrono::milliseconds timeout) noexcept {
    if (io_thread_.joinable()) {
        WD_WARN(log_, "[WS] connect() called on an active transport");
        return Error::InvalidState;
    }

    try {
        queue_.reset();
        closing_.store(false, std::memory_order_release);
        start_io_();

        // Streams
        Error result = Error::None;
        if (url.secure) {
            ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);
            ssl_ctx_->set_default_verify_paths();
            ssl_ctx_->set_verify_mode(ssl::verify_peer);
            wss_ = std::make_unique<tls_ws>(ioc_, *ssl_ctx_);
            // SNI
            if (!SSL_set_tlsext_host_name(wss_->next_layer().native_handle(), url.host.c_str())) {
                WD_ERROR(log_, "[WS] Failed to set SNI host name " << url.host);
                result = Error::HandshakeFailed;
            } else {
                wss_->next_layer().set_verify_callback(ssl::host_name_verification(url.host));
                result = establish_(*wss_, url, handshake, timeout);
            }
        } else {
            ws_ = std::make_unique<plain_ws>(ioc_);
            result = establish_(*ws_, url, handshake, timeout);
        }

        if (result != Error::None) {
            stop_io_();
            ws_.reset();
            wss_.reset();
            ssl_ctx_.reset();
            return result;
        }

        open_.store(true, std::memory_order_release);
        net::post(ioc_, [this] {
            visit_([this](auto& ws) { read_next_(ws); });
        });

        WD_INFO(log_, "[WS] Connected to " << (url.secure ? "wss://" : "ws://") << url.host_header() << url.target);
        return Error::None;
    }
    catch (const std::exception& e) {
        WD_ERROR(log_, "[WS] connect() failed: " << e.what());
        stop_io_();
        ws_.reset();
        wss_.reset();
        ssl_ctx_.reset();
        return Error::TransportFailure;
    }
}

template <class Stream>
Error WebSocket::establish_(Stream& ws, const ParsedUrl& url, const Handshake& handshake, std::chrono::milliseconds timeout) {
    auto& lowest = boost::beast::get_lowest_layer(ws);
    auto cancel = [&lowest] { lowest.cancel(); };

    // 1) Resolve + TCP connect
    tcp::resolver resolver{ioc_};
    tcp::resolver::results_type endpoints;
    error_code ec = await_(
        [&](auto handler) {
            resolver.async_resolve(url.host, url.port,
                [&lowest, &endpoints, handler](error_code ec, tcp::resolver::results_type results) mutable {
                    if (ec) {
                        handler(ec);
                        return;
                    }
                    endpoints = std::move(results);
                    lowest.async_connect(endpoints, [handler](error_code ec, const tcp::endpoint&) mutable {
                        handler(ec);
                    });
                });
        },
        timeout,
        [&resolver, &cancel] { resolver.cancel(); cancel(); });
    if (ec) {
        WD_ERROR(log_, "[WS] TCP connect to " << url.host << ":" << url.port << " failed (" << ec.message() << ")");
        return classify_(ec, Error::ConnectionFailed);
    }

    // 2) TLS handshake
    if constexpr (std::is_same_v<Stream, tls_ws>) {
        ec = await_(
            [&](auto handler) { ws.next_layer().async_handshake(ssl::stream_base::client, handler); },
            timeout,
            cancel);
        if (ec) {
            WD_ERROR(log_, "[WS] TLS handshake with " << url.host << " failed (" << ec.message() << ")");
            return classify_(ec, Error::HandshakeFailed);
        }
    }

    // 3) WebSocket upgrade
    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = timeout;
    opt.idle_timeout = IDLE_TIMEOUT;
    opt.keep_alive_pings = true;
    ws.set_option(opt);

    ws.set_option(websocket::stream_base::decorator(
        [headers = handshake.headers, protocols = handshake.subprotocol_header()](websocket::request_type& req) {
            for (const auto& [name, value] : headers) {
                req.set(name, value);
            }
            if (!protocols.empty()) {
                req.set(http::field::sec_websocket_protocol, protocols);
            }
        }));
    ws.read_message_max(handshake.max_message_size);
    ws.control_callback([this](websocket::frame_type kind, boost::beast::string_view) {
        if (kind == websocket::frame_type::pong) {
            pongs_.fetch_add(1, std::memory_order_relaxed);
        }
    });

    websocket::response_type response;
    const std::string host = url.host_header();
    ec = await_(
        [&](auto handler) { ws.async_handshake(response, host, url.target, handler); },
        timeout,
        cancel);
    if (ec) {
        WD_ERROR(log_, "[WS] WebSocket upgrade rejected by " << host << " (" << ec.message()
                       << ", HTTP " << response.result_int() << ")");
        return classify_(ec, Error::HandshakeFailed);
    }

    WD_DEBUG(log_, "[WS] Upgrade accepted (HTTP " << response.result_int() << ")");
    return Error::None;
}

void WebSocket::close() noexcept {
    if (!io_thread_.joinable()) {
        return;
    }
    closing_.store(true, std::memory_order_release);

    try {
        if (open_.exchange(false, std::memory_order_acq_rel)) {
            error_code ec = await_(
                [this](auto handler) {
                    visit_([&handler](auto& ws) { ws.async_close(websocket::close_code::normal, handler); });
                },
                CLOSE_TIMEOUT,
                [this] { cancel_socket_(); });
            if (ec && ec != net::error::operation_aborted) {
                WD_DEBUG(log_, "[WS] Close handshake incomplete (" << ec.message() << ")");
            }
        }

        // Tear down the socket on the I/O thread so the read loop completes
        net::post(ioc_, [this] {
            visit_([](auto& ws) {
                auto& lowest = boost::beast::get_lowest_layer(ws);
                error_code ignored;
                lowest.socket().shutdown(tcp::socket::shutdown_both, ignored);
                lowest.close();
            });
        });
    }
    catch (const std::exception& e) {
        WD_WARN(log_, "[WS] close() error: " << e.what());
    }

    work_.reset();
    io_thread_.join();

    queue_.close(Error::LocalShutdown);
    ws_.reset();
    wss_.reset();
    ssl_ctx_.reset();
    rx_buffer_.clear();

    WD_DEBUG(log_, "[WS] Closed (reason: " << to_string(queue_.close_reason()) << ")");
}

// -----------------------------------------------------------------------------
// Data plane
// -----------------------------------------------------------------------------

bool WebSocket::send(std::string_view payload, FrameKind kind) noexcept {
    if (!is_open()) {
        WD_WARN(log_, "[WS] send() on a closed transport");
        return false;
    }
    try {
        error_code ec = await_(
            [this, payload, kind](auto handler) {
                visit_([&](auto& ws) {
                    ws.binary(kind == FrameKind::Binary);
                    ws.async_write(net::buffer(payload.data(), payload.size()), handler);
                });
            },
            WRITE_TIMEOUT,
            [this] { cancel_socket_(); });
        if (ec) {
            WD_ERROR(log_, "[WS] send failed (" << ec.message() << ")");
            return false;
        }
        tx_messages_.fetch_add(1, std::memory_order_relaxed);
        WD_TRACE(log_, "[WS] Sent " << payload.size() << " bytes (" << to_string(kind) << ")");
        return true;
    }
    catch (const std::exception& e) {
        WD_ERROR(log_, "[WS] send failed: " << e.what());
        return false;
    }
}

bool WebSocket::ping() noexcept {
    if (!is_open()) {
        return false;
    }
    try {
        error_code ec = await_(
            [this](auto handler) {
                visit_([&handler](auto& ws) { ws.async_ping(websocket::ping_data{}, handler); });
            },
            WRITE_TIMEOUT,
            [this] { cancel_socket_(); });
        if (ec) {
            WD_WARN(log_, "[WS] ping failed (" << ec.message() << ")");
            return false;
        }
        return true;
    }
    catch (const std::exception& e) {
        WD_WARN(log_, "[WS] ping failed: " << e.what());
        return false;
    }
}

WaitStatus WebSocket::wait_frame(Frame& out, std::optional<std::chrono::milliseconds> timeout) noexcept {
    try {
        return queue_.wait_pop(out, timeout);
    }
    catch (const std::system_error& e) {
        WD_ERROR(log_, "[WS] wait_frame failed: " << e.what());
        return WaitStatus::Closed;
    }
}

// -----------------------------------------------------------------------------
// Read loop (I/O thread)
// -----------------------------------------------------------------------------

template <class Stream>
void WebSocket::read_next_(Stream& ws) {
    ws.async_read(rx_buffer_, [this, &ws](error_code ec, std::size_t bytes) {
        if (ec) {
            on_read_error_(ec, std::string_view(ws.reason().reason.data(), ws.reason().reason.size()));
            return;
        }

        Frame frame;
        frame.payload = boost::beast::buffers_to_string(rx_buffer_.data());
        frame.kind = ws.got_binary() ? FrameKind::Binary : FrameKind::Text;
        frame.received_at = std::chrono::system_clock::now();
        rx_buffer_.consume(rx_buffer_.size());
        rx_messages_.fetch_add(1, std::memory_order_relaxed);

        WD_TRACE(log_, "[WS] Received " << bytes << " bytes (" << to_string(frame.kind) << ")");

        if (!queue_.push(std::move(frame))) {
            WD_ERROR(log_, "[WS] Inbound queue full (" << queue_.capacity() << " frames), closing transport");
            open_.store(false, std::memory_order_release);
            queue_.close(Error::Backpressure);
            boost::beast::get_lowest_layer(ws).cancel();
            return;
        }

        read_next_(ws);
    });
}

void WebSocket::on_read_error_(const error_code& ec, std::string_view close_reason) {
    Error reason = Error::TransportFailure;
    // The reply to our own CLOSE also completes the read with error::closed
    if (closing_.load(std::memory_order_acquire)) {
        reason = Error::LocalShutdown;
    } else if (ec == websocket::error::closed) {
        reason = Error::RemoteClosed;
        WD_INFO(log_, "[WS] Remote closed the connection" << (close_reason.empty() ? "" : ": ") << close_reason);
    } else if (ec == boost::beast::error::timeout) {
        reason = Error::Timeout;
        WD_WARN(log_, "[WS] Peer idle for more than " << IDLE_TIMEOUT.count() << "s, closing");
    } else if (ec == websocket::error::message_too_big) {
        reason = Error::ProtocolError;
        WD_ERROR(log_, "[WS] Inbound message exceeds the configured maximum size");
    } else {
        WD_ERROR(log_, "[WS] Read failed (" << ec.message() << ")");
    }
    open_.store(false, std::memory_order_release);
    queue_.close(reason);
}

} // namespace beast
} // namespace transport
} // namespace wiredive::core
