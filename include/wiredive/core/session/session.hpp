#pragma once

#include <string_view>
#include <optional>
#include <memory>
#include <atomic>
#include <chrono>
#include <thread>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <utility>

#include "wiredive/core/session/config.hpp"
#include "wiredive/core/session/state.hpp"
#include "wiredive/core/session/frame_stream.hpp"
#include "wiredive/core/transport/websocket_concept.hpp"
#include "wiredive/core/transport/error.hpp"
#include "wiredive/core/transport/frame.hpp"
#include "lcr/log/logger.hpp"


namespace wiredive::core::session {

/*
===============================================================================
 wiredive::core::session::Session
===============================================================================

One logical connection to the remote endpoint, parameterized by a WebSocket
transport conforming to transport::WebSocketConcept.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Connect with bounded retries and linear backoff (open)
- Write one frame at a time (send), never resending on failure
- Pull inbound frames with an optional deadline (receive)
- Expose a lazy, limit-bounded frame sequence (receive_stream)
- Check liveness with a keepalive ping
- Drop frames left unread by a previous request (discard_pending)
- Release the transport exactly once (close)

-------------------------------------------------------------------------------
 Ownership
-------------------------------------------------------------------------------
A Session is owned by a Pool while idle and by exactly one lessee while
leased. It is never accessed from two threads at the same time; the only
concurrency is inside the transport (its I/O thread).

-------------------------------------------------------------------------------
 Failure Semantics
-------------------------------------------------------------------------------
- open() returns the error of the last attempt once every attempt failed.
- Timeouts are values, not faults: receive() returns std::nullopt.
- Loss of the transport mid-stream ends receive_stream() gracefully so
  callers keep every frame that arrived before the loss.
===============================================================================
*/

template <transport::WebSocketConcept WS>
class Session {
public:
    using clock = std::chrono::steady_clock;

    Session(Endpoint endpoint, lcr::log::Logger& log)
        : endpoint_(std::move(endpoint))
        , log_(log)
        , id_(next_id_())
        , created_at_(clock::now())
        , last_activity_(created_at_)
    {}

    ~Session() {
        close();
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    transport::Error open(const OpenPolicy& policy) noexcept {
        return open(policy.timeout, policy.max_retries, policy.backoff_base);
    }

    [[nodiscard]]
    transport::Error open(std::chrono::milliseconds timeout, std::uint32_t max_retries, std::chrono::milliseconds backoff_base) noexcept {
        if (state_ != State::Idle) {
            WD_WARN(log_, "[SESSION #" << id_ << "] open() ignored in state " << to_string(state_));
            return transport::Error::InvalidState;
        }
        state_ = State::Connecting;

        const std::uint32_t attempts = (max_retries == 0) ? 1 : max_retries;
        transport::Error last = transport::Error::None;

        for (std::uint32_t attempt = 0; attempt < attempts; ++attempt) {
            if (attempt > 0) {
                const auto delay = backoff_base * attempt;
                WD_INFO(log_, "[SESSION #" << id_ << "] Retrying in " << delay.count() << " ms");
                std::this_thread::sleep_for(delay);
            }

            WD_INFO(log_, "[SESSION #" << id_ << "] Connecting to " << endpoint_.url
                          << " (attempt " << (attempt + 1) << "/" << attempts << ")");

            auto ws = make_transport_();
            if (!ws) {
                last = transport::Error::TransportFailure;
                continue;
            }
            last = ws->connect(endpoint_.target, endpoint_.handshake, timeout);
            if (last == transport::Error::None) {
                ws_ = std::move(ws);
                state_ = State::Open;
                touch_();
                WD_INFO(log_, "[SESSION #" << id_ << "] Open");
                return transport::Error::None;
            }

            WD_WARN(log_, "[SESSION #" << id_ << "] Attempt " << (attempt + 1) << "/" << attempts
                          << " failed: " << transport::to_string(last));
        }

        state_ = State::Closed;
        WD_ERROR(log_, "[SESSION #" << id_ << "] Failed to connect after " << attempts << " attempts");
        return last;
    }

    // Idempotent
    void close() noexcept {
        if (state_ == State::Closed) {
            return;
        }
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
        state_ = State::Closed;
        WD_DEBUG(log_, "[SESSION #" << id_ << "] Closed");
    }

    // Transport state only; recent traffic is irrelevant.
    [[nodiscard]]
    bool is_alive() const noexcept {
        return state_ == State::Open && ws_ && ws_->is_open();
    }

    // -------------------------------------------------------------------------
    // Data plane
    // -------------------------------------------------------------------------

    [[nodiscard]]
    bool send(std::string_view bytes, transport::FrameKind kind = transport::FrameKind::Binary) noexcept {
        if (state_ != State::Open || !ws_) {
            WD_WARN(log_, "[SESSION #" << id_ << "] send() while " << to_string(state_));
            return false;
        }
        if (!ws_->send(bytes, kind)) {
            WD_ERROR(log_, "[SESSION #" << id_ << "] send of " << bytes.size() << " bytes rejected by transport");
            return false;
        }
        ++frames_sent_;
        touch_();
        return true;
    }

    // Blocks for at most `timeout` (indefinitely when absent).
    // std::nullopt on timeout or when the session is no longer readable.
    [[nodiscard]]
    std::optional<transport::Frame> receive(std::optional<std::chrono::milliseconds> timeout = std::nullopt) noexcept {
        transport::Frame frame;
        if (wait_(frame, timeout) == transport::WaitStatus::Ready) {
            return frame;
        }
        return std::nullopt;
    }

    [[nodiscard]]
    FrameStream<WS> receive_stream(const StreamLimits& limits) noexcept {
        return FrameStream<WS>(*this, limits);
    }

    [[nodiscard]]
    bool ping() noexcept {
        if (state_ != State::Open || !ws_) {
            return false;
        }
        const bool ok = ws_->ping();
        WD_DEBUG(log_, "[SESSION #" << id_ << "] Keepalive ping " << (ok ? "sent" : "failed"));
        return ok;
    }

    // Drops up to `limit` frames already delivered but not read. Never waits.
    // Returns the number of frames dropped.
    std::size_t discard_pending(std::size_t limit) noexcept {
        std::size_t dropped = 0;
        transport::Frame frame;
        while (dropped < limit && state_ == State::Open && ws_ &&
               ws_->wait_frame(frame, std::chrono::milliseconds{0}) == transport::WaitStatus::Ready) {
            ++dropped;
        }
        if (dropped > 0) {
            WD_DEBUG(log_, "[SESSION #" << id_ << "] Discarded " << dropped << " unread frame(s)");
        }
        return dropped;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] clock::time_point created_at() const noexcept { return created_at_; }
    [[nodiscard]] clock::time_point last_activity() const noexcept { return last_activity_; }
    [[nodiscard]] std::uint64_t frames_received() const noexcept { return frames_received_; }
    [[nodiscard]] std::uint64_t frames_sent() const noexcept { return frames_sent_; }

#ifdef WD_UNIT_TEST
    [[nodiscard]] WS* ws() noexcept { return ws_.get(); }
#endif

private:
    friend class FrameStream<WS>;

    [[nodiscard]]
    transport::WaitStatus wait_(transport::Frame& out, std::optional<std::chrono::milliseconds> timeout) noexcept {
        if (state_ != State::Open || !ws_) {
            return transport::WaitStatus::Closed;
        }
        const transport::WaitStatus status = ws_->wait_frame(out, timeout);
        if (status == transport::WaitStatus::Ready) {
            ++frames_received_;
            touch_();
        }
        return status;
    }

    [[nodiscard]]
    std::unique_ptr<WS> make_transport_() noexcept {
        try {
            return std::make_unique<WS>(log_);
        } catch (const std::exception& e) {
            WD_ERROR(log_, "[SESSION #" << id_ << "] Transport construction failed: " << e.what());
            return nullptr;
        }
    }

    void touch_() noexcept {
        last_activity_ = clock::now();
    }

    [[nodiscard]]
    static std::uint64_t next_id_() noexcept {
        static std::atomic<std::uint64_t> counter{0};
        return counter.fetch_add(1, std::memory_order_relaxed) + 1;
    }

private:
    Endpoint endpoint_;
    lcr::log::Logger& log_;
    std::unique_ptr<WS> ws_;

    const std::uint64_t id_;
    State state_ = State::Idle;

    const clock::time_point created_at_;
    clock::time_point last_activity_;

    std::uint64_t frames_received_ = 0;
    std::uint64_t frames_sent_ = 0;
};

} // namespace wiredive::core::session
