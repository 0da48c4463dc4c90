#pragma once

#include <optional>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <algorithm>

#include "wiredive/core/session/config.hpp"
#include "wiredive/core/session/state.hpp"
#include "wiredive/core/transport/websocket_concept.hpp"
#include "wiredive/core/transport/frame.hpp"
#include "wiredive/core/transport/frame_queue.hpp"


namespace wiredive::core::session {

template <transport::WebSocketConcept WS>
class Session;

/*
===============================================================================
 FrameStream
===============================================================================

Lazy, single-pass sequence of inbound frames from one Session.

Each step waits for the next frame. The sequence ends, without raising, when:

  • max_frames frames have been produced
  • total_timeout has elapsed since the stream was created
  • the transport is closed and drained
  • frame_timeout elapsed with no frame AND the keepalive ping failed

A lone frame_timeout is not a failure: the stream pings, and if the ping
goes out it keeps waiting. The wait for a single frame never extends past
the total deadline, so a silent server ends the stream within
total_timeout plus scheduling jitter.

Usage:

    for (const transport::Frame& frame : session.receive_stream(limits)) {
        ...
    }

or pull-style with next(frame).
===============================================================================
*/
template <transport::WebSocketConcept WS>
class FrameStream {
public:
    using clock = std::chrono::steady_clock;

    FrameStream(Session<WS>& session, const StreamLimits& limits) noexcept
        : session_(session)
        , limits_(limits)
        , started_at_(clock::now())
    {}

    // Produces the next frame, or returns false once the stream has ended.
    [[nodiscard]]
    bool next(transport::Frame& out) noexcept {
        if (stop_ != StopReason::None) {
            return false;
        }
        if (limits_.max_frames && count_ >= *limits_.max_frames) {
            return finish_(StopReason::MaxFrames);
        }

        for (;;) {
            std::optional<std::chrono::milliseconds> wait = limits_.frame_timeout;
            bool bounded_by_total = false;

            if (limits_.total_timeout) {
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started_at_);
                if (elapsed >= *limits_.total_timeout) {
                    return finish_(StopReason::TotalTimeout);
                }
                const auto remaining = *limits_.total_timeout - elapsed;
                if (!wait || remaining <= *wait) {
                    wait = remaining;
                    bounded_by_total = true;
                }
            }

            switch (session_.wait_(out, wait)) {
            case transport::WaitStatus::Ready:
                ++count_;
                return true;

            case transport::WaitStatus::Closed:
                return finish_(StopReason::Closed);

            case transport::WaitStatus::Timeout:
                if (bounded_by_total) {
                    continue; // deadline check at loop head
                }
                ++timeouts_;
                if (!session_.ping()) {
                    return finish_(StopReason::KeepaliveFailed);
                }
                continue;
            }
        }
    }

    // Ends the stream from the consumer side (e.g. terminal frame observed)
    void stop() noexcept {
        if (stop_ == StopReason::None) {
            stop_ = StopReason::Stopped;
        }
    }

    [[nodiscard]] bool done() const noexcept { return stop_ != StopReason::None; }
    [[nodiscard]] StopReason stop_reason() const noexcept { return stop_; }
    [[nodiscard]] std::size_t count() const noexcept { return count_; }
    [[nodiscard]] std::size_t frame_timeouts() const noexcept { return timeouts_; }

    // -------------------------------------------------------------------------
    // Input range support
    // -------------------------------------------------------------------------
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = transport::Frame;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const transport::Frame*;
        using reference         = const transport::Frame&;

        iterator() noexcept = default;

        explicit iterator(FrameStream* stream) noexcept
            : stream_(stream)
        {
            advance_();
        }

        reference operator*() const noexcept { return stream_->current_; }
        pointer operator->() const noexcept { return &stream_->current_; }

        iterator& operator++() noexcept {
            advance_();
            return *this;
        }

        void operator++(int) noexcept { advance_(); }

        friend bool operator==(const iterator& a, const iterator& b) noexcept {
            return a.stream_ == b.stream_;
        }

    private:
        void advance_() noexcept {
            if (stream_ && !stream_->next(stream_->current_)) {
                stream_ = nullptr;
            }
        }

        FrameStream* stream_ = nullptr;
    };

    [[nodiscard]] iterator begin() noexcept { return iterator(this); }
    [[nodiscard]] iterator end() noexcept { return iterator(); }

private:
    [[nodiscard]]
    bool finish_(StopReason reason) noexcept {
        stop_ = reason;
        return false;
    }

private:
    Session<WS>& session_;
    const StreamLimits limits_;
    const clock::time_point started_at_;

    transport::Frame current_{};
    std::size_t count_ = 0;
    std::size_t timeouts_ = 0;
    StopReason stop_ = StopReason::None;
};

} // namespace wiredive::core::session
