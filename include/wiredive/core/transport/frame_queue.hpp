#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "wiredive/core/transport/frame.hpp"
#include "wiredive/core/transport/error.hpp"


namespace wiredive::core::transport {

// -----------------------------------------------------------------------------
// WaitStatus
// -----------------------------------------------------------------------------
enum class WaitStatus : std::uint8_t {
    Ready,    // A frame was produced
    Timeout,  // No frame within the requested time
    Closed    // Transport closed and every queued frame has been consumed
};

inline constexpr std::string_view to_string(WaitStatus s) noexcept {
    switch (s) {
    case WaitStatus::Ready:   return "Ready";
    case WaitStatus::Timeout: return "Timeout";
    case WaitStatus::Closed:  return "Closed";
    default:                  return "Unknown";
    }
}

/*
===============================================================================
 FrameQueue
===============================================================================

Bounded hand-off between the transport I/O thread (producer) and the session
owner (consumer).

  • push() never blocks. A full queue is reported to the producer, which
    treats it as Backpressure and closes the transport.
  • close() is sticky. Frames queued before close() are still delivered;
    wait_pop() reports Closed only once the queue is drained, so a consumer
    always sees every frame that arrived before the connection went away.
  • wait_pop() blocks for at most `timeout`, or indefinitely when no timeout
    is given.
===============================================================================
*/
class FrameQueue {
public:
    explicit FrameQueue(std::size_t capacity) noexcept
        : capacity_(capacity)
    {}

    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    [[nodiscard]]
    bool push(Frame&& frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || frames_.size() >= capacity_) {
                return false;
            }
            frames_.push_back(std::move(frame));
        }
        cv_.notify_one();
        return true;
    }

    // First reason wins
    void close(Error reason) noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) {
                closed_ = true;
                reason_ = reason;
            }
        }
        cv_.notify_all();
    }

    // Re-arms the queue for a new connection
    void reset() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.clear();
        closed_ = false;
        reason_ = Error::None;
    }

    [[nodiscard]]
    WaitStatus wait_pop(Frame& out, std::optional<std::chrono::milliseconds> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [this] { return !frames_.empty() || closed_; };
        if (timeout) {
            if (!cv_.wait_for(lock, *timeout, ready)) {
                return WaitStatus::Timeout;
            }
        } else {
            cv_.wait(lock, ready);
        }
        if (frames_.empty()) {
            return WaitStatus::Closed;
        }
        out = std::move(frames_.front());
        frames_.pop_front();
        return WaitStatus::Ready;
    }

    [[nodiscard]]
    bool closed() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]]
    Error close_reason() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    [[nodiscard]]
    std::size_t size() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_.size();
    }

    [[nodiscard]]
    std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Frame> frames_;
    bool closed_ = false;
    Error reason_ = Error::None;
};

} // namespace wiredive::core::transport
