#pragma once

#include <cstdint>
#include <string_view>


namespace wiredive::core::session {

// -----------------------------------------------------------------------------
// Session lifecycle
// -----------------------------------------------------------------------------
//
//   Idle ──open()──► Connecting ──► Open ──close()/transport loss──► Closed
//                         │
//                         └──all attempts failed──────────────────► Closed
//
// Closed is terminal. A closed session is never reopened or reused.
// -----------------------------------------------------------------------------
enum class State : std::uint8_t {
    Idle,
    Connecting,
    Open,
    Closed
};

inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
    case State::Idle:       return "Idle";
    case State::Connecting: return "Connecting";
    case State::Open:       return "Open";
    case State::Closed:     return "Closed";
    default:                return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Why a frame stream ended
// -----------------------------------------------------------------------------
enum class StopReason : std::uint8_t {
    None,             // Still running
    MaxFrames,        // Frame budget exhausted
    TotalTimeout,     // Overall deadline elapsed
    Closed,           // Transport closed (remote close, error, local close)
    KeepaliveFailed,  // Per-frame timeout and the keepalive ping also failed
    Stopped           // Consumer stopped early (terminal signal)
};

inline constexpr std::string_view to_string(StopReason r) noexcept {
    switch (r) {
    case StopReason::None:            return "None";
    case StopReason::MaxFrames:       return "MaxFrames";
    case StopReason::TotalTimeout:    return "TotalTimeout";
    case StopReason::Closed:          return "Closed";
    case StopReason::KeepaliveFailed: return "KeepaliveFailed";
    case StopReason::Stopped:         return "Stopped";
    default:                          return "Unknown";
    }
}

} // namespace wiredive::core::session
