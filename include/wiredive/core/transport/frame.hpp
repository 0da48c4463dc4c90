#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <cstddef>
#include <cstdint>


namespace wiredive::core::transport {

// -----------------------------------------------------------------------------
// FrameKind
// -----------------------------------------------------------------------------
enum class FrameKind : std::uint8_t {
    Binary,
    Text
};

inline constexpr std::string_view to_string(FrameKind kind) noexcept {
    switch (kind) {
    case FrameKind::Binary: return "Binary";
    case FrameKind::Text:   return "Text";
    default:                return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Frame
// -----------------------------------------------------------------------------
//
// One complete inbound WebSocket message as delivered by the transport.
// The payload is owned by the frame; consumers treat it as immutable once
// received.
// -----------------------------------------------------------------------------
struct Frame {
    std::string payload;
    FrameKind kind = FrameKind::Binary;
    std::chrono::system_clock::time_point received_at{};

    [[nodiscard]]
    std::size_t size() const noexcept { return payload.size(); }

    [[nodiscard]]
    bool is_binary() const noexcept { return kind == FrameKind::Binary; }

    [[nodiscard]]
    bool is_text() const noexcept { return kind == FrameKind::Text; }
};

} // namespace wiredive::core::transport
