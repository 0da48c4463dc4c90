#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include "wiredive/core/config/session.hpp"
#include "wiredive/core/transport/parse_url.hpp"
#include "wiredive/core/transport/handshake.hpp"
#include "wiredive/core/transport/error.hpp"


namespace wiredive::core::session {

// -----------------------------------------------------------------------------
// Endpoint
// -----------------------------------------------------------------------------
//
// Target address plus the immutable handshake derived from credentials.
// Every session opened against the endpoint carries its own copy.
// -----------------------------------------------------------------------------
struct Endpoint {
    std::string url;
    transport::ParsedUrl target;
    transport::Handshake handshake;
};

[[nodiscard]]
inline transport::Error make_endpoint(std::string_view url, transport::Handshake handshake, Endpoint& out) {
    transport::ParsedUrl parsed;
    const transport::Error err = transport::parse_url(url, parsed);
    if (err != transport::Error::None) {
        return err;
    }
    out.url = std::string(url);
    out.target = std::move(parsed);
    out.handshake = std::move(handshake);
    return transport::Error::None;
}

// -----------------------------------------------------------------------------
// Open policy
// -----------------------------------------------------------------------------
//
// max_retries is the total number of attempts. Attempt i (0-based) is
// preceded by a pause of backoff_base * i.
// -----------------------------------------------------------------------------
struct OpenPolicy {
    std::chrono::milliseconds timeout      = config::session::OPEN_TIMEOUT;
    std::uint32_t             max_retries  = config::session::MAX_RETRIES;
    std::chrono::milliseconds backoff_base = config::session::BACKOFF_BASE;
};

// -----------------------------------------------------------------------------
// Frame stream limits
// -----------------------------------------------------------------------------
//
// Absent limits are unbounded. frame_timeout bounds the wait for a single
// frame; when it elapses the stream checks liveness with a ping and only
// ends if that ping fails.
// -----------------------------------------------------------------------------
struct StreamLimits {
    std::optional<std::size_t>               max_frames{};
    std::optional<std::chrono::milliseconds> frame_timeout{};
    std::optional<std::chrono::milliseconds> total_timeout{};
};

} // namespace wiredive::core::session
