#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>


namespace wiredive::core::config::session {

// -----------------------------------------------------------------------------
// Open policy
// -----------------------------------------------------------------------------
inline constexpr std::chrono::milliseconds OPEN_TIMEOUT{30000};   // per attempt
inline constexpr std::uint32_t             MAX_RETRIES  = 3;      // attempts in total
inline constexpr std::chrono::milliseconds BACKOFF_BASE{2000};    // delay = base x attempt index

// -----------------------------------------------------------------------------
// Pool
// -----------------------------------------------------------------------------
inline constexpr std::size_t               POOL_CAPACITY = 10;
inline constexpr std::chrono::milliseconds POOL_IDLE_TTL{300000}; // 5 minutes

} // namespace wiredive::core::config::session
