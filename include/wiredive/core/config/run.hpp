#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>


namespace wiredive::core::config::run {

// -----------------------------------------------------------------------------
// Frame stream limits for one extraction run
// -----------------------------------------------------------------------------
inline constexpr std::size_t               MAX_FRAMES = 300;
inline constexpr std::chrono::milliseconds FRAME_TIMEOUT{10000};
inline constexpr std::chrono::milliseconds TOTAL_TIMEOUT{120000};

// Pause between sending the request and reading the stream
inline constexpr std::chrono::milliseconds SETTLE_DELAY{1000};

// Pause between successive runs dispatched by the bulk driver
inline constexpr std::chrono::milliseconds PACING_DELAY{1000};

// -----------------------------------------------------------------------------
// Codec schemas
// -----------------------------------------------------------------------------
inline constexpr std::string_view OUTBOUND_SCHEMA = "BackMsg";
inline constexpr std::string_view INBOUND_SCHEMA  = "ForwardMsg";

// Terminal signal: top-level "scriptFinished" value
inline constexpr std::string_view SCRIPT_FINISHED_OK = "FINISHED_SUCCESSFULLY";

} // namespace wiredive::core::config::run
