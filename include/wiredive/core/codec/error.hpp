#pragma once

#include <string_view>

namespace wiredive::core::codec {

// -----------------------------------------------------------------------------
// codec::Error
// -----------------------------------------------------------------------------
//
// Failures at the frame codec boundary. None of them is fatal to a run:
// an undecodable inbound frame is skipped, an unencodable request fails
// only the run that produced it.
// -----------------------------------------------------------------------------
enum class Error {
    None = 0,
    InvalidInput,   // Empty payload or malformed request document
    SpawnFailed,    // Encoder/decoder process could not be started
    ProcessFailed,  // Process exited with a non-zero status or was signalled
    EmptyOutput,    // Process produced nothing on stdout
    IoError         // Pipe read/write failure
};

inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:          return "None";
    case Error::InvalidInput:  return "InvalidInput";
    case Error::SpawnFailed:   return "SpawnFailed";
    case Error::ProcessFailed: return "ProcessFailed";
    case Error::EmptyOutput:   return "EmptyOutput";
    case Error::IoError:       return "IoError";
    default:                   return "Unknown";
    }
}

} // namespace wiredive::core::codec
