#pragma once

#include <cstdint>
#include <string_view>


namespace wiredive::core::protocol::streamlit::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ok            = 0,   // Field / document parsed
    Ignored       = 1,   // Not applicable (optional field absent)
    InvalidJson   = 2,   // Structural failure
    InvalidSchema = 3,   // Missing required field or type mismatch
    InvalidValue  = 4    // Field present but semantically invalid
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:            return "Ok";
        case Result::Ignored:       return "Ignored";
        case Result::InvalidJson:   return "InvalidJson";
        case Result::InvalidSchema: return "InvalidSchema";
        case Result::InvalidValue:  return "InvalidValue";
        default:                    return "unknown";
    }
}

} // namespace wiredive::core::protocol::streamlit::parser
