#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace wiredive::bulk {

// Column holding the target identifier
inline constexpr std::string_view TARGET_COLUMN = "user_address";

// -----------------------------------------------------------------------------
// Target
// -----------------------------------------------------------------------------
//
// One row of the input list: the identifier plus every other column whose
// value is numeric (copied into the output record as is).
// -----------------------------------------------------------------------------
struct Target {
    std::string id;
    std::vector<std::pair<std::string, double>> extras;
};

enum class ListError {
    None = 0,
    NotFound,        // File missing or unreadable
    MissingColumn,   // No user_address column in the header
    Empty            // Header only
};

inline constexpr std::string_view to_string(ListError e) noexcept {
    switch (e) {
    case ListError::None:          return "None";
    case ListError::NotFound:      return "NotFound";
    case ListError::MissingColumn: return "MissingColumn";
    case ListError::Empty:         return "Empty";
    default:                       return "Unknown";
    }
}

// Splits one CSV record (RFC 4180 quoting, no embedded newlines)
[[nodiscard]]
std::vector<std::string> split_csv_line(std::string_view line);

// Parses a CSV document with a header row. Rows with an empty identifier are
// dropped. The window [offset, offset + limit) is applied after parsing.
[[nodiscard]]
ListError parse_targets(std::string_view csv,
                        std::size_t offset,
                        std::optional<std::size_t> limit,
                        std::vector<Target>& out);

[[nodiscard]]
ListError load_targets(const std::filesystem::path& path,
                       std::size_t offset,
                       std::optional<std::size_t> limit,
                       std::vector<Target>& out);

} // namespace wiredive::bulk
