#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "lcr/log/logger.hpp"


namespace wiredive::core::pipeline {

// -----------------------------------------------------------------------------
// FrameDump
// -----------------------------------------------------------------------------
//
// Raw decoded frames of one run, one file per frame:
//
//     <dir>/frame_<index>.json
//
// Written as the run goes so a crash still leaves the frames seen so far.
// Write failures are logged once and disable the dump; they never fail the
// run.
// -----------------------------------------------------------------------------
class FrameDump {
public:
    FrameDump(std::filesystem::path dir, lcr::log::Logger& log);

    void write(std::size_t index, std::string_view json) noexcept;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] std::size_t written() const noexcept { return written_; }
    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

private:
    std::filesystem::path dir_;
    lcr::log::Logger& log_;
    bool enabled_ = false;
    std::size_t written_ = 0;
};

enum class DumpError {
    None = 0,
    NotFound,     // Not a directory
    Empty,        // No frame_<i>.json files
    IoError
};

inline constexpr std::string_view to_string(DumpError e) noexcept {
    switch (e) {
    case DumpError::None:     return "None";
    case DumpError::NotFound: return "NotFound";
    case DumpError::Empty:    return "Empty";
    case DumpError::IoError:  return "IoError";
    default:                  return "Unknown";
    }
}

// Reads every frame_<i>.json in `dir`, ordered by index
[[nodiscard]]
DumpError load_dump(const std::filesystem::path& dir, std::vector<std::string>& frames);

} // namespace wiredive::core::pipeline
