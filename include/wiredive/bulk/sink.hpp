#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "lcr/log/logger.hpp"


namespace wiredive::bulk {

// A target id usable as one file name component: not empty, not "." or
// "..", without path separators or control characters.
[[nodiscard]]
bool is_safe_id(std::string_view id) noexcept;

// -----------------------------------------------------------------------------
// DirectorySink
// -----------------------------------------------------------------------------
//
// One file per target under a single directory:
//
//   <dir>/<id>.json          complete record
//   <dir>/<id>.partial.json  incomplete or failed run
//
// Files are written to a temporary name and renamed into place, so readers
// never see half a document. Writing a complete record removes a leftover
// partial one. Ids that fail is_safe_id() are refused. Safe to use from
// several threads for different ids.
// -----------------------------------------------------------------------------
class DirectorySink {
public:
    DirectorySink(std::filesystem::path dir, lcr::log::Logger& log)
        : dir_(std::move(dir))
        , log_(log)
    {}

    // Creates the directory
    [[nodiscard]]
    bool prepare() noexcept;

    // A complete record exists for `id`
    [[nodiscard]]
    bool exists(std::string_view id) const noexcept;

    [[nodiscard]]
    bool write(std::string_view id, std::string_view document, bool complete) noexcept;

    // Throws std::invalid_argument for an id that fails is_safe_id()
    [[nodiscard]]
    std::filesystem::path path_for(std::string_view id, bool complete) const;

    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

private:
    std::filesystem::path dir_;
    lcr::log::Logger& log_;
};

} // namespace wiredive::bulk
