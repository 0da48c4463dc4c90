#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include "wiredive/core/pipeline/frame_dump.hpp"


namespace wiredive::core::pipeline {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view PREFIX = "frame_";
constexpr std::string_view SUFFIX = ".json";

// "frame_17.json" -> 17
[[nodiscard]]
bool frame_index(const std::string& name, std::size_t& index) noexcept {
    if (name.size() <= PREFIX.size() + SUFFIX.size() ||
        name.compare(0, PREFIX.size(), PREFIX) != 0 ||
        name.compare(name.size() - SUFFIX.size(), SUFFIX.size(), SUFFIX) != 0) {
        return false;
    }
    const char* first = name.data() + PREFIX.size();
    const char* last = name.data() + name.size() - SUFFIX.size();
    const auto [ptr, ec] = std::from_chars(first, last, index);
    return ec == std::errc{} && ptr == last;
}

} // namespace


FrameDump::FrameDump(fs::path dir, lcr::log::Logger& log)
    : dir_(std::move(dir))
    , log_(log)
{
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        WD_WARN(log_, "[RUN] Frame dump disabled, cannot create " << dir_.string() << ": " << ec.message());
        return;
    }
    enabled_ = true;
}

void FrameDump::write(std::size_t index, std::string_view json) noexcept {
    if (!enabled_) {
        return;
    }
    try {
        const fs::path file = dir_ / (std::string(PREFIX) + std::to_string(index) + std::string(SUFFIX));
        std::ofstream os(file, std::ios::binary | std::ios::trunc);
        os.write(json.data(), static_cast<std::streamsize>(json.size()));
        if (!os) {
            WD_WARN(log_, "[RUN] Frame dump disabled, write failed: " << file.string());
            enabled_ = false;
            return;
        }
        ++written_;
    }
    catch (const std::exception& e) {
        WD_WARN(log_, "[RUN] Frame dump disabled: " << e.what());
        enabled_ = false;
    }
}

DumpError load_dump(const fs::path& dir, std::vector<std::string>& frames) {
    frames.clear();

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return DumpError::NotFound;
    }

    std::vector<std::pair<std::size_t, fs::path>> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::size_t index = 0;
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && frame_index(it->path().filename().string(), index)) {
            files.emplace_back(index, it->path());
        }
    }
    if (ec) {
        return DumpError::IoError;
    }
    if (files.empty()) {
        return DumpError::Empty;
    }
    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    frames.reserve(files.size());
    for (const auto& [index, path] : files) {
        std::ifstream is(path, std::ios::binary);
        if (!is) {
            frames.clear();
            return DumpError::IoError;
        }
        frames.emplace_back(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
    }
    return DumpError::None;
}

} // namespace wiredive::core::pipeline
