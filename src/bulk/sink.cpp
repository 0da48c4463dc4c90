#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "wiredive/bulk/sink.hpp"


namespace wiredive::bulk {

namespace fs = std::filesystem;

bool is_safe_id(std::string_view id) noexcept {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    for (const char c : id) {
        if (c == '/' || c == '\\' || static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            return false;
        }
    }
    return true;
}

bool DirectorySink::prepare() noexcept {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        WD_ERROR(log_, "[SINK] Cannot create " << dir_.string() << ": " << ec.message());
        return false;
    }
    return true;
}

fs::path DirectorySink::path_for(std::string_view id, bool complete) const {
    if (!is_safe_id(id)) {
        throw std::invalid_argument("target id is not a plain file name: '" + std::string(id) + "'");
    }
    std::string name(id);
    name += complete ? ".json" : ".partial.json";
    return dir_ / name;
}

bool DirectorySink::exists(std::string_view id) const noexcept {
    try {
        std::error_code ec;
        return fs::is_regular_file(path_for(id, true), ec);
    }
    catch (const std::exception& e) {
        WD_WARN(log_, "[SINK] exists(" << id << ") failed: " << e.what());
        return false;
    }
}

bool DirectorySink::write(std::string_view id, std::string_view document, bool complete) noexcept {
    try {
        const fs::path target = path_for(id, complete);
        fs::path tmp = target;
        tmp += ".tmp";

        {
            std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
            os.write(document.data(), static_cast<std::streamsize>(document.size()));
            os.flush();
            if (!os) {
                WD_ERROR(log_, "[SINK] Write failed: " << tmp.string());
                std::error_code ignored;
                fs::remove(tmp, ignored);
                return false;
            }
        }

        std::error_code ec;
        fs::rename(tmp, target, ec);
        if (ec) {
            WD_ERROR(log_, "[SINK] Rename to " << target.string() << " failed: " << ec.message());
            fs::remove(tmp, ec);
            return false;
        }

        if (complete) {
            fs::remove(path_for(id, false), ec);
        }
        WD_DEBUG(log_, "[SINK] Wrote " << target.string() << " (" << document.size() << " bytes)");
        return true;
    }
    catch (const std::exception& e) {
        WD_ERROR(log_, "[SINK] write(" << id << ") failed: " << e.what());
        return false;
    }
}

} // namespace wiredive::bulk
