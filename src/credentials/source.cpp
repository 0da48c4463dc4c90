#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <iterator>
#include <system_error>

#include "wiredive/core/credentials/source.hpp"


namespace wiredive::core::credentials {

namespace {

constexpr std::string_view HTTP_ONLY_PREFIX = "#HttpOnly_";

[[nodiscard]]
bool wanted(std::string_view name, std::span<const std::string_view> names) noexcept {
    return std::find(names.begin(), names.end(), name) != names.end();
}

[[nodiscard]]
bool ends_with_label(std::string_view s, std::string_view suffix) noexcept {
    return s.size() > suffix.size() &&
           s.substr(s.size() - suffix.size()) == suffix &&
           s[s.size() - suffix.size() - 1] == '.';
}

// Splits on TAB into exactly `N` fields (the last keeps any remaining text)
template <std::size_t N>
[[nodiscard]]
bool split_fields(std::string_view line, std::array<std::string_view, N>& fields) noexcept {
    for (std::size_t i = 0; i + 1 < N; ++i) {
        const auto tab = line.find('\t');
        if (tab == std::string_view::npos) {
            return false;
        }
        fields[i] = line.substr(0, tab);
        line.remove_prefix(tab + 1);
    }
    fields[N - 1] = line;
    return true;
}

} // namespace


std::vector<std::string> missing(const Cookies& cookies, std::span<const std::string_view> names) {
    std::vector<std::string> out;
    for (std::string_view name : names) {
        if (cookies.find(name) == cookies.end()) {
            out.emplace_back(name);
        }
    }
    return out;
}

bool domain_matches(std::string_view cookie_domain, std::string_view domain) noexcept {
    if (!cookie_domain.empty() && cookie_domain.front() == '.') {
        cookie_domain.remove_prefix(1);
    }
    if (cookie_domain.empty() || domain.empty()) {
        return false;
    }
    return cookie_domain == domain ||
           ends_with_label(domain, cookie_domain) ||
           ends_with_label(cookie_domain, domain);
}

// -----------------------------------------------------------------------------
// StaticSource
// -----------------------------------------------------------------------------

Cookies StaticSource::get(std::string_view, std::span<const std::string_view> names) const {
    Cookies out;
    for (const auto& [name, value] : cookies_) {
        if (wanted(name, names)) {
            out.emplace(name, value);
        }
    }
    return out;
}

// -----------------------------------------------------------------------------
// CookieFile
// -----------------------------------------------------------------------------

LoadError parse_cookie_file(std::string_view text, std::vector<Cookie>& out) {
    out.clear();

    while (!text.empty()) {
        const auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.substr(0, HTTP_ONLY_PREFIX.size()) == HTTP_ONLY_PREFIX) {
            line.remove_prefix(HTTP_ONLY_PREFIX.size());
        }
        else if (line.empty() || line.front() == '#') {
            continue;
        }

        std::array<std::string_view, 7> f{};
        if (!split_fields(line, f) || f[0].empty() || f[5].empty()) {
            continue;
        }

        Cookie c;
        c.domain = std::string(f[0]);
        c.path   = std::string(f[2]);
        c.secure = (f[3] == "TRUE");
        const auto [ptr, ec] = std::from_chars(f[4].data(), f[4].data() + f[4].size(), c.expires);
        if (ec != std::errc{}) {
            c.expires = 0;
        }
        c.name  = std::string(f[5]);
        c.value = std::string(f[6]);
        out.push_back(std::move(c));
    }

    return out.empty() ? LoadError::Malformed : LoadError::None;
}

LoadError CookieFile::load(const std::filesystem::path& path) {
    std::ifstream is(path, std::ios::binary);
    if (!is) {
        cookies_.clear();
        return LoadError::NotFound;
    }
    const std::string text{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
    return parse_cookie_file(text, cookies_);
}

Cookies CookieFile::get(std::string_view domain, std::span<const std::string_view> names) const {
    Cookies out;
    for (const auto& c : cookies_) {
        if (domain_matches(c.domain, domain) && wanted(c.name, names)) {
            out.insert_or_assign(c.name, c.value);
        }
    }
    return out;
}

} // namespace wiredive::core::credentials
