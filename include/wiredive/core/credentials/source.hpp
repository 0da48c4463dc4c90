#pragma once

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace wiredive::core::credentials {

// name -> value
using Cookies = std::map<std::string, std::string, std::less<>>;

// -----------------------------------------------------------------------------
// CredentialSourceConcept
// -----------------------------------------------------------------------------
//
// get(domain, names) returns the requested cookies it holds for `domain`.
// Names it does not hold are simply absent; an empty map means nothing was
// found.
// -----------------------------------------------------------------------------
template<class S>
concept CredentialSourceConcept =
    requires(const S& source, std::string_view domain, std::span<const std::string_view> names) {
        { source.get(domain, names) } -> std::same_as<Cookies>;
    };

// Names of `names` missing from `cookies`, in order
[[nodiscard]]
std::vector<std::string> missing(const Cookies& cookies, std::span<const std::string_view> names);

// `cookie_domain` as written in a cookie jar (".example.com" or
// "example.com") applies to `domain`, one of its sub-domains or one of its
// parents.
[[nodiscard]]
bool domain_matches(std::string_view cookie_domain, std::string_view domain) noexcept;

// -----------------------------------------------------------------------------
// StaticSource
// -----------------------------------------------------------------------------
class StaticSource {
public:
    StaticSource() = default;
    explicit StaticSource(Cookies cookies)
        : cookies_(std::move(cookies))
    {}

    void set(std::string name, std::string value) {
        cookies_.insert_or_assign(std::move(name), std::move(value));
    }

    [[nodiscard]]
    Cookies get(std::string_view domain, std::span<const std::string_view> names) const;

private:
    Cookies cookies_;
};

// -----------------------------------------------------------------------------
// CookieFile
// -----------------------------------------------------------------------------
//
// Netscape cookies.txt export (curl, browser extensions):
//
//   domain <TAB> subdomains <TAB> path <TAB> secure <TAB> expires <TAB> name <TAB> value
//
// Lines starting with '#' are comments, except the "#HttpOnly_" domain
// prefix. When a name appears more than once for a matching domain the
// later line wins.
// -----------------------------------------------------------------------------
struct Cookie {
    std::string domain;
    std::string path;
    std::string name;
    std::string value;
    bool secure = false;
    std::int64_t expires = 0;
};

enum class LoadError {
    None = 0,
    NotFound,     // File missing or unreadable
    Malformed,    // Not a single valid cookie line
};

inline constexpr std::string_view to_string(LoadError e) noexcept {
    switch (e) {
    case LoadError::None:      return "None";
    case LoadError::NotFound:  return "NotFound";
    case LoadError::Malformed: return "Malformed";
    default:                   return "Unknown";
    }
}

// Parses cookies.txt content. Invalid lines are skipped.
[[nodiscard]]
LoadError parse_cookie_file(std::string_view text, std::vector<Cookie>& out);

class CookieFile {
public:
    [[nodiscard]]
    LoadError load(const std::filesystem::path& path);

    [[nodiscard]]
    LoadError parse(std::string_view text) {
        return parse_cookie_file(text, cookies_);
    }

    [[nodiscard]]
    Cookies get(std::string_view domain, std::span<const std::string_view> names) const;

    [[nodiscard]] std::size_t size() const noexcept { return cookies_.size(); }

private:
    std::vector<Cookie> cookies_;
};

static_assert(CredentialSourceConcept<StaticSource>);
static_assert(CredentialSourceConcept<CookieFile>);

} // namespace wiredive::core::credentials
