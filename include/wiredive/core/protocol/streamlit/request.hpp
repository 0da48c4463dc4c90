#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace wiredive::core::protocol::streamlit {

// -----------------------------------------------------------------------------
// Request (BackMsg.rerunScript)
// -----------------------------------------------------------------------------
//
// Asks the remote app to run one page with a query string, as a browser
// does on navigation. Only query_string changes between targets; the rest
// is loaded once from a template (or the built-in defaults below).
// -----------------------------------------------------------------------------
struct ContextInfo {
    std::string timezone     = "Europe/Istanbul";
    std::int64_t timezone_offset = -180;
    std::string locale       = "en-US";
    std::string url          = "https://hashdive.com/Analyze_User";
    bool is_embedded         = false;
    std::string color_scheme = "light";
};

struct Request {
    std::string query_string;
    std::string widget_states = "{}";   // raw JSON object
    std::string page_script_hash;
    std::string page_name = "Analyze_User";
    ContextInfo context;

    // {"rerunScript":{...}}
    [[nodiscard]]
    std::string to_json() const;
};

// Query parameter carrying the target identifier
inline constexpr std::string_view TARGET_QUERY_KEY = "user_address";

// Copy of `tmpl` whose query string selects `target` ("<key>=<target>",
// percent-encoded)
[[nodiscard]]
Request with_target(const Request& tmpl, std::string_view target, std::string_view key = TARGET_QUERY_KEY);

// -----------------------------------------------------------------------------
// Template loading
// -----------------------------------------------------------------------------
enum class TemplateError {
    None = 0,
    NotFound,       // File missing or unreadable
    InvalidJson,    // Not a JSON document
    InvalidSchema   // No rerunScript object
};

inline constexpr std::string_view to_string(TemplateError e) noexcept {
    switch (e) {
    case TemplateError::None:          return "None";
    case TemplateError::NotFound:      return "NotFound";
    case TemplateError::InvalidJson:   return "InvalidJson";
    case TemplateError::InvalidSchema: return "InvalidSchema";
    default:                           return "Unknown";
    }
}

// Accepts {"rerunScript":{...}} or the bare rerunScript object. Fields
// missing from the file keep their built-in defaults.
[[nodiscard]]
TemplateError parse_request(std::string_view json, Request& out);

[[nodiscard]]
TemplateError load_request(const std::string& path, Request& out);

} // namespace wiredive::core::protocol::streamlit
