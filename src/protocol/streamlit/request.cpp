#include <fstream>
#include <sstream>

#include "simdjson.h"

#include "wiredive/core/protocol/streamlit/request.hpp"
#include "wiredive/core/protocol/streamlit/parser/helpers.hpp"
#include "lcr/json.hpp"


namespace wiredive::core::protocol::streamlit {

namespace {

[[nodiscard]]
std::string percent_encode(std::string_view in) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        const auto u = static_cast<unsigned char>(c);
        const bool unreserved = (u >= 'A' && u <= 'Z') || (u >= 'a' && u <= 'z') || (u >= '0' && u <= '9')
                             || u == '-' || u == '_' || u == '.' || u == '~';
        if (unreserved) {
            out += c;
        } else {
            out += '%';
            out += hex[u >> 4];
            out += hex[u & 0x0F];
        }
    }
    return out;
}

} // namespace


std::string Request::to_json() const {
    std::string out;
    out.reserve(512 + query_string.size() + widget_states.size());

    out += "{\"rerunScript\":{\"queryString\":";
    lcr::json::append_string(out, query_string);
    out += ",\"widgetStates\":";
    out += widget_states.empty() ? std::string("{}") : widget_states;
    out += ",\"pageScriptHash\":";
    lcr::json::append_string(out, page_script_hash);
    out += ",\"pageName\":";
    lcr::json::append_string(out, page_name);

    out += ",\"contextInfo\":{\"timezone\":";
    lcr::json::append_string(out, context.timezone);
    out += ",\"timezoneOffset\":";
    lcr::json::append(out, context.timezone_offset);
    out += ",\"locale\":";
    lcr::json::append_string(out, context.locale);
    out += ",\"url\":";
    lcr::json::append_string(out, context.url);
    out += ",\"isEmbedded\":";
    lcr::json::append(out, context.is_embedded);
    out += ",\"colorScheme\":";
    lcr::json::append_string(out, context.color_scheme);
    out += "}}}";

    return out;
}

Request with_target(const Request& tmpl, std::string_view target, std::string_view key) {
    Request req = tmpl;
    req.query_string.clear();
    req.query_string += key;
    req.query_string += '=';
    req.query_string += percent_encode(target);
    return req;
}

TemplateError parse_request(std::string_view json, Request& out) {
    namespace helper = parser::helper;
    using parser::Result;

    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (parser.parse(json.data(), json.size(), true).get(root) != simdjson::SUCCESS) {
        return TemplateError::InvalidJson;
    }
    if (helper::require_object(root) != Result::Ok) {
        return TemplateError::InvalidSchema;
    }

    simdjson::dom::element rerun = root;
    const Result wrapped = helper::parse_object_optional(root, "rerunScript", rerun);
    if (wrapped == Result::InvalidSchema) {
        return TemplateError::InvalidSchema;
    }
    if (wrapped == Result::Ignored && root["pageName"].error()) {
        return TemplateError::InvalidSchema;
    }

    (void)helper::parse_string_optional(rerun, "queryString", out.query_string);
    (void)helper::parse_string_optional(rerun, "pageScriptHash", out.page_script_hash);
    (void)helper::parse_string_optional(rerun, "pageName", out.page_name);

    simdjson::dom::element widgets;
    if (helper::parse_object_optional(rerun, "widgetStates", widgets) == Result::Ok) {
        out.widget_states = helper::to_json(widgets);
    }

    simdjson::dom::element ctx;
    if (helper::parse_object_optional(rerun, "contextInfo", ctx) == Result::Ok) {
        (void)helper::parse_string_optional(ctx, "timezone", out.context.timezone);
        (void)helper::parse_int64_optional(ctx, "timezoneOffset", out.context.timezone_offset);
        (void)helper::parse_string_optional(ctx, "locale", out.context.locale);
        (void)helper::parse_string_optional(ctx, "url", out.context.url);
        (void)helper::parse_bool_optional(ctx, "isEmbedded", out.context.is_embedded);
        (void)helper::parse_string_optional(ctx, "colorScheme", out.context.color_scheme);
    }
    return TemplateError::None;
}

TemplateError load_request(const std::string& path, Request& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return TemplateError::NotFound;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_request(ss.str(), out);
}

} // namespace wiredive::core::protocol::streamlit
