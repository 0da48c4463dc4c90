#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "wiredive/core/transport/error.hpp"


namespace wiredive::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure = true;   // true = wss, false = ws
        std::string host;
        std::string port;
        std::string target;   // path plus optional query, always starts with '/'

        // Value for the HTTP Host header (port omitted when it is the scheme default)
        [[nodiscard]]
        std::string host_header() const {
            const bool default_port = secure ? (port == "443") : (port == "80");
            return default_port ? host : host + ":" + port;
        }
    };


    // ---------------------------------------------------------------------
    // Minimal URL parser supporting ws:// and wss://
    // Accepts the common forms used by streaming endpoints and rejects
    // malformed inputs without attempting full RFC compliance. A query
    // string directly after the authority is folded into the target.
    //
    // Example inputs:
    //   wss://hashdive.com/_stcore/stream
    //   ws://127.0.0.1:8501/_stcore/stream
    //   ws://localhost:9000?debug=1
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.substr(0, ws.size()) == ws) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.substr(0, wss.size()) == wss) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Extract host[:port] up to the first '/' or '?'
        const std::size_t end = url.find_first_of("/?", pos);
        const std::string_view hostport = (end == std::string_view::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (hostport.empty() || hostport.find('@') != std::string_view::npos) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        const std::size_t colon = hostport.rfind(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = (out.secure) ? "443" : "80";
        }
        // 4) Target (default "/" if missing)
        if (end == std::string_view::npos) {
            out.target = "/";
        } else if (url[end] == '?') {
            out.target = "/" + std::string(url.substr(end));
        } else {
            out.target = std::string(url.substr(end));
        }

        // Invariants check --------------------------------

        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        // Port must be numeric and in range
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace wiredive::core::transport
