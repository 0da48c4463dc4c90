#pragma once

#include <string>
#include <string_view>

#include "wiredive/core/config/endpoint.hpp"
#include "wiredive/core/credentials/source.hpp"
#include "wiredive/core/transport/handshake.hpp"


namespace wiredive::core::credentials {

// "a=1; b=2" (map order)
[[nodiscard]]
inline std::string cookie_header(const Cookies& cookies) {
    std::string out;
    for (const auto& [name, value] : cookies) {
        if (!out.empty()) {
            out += "; ";
        }
        out += name;
        out += '=';
        out += value;
    }
    return out;
}

// -----------------------------------------------------------------------------
// Upgrade request derived from the session cookies:
//
//   User-Agent, Origin, Cookie
//   Sec-WebSocket-Protocol: streamlit, <xsrf cookie value>
//
// The XSRF token is only appended when the cookie is present.
// -----------------------------------------------------------------------------
[[nodiscard]]
inline transport::Handshake make_handshake(const Cookies& cookies,
                                           std::string_view origin = config::endpoint::ORIGIN,
                                           std::string_view user_agent = config::endpoint::USER_AGENT) {
    transport::Handshake hs;
    hs.headers.emplace_back("User-Agent", std::string(user_agent));
    hs.headers.emplace_back("Origin", std::string(origin));
    if (!cookies.empty()) {
        hs.headers.emplace_back("Cookie", cookie_header(cookies));
    }

    hs.subprotocols.emplace_back(config::endpoint::SUBPROTOCOL);
    if (auto it = cookies.find(config::endpoint::XSRF_COOKIE); it != cookies.end()) {
        hs.subprotocols.push_back(it->second);
    }
    hs.max_message_size = config::endpoint::MAX_MESSAGE_SIZE;
    return hs;
}

} // namespace wiredive::core::credentials
