#pragma once

#include <array>
#include <cstddef>
#include <string_view>


namespace wiredive::core::config::endpoint {

/*
===============================================================================
Remote Endpoint Defaults
===============================================================================

The remote application speaks its push protocol over a single WebSocket
route. Access is cookie-gated: the upgrade request must carry the session
cookies of a logged-in browser, and the XSRF cookie value doubles as the
second Sec-WebSocket-Protocol token.
===============================================================================
*/

inline constexpr std::string_view URL        = "wss://hashdive.com/_stcore/stream";
inline constexpr std::string_view ORIGIN     = "https://hashdive.com";
inline constexpr std::string_view USER_AGENT =
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/143.0.0.0 Safari/537.36";

// Cookie jar domain the credentials are looked up under
inline constexpr std::string_view COOKIE_DOMAIN = "hashdive.com";

// Cookie whose value is echoed as the second sub-protocol token
inline constexpr std::string_view XSRF_COOKIE = "_streamlit_xsrf";

// First sub-protocol token
inline constexpr std::string_view SUBPROTOCOL = "streamlit";

// Every one of these must be present or authentication is considered failed
inline constexpr std::array<std::string_view, 3> REQUIRED_COOKIES = {
    "ajs_anonymous_id",
    "_streamlit_user",
    "_streamlit_xsrf"
};

// Largest inbound message accepted by the transport (20 MiB)
inline constexpr std::size_t MAX_MESSAGE_SIZE = 20 * 1024 * 1024;

} // namespace wiredive::core::config::endpoint
