#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cstddef>


namespace wiredive::core::transport {

// -----------------------------------------------------------------------------
// Handshake
// -----------------------------------------------------------------------------
//
// Everything the WebSocket upgrade request carries besides the target URL.
// Built once from credentials and shared by every session opened against the
// same endpoint.
// -----------------------------------------------------------------------------
struct Handshake {
    std::vector<std::pair<std::string, std::string>> headers;
    std::vector<std::string> subprotocols;
    std::size_t max_message_size = 20 * 1024 * 1024;

    // Sec-WebSocket-Protocol value: "a, b, c"
    [[nodiscard]]
    std::string subprotocol_header() const {
        std::string out;
        for (const auto& p : subprotocols) {
            if (!out.empty()) {
                out += ", ";
            }
            out += p;
        }
        return out;
    }
};

} // namespace wiredive::core::transport
