#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace wiredive::core::codec::base64 {

inline constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Standard alphabet, '=' padded
[[nodiscard]]
inline std::string encode(std::string_view in) {
    std::string out;
    out.reserve(((in.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= in.size(); i += 3) {
        const std::uint32_t v = (static_cast<std::uint8_t>(in[i]) << 16)
                              | (static_cast<std::uint8_t>(in[i + 1]) << 8)
                              |  static_cast<std::uint8_t>(in[i + 2]);
        out += ALPHABET[(v >> 18) & 0x3F];
        out += ALPHABET[(v >> 12) & 0x3F];
        out += ALPHABET[(v >> 6) & 0x3F];
        out += ALPHABET[v & 0x3F];
    }

    const std::size_t rest = in.size() - i;
    if (rest == 1) {
        const std::uint32_t v = static_cast<std::uint8_t>(in[i]) << 16;
        out += ALPHABET[(v >> 18) & 0x3F];
        out += ALPHABET[(v >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t v = (static_cast<std::uint8_t>(in[i]) << 16)
                              | (static_cast<std::uint8_t>(in[i + 1]) << 8);
        out += ALPHABET[(v >> 18) & 0x3F];
        out += ALPHABET[(v >> 12) & 0x3F];
        out += ALPHABET[(v >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

// Returns false on characters outside the alphabet. Whitespace is skipped.
[[nodiscard]]
inline bool decode(std::string_view in, std::string& out) {
    auto value_of = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    out.clear();
    out.reserve((in.size() / 4) * 3);

    std::uint32_t acc = 0;
    int bits = 0;
    for (char c : in) {
        if (c == '=' ) break;
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
        const int v = value_of(c);
        if (v < 0) {
            return false;
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((acc >> bits) & 0xFF);
        }
    }
    return true;
}

} // namespace wiredive::core::codec::base64
