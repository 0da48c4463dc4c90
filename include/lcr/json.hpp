#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <charconv>
#include <cmath>
#include <system_error>


namespace lcr {
namespace json {

// Appends `s` to `out` with JSON string escaping (quotes not included)
inline void escape(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

// Convenience (allocating)
[[nodiscard]]
inline std::string escape(std::string_view s) {
    std::string out;
    escape(out, s);
    return out;
}

// Appends a quoted, escaped JSON string
inline void append_string(std::string& out, std::string_view s) {
    out += '"';
    escape(out, s);
    out += '"';
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = '0' + (value % 10);
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

inline void append(std::string& out, std::int64_t value)
{
    if (value < 0) {
        out += '-';
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

// Shortest round-trip representation. Non-finite values become null.
inline void append(std::string& out, double value)
{
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        out += "null";
        return;
    }
    out.append(buf, ptr);
}

inline void append(std::string& out, bool value)
{
    out += value ? "true" : "false";
}

} // namespace json
} // namespace lcr
