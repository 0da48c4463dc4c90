#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>
#include <system_error>

#include "wiredive/bulk/target_list.hpp"


namespace wiredive::bulk {

namespace {

[[nodiscard]]
std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// Finite decimal number, nothing else
[[nodiscard]]
bool parse_number(std::string_view s, double& out) noexcept {
    if (s.empty()) {
        return false;
    }
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size() && std::isfinite(out);
}

} // namespace


std::vector<std::string> split_csv_line(std::string_view line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
            continue;
        }
        switch (c) {
        case '"':
            quoted = true;
            break;
        case ',':
            fields.push_back(std::string(trim(field)));
            field.clear();
            break;
        default:
            field += c;
        }
    }
    fields.push_back(std::string(trim(field)));
    return fields;
}

ListError parse_targets(std::string_view csv,
                        std::size_t offset,
                        std::optional<std::size_t> limit,
                        std::vector<Target>& out)
{
    out.clear();

    // UTF-8 BOM
    if (csv.substr(0, 3) == "\xEF\xBB\xBF") {
        csv.remove_prefix(3);
    }

    std::vector<std::string> header;
    std::size_t id_column = 0;
    std::size_t row = 0;

    while (!csv.empty()) {
        const auto eol = csv.find('\n');
        const std::string_view line = trim(csv.substr(0, eol));
        csv.remove_prefix(eol == std::string_view::npos ? csv.size() : eol + 1);
        if (line.empty()) {
            continue;
        }

        if (header.empty()) {
            header = split_csv_line(line);
            const auto it = std::find(header.begin(), header.end(), TARGET_COLUMN);
            if (it == header.end()) {
                return ListError::MissingColumn;
            }
            id_column = static_cast<std::size_t>(it - header.begin());
            continue;
        }

        const std::vector<std::string> cells = split_csv_line(line);
        if (id_column >= cells.size() || cells[id_column].empty()) {
            continue;
        }
        if (row++ < offset) {
            continue;
        }
        if (limit && out.size() >= *limit) {
            break;
        }

        Target t;
        t.id = cells[id_column];
        for (std::size_t i = 0; i < cells.size() && i < header.size(); ++i) {
            double v = 0.0;
            if (i != id_column && parse_number(cells[i], v)) {
                t.extras.emplace_back(header[i], v);
            }
        }
        out.push_back(std::move(t));
    }

    if (header.empty()) {
        return ListError::MissingColumn;
    }
    return out.empty() && row == 0 ? ListError::Empty : ListError::None;
}

ListError load_targets(const std::filesystem::path& path,
                       std::size_t offset,
                       std::optional<std::size_t> limit,
                       std::vector<Target>& out)
{
    std::ifstream is(path, std::ios::binary);
    if (!is) {
        out.clear();
        return ListError::NotFound;
    }
    const std::string text{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
    return parse_targets(text, offset, limit, out);
}

} // namespace wiredive::bulk
