#include <algorithm>
#include <charconv>
#include <cmath>
#include <system_error>

#include "wiredive/core/extractor/extract.hpp"
#include "wiredive/core/protocol/streamlit/parser/chart_parser.hpp"


namespace wiredive::core::extractor {

namespace {

// Markup scanning is linear in the frame size: every pattern is a literal
// marker followed by a bounded token, located with find().

constexpr std::string_view LINE_BREAKS = "\n\r";

[[nodiscard]] inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
[[nodiscard]] inline bool is_alpha(char c) noexcept { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }
[[nodiscard]] inline bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

template <class Pred>
[[nodiscard]]
std::size_t run_length(std::string_view s, Pred pred) noexcept {
    std::size_t n = 0;
    while (n < s.size() && pred(s[n])) {
        ++n;
    }
    return n;
}

// "1,234.50": digits and commas, then an optional fraction
[[nodiscard]]
std::size_t amount_length(std::string_view s) noexcept {
    std::size_t n = run_length(s, [](char c) { return is_digit(c) || c == ','; });
    if (n == 0) {
        return 0;
    }
    if (n < s.size() && s[n] == '.') {
        ++n;
        n += run_length(s.substr(n), is_digit);
    }
    return n;
}

// "72.5": digits and dots
[[nodiscard]]
std::size_t decimal_length(std::string_view s) noexcept {
    return run_length(s, [](char c) { return is_digit(c) || c == '.'; });
}

[[nodiscard]]
std::size_t digits_length(std::string_view s) noexcept {
    return run_length(s, is_digit);
}

[[nodiscard]]
std::size_t skip_space(std::string_view s) noexcept {
    return run_length(s, is_space);
}

// First token of `open` TOKEN `close`, where TOKEN is the non-empty prefix
// measured by `measure` right after an occurrence of `open`.
template <class Measure>
[[nodiscard]]
std::optional<std::string_view> enclosed(std::string_view text, std::string_view open, Measure measure, std::string_view close = {}) {
    for (auto pos = text.find(open); pos != std::string_view::npos; pos = text.find(open, pos + 1)) {
        const std::string_view rest = text.substr(pos + open.size());
        const std::size_t n = measure(rest);
        if (n > 0 && rest.substr(n).starts_with(close)) {
            return rest.substr(0, n);
        }
    }
    return std::nullopt;
}

[[nodiscard]]
std::optional<std::string> owned(std::optional<std::string_view> v) {
    if (!v) {
        return std::nullopt;
    }
    return std::string(*v);
}

[[nodiscard]]
std::optional<std::int64_t> parse_integer(std::string_view text) noexcept {
    std::int64_t v = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return v;
}

[[nodiscard]]
std::string trim(std::string s) {
    constexpr const char* ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// U+2212 MINUS SIGN as rendered by the page
constexpr std::string_view UNICODE_MINUS = "\xE2\x88\x92";

[[nodiscard]]
std::string normalize_minus(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (true) {
        const auto hit = text.find(UNICODE_MINUS, pos);
        if (hit == std::string_view::npos) {
            out.append(text.substr(pos));
            return out;
        }
        out.append(text.substr(pos, hit - pos));
        out += '-';
        pos = hit + UNICODE_MINUS.size();
    }
}

[[nodiscard]]
inline double round2(double v) noexcept {
    return std::round(v * 100.0) / 100.0;
}

[[nodiscard]]
std::optional<Points> chart(std::string_view spec, const char* labels, const char* values) {
    thread_local protocol::streamlit::parser::ChartParser parser;
    Points points;
    if (parser.parse(spec, labels, values, points) != protocol::streamlit::parser::Result::Ok) {
        return std::nullopt;
    }
    return points;
}

// --- Badge -------------------------------------------------------------------

// ":<color>-badge[<label>]": the bracketed label after the first colon of a
// line, all on that line
[[nodiscard]]
std::optional<std::string_view> badge_label(std::string_view text) noexcept {
    std::size_t line = 0;
    while (line < text.size()) {
        const std::size_t eol = std::min(text.find_first_of(LINE_BREAKS, line), text.size());
        const std::string_view l = text.substr(line, eol - line);
        const auto colon = l.find(':');
        if (colon != std::string_view::npos) {
            const auto open = l.find('[', colon + 1);
            if (open != std::string_view::npos) {
                const auto close = l.find(']', open + 1);
                if (close != std::string_view::npos) {
                    return l.substr(open + 1, close - open - 1);
                }
            }
        }
        line = eol + 1;
    }
    return std::nullopt;
}

// Drops ":material/<icon>" names and the blanks after them
[[nodiscard]]
std::string strip_icons(std::string_view text) {
    constexpr std::string_view ICON = ":material/";
    std::string out;
    std::size_t pos = 0;
    for (auto hit = text.find(ICON); hit != std::string_view::npos; hit = text.find(ICON, hit + 1)) {
        if (hit < pos) {
            continue;
        }
        const std::string_view rest = text.substr(hit + ICON.size());
        const std::size_t name = run_length(rest, [](char c) { return !is_space(c); });
        if (name == 0) {
            continue;
        }
        out.append(text.substr(pos, hit - pos));
        pos = hit + ICON.size() + name;
        pos += skip_space(text.substr(pos));
    }
    out.append(text.substr(pos));
    return out;
}

// Drops non-empty "(...)" groups with the blanks around them
[[nodiscard]]
std::string strip_parenthesized(std::string_view text) {
    std::string out;
    std::size_t pos = 0;
    for (auto open = text.find('('); open != std::string_view::npos; open = text.find('(', open + 1)) {
        if (open < pos) {
            continue;
        }
        const auto close = text.find(')', open + 1);
        if (close == std::string_view::npos) {
            break;
        }
        if (close == open + 1) {
            continue;
        }
        std::size_t from = open;
        while (from > pos && is_space(text[from - 1])) {
            --from;
        }
        out.append(text.substr(pos, from - pos));
        pos = close + 1;
        pos += skip_space(text.substr(pos));
        open = close;
    }
    out.append(text.substr(pos));
    return out;
}

// --- Bets --------------------------------------------------------------------

// `$<amount>` after optional blanks
[[nodiscard]]
std::optional<std::string_view> dollar_amount(std::string_view s) noexcept {
    s.remove_prefix(skip_space(s));
    if (s.empty() || s.front() != '$') {
        return std::nullopt;
    }
    s.remove_prefix(1);
    const std::size_t n = amount_length(s);
    if (n == 0) {
        return std::nullopt;
    }
    return s.substr(0, n);
}

// "font-size: 26px ...> $5,400.00"
[[nodiscard]]
std::optional<std::string_view> headline_amount(std::string_view text) noexcept {
    constexpr std::string_view MARKER = "font-size: 26px";
    for (auto pos = text.find(MARKER); pos != std::string_view::npos; pos = text.find(MARKER, pos + 1)) {
        const auto gt = text.find('>', pos + MARKER.size());
        if (gt == std::string_view::npos) {
            return std::nullopt;
        }
        if (auto amount = dollar_amount(text.substr(gt + 1))) {
            return amount;
        }
    }
    return std::nullopt;
}

// "PnL: ... <span ...> $320.10", the span on the same line as "PnL:"
[[nodiscard]]
std::optional<std::string_view> pnl_amount(std::string_view text) noexcept {
    constexpr std::string_view MARKER = "PnL:";
    constexpr std::string_view SPAN = "<span";
    auto pos = text.find(MARKER);
    while (pos != std::string_view::npos) {
        const std::size_t eol = std::min(text.find_first_of(LINE_BREAKS, pos), text.size());
        for (auto span = text.find(SPAN, pos + MARKER.size()); span != std::string_view::npos && span < eol;
             span = text.find(SPAN, span + 1)) {
            const auto gt = text.find('>', span + SPAN.size());
            if (gt == std::string_view::npos) {
                return std::nullopt;
            }
            if (auto amount = dollar_amount(text.substr(gt + 1))) {
                return amount;
            }
        }
        // A later marker on the same line sees no span the first did not
        pos = (eol < text.size()) ? text.find(MARKER, eol + 1) : std::string_view::npos;
    }
    return std::nullopt;
}

void assign_rank(std::string_view markdown, std::optional<std::string>& place, std::optional<std::string>& amount) {
    RankValue v = extract_rank(markdown);
    place = std::move(v.place);
    amount = std::move(v.amount);
}

void assign_radar(std::string_view spec, const char* key, UserRecord& out) {
    if (auto points = extract_radar(spec)) {
        out.category_metrics[key] = std::move(*points);
    }
}

} // namespace


std::optional<double> parse_amount(std::string_view text) noexcept {
    char buf[64];
    std::size_t n = 0;
    for (char c : text) {
        if (c == ',') {
            continue;
        }
        if (n == sizeof(buf)) {
            return std::nullopt;
        }
        buf[n++] = c;
    }
    if (n == 0) {
        return std::nullopt;
    }
    double v = 0.0;
    const auto [ptr, ec] = std::from_chars(buf, buf + n, v);
    if (ec != std::errc{} || ptr != buf + n) {
        return std::nullopt;
    }
    return v;
}

std::optional<std::string> extract_trader_type(std::string_view markdown) {
    const auto label = badge_label(markdown);
    if (!label) {
        return std::nullopt;
    }
    std::string s = trim(strip_parenthesized(strip_icons(*label)));
    if (s.empty()) {
        return std::nullopt;
    }
    return s;
}

std::optional<std::int64_t> extract_total_positions(std::string_view markdown) {
    if (auto digits = enclosed(markdown, ">", digits_length, "</div>")) {
        return parse_integer(*digits);
    }
    return std::nullopt;
}

std::optional<double> extract_current_balance(std::string_view markdown) {
    if (auto amount = enclosed(markdown, "<span>", amount_length, "</span>")) {
        return parse_amount(*amount);
    }
    return std::nullopt;
}

std::optional<std::string> extract_profile_url(std::string_view markdown) {
    constexpr std::string_view PROFILE = "https://polymarket.com/profile/";
    return owned(enclosed(markdown, "href=\"", [PROFILE](std::string_view s) -> std::size_t {
        if (!s.starts_with(PROFILE)) {
            return 0;
        }
        const std::size_t id = run_length(s.substr(PROFILE.size()), [](char c) { return c != '"'; });
        return id == 0 ? 0 : PROFILE.size() + id;
    }, "\""));
}

RankValue extract_rank(std::string_view markdown) {
    RankValue v;
    if (auto place = enclosed(markdown, "Rank: #", digits_length)) {
        v.place = "#" + std::string(*place);
    }
    const auto amount = enclosed(markdown, "$", [](std::string_view s) -> std::size_t {
        const std::size_t n = decimal_length(s);
        if (n > 0 && n < s.size() && std::string_view("kKmM").find(s[n]) != std::string_view::npos) {
            return n + 1;
        }
        return n;
    });
    if (amount) {
        v.amount = "$" + std::string(*amount);
    }
    return v;
}

std::optional<double> extract_sharpe_ratio(std::string_view markdown) {
    if (auto ratio = enclosed(markdown, "Sharpe Ratio: <span>", decimal_length, "</span>")) {
        return parse_amount(*ratio);
    }
    return std::nullopt;
}

std::optional<double> extract_traded_volume(std::string_view metric_body) {
    const auto sum = enclosed(metric_body, "$", [](std::string_view s) {
        return run_length(s, [](char c) { return is_digit(c) || c == ','; });
    });
    if (sum) {
        return parse_amount(*sum);
    }
    return std::nullopt;
}

AmountPnl extract_bets_summary(std::string_view markdown) {
    AmountPnl v;
    if (auto amount = headline_amount(markdown)) {
        v.amount = parse_amount(*amount);
    }
    if (auto pnl = pnl_amount(markdown)) {
        v.pnl = parse_amount(*pnl);
    }
    return v;
}

TradeRoi extract_trade_roi(std::string_view markdown) {
    const std::string text = normalize_minus(markdown);
    TradeRoi v;

    const auto signed_amount = [](std::string_view s) -> std::size_t {
        const std::size_t sign = (!s.empty() && (s.front() == '+' || s.front() == '-')) ? 1 : 0;
        const std::size_t n = amount_length(s.substr(sign));
        return n == 0 ? 0 : sign + n;
    };

    // ">+245.5%<"
    if (auto proc = enclosed(text, ">", signed_amount, "%<")) {
        std::string_view p = *proc;
        if (p.front() == '+') {
            p.remove_prefix(1);
        }
        v.proc = parse_amount(p);
    }

    // "(+$1,230.00)"
    const auto amount = enclosed(text, "(", [](std::string_view s) -> std::size_t {
        const std::size_t sign = (!s.empty() && (s.front() == '+' || s.front() == '-')) ? 1 : 0;
        if (s.size() <= sign || s[sign] != '$') {
            return 0;
        }
        const std::size_t n = amount_length(s.substr(sign + 1));
        return n == 0 ? 0 : sign + 1 + n;
    }, ")");
    if (amount) {
        const bool negative = amount->front() == '-';
        if (auto value = parse_amount(amount->substr(amount->find('$') + 1))) {
            v.amount = negative ? -*value : *value;
        }
    }
    return v;
}

std::optional<Points> extract_price_buckets(std::string_view chart_spec) {
    auto points = chart(chart_spec, "x", "y");
    if (!points) {
        return std::nullopt;
    }
    for (auto& [label, value] : *points) {
        value = round2(value);
    }
    return points;
}

std::optional<Points> extract_radar(std::string_view chart_spec) {
    auto points = chart(chart_spec, "theta", "r");
    if (!points) {
        return std::nullopt;
    }
    // Polar traces repeat the first point to close the outline
    if (points->size() > 1 && points->front().first == points->back().first) {
        points->pop_back();
    }
    return points;
}

UserRecord extract(classifier::Tag tag, const protocol::streamlit::Element& element) {
    using classifier::Tag;

    UserRecord out;
    const std::string_view md = element.markdown;

    switch (tag) {
    case Tag::TypeLabel:
        if (auto type = extract_trader_type(md)) {
            out.trader_types.push_back(std::move(*type));
        }
        break;

    case Tag::TypeLabelDescription: {
        std::string text = trim(element.markdown);
        if (!text.empty()) {
            out.trader_type_description = std::move(text);
        }
        break;
    }

    case Tag::TotalPositions:
        out.total_positions = extract_total_positions(md);
        break;

    case Tag::ActiveSince:
        out.active_since_date = owned(enclosed(md, "color: #312e81;\">", [](std::string_view s) -> std::size_t {
            // "March 2024"
            const std::size_t month = run_length(s, is_alpha);
            if (month == 0 || s.size() < month + 5 || s[month] != ' ') {
                return 0;
            }
            return digits_length(s.substr(month + 1, 4)) == 4 ? month + 5 : 0;
        }, "</div>"));
        if (auto days = enclosed(md, "color: #1e1b4b;\">", digits_length, " days</div>")) {
            out.active_since_days = parse_integer(*days);
        }
        break;

    case Tag::CurrentBalance:
        out.current_balance = extract_current_balance(md);
        break;

    case Tag::ProfileLink:
        out.polymarket_url = extract_profile_url(md);
        break;

    case Tag::Rank1d:
        assign_rank(md, out.rank_1d_place, out.rank_1d_amount);
        break;
    case Tag::Rank7d:
        assign_rank(md, out.rank_7d_place, out.rank_7d_amount);
        break;
    case Tag::Rank30d:
        assign_rank(md, out.rank_30d_place, out.rank_30d_amount);
        break;
    case Tag::RankAllTime:
        assign_rank(md, out.rank_all_time_place, out.rank_all_time_amount);
        break;

    case Tag::SmartScoreSummary:
        if (auto score = enclosed(md, "Smart Score: <strong>", decimal_length, "</strong>")) {
            out.smart_score = parse_amount(*score);
        }
        if (auto pnl = enclosed(md, "Total PnL: <strong>$", amount_length, "</strong>")) {
            out.total_pnl = parse_amount(*pnl);
        }
        break;

    case Tag::SharpeRatio:
        out.sharpe_ratio = extract_sharpe_ratio(md);
        break;

    case Tag::TradedVolume30d:
        out.traded_usd_volume_last_30d_sum = extract_traded_volume(element.metric_body);
        break;

    case Tag::ActiveBetsSummary: {
        AmountPnl v = extract_bets_summary(md);
        out.active_bets_amount = v.amount;
        out.active_bets_pnl = v.pnl;
        break;
    }
    case Tag::FinishedBetsSummary: {
        AmountPnl v = extract_bets_summary(md);
        out.finished_bets_amount = v.amount;
        out.finished_bets_pnl = v.pnl;
        break;
    }

    case Tag::BestTrade: {
        TradeRoi v = extract_trade_roi(md);
        out.best_trade_roi_proc = v.proc;
        out.best_trade_roi_amount = v.amount;
        break;
    }
    case Tag::WorstTrade: {
        TradeRoi v = extract_trade_roi(md);
        out.worst_trade_roi_proc = v.proc;
        out.worst_trade_roi_amount = v.amount;
        break;
    }

    case Tag::PriceBuckets:
        if (element.has_chart) {
            out.where_trader_bets_most = extract_price_buckets(element.chart_spec);
        }
        break;

    case Tag::MostTradedCategories:
        if (element.has_chart) {
            assign_radar(element.chart_spec, "most_traded_categories", out);
        }
        break;
    case Tag::SmartScoreByCategory:
        if (element.has_chart) {
            assign_radar(element.chart_spec, "smart_score_categories", out);
        }
        break;
    case Tag::WinRateByCategory:
        if (element.has_chart) {
            assign_radar(element.chart_spec, "win_rate_categories", out);
        }
        break;

    default:
        break;
    }
    return out;
}

} // namespace wiredive::core::extractor
