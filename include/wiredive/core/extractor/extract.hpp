#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "wiredive/core/classifier/tag.hpp"
#include "wiredive/core/extractor/user_record.hpp"
#include "wiredive/core/protocol/streamlit/element.hpp"

/*
===============================================================================
 Field extraction
===============================================================================

extract(tag, element) -> partial UserRecord

One routine per tag, each isolated from the others: a pattern that stops
matching leaves its own fields absent and nothing else. Markup routines work
on the rendered markdown body; chart routines decode the embedded Plotly
specification independently.

Tags without fields of their own (tables, ROI distribution, historical PnL,
terminal and unknown frames) yield an empty partial.
===============================================================================
*/

namespace wiredive::core::extractor {

[[nodiscard]]
UserRecord extract(classifier::Tag tag, const protocol::streamlit::Element& element);

// --- Individual routines ------------------------------------------------------
//
// Exposed for testing. Each takes the text it needs and returns only what it
// could read.

struct RankValue {
    std::optional<std::string> place;    // "#12"
    std::optional<std::string> amount;   // "$1.2k"
};

struct AmountPnl {
    std::optional<double> amount;
    std::optional<double> pnl;
};

struct TradeRoi {
    std::optional<double> proc;
    std::optional<double> amount;
};

[[nodiscard]] std::optional<std::string> extract_trader_type(std::string_view markdown);
[[nodiscard]] std::optional<std::int64_t> extract_total_positions(std::string_view markdown);
[[nodiscard]] std::optional<double> extract_current_balance(std::string_view markdown);
[[nodiscard]] std::optional<std::string> extract_profile_url(std::string_view markdown);
[[nodiscard]] RankValue extract_rank(std::string_view markdown);
[[nodiscard]] std::optional<double> extract_sharpe_ratio(std::string_view markdown);
[[nodiscard]] std::optional<double> extract_traded_volume(std::string_view metric_body);
[[nodiscard]] AmountPnl extract_bets_summary(std::string_view markdown);
[[nodiscard]] TradeRoi extract_trade_roi(std::string_view markdown);

// Bar chart x/y, values rounded to two decimals
[[nodiscard]] std::optional<Points> extract_price_buckets(std::string_view chart_spec);

// Radar chart theta/r, the closing point dropped when it repeats the first
[[nodiscard]] std::optional<Points> extract_radar(std::string_view chart_spec);

// "1,234.50" -> 1234.5
[[nodiscard]] std::optional<double> parse_amount(std::string_view text) noexcept;

} // namespace wiredive::core::extractor
