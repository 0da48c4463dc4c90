#include <array>

#include "wiredive/core/classifier/classifier.hpp"
#include "wiredive/core/config/run.hpp"


namespace wiredive::core::classifier {

namespace {

// Content contains `first` and, when given, `second`
struct Signature {
    Tag tag;
    std::string_view first;
    std::string_view second = {};
};

// Order matters: first match wins
constexpr std::array<Signature, 21> SIGNATURES = {{
    {Tag::TypeLabel,            ":material/"},
    {Tag::TotalPositions,       ">Total Positions<"},
    {Tag::ActiveSince,          ">Active Since<"},
    {Tag::CurrentBalance,       "Current Balance\n"},
    {Tag::CurrentBalance,       ">Current Balance<"},
    {Tag::ProfileLink,          "<a href=\"https://polymarket.com/profile/"},
    {Tag::Rank1d,               ">Rank: "},
    {Tag::SmartScoreSummary,    "User Smart Score:"},
    {Tag::HistoricalPnlChart,   "Historical PnL"},
    {Tag::SharpeRatio,          "Sharpe Ratio:"},
    {Tag::TradedVolume30d,      "Traded USD Volume (Last 30d, daily)"},
    {Tag::ActiveBetsSummary,    "Active Bets",   "PnL:"},
    {Tag::FinishedBetsSummary,  "Finished Bets", "PnL:"},
    {Tag::BestTrade,            "Best trade (ROI):"},
    {Tag::WorstTrade,           "Worst trade (ROI):"},
    {Tag::RoiDistribution,      "Distribution of ROI weighted by invested capital"},
    {Tag::MostTradedCategories, "Markets traded:"},
    {Tag::SmartScoreByCategory, "Smart Score: %{r:.2f}"},
    {Tag::WinRateByCategory,    "Win Rate: %{r:.2%}"},
    {Tag::RecentTradesTable,    "\"timestamp\": {\"label\": \"Timestamp\"", "\"question\": {\"label\": \"Question\""},
    {Tag::PriceBuckets,         "Where This Trader Bets Most"},
}};

constexpr std::array<Tag, 3> RANK_FOLLOWERS = {Tag::Rank7d, Tag::Rank30d, Tag::RankAllTime};

[[nodiscard]]
constexpr bool contains(std::string_view haystack, std::string_view needle) noexcept {
    return haystack.find(needle) != std::string_view::npos;
}

// Consumes the one-shot table slot that follows a bets summary
[[nodiscard]]
bool take_table_slot(Tag summary, bool& seen, const State& prev, const protocol::streamlit::Element& element) noexcept {
    if (prev.last != summary || seen) {
        return false;
    }
    seen = true;
    return element.has_dataframe;
}

} // namespace


Tag signature(std::string_view content) noexcept {
    for (const auto& sig : SIGNATURES) {
        if (contains(content, sig.first) && (sig.second.empty() || contains(content, sig.second))) {
            return sig.tag;
        }
    }
    return Tag::Unknown;
}

Classification classify(const protocol::streamlit::Element& element, const State& state) noexcept {
    Classification out{Tag::Unknown, state};

    // Stream control frames carry no element
    if (!element.script_finished.empty()) {
        if (element.script_finished == config::run::SCRIPT_FINISHED_OK) {
            out.tag = Tag::ScriptFinished;
        }
        return out;
    }
    if (!element.has_element) {
        return out;
    }

    const Tag sig = signature(element.content());
    State& next = out.state;

    // 1) Description of the preceding type label
    if (state.last == Tag::TypeLabel && sig == Tag::Unknown && element.has_markdown) {
        out.tag = Tag::TypeLabelDescription;
        next.last = out.tag;
        next.rank_index = 0;
        return out;
    }

    // 2) Bets tables (one-shot per category)
    if (take_table_slot(Tag::ActiveBetsSummary, next.active_table_seen, state, element)) {
        out.tag = Tag::ActiveBetsTable;
        next.last = out.tag;
        next.rank_index = 0;
        return out;
    }
    if (take_table_slot(Tag::FinishedBetsSummary, next.finished_table_seen, state, element)) {
        out.tag = Tag::FinishedBetsTable;
        next.last = out.tag;
        next.rank_index = 0;
        return out;
    }

    // 3) Ranked window continuation
    if (state.rank_index > 0) {
        if (sig == Tag::Rank1d) {
            const std::uint8_t idx = state.rank_index;
            out.tag = RANK_FOLLOWERS[idx - 1];
            next.rank_index = (idx >= RANK_FOLLOWERS.size()) ? 0 : static_cast<std::uint8_t>(idx + 1);
            next.last = out.tag;
            return out;
        }
        next.rank_index = 0;
    }

    // 4) Plain signature
    out.tag = sig;
    if (sig == Tag::Rank1d) {
        next.rank_index = 1;
    }
    next.last = out.tag;
    return out;
}

} // namespace wiredive::core::classifier
