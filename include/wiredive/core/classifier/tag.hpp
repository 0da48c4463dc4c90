#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>


namespace wiredive::core::classifier {

// -----------------------------------------------------------------------------
// Tag
// -----------------------------------------------------------------------------
//
// Semantic role of one decoded frame of an Analyze_User page run.
// Unknown is the catch-all for anything matching no signature.
// -----------------------------------------------------------------------------
enum class Tag : std::uint8_t {
    Unknown = 0,

    // --- Profile attributes -------------------------------------------------
    TypeLabel,               // ":material/..." badge, e.g. [Contrarian]
    TypeLabelDescription,    // free text right after a TypeLabel
    TotalPositions,
    ActiveSince,
    CurrentBalance,
    ProfileLink,             // link to the trader's profile page

    // --- Ranked window family (structurally identical, order-dependent) ----
    Rank1d,
    Rank7d,
    Rank30d,
    RankAllTime,

    // --- Scores -------------------------------------------------------------
    SmartScoreSummary,
    HistoricalPnlChart,
    SharpeRatio,
    TradedVolume30d,

    // --- Bets (summary, then at most one table per category) ---------------
    ActiveBetsSummary,
    ActiveBetsTable,
    FinishedBetsSummary,
    FinishedBetsTable,

    // --- Trades -------------------------------------------------------------
    BestTrade,
    WorstTrade,
    RoiDistribution,

    // --- Category charts ----------------------------------------------------
    MostTradedCategories,
    SmartScoreByCategory,
    WinRateByCategory,

    RecentTradesTable,
    PriceBuckets,            // "Where This Trader Bets Most"

    // --- Stream control -----------------------------------------------------
    ScriptFinished,          // terminal signal

    Count_
};

inline constexpr std::size_t TAG_COUNT = static_cast<std::size_t>(Tag::Count_);

[[nodiscard]]
inline constexpr std::size_t index_of(Tag t) noexcept {
    return static_cast<std::size_t>(t);
}

[[nodiscard]]
inline constexpr std::string_view to_string(Tag t) noexcept {
    switch (t) {
    case Tag::Unknown:              return "Unknown";
    case Tag::TypeLabel:            return "TypeLabel";
    case Tag::TypeLabelDescription: return "TypeLabelDescription";
    case Tag::TotalPositions:       return "TotalPositions";
    case Tag::ActiveSince:          return "ActiveSince";
    case Tag::CurrentBalance:       return "CurrentBalance";
    case Tag::ProfileLink:          return "ProfileLink";
    case Tag::Rank1d:               return "Rank1d";
    case Tag::Rank7d:               return "Rank7d";
    case Tag::Rank30d:              return "Rank30d";
    case Tag::RankAllTime:          return "RankAllTime";
    case Tag::SmartScoreSummary:    return "SmartScoreSummary";
    case Tag::HistoricalPnlChart:   return "HistoricalPnlChart";
    case Tag::SharpeRatio:          return "SharpeRatio";
    case Tag::TradedVolume30d:      return "TradedVolume30d";
    case Tag::ActiveBetsSummary:    return "ActiveBetsSummary";
    case Tag::ActiveBetsTable:      return "ActiveBetsTable";
    case Tag::FinishedBetsSummary:  return "FinishedBetsSummary";
    case Tag::FinishedBetsTable:    return "FinishedBetsTable";
    case Tag::BestTrade:            return "BestTrade";
    case Tag::WorstTrade:           return "WorstTrade";
    case Tag::RoiDistribution:      return "RoiDistribution";
    case Tag::MostTradedCategories: return "MostTradedCategories";
    case Tag::SmartScoreByCategory: return "SmartScoreByCategory";
    case Tag::WinRateByCategory:    return "WinRateByCategory";
    case Tag::RecentTradesTable:    return "RecentTradesTable";
    case Tag::PriceBuckets:         return "PriceBuckets";
    case Tag::ScriptFinished:       return "ScriptFinished";
    default:                        return "Invalid";
    }
}

} // namespace wiredive::core::classifier
