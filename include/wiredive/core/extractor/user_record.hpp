#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>


namespace wiredive::core::extractor {

// Ordered (label, value) points, in chart order
using Points = std::vector<std::pair<std::string, double>>;

// -----------------------------------------------------------------------------
// UserRecord
// -----------------------------------------------------------------------------
//
// Everything one Analyze_User run can tell about a trader. Every field is
// absent until a classified frame supplies it.
//
// Category metric keys:
//   most_traded_categories | smart_score_categories | win_rate_categories
// -----------------------------------------------------------------------------
struct UserRecord {
    // --- Profile ------------------------------------------------------------
    std::vector<std::string> trader_types;
    std::optional<std::string> trader_type_description;
    std::optional<std::int64_t> total_positions;
    std::optional<std::string> active_since_date;
    std::optional<std::int64_t> active_since_days;
    std::optional<double> current_balance;
    std::optional<std::string> polymarket_url;

    // --- Ranked windows -----------------------------------------------------
    std::optional<std::string> rank_1d_place;
    std::optional<std::string> rank_1d_amount;
    std::optional<std::string> rank_7d_place;
    std::optional<std::string> rank_7d_amount;
    std::optional<std::string> rank_30d_place;
    std::optional<std::string> rank_30d_amount;
    std::optional<std::string> rank_all_time_place;
    std::optional<std::string> rank_all_time_amount;

    // --- Scores -------------------------------------------------------------
    std::optional<double> smart_score;
    std::optional<double> total_pnl;
    std::optional<double> sharpe_ratio;
    std::optional<double> traded_usd_volume_last_30d_sum;

    // --- Bets ---------------------------------------------------------------
    std::optional<double> active_bets_amount;
    std::optional<double> active_bets_pnl;
    std::optional<double> finished_bets_amount;
    std::optional<double> finished_bets_pnl;

    // --- Trades -------------------------------------------------------------
    std::optional<double> best_trade_roi_proc;
    std::optional<double> best_trade_roi_amount;
    std::optional<double> worst_trade_roi_proc;
    std::optional<double> worst_trade_roi_amount;

    // --- Charts -------------------------------------------------------------
    std::optional<Points> where_trader_bets_most;
    std::map<std::string, Points> category_metrics;

    // Number of present fields (non-empty for the collections)
    [[nodiscard]]
    std::size_t present() const noexcept;

    [[nodiscard]]
    bool empty() const noexcept { return present() == 0; }

    bool operator==(const UserRecord&) const = default;
};

// Folds `partial` into `record`. Present fields of `partial` overwrite;
// trader_types append without duplicates, category_metrics union by key.
void merge(UserRecord& record, const UserRecord& partial);

// Appends the record members as `"name":value` pairs without the enclosing
// braces, after a separating comma unless `out` is empty or ends in '{'.
// Absent fields are written as null.
void append_fields(std::string& out, const UserRecord& record);

[[nodiscard]]
std::string to_json(const UserRecord& record);

} // namespace wiredive::core::extractor
