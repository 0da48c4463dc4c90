#include <algorithm>

#include "wiredive/core/extractor/user_record.hpp"

#include "lcr/json.hpp"


namespace wiredive::core::extractor {

namespace {

template<class T>
inline void take(std::optional<T>& dst, const std::optional<T>& src) {
    if (src) {
        dst = src;
    }
}

template<class T>
inline std::size_t count(const std::optional<T>& v) noexcept {
    return v ? 1u : 0u;
}

// --- JSON members ------------------------------------------------------------

inline void key(std::string& out, const char* name) {
    if (!out.empty() && out.back() != '{') {
        out += ',';
    }
    lcr::json::append_string(out, name);
    out += ':';
}

inline void value(std::string& out, const std::optional<std::string>& v) {
    if (v) lcr::json::append_string(out, *v);
    else   out += "null";
}

inline void value(std::string& out, const std::optional<std::int64_t>& v) {
    if (v) lcr::json::append(out, *v);
    else   out += "null";
}

inline void value(std::string& out, const std::optional<double>& v) {
    if (v) lcr::json::append(out, *v);
    else   out += "null";
}

inline void value(std::string& out, const Points& points) {
    out += '{';
    bool first = true;
    for (const auto& [label, v] : points) {
        if (!first) out += ',';
        first = false;
        lcr::json::append_string(out, label);
        out += ':';
        lcr::json::append(out, v);
    }
    out += '}';
}

template<class T>
inline void member(std::string& out, const char* name, const T& v) {
    key(out, name);
    value(out, v);
}

} // namespace


std::size_t UserRecord::present() const noexcept {
    std::size_t n = 0;
    n += trader_types.empty() ? 0u : 1u;
    n += count(trader_type_description);
    n += count(total_positions);
    n += count(active_since_date);
    n += count(active_since_days);
    n += count(current_balance);
    n += count(polymarket_url);
    n += count(rank_1d_place) + count(rank_1d_amount);
    n += count(rank_7d_place) + count(rank_7d_amount);
    n += count(rank_30d_place) + count(rank_30d_amount);
    n += count(rank_all_time_place) + count(rank_all_time_amount);
    n += count(smart_score);
    n += count(total_pnl);
    n += count(sharpe_ratio);
    n += count(traded_usd_volume_last_30d_sum);
    n += count(active_bets_amount) + count(active_bets_pnl);
    n += count(finished_bets_amount) + count(finished_bets_pnl);
    n += count(best_trade_roi_proc) + count(best_trade_roi_amount);
    n += count(worst_trade_roi_proc) + count(worst_trade_roi_amount);
    n += count(where_trader_bets_most);
    n += category_metrics.empty() ? 0u : 1u;
    return n;
}

void merge(UserRecord& record, const UserRecord& partial) {
    for (const auto& type : partial.trader_types) {
        if (std::find(record.trader_types.begin(), record.trader_types.end(), type) == record.trader_types.end()) {
            record.trader_types.push_back(type);
        }
    }
    take(record.trader_type_description, partial.trader_type_description);
    take(record.total_positions, partial.total_positions);
    take(record.active_since_date, partial.active_since_date);
    take(record.active_since_days, partial.active_since_days);
    take(record.current_balance, partial.current_balance);
    take(record.polymarket_url, partial.polymarket_url);

    take(record.rank_1d_place, partial.rank_1d_place);
    take(record.rank_1d_amount, partial.rank_1d_amount);
    take(record.rank_7d_place, partial.rank_7d_place);
    take(record.rank_7d_amount, partial.rank_7d_amount);
    take(record.rank_30d_place, partial.rank_30d_place);
    take(record.rank_30d_amount, partial.rank_30d_amount);
    take(record.rank_all_time_place, partial.rank_all_time_place);
    take(record.rank_all_time_amount, partial.rank_all_time_amount);

    take(record.smart_score, partial.smart_score);
    take(record.total_pnl, partial.total_pnl);
    take(record.sharpe_ratio, partial.sharpe_ratio);
    take(record.traded_usd_volume_last_30d_sum, partial.traded_usd_volume_last_30d_sum);

    take(record.active_bets_amount, partial.active_bets_amount);
    take(record.active_bets_pnl, partial.active_bets_pnl);
    take(record.finished_bets_amount, partial.finished_bets_amount);
    take(record.finished_bets_pnl, partial.finished_bets_pnl);

    take(record.best_trade_roi_proc, partial.best_trade_roi_proc);
    take(record.best_trade_roi_amount, partial.best_trade_roi_amount);
    take(record.worst_trade_roi_proc, partial.worst_trade_roi_proc);
    take(record.worst_trade_roi_amount, partial.worst_trade_roi_amount);

    take(record.where_trader_bets_most, partial.where_trader_bets_most);
    for (const auto& [name, points] : partial.category_metrics) {
        record.category_metrics[name] = points;
    }
}

void append_fields(std::string& out, const UserRecord& r) {
    key(out, "trader_types");
    out += '[';
    for (std::size_t i = 0; i < r.trader_types.size(); ++i) {
        if (i) out += ',';
        lcr::json::append_string(out, r.trader_types[i]);
    }
    out += ']';

    member(out, "trader_type_description", r.trader_type_description);
    member(out, "total_positions", r.total_positions);
    member(out, "active_since_date", r.active_since_date);
    member(out, "active_since_days", r.active_since_days);
    member(out, "current_balance", r.current_balance);
    member(out, "polymarket_url", r.polymarket_url);
    member(out, "rank_1d_place", r.rank_1d_place);
    member(out, "rank_1d_amount", r.rank_1d_amount);
    member(out, "rank_7d_place", r.rank_7d_place);
    member(out, "rank_7d_amount", r.rank_7d_amount);
    member(out, "rank_30d_place", r.rank_30d_place);
    member(out, "rank_30d_amount", r.rank_30d_amount);
    member(out, "rank_all_time_place", r.rank_all_time_place);
    member(out, "rank_all_time_amount", r.rank_all_time_amount);
    member(out, "smart_score", r.smart_score);
    member(out, "total_pnl", r.total_pnl);
    member(out, "sharpe_ratio", r.sharpe_ratio);
    member(out, "traded_usd_volume_last_30d_sum", r.traded_usd_volume_last_30d_sum);
    member(out, "active_bets_amount", r.active_bets_amount);
    member(out, "active_bets_pnl", r.active_bets_pnl);
    member(out, "finished_bets_amount", r.finished_bets_amount);
    member(out, "finished_bets_pnl", r.finished_bets_pnl);
    member(out, "best_trade_roi_proc", r.best_trade_roi_proc);
    member(out, "best_trade_roi_amount", r.best_trade_roi_amount);
    member(out, "worst_trade_roi_proc", r.worst_trade_roi_proc);
    member(out, "worst_trade_roi_amount", r.worst_trade_roi_amount);

    key(out, "where_trader_bets_most");
    if (r.where_trader_bets_most) value(out, *r.where_trader_bets_most);
    else                          out += "null";

    key(out, "category_metrics");
    out += '{';
    bool first = true;
    for (const auto& [name, points] : r.category_metrics) {
        if (!first) out += ',';
        first = false;
        lcr::json::append_string(out, name);
        out += ':';
        value(out, points);
    }
    out += '}';
}

std::string to_json(const UserRecord& record) {
    std::string out;
    out.reserve(2048);
    out += '{';
    append_fields(out, record);
    out += '}';
    return out;
}

} // namespace wiredive::core::extractor
