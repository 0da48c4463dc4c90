/*
===============================================================================
 extractor — Field Extraction Unit Tests
===============================================================================

Scope:
------
Validates the per-tag field routines against rendered page content.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

X1. Profile fields (type label, positions, active since, balance, profile URL)
X2. Ranked windows keep place and amount as displayed
X3. Scores (smart score, total PnL, Sharpe ratio, 30d volume)
X4. Bets summaries (amount, PnL)
X5. Trade ROI, including the U+2212 minus sign
X6. Charts (price buckets rounded, radar closing point dropped)
X7. Unreadable content yields absent fields, never garbage
X8. extract() routes each tag to its fields only
X9. Large element bodies are scanned in linear time
    - Multi-megabyte filler between marker and value
    - Badge and PnL markers do not reach across line breaks

===============================================================================
*/

#include <cmath>
#include <iostream>
#include <optional>
#include <string>

#include "common/frames.hpp"
#include "common/test_check.hpp"
#include "common/user_page.hpp"

#include "wiredive/core/extractor/extract.hpp"

using namespace wiredive::core::extractor;
using wiredive::core::classifier::Tag;

namespace {

bool near(std::optional<double> v, double expected) {
    return v && std::fabs(*v - expected) < 1e-9;
}

} // namespace


// -----------------------------------------------------------------------------
// X1. Profile
// -----------------------------------------------------------------------------
void test_profile_fields() {
    std::cout << "[TEST] Group X1: profile fields\n";

    TEST_CHECK(extract_trader_type(page::TYPE_LABEL) == std::optional<std::string>("Contrarian"));
    TEST_CHECK(extract_trader_type(":blue-badge[:material/bolt: Whale]") == std::optional<std::string>("Whale"));
    TEST_CHECK(extract_trader_type(":green-badge[Early Bird (first movers)]") == std::optional<std::string>("Early Bird"));

    TEST_CHECK(extract_total_positions(page::TOTAL_POSITIONS) == std::optional<std::int64_t>(128));
    TEST_CHECK(near(extract_current_balance(page::CURRENT_BALANCE), 12345.67));
    TEST_CHECK(extract_profile_url(page::PROFILE_LINK) ==
               std::optional<std::string>("https://polymarket.com/profile/0xabc123"));

    const UserRecord since = extract(Tag::ActiveSince, elements::markdown(std::string(page::ACTIVE_SINCE)));
    TEST_CHECK(since.active_since_date == std::optional<std::string>("March 2024"));
    TEST_CHECK(since.active_since_days == std::optional<std::int64_t>(412));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// X2. Ranks
// -----------------------------------------------------------------------------
void test_ranks() {
    std::cout << "[TEST] Group X2: ranked windows\n";

    const RankValue r1 = extract_rank(page::RANK_1D);
    TEST_CHECK(r1.place == std::optional<std::string>("#12"));
    TEST_CHECK(r1.amount == std::optional<std::string>("$1.2k"));

    const RankValue all = extract_rank(page::RANK_ALL);
    TEST_CHECK(all.place == std::optional<std::string>("#310"));
    TEST_CHECK(all.amount == std::optional<std::string>("$1.1M"));

    const RankValue plain = extract_rank("<div>Rank: #7</div><div>$950</div>");
    TEST_CHECK(plain.amount == std::optional<std::string>("$950"));

    const UserRecord r30 = extract(Tag::Rank30d, elements::markdown(std::string(page::RANK_30D)));
    TEST_CHECK(r30.rank_30d_place == std::optional<std::string>("#95"));
    TEST_CHECK(r30.rank_30d_amount == std::optional<std::string>("$10.5k"));
    TEST_CHECK(!r30.rank_1d_place);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// X3. Scores
// -----------------------------------------------------------------------------
void test_scores() {
    std::cout << "[TEST] Group X3: scores\n";

    const UserRecord s = extract(Tag::SmartScoreSummary, elements::markdown(std::string(page::SMART_SCORE)));
    TEST_CHECK(near(s.smart_score, 72.5));
    TEST_CHECK(near(s.total_pnl, 45210.5));

    TEST_CHECK(near(extract_sharpe_ratio(page::SHARPE), 1.85));
    TEST_CHECK(near(extract_traded_volume(page::VOLUME_BODY), 98765.0));

    // Volume lives in the metric body, not in markdown
    const UserRecord v = extract(Tag::TradedVolume30d,
                                 elements::metric(std::string(page::VOLUME_LABEL), std::string(page::VOLUME_BODY)));
    TEST_CHECK(near(v.traded_usd_volume_last_30d_sum, 98765.0));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// X4. Bets
// -----------------------------------------------------------------------------
void test_bets() {
    std::cout << "[TEST] Group X4: bets summaries\n";

    const AmountPnl active = extract_bets_summary(page::ACTIVE_BETS);
    TEST_CHECK(near(active.amount, 5400.0));
    TEST_CHECK(near(active.pnl, 320.10));

    const UserRecord finished = extract(Tag::FinishedBetsSummary, elements::markdown(std::string(page::FINISHED_BETS)));
    TEST_CHECK(near(finished.finished_bets_amount, 12000.0));
    TEST_CHECK(near(finished.finished_bets_pnl, 1500.25));
    TEST_CHECK(!finished.active_bets_amount);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// X5. Trade ROI
// -----------------------------------------------------------------------------
void test_trade_roi() {
    std::cout << "[TEST] Group X5: trade ROI and signs\n";

    const TradeRoi best = extract_trade_roi(page::BEST_TRADE);
    TEST_CHECK(near(best.proc, 245.5));
    TEST_CHECK(near(best.amount, 1230.0));

    const TradeRoi worst = extract_trade_roi(page::WORST_TRADE);
    TEST_CHECK(near(worst.proc, -87.2));
    TEST_CHECK(near(worst.amount, -640.0));

    // ASCII minus too
    const TradeRoi ascii = extract_trade_roi("Worst trade (ROI): <span>-12.5%</span> (-$30.00)");
    TEST_CHECK(near(ascii.proc, -12.5));
    TEST_CHECK(near(ascii.amount, -30.0));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// X6. Charts
// -----------------------------------------------------------------------------
void test_charts() {
    std::cout << "[TEST] Group X6: price buckets and radar charts\n";

    const auto buckets = extract_price_buckets(page::PRICE_BUCKETS_SPEC);
    TEST_CHECK(buckets.has_value());
    TEST_CHECK(buckets->size() == 3);
    TEST_CHECK((*buckets)[0].first == "0-10c");
    TEST_CHECK(std::fabs((*buckets)[0].second - 12.35) < 1e-9);
    TEST_CHECK(std::fabs((*buckets)[1].second - 40.0) < 1e-9);
    TEST_CHECK(std::fabs((*buckets)[2].second - 7.89) < 1e-9);

    const auto radar = extract_radar(page::MOST_TRADED_SPEC);
    TEST_CHECK(radar.has_value());
    TEST_CHECK(radar->size() == 3);
    TEST_CHECK((*radar)[0] == (std::pair<std::string, double>{"Politics", 40.0}));
    TEST_CHECK((*radar)[2] == (std::pair<std::string, double>{"Crypto", 12.0}));

    // Open outline is kept as is
    const auto open = extract_radar(R"({"data":[{"theta":["A","B"],"r":[1,2]}]})");
    TEST_CHECK(open && open->size() == 2);

    const UserRecord wr = extract(Tag::WinRateByCategory, elements::chart(std::string(page::WIN_RATE_SPEC)));
    TEST_CHECK(wr.category_metrics.size() == 1);
    TEST_CHECK(wr.category_metrics.count("win_rate_categories") == 1);
    TEST_CHECK(wr.category_metrics.at("win_rate_categories").size() == 2);

    const UserRecord pb = extract(Tag::PriceBuckets, elements::chart(std::string(page::PRICE_BUCKETS_SPEC)));
    TEST_CHECK(pb.where_trader_bets_most.has_value());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// X7. Unreadable content
// -----------------------------------------------------------------------------
void test_unreadable() {
    std::cout << "[TEST] Group X7: unreadable content yields absent fields\n";

    TEST_CHECK(!extract_trader_type("no badge here"));
    TEST_CHECK(!extract_trader_type(":badge[:material/x: (only parenthesized)]"));
    TEST_CHECK(!extract_total_positions("<div>Total Positions</div><div>n/a</div>"));
    TEST_CHECK(!extract_current_balance("<div>Current Balance</div>"));
    TEST_CHECK(!extract_profile_url("<a href=\"https://example.com\">x</a>"));
    TEST_CHECK(!extract_sharpe_ratio("Sharpe Ratio: <span>n/a</span>"));

    const RankValue r = extract_rank("<div>Rank: -</div>");
    TEST_CHECK(!r.place && !r.amount);

    TEST_CHECK(!extract_price_buckets("not json"));
    TEST_CHECK(!extract_radar(R"({"layout":{}})"));

    TEST_CHECK(!parse_amount(""));
    TEST_CHECK(!parse_amount("12abc"));
    TEST_CHECK(near(parse_amount("1,234.50"), 1234.5));

    // Tags without fields of their own
    TEST_CHECK(extract(Tag::ActiveBetsTable, elements::dataframe()).empty());
    TEST_CHECK(extract(Tag::HistoricalPnlChart, elements::chart(std::string(page::HISTORICAL_PNL_SPEC))).empty());
    TEST_CHECK(extract(Tag::Unknown, elements::markdown(std::string(page::SMART_SCORE))).empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// X8. Routing
// -----------------------------------------------------------------------------
void test_routing() {
    std::cout << "[TEST] Group X8: extract() routes by tag\n";

    const UserRecord label = extract(Tag::TypeLabel, elements::markdown(std::string(page::TYPE_LABEL)));
    TEST_CHECK(label.trader_types == (std::vector<std::string>{"Contrarian"}));
    TEST_CHECK(label.present() == 1);

    const UserRecord desc = extract(Tag::TypeLabelDescription, elements::markdown(std::string(page::TYPE_DESCRIPTION)));
    TEST_CHECK(desc.trader_type_description ==
               std::optional<std::string>("Takes positions opposite to the market consensus and profits when the crowd is wrong."));

    // Same content, different tag, different field
    const UserRecord r1 = extract(Tag::Rank1d, elements::markdown(std::string(page::RANK_1D)));
    const UserRecord r7 = extract(Tag::Rank7d, elements::markdown(std::string(page::RANK_1D)));
    TEST_CHECK(r1.rank_1d_place && !r1.rank_7d_place);
    TEST_CHECK(r7.rank_7d_place && !r7.rank_1d_place);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// X9. Large bodies
// -----------------------------------------------------------------------------
void test_large_bodies() {
    std::cout << "[TEST] Group X9: multi-megabyte bodies\n";

    const std::string filler(4 * 1024 * 1024, 'x');

    const std::string bets = "<div>Active Bets</div><div>PnL:" + filler + "<span> $12.50</span></div>";
    TEST_CHECK(near(extract_bets_summary(bets).pnl, 12.5));
    const UserRecord routed = extract(Tag::ActiveBetsSummary, elements::markdown(bets));
    TEST_CHECK(near(routed.active_bets_pnl, 12.5));
    TEST_CHECK(!routed.active_bets_amount);

    const std::string label = ":orange-badge[:material/bolt: " + filler + " (note)]";
    const auto type = extract_trader_type(label);
    TEST_CHECK(type.has_value());
    TEST_CHECK(type->size() == filler.size());

    const std::string balance = "<div>Current Balance</div>" + filler + "<span>1,024.00</span>";
    TEST_CHECK(near(extract_current_balance(balance), 1024.0));

    const std::string roi = "Best trade (ROI): " + filler + "<span>+3.5%</span> <span>(+$7.00)</span>";
    const TradeRoi r = extract_trade_roi(roi);
    TEST_CHECK(near(r.proc, 3.5));
    TEST_CHECK(near(r.amount, 7.0));

    // No value anywhere: every routine gives up without a match
    TEST_CHECK(!extract_bets_summary("PnL:" + filler).pnl);
    TEST_CHECK(!extract_trader_type(":" + filler));
    TEST_CHECK(!extract_total_positions(std::string(filler.size(), '>')));

    // Same line only
    TEST_CHECK(!extract_bets_summary("<div>PnL:\n<span>$5.00</span></div>").pnl);
    TEST_CHECK(near(extract_bets_summary("PnL:\n<div>PnL: <span>$5.00</span></div>").pnl, 5.0));
    TEST_CHECK(!extract_trader_type(":badge\n[Whale]"));
    TEST_CHECK(extract_trader_type("intro\n:blue-badge[Whale]") == std::optional<std::string>("Whale"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_profile_fields();
    test_ranks();
    test_scores();
    test_bets();
    test_trade_roi();
    test_charts();
    test_unreadable();
    test_routing();
    test_large_bodies();

    std::cout << "\n[EXTRACT TESTS PASSED]\n";
    return 0;
}
