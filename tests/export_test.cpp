// export_test.cpp: CSV reports and console summaries

#include <gtest/gtest.h>

#include "bondspread/Export.hpp"
#include "test_helpers.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

using namespace bondspread;
namespace pt = boost::posix_time;

namespace {

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

TradingSignal sell_signal() {
    TradingSignal s;
    s.pair_name = "SU26221RMFS0_SU26225RMFS1";
    s.bond_long = "SU26221RMFS0";
    s.bond_short = "SU26225RMFS1";
    s.signal_type = SignalType::Sell;
    s.direction = SignalDirection::ShortLong;
    s.confidence = 0.5512;
    s.spread_bp = 150.0;
    s.spread_mean = 100.0;
    s.zscore = 1.25;
    s.percentile_rank = 95.0;
    s.expected_return_bp = 50.0;
    s.timestamp = pt::time_from_string("2025-03-03 10:00:00.750");
    s.expires_at = s.timestamp + pt::hours(4);
    return s;
}

}  // namespace

TEST(ExportTest, Formatting) {
    EXPECT_EQ(fmt_fixed(1.23456, 2), "1.23");
    EXPECT_EQ(fmt_fixed(NAN, 2), "");
    EXPECT_EQ(iso_timestamp(pt::time_from_string("2025-03-03 10:00:00.750")), "2025-03-03T10:00:00");
    EXPECT_EQ(iso_timestamp(pt::ptime()), "");
}

TEST(ExportTest, SignalsCsv) {
    auto never = sell_signal();
    never.expires_at.reset();

    std::ostringstream out;
    write_signals_csv(out, {sell_signal(), never});
    const auto lines = lines_of(out.str());

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].substr(0, 40), "pair_name,bond_long,bond_short,signal_ty");
    EXPECT_EQ(lines[1],
              "SU26221RMFS0_SU26225RMFS1,SU26221RMFS0,SU26225RMFS1,SELL,SHORT_LONG,0.551,"
              "150.00,100.00,1.25,95.0,50.00,2025-03-03T10:00:00,2025-03-03T14:00:00");
    EXPECT_EQ(lines[2].back(), ',');
}

TEST(ExportTest, BacktestCsvs) {
    const auto table = test_helpers::make_spread_table({
        100, 130, 70, 150, 50, 160, 40, 120, 80, 110,
        90, 100, 130, 70, 140, 60, 125, 75, 105, 95,
        45, 80,
    });
    BacktestConfig cfg;
    cfg.min_history_days = 20;
    std::map<std::string, BacktestResult> results;
    results["A_B"] = run_backtest(table, "A_B", cfg);
    ASSERT_EQ(results["A_B"].positions.size(), 1u);

    std::ostringstream summary, positions, equity;
    write_backtest_summary_csv(summary, results);
    write_positions_csv(positions, results);
    write_equity_curve_csv(equity, results);

    const auto s = lines_of(summary.str());
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[1].substr(0, 26), "A_B,1,1,0,100.00,34.50,612");

    const auto p = lines_of(positions.str());
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[1],
              "A_B,LONG_SHORT,2024-01-21 00:00:00,45.00,2024-01-22 00:00:00,80.00,"
              "34.50,612.50,1,TAKEN,TAKE_PROFIT");

    const auto e = lines_of(equity.str());
    ASSERT_EQ(e.size(), 2u);
    EXPECT_EQ(e[0], "pair_name,time,capital");
    EXPECT_EQ(e[1], "A_B,2024-01-22 00:00:00,1000612.50");
}

TEST(ExportTest, SignalSummaryLine) {
    EXPECT_EQ(format_signal_summary(sell_signal()),
              "SELL SU26221RMFS0_SU26225RMFS1 SHORT_LONG | spread 150.0 bp (mean 100.0, z 1.25, P 95.0%)"
              " | exp 50.0 bp | conf 55%");

    TradingSignal none;
    none.pair_name = "A_B";
    EXPECT_EQ(format_signal_summary(none), "NO_DATA A_B | insufficient history");
}
