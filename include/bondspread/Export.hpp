#pragma once
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include "bondspread/Backtest.hpp"
#include "bondspread/Signals.hpp"

namespace bondspread {

    // "YYYY-MM-DDTHH:MM:SS"; empty for not_a_date_time
    std::string iso_timestamp(const boost::posix_time::ptime& t);

    // Fixed-point with `decimals` digits; empty for NaN/inf.
    std::string fmt_fixed(double x, int decimals);

    // One row per signal; confidence 3 dp, other figures 2 dp,
    // empty expires_at when the signal never expires.
    void write_signals_csv(std::ostream& out, const std::vector<TradingSignal>& signals);

    // One row of aggregate metrics per pair.
    void write_backtest_summary_csv(std::ostream& out,
                                    const std::map<std::string, BacktestResult>& results);

    // One row per closed position, all pairs.
    void write_positions_csv(std::ostream& out,
                             const std::map<std::string, BacktestResult>& results);

    // pair, time, capital: one row per closed trade.
    void write_equity_curve_csv(std::ostream& out,
                                const std::map<std::string, BacktestResult>& results);

    // e.g. "SELL SU26221RMFS0_SU26225RMFS1 SHORT_LONG | spread 150.0 bp (mean 100.0, z 1.25, P 95.0%) | exp 50.0 bp | conf 55%"
    std::string format_signal_summary(const TradingSignal& s);

}
