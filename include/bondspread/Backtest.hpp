#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include "bondspread/Bond.hpp"
#include "bondspread/DataOrdering.hpp"
#include "bondspread/Signals.hpp"

namespace bondspread {

enum class PositionState { Open, Closed, Stopped, Taken };

std::string to_string(PositionState s);

struct Position {
    std::string pair_name;
    SignalDirection direction = SignalDirection::Flat;

    // timestamps as they appear in the spread table
    std::string entry_date;
    double entry_spread    = 0.0;
    double entry_ytm_long  = 0.0;
    double entry_ytm_short = 0.0;

    // capital committed (currency units)
    double size = 0.0;

    PositionState state = PositionState::Open;
    std::optional<std::string> exit_date;
    std::optional<double> exit_spread;
    std::optional<double> exit_ytm_long;
    std::optional<double> exit_ytm_short;

    // net of spread cost (bp) / of cost and commission (currency)
    double pnl_bp  = 0.0;
    double pnl_rub = 0.0;
    long holding_days = 0;

    double stop_loss_bp   = 0.0;
    double take_profit_bp = 0.0;
    std::string exit_reason;   // STOP_LOSS, TAKE_PROFIT, MEAN_REVERSION, MAX_HOLDING
};

struct BacktestConfig {
    double initial_capital   = 1'000'000.0;
    double position_size_pct = 0.25;     // share of current capital per position
    double commission_rate   = 0.0005;   // per side
    double spread_cost_bp    = 0.5;      // per round trip

    long   max_holding_days = 10;        // calendar days
    double stop_loss_bp     = 20.0;
    double take_profit_bp   = 30.0;

    // rolling percentile levels
    double entry_percentile_low  = 10.0;
    double entry_percentile_high = 90.0;
    double exit_percentile       = 50.0;

    size_t min_history_days   = 100;     // rows required before anything is simulated
    size_t percentile_window  = 252;
    size_t percentile_min_periods = 20;
};

struct BacktestMetrics {
    size_t total_trades   = 0;
    size_t winning_trades = 0;
    size_t losing_trades  = 0;    // pnl_bp <= 0

    double total_pnl_bp      = 0.0;
    double total_pnl_rub     = 0.0;
    double total_pnl_percent = 0.0;   // of initial capital

    double avg_pnl_bp       = 0.0;
    double avg_winning_bp   = 0.0;
    double avg_losing_bp    = 0.0;
    double avg_holding_days = 0.0;

    double max_drawdown_bp  = 0.0;    // on the trade-indexed cumulative pnl_bp
    double max_drawdown_rub = 0.0;    // on the equity curve
    double sharpe_ratio     = 0.0;    // per trade, pnl_bp
    double win_rate         = 0.0;    // %
    double profit_factor    = 0.0;    // 0 without losses
};

struct BacktestResult {
    BacktestMetrics metrics;
    std::vector<Position> positions;    // closed, in exit order
    // capital after each closed trade
    std::vector<double> equity_curve;
    // exit timestamps matching equity_curve
    std::vector<std::string> equity_time;
};

/**
 * Replay one pair's spread history through the entry/exit rules.
 * - rows with a missing spread or yield are dropped; fewer than
 *   min_history_days rows left gives an empty result
 * - optional [start_date, end_date] restriction, both bounds inclusive
 * - entry while flat: LONG_SHORT at spread <= P(low), SHORT_LONG at >= P(high)
 * - exit, first match: stop loss, take profit, crossing P(exit), max holding
 * - a new position may open on the step that closed the previous one
 */
BacktestResult run_backtest(
    const SpreadTable& history,
    const std::string& pair_name,
    const BacktestConfig& cfg,
    const std::optional<boost::gregorian::date>& start_date = std::nullopt,
    const std::optional<boost::gregorian::date>& end_date = std::nullopt
);

// Results keyed by pair key; pairs without history are skipped.
std::map<std::string, BacktestResult> run_multi_pair_backtest(
    const std::map<std::string, SpreadTable>& history,
    const std::vector<BondPair>& pairs,
    const BacktestConfig& cfg,
    const std::optional<boost::gregorian::date>& start_date = std::nullopt,
    const std::optional<boost::gregorian::date>& end_date = std::nullopt
);

// Aggregates from closed positions; drawdowns, profit factor, Sharpe.
BacktestMetrics compute_metrics(const std::vector<Position>& positions,
                                const std::vector<double>& equity_curve,
                                double initial_capital);

struct StrategyMetrics {
    size_t total_pairs   = 0;
    size_t total_trades  = 0;
    size_t total_winning = 0;
    double win_rate      = 0.0;
    double total_pnl_bp  = 0.0;
    double total_pnl_rub = 0.0;
    double avg_pnl_per_pair = 0.0;
    // (pair key, total pnl_bp); empty when there are no results
    std::optional<std::pair<std::string, double>> best_pair;
    std::optional<std::pair<std::string, double>> worst_pair;
    size_t profitable_pairs = 0;
};

// Ties on total pnl_bp: best is the first maximum, worst the last minimum,
// walking `order` (pair-list order) when given, key order otherwise.
// Pairs in `order` without a result are skipped.
StrategyMetrics strategy_metrics(const std::map<std::string, BacktestResult>& results,
                                 const std::vector<BondPair>& order = {});

} // namespace bondspread
