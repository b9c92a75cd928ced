#include "bondspread/Backtest.hpp"
#include "bondspread/SpreadStatistics.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

#include <boost/math/statistics/univariate_statistics.hpp>

namespace bondspread {

namespace bg = boost::gregorian;

std::string to_string(PositionState s){
    switch (s){
        case PositionState::Open:    return "OPEN";
        case PositionState::Closed:  return "CLOSED";
        case PositionState::Stopped: return "STOPPED";
        case PositionState::Taken:   return "TAKEN";
    }
    return "OPEN";
}

static SpreadTable complete_rows(const SpreadTable& history){
    SpreadTable out;
    out.reserve(history.size());
    for (const auto& r : history){
        if (std::isnan(r.spread_bp) || std::isnan(r.ytm_long) || std::isnan(r.ytm_short)) continue;
        out.push_back(r);
    }
    return out;
}

static std::optional<std::string> day_after(const std::optional<bg::date>& d){
    if (!d) return std::nullopt;
    return format_date(*d + bg::days(1));
}

// LONG_SHORT at the low band, SHORT_LONG at the high band
static std::optional<SignalDirection> entry_direction(double spread, double p_low, double p_high){
    if (spread <= p_low)  return SignalDirection::LongShort;
    if (spread >= p_high) return SignalDirection::ShortLong;
    return std::nullopt;
}

BacktestResult run_backtest(
    const SpreadTable& history,
    const std::string& pair_name,
    const BacktestConfig& cfg,
    const std::optional<bg::date>& start_date,
    const std::optional<bg::date>& end_date
){
    BacktestResult R;

    SpreadTable rows = complete_rows(history);
    if (rows.empty() || rows.size() < cfg.min_history_days) return R;

    std::optional<std::string> from;
    if (start_date) from = format_date(*start_date);
    rows = filter_by_date(rows, from, day_after(end_date));

    const std::vector<double> spread = spreads_of(rows);
    const auto p_low  = stats::rolling_percentile(spread, cfg.percentile_window, cfg.percentile_min_periods, cfg.entry_percentile_low);
    const auto p_exit = stats::rolling_percentile(spread, cfg.percentile_window, cfg.percentile_min_periods, cfg.exit_percentile);
    const auto p_high = stats::rolling_percentile(spread, cfg.percentile_window, cfg.percentile_min_periods, cfg.entry_percentile_high);

    double capital = cfg.initial_capital;
    std::optional<Position> open;

    auto close_position = [&](Position& pos, const SpreadRow& r, PositionState state, const char* reason, double pnl_bp){
        pos.state          = state;
        pos.exit_reason    = reason;
        pos.exit_date      = r.Time;
        pos.exit_spread    = r.spread_bp;
        pos.exit_ytm_long  = r.ytm_long;
        pos.exit_ytm_short = r.ytm_short;
        pos.pnl_bp  = pnl_bp - cfg.spread_cost_bp;

        const double commission = pos.size * cfg.commission_rate * 2.0;   // entry + exit
        pos.pnl_rub = pos.pnl_bp * pos.size / 10000.0 - commission;
    };

    for (size_t i = 0; i < rows.size(); ++i){
        if (std::isnan(p_low[i]) || std::isnan(p_high[i])) continue;
        const SpreadRow& r = rows[i];

        if (open){
            Position& pos = *open;
            const double change = r.spread_bp - pos.entry_spread;
            const double pnl_bp = (pos.direction == SignalDirection::LongShort) ? change : -change;
            pos.holding_days = days_between(pos.entry_date, r.Time);

            const bool reverted = (pos.direction == SignalDirection::LongShort)
                                ? (r.spread_bp >= p_exit[i])
                                : (r.spread_bp <= p_exit[i]);

            if (pnl_bp <= -cfg.stop_loss_bp)
                close_position(pos, r, PositionState::Stopped, "STOP_LOSS", pnl_bp);
            else if (pnl_bp >= cfg.take_profit_bp)
                close_position(pos, r, PositionState::Taken, "TAKE_PROFIT", pnl_bp);
            else if (reverted)
                close_position(pos, r, PositionState::Closed, "MEAN_REVERSION", pnl_bp);
            else if (pos.holding_days >= cfg.max_holding_days)
                close_position(pos, r, PositionState::Closed, "MAX_HOLDING", pnl_bp);

            if (pos.state != PositionState::Open){
                capital += pos.pnl_rub;
                R.equity_curve.push_back(capital);
                R.equity_time.push_back(r.Time);
                R.positions.push_back(std::move(pos));
                open.reset();
            }
        }

        if (!open){
            const auto dir = entry_direction(r.spread_bp, p_low[i], p_high[i]);
            if (dir){
                Position pos;
                pos.pair_name       = pair_name;
                pos.direction       = *dir;
                pos.entry_date      = r.Time;
                pos.entry_spread    = r.spread_bp;
                pos.entry_ytm_long  = r.ytm_long;
                pos.entry_ytm_short = r.ytm_short;
                pos.size            = capital * cfg.position_size_pct;
                pos.stop_loss_bp    = cfg.stop_loss_bp;
                pos.take_profit_bp  = cfg.take_profit_bp;
                open = std::move(pos);
            }
        }
    }

    R.metrics = compute_metrics(R.positions, R.equity_curve, cfg.initial_capital);
    return R;
}

BacktestMetrics compute_metrics(const std::vector<Position>& positions,
                                const std::vector<double>& equity_curve,
                                double initial_capital){
    BacktestMetrics M;
    if (positions.empty()) return M;

    M.total_trades = positions.size();

    double gross_profit = 0.0, gross_loss = 0.0, holding = 0.0;
    std::vector<double> pnl;
    pnl.reserve(positions.size());
    for (const auto& p : positions){
        M.total_pnl_bp  += p.pnl_bp;
        M.total_pnl_rub += p.pnl_rub;
        holding += static_cast<double>(p.holding_days);
        pnl.push_back(p.pnl_bp);
        if (p.pnl_bp > 0.0){ ++M.winning_trades; gross_profit += p.pnl_bp; }
        else               { ++M.losing_trades;  gross_loss   += p.pnl_bp; }
    }
    gross_loss = std::fabs(gross_loss);

    const double n = static_cast<double>(M.total_trades);
    M.win_rate         = M.winning_trades / n * 100.0;
    M.avg_pnl_bp       = M.total_pnl_bp / n;
    M.avg_holding_days = holding / n;
    if (M.winning_trades) M.avg_winning_bp = gross_profit / M.winning_trades;
    if (M.losing_trades)  M.avg_losing_bp  = -gross_loss / M.losing_trades;
    M.profit_factor     = (gross_loss > 0.0) ? gross_profit / gross_loss : 0.0;
    M.total_pnl_percent = (initial_capital > 0.0) ? M.total_pnl_rub / initial_capital * 100.0 : 0.0;

    // trade-indexed cumulative pnl, peak starts at zero
    double cum = 0.0, peak = 0.0;
    for (double v : pnl){
        cum += v;
        peak = std::max(peak, cum);
        M.max_drawdown_bp = std::max(M.max_drawdown_bp, peak - cum);
    }

    double eq_peak = initial_capital;
    for (double e : equity_curve){
        eq_peak = std::max(eq_peak, e);
        M.max_drawdown_rub = std::max(M.max_drawdown_rub, eq_peak - e);
    }

    if (pnl.size() > 1){
        const double m   = boost::math::statistics::mean(pnl);
        const double var = boost::math::statistics::sample_variance(pnl);
        const double s   = std::sqrt(std::max(0.0, var));
        M.sharpe_ratio = (s > 0.0) ? m / s : 0.0;
    }
    return M;
}

std::map<std::string, BacktestResult> run_multi_pair_backtest(
    const std::map<std::string, SpreadTable>& history,
    const std::vector<BondPair>& pairs,
    const BacktestConfig& cfg,
    const std::optional<bg::date>& start_date,
    const std::optional<bg::date>& end_date
){
    std::map<std::string, BacktestResult> out;
    for (const auto& pair : pairs){
        const std::string key = pair_key(pair);
        auto it = history.find(key);
        if (it == history.end() || it->second.empty()) continue;
        out.emplace(key, run_backtest(it->second, key, cfg, start_date, end_date));
    }
    return out;
}

StrategyMetrics strategy_metrics(const std::map<std::string, BacktestResult>& results,
                                 const std::vector<BondPair>& order){
    StrategyMetrics S;
    if (results.empty()) return S;

    std::vector<const std::pair<const std::string, BacktestResult>*> walk;
    walk.reserve(results.size());
    if (order.empty()){
        for (const auto& kv : results) walk.push_back(&kv);
    } else {
        for (const auto& pair : order){
            auto it = results.find(pair_key(pair));
            if (it != results.end()) walk.push_back(&*it);
        }
    }

    S.total_pairs = walk.size();
    for (const auto* kv : walk){
        const std::string& key = kv->first;
        const auto& m = kv->second.metrics;
        S.total_trades  += m.total_trades;
        S.total_winning += m.winning_trades;
        S.total_pnl_bp  += m.total_pnl_bp;
        S.total_pnl_rub += m.total_pnl_rub;
        if (m.total_pnl_bp > 0.0) ++S.profitable_pairs;

        if (!S.best_pair || m.total_pnl_bp > S.best_pair->second)
            S.best_pair = std::make_pair(key, m.total_pnl_bp);
        if (!S.worst_pair || m.total_pnl_bp <= S.worst_pair->second)
            S.worst_pair = std::make_pair(key, m.total_pnl_bp);
    }
    if (!S.total_pairs) return S;
    S.win_rate = S.total_trades ? static_cast<double>(S.total_winning) / S.total_trades * 100.0 : 0.0;
    S.avg_pnl_per_pair = S.total_pnl_bp / static_cast<double>(S.total_pairs);
    return S;
}

} // namespace bondspread
