#include "bondspread/Export.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace bondspread {

std::string iso_timestamp(const boost::posix_time::ptime& t){
    if (t.is_special()) return "";
    // whole seconds only
    const boost::posix_time::ptime s(t.date(), boost::posix_time::seconds(t.time_of_day().total_seconds()));
    return boost::posix_time::to_iso_extended_string(s);
}

std::string fmt_fixed(double x, int decimals){
    std::ostringstream oss;
    if (std::isfinite(x)) { oss << std::fixed << std::setprecision(decimals) << x; }
    return oss.str();
}

void write_signals_csv(std::ostream& out, const std::vector<TradingSignal>& signals){
    out << "pair_name,bond_long,bond_short,signal_type,direction,confidence,spread_bp,spread_mean,"
           "spread_zscore,percentile_rank,expected_return_bp,timestamp,expires_at\n";
    for (const auto& s : signals){
        out << s.pair_name << ","
            << s.bond_long << ","
            << s.bond_short << ","
            << to_string(s.signal_type) << ","
            << to_string(s.direction) << ","
            << fmt_fixed(s.confidence, 3) << ","
            << fmt_fixed(s.spread_bp, 2) << ","
            << fmt_fixed(s.spread_mean, 2) << ","
            << fmt_fixed(s.zscore, 2) << ","
            << fmt_fixed(s.percentile_rank, 1) << ","
            << fmt_fixed(s.expected_return_bp, 2) << ","
            << iso_timestamp(s.timestamp) << ","
            << (s.expires_at ? iso_timestamp(*s.expires_at) : std::string()) << "\n";
    }
}

void write_backtest_summary_csv(std::ostream& out,
                                const std::map<std::string, BacktestResult>& results){
    out << "pair_name,total_trades,winning_trades,losing_trades,win_rate,total_pnl_bp,total_pnl_rub,"
           "total_pnl_percent,avg_pnl_bp,avg_winning_bp,avg_losing_bp,avg_holding_days,"
           "max_drawdown_bp,max_drawdown_rub,sharpe_ratio,profit_factor\n";
    for (const auto& [pair, r] : results){
        const auto& m = r.metrics;
        out << pair << ","
            << m.total_trades << ","
            << m.winning_trades << ","
            << m.losing_trades << ","
            << fmt_fixed(m.win_rate, 2) << ","
            << fmt_fixed(m.total_pnl_bp, 2) << ","
            << fmt_fixed(m.total_pnl_rub, 2) << ","
            << fmt_fixed(m.total_pnl_percent, 2) << ","
            << fmt_fixed(m.avg_pnl_bp, 2) << ","
            << fmt_fixed(m.avg_winning_bp, 2) << ","
            << fmt_fixed(m.avg_losing_bp, 2) << ","
            << fmt_fixed(m.avg_holding_days, 1) << ","
            << fmt_fixed(m.max_drawdown_bp, 2) << ","
            << fmt_fixed(m.max_drawdown_rub, 2) << ","
            << fmt_fixed(m.sharpe_ratio, 3) << ","
            << fmt_fixed(m.profit_factor, 3) << "\n";
    }
}

void write_positions_csv(std::ostream& out,
                         const std::map<std::string, BacktestResult>& results){
    out << "pair_name,direction,entry_date,entry_spread,exit_date,exit_spread,"
           "pnl_bp,pnl_rub,holding_days,state,exit_reason\n";
    for (const auto& kv : results){
        for (const auto& p : kv.second.positions){
            out << p.pair_name << ","
                << to_string(p.direction) << ","
                << p.entry_date << ","
                << fmt_fixed(p.entry_spread, 2) << ","
                << p.exit_date.value_or("") << ","
                << (p.exit_spread ? fmt_fixed(*p.exit_spread, 2) : std::string()) << ","
                << fmt_fixed(p.pnl_bp, 2) << ","
                << fmt_fixed(p.pnl_rub, 2) << ","
                << p.holding_days << ","
                << to_string(p.state) << ","
                << p.exit_reason << "\n";
        }
    }
}

void write_equity_curve_csv(std::ostream& out,
                            const std::map<std::string, BacktestResult>& results){
    out << "pair_name,time,capital\n";
    for (const auto& [pair, r] : results){
        for (size_t i = 0; i < r.equity_curve.size(); ++i){
            out << pair << ","
                << (i < r.equity_time.size() ? r.equity_time[i] : std::string()) << ","
                << fmt_fixed(r.equity_curve[i], 2) << "\n";
        }
    }
}

std::string format_signal_summary(const TradingSignal& s){
    std::ostringstream oss;
    oss << to_string(s.signal_type) << " " << s.pair_name;
    if (s.signal_type == SignalType::NoData){
        oss << " | insufficient history";
        return oss.str();
    }
    oss << " " << to_string(s.direction)
        << " | spread " << fmt_fixed(s.spread_bp, 1) << " bp"
        << " (mean " << fmt_fixed(s.spread_mean, 1)
        << ", z " << fmt_fixed(s.zscore, 2)
        << ", P " << fmt_fixed(s.percentile_rank, 1) << "%)"
        << " | exp " << fmt_fixed(s.expected_return_bp, 1) << " bp"
        << " | conf " << fmt_fixed(s.confidence * 100.0, 0) << "%";
    return oss.str();
}

} // namespace bondspread
