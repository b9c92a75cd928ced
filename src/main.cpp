#include <iostream>
#include <fstream>
#include <functional>
#include <map>
#include <vector>
#include <optional>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/program_options.hpp>

#include "bondspread/Backtest.hpp"
#include "bondspread/Config.hpp"
#include "bondspread/Export.hpp"
#include "bondspread/Loaders.hpp"
#include "bondspread/Signals.hpp"
#include "bondspread/SpreadStatistics.hpp"
#include "bondspread/YieldSolver.hpp"

namespace po = boost::program_options;

namespace {

void save_table(const std::string& path, const std::function<void(std::ostream&)>& write){
    std::ofstream fout(path);
    if (!fout.is_open()) {
        std::cerr << "[Warn] cannot open " << path << " for writing.\n";
        return;
    }
    write(fout);
    std::cout << "[Info] Saved: " << path << "\n";
}

std::string out_path(const bondspread::AppConfig& cfg, const std::string& file){
    if (cfg.output_dir.empty()) return file;
    return cfg.output_dir + "/" + file;
}

} // namespace

int main(int argc, char** argv) {
    using namespace bondspread;

    try {
        // ====== 0) OPTIONS ======
        po::options_description desc("bondspread options");
        desc.add_options()
            ("help,h", "show this help")
            ("config,c",     po::value<std::string>(), "INI configuration file")
            ("data-dir,d",   po::value<std::string>(), "directory with <ISIN>.csv series")
            ("output-dir,o", po::value<std::string>(), "directory for the CSV reports")
            ("mode,m",       po::value<std::string>()->default_value("all"), "signals | backtest | all")
            ("input,i",      po::value<std::string>(), "ytm | price (content of the series files)")
            ("lookback,l",   po::value<size_t>(), "percentile window, observations");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << "\n";
            return 0;
        }

        const std::string mode = vm["mode"].as<std::string>();
        if (mode != "signals" && mode != "backtest" && mode != "all")
            throw std::runtime_error("Unknown mode: '" + mode + "' (expected signals, backtest or all)");
        const bool do_signals = (mode != "backtest");
        const bool do_backtest = (mode != "signals");

        AppConfig cfg = vm.count("config") ? load_app_config(vm["config"].as<std::string>())
                                           : default_app_config();
        if (vm.count("data-dir"))   cfg.data_dir   = vm["data-dir"].as<std::string>();
        if (vm.count("output-dir")) cfg.output_dir = vm["output-dir"].as<std::string>();
        if (vm.count("input"))      cfg.input      = parse_input_mode(vm["input"].as<std::string>());
        if (vm.count("lookback")) {
            cfg.signals.lookback_days     = vm["lookback"].as<size_t>();
            cfg.backtest.percentile_window = cfg.signals.lookback_days;
        }
        validate(cfg);

        std::cout << "=== Bond Spread Pipeline ===\n";
        std::cout << "[Info] bonds: " << cfg.bonds.size()
                  << " | pairs: " << cfg.pairs.size()
                  << " | input: " << to_string(cfg.input)
                  << " | data: " << cfg.data_dir << "\n";

        // ====== 1) LOAD ======
        std::map<std::string, TimeSeries> ytm_by_isin;
        for (const auto& [bond_long, bond_short] : cfg.pairs) {
            for (const std::string& isin : {bond_long, bond_short}) {
                if (ytm_by_isin.count(isin)) continue;

                const BondParams* bond = find_bond(cfg.bonds, isin);
                if (!bond) {
                    std::cerr << "[Warn] " << isin << ": no bond parameters, skipped.\n";
                    continue;
                }

                const std::string path = bond_series_path(cfg.data_dir, isin);
                TimeSeries series;
                try {
                    series = load_series_csv(path, "*", cfg.input == InputMode::Ytm ? "ytm" : "close");
                } catch (const std::runtime_error& ex) {
                    std::cerr << "[Warn] " << ex.what() << "\n";
                    continue;
                }

                if (cfg.input == InputMode::Price) {
                    auto conv = yields_from_prices(series, *bond, cfg.solver);
                    if (conv.failed > 0)
                        std::cerr << "[Warn] " << isin << ": YTM not solvable for "
                                  << conv.failed << " of " << series.size() << " prices.\n";
                    series = std::move(conv.yields);
                }

                std::cout << "[Info] " << isin << " (" << bond->name << "): "
                          << series.size() << " observations\n";
                ytm_by_isin.emplace(isin, std::move(series));
            }
        }

        // ====== 2) SPREADS ======
        const auto history = stats::build_spread_history(ytm_by_isin, cfg.pairs);
        for (const auto& pair : cfg.pairs) {
            const std::string key = pair_key(pair);
            auto it = history.find(key);
            if (it == history.end()) {
                std::cerr << "[Warn] " << key << ": missing yield history, pair skipped.\n";
                continue;
            }
            std::cout << "[Info] " << key << ": " << it->second.rows.size() << " aligned rows\n";
        }

        // ====== 3) SIGNALS ======
        if (do_signals) {
            const auto now = boost::posix_time::second_clock::local_time();
            SignalGenerator generator(cfg.signals);

            const auto signals = generator.generate_all_signals(history, cfg.pairs, now);
            std::cout << "\n=== Signals ===\n";
            for (const auto& s : signals) std::cout << format_signal_summary(s) << "\n";

            const auto actionable = active_signals(generator.filter_signals(signals), now);
            std::cout << "[Info] actionable signals: " << actionable.size()
                      << " of " << signals.size() << "\n";

            save_table(out_path(cfg, "signals.csv"),
                       [&](std::ostream& os){ write_signals_csv(os, signals); });
        }

        // ====== 4) BACKTEST ======
        if (do_backtest) {
            std::map<std::string, SpreadTable> tables;
            for (const auto& [key, h] : history) {
                if (h.rows.size() < cfg.backtest.min_history_days)
                    std::cerr << "[Warn] " << key << ": " << h.rows.size()
                              << " rows, fewer than min_history_days=" << cfg.backtest.min_history_days << ".\n";
                tables.emplace(key, h.rows);
            }

            const auto results = run_multi_pair_backtest(tables, cfg.pairs, cfg.backtest,
                                                         cfg.start_date, cfg.end_date);

            std::cout << "\n=== Backtest Results ===\n";
            std::cout << std::left
                      << std::setw(30) << "Pair"
                      << std::setw(8)  << "Trades"
                      << std::setw(10) << "WinRate"
                      << std::setw(12) << "PnL_bp"
                      << std::setw(14) << "PnL_rub"
                      << std::setw(10) << "MaxDD_bp"
                      << std::setw(10) << "Sharpe"
                      << std::setw(8)  << "PF"
                      << "\n";
            for (const auto& [key, r] : results) {
                const auto& m = r.metrics;
                std::cout << std::left
                          << std::setw(30) << key
                          << std::setw(8)  << m.total_trades
                          << std::setw(10) << fmt_fixed(m.win_rate, 2)
                          << std::setw(12) << fmt_fixed(m.total_pnl_bp, 2)
                          << std::setw(14) << fmt_fixed(m.total_pnl_rub, 2)
                          << std::setw(10) << fmt_fixed(m.max_drawdown_bp, 2)
                          << std::setw(10) << fmt_fixed(m.sharpe_ratio, 3)
                          << std::setw(8)  << fmt_fixed(m.profit_factor, 3)
                          << "\n";
            }

            const StrategyMetrics sm = strategy_metrics(results, cfg.pairs);
            std::cout << "\n[Info] pairs: " << sm.total_pairs
                      << " | trades: " << sm.total_trades
                      << " | win rate: " << fmt_fixed(sm.win_rate, 2) << "%"
                      << " | pnl: " << fmt_fixed(sm.total_pnl_bp, 2) << " bp / "
                      << fmt_fixed(sm.total_pnl_rub, 2)
                      << " | profitable pairs: " << sm.profitable_pairs << "\n";
            if (sm.best_pair)
                std::cout << "[Info] best: " << sm.best_pair->first << " (" << fmt_fixed(sm.best_pair->second, 2)
                          << " bp), worst: " << sm.worst_pair->first << " (" << fmt_fixed(sm.worst_pair->second, 2) << " bp)\n";

            save_table(out_path(cfg, "backtest_summary.csv"),
                       [&](std::ostream& os){ write_backtest_summary_csv(os, results); });
            save_table(out_path(cfg, "positions.csv"),
                       [&](std::ostream& os){ write_positions_csv(os, results); });
            save_table(out_path(cfg, "equity_curve.csv"),
                       [&](std::ostream& os){ write_equity_curve_csv(os, results); });
        }

        std::cout << "\n[OK] Pipeline done.\n";
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
