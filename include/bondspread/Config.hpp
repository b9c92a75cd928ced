#pragma once
#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include "bondspread/Backtest.hpp"
#include "bondspread/Bond.hpp"
#include "bondspread/Signals.hpp"
#include "bondspread/YieldSolver.hpp"

namespace bondspread {

    // What the per-bond CSV files hold.
    enum class InputMode { Ytm, Price };

    std::string to_string(InputMode m);
    InputMode parse_input_mode(const std::string& s);   // "ytm" | "price", throws std::runtime_error

    struct AppConfig {
        SignalConfig   signals;
        BacktestConfig backtest;
        SolverConfig   solver;

        std::vector<BondParams> bonds;
        std::vector<BondPair>   pairs;

        std::string data_dir   = "data";
        std::string output_dir = "outputs";
        InputMode   input      = InputMode::Ytm;

        // backtest window, both inclusive
        std::optional<boost::gregorian::date> start_date;
        std::optional<boost::gregorian::date> end_date;
    };

    // OFZ universe and the four standard pairs.
    AppConfig default_app_config();

    /**
     * Defaults overlaid with an INI file:
     *   [signals] [backtest] [solver] [data]   keys named as the struct fields
     *   [bond.<ISIN>]   name, face_value, coupon_rate, coupon_frequency,
     *                   maturity_date, issue_date, day_count, accrued_interest
     *   [pairs]         pair1 = LONG_ISIN,SHORT_ISIN ...
     * A bond section replaces the default bond with the same ISIN or adds a
     * new one; a [pairs] section replaces the default pair list.
     * Throws std::runtime_error naming the file and key on any problem.
     */
    AppConfig load_app_config(const std::string& path);

    // Range checks on the numeric settings; throws std::runtime_error.
    void validate(const AppConfig& cfg);

}
