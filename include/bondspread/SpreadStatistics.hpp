#pragma once
#include <cmath>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "bondspread/Bond.hpp"
#include "bondspread/DataOrdering.hpp"

namespace bondspread::stats {

    // Raised only when a statistics window holds no observation at all.
    class EmptySeriesError : public std::runtime_error {
    public:
        EmptySeriesError() : std::runtime_error("Empty spread series") {}
    };

    struct SpreadStats {
        double current = NAN;
        double mean = NAN;
        double stddev = NAN;    // sample (n-1); NaN for a single observation
        double min = NAN;
        double max = NAN;
        double percentile_10 = NAN;
        double percentile_25 = NAN;
        double percentile_50 = NAN;
        double percentile_75 = NAN;
        double percentile_90 = NAN;
        double zscore = 0.0;
        size_t lookback_days = 0;  // observations actually used
    };

    // Rolling statistics of one pair's spread.
    struct SpreadHistory {
        std::string bond_long;
        std::string bond_short;
        SpreadTable rows;
        std::vector<double> mean_20, std_20;
        std::vector<double> mean_60, std_60;
    };

    // round((ytm_long - ytm_short) * 100, 2)
    double calculate_spread(double ytm_long, double ytm_short);

    // Inner join on Time; rows where either yield is missing are dropped.
    SpreadTable calculate_spread_series(const TimeSeries& ytm_long, const TimeSeries& ytm_short);

    /**
     * Distribution of the last `lookback` non-NaN observations.
     * Throws EmptySeriesError when that window is empty.
     */
    SpreadStats calculate_spread_stats(const std::vector<double>& series, size_t lookback = 252);

    // Share of the window strictly below `current`, in percent (1 dp).
    // 50.0 for an empty window.
    double percentile_rank(double current,
                           const std::vector<double>& series,
                           std::optional<size_t> lookback = std::nullopt);

    // |x - rolling mean| > threshold * rolling std over 20 periods.
    std::vector<bool> detect_anomalies(const std::vector<double>& series, double threshold_std = 2.0);

    // Spread normalised to a 10y average duration.
    double duration_weighted_spread(double ytm_long, double ytm_short,
                                    double duration_long, double duration_short);

    // x[i] - x[i - periods]; NaN for the first `periods` entries.
    std::vector<double> spread_change(const std::vector<double>& series, size_t periods = 1);

    // Trailing-window statistics; NaN until `min_periods` non-NaN values are
    // available in the window.
    std::vector<double> rolling_mean(const std::vector<double>& series, size_t window, size_t min_periods);
    std::vector<double> rolling_std(const std::vector<double>& series, size_t window, size_t min_periods);
    std::vector<double> rolling_percentile(const std::vector<double>& series, size_t window,
                                           size_t min_periods, double p);

    // Spread history per pair key; pairs lacking either yield series are skipped.
    std::map<std::string, SpreadHistory> build_spread_history(
        const std::map<std::string, TimeSeries>& ytm_by_isin,
        const std::vector<BondPair>& pairs
    );

} // namespace bondspread::stats
