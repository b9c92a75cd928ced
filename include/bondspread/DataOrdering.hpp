#pragma once
#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian_types.hpp>

namespace bondspread {

    // One observation of a single-instrument series (yield % or clean price).
    struct SeriesPoint {
        std::string Time;   // "YYYY-MM-DD HH:MM:SS"
        double value{NAN};
    };

    using TimeSeries = std::vector<SeriesPoint>;

    // One aligned observation of a bond pair.
    struct SpreadRow {
        std::string Time;
        double ytm_long{NAN};
        double ytm_short{NAN};
        double spread_bp{NAN};   // (ytm_long - ytm_short) * 100
    };

    using SpreadTable = std::vector<SpreadRow>;

    // ---- date / time helpers ----

    // Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]", "YYYY-MM-DDTHH:MM:SS",
    // "DD.MM.YYYY", "DD/MM/YY" ... and returns "YYYY-MM-DD HH:MM:SS".
    // Returns the trimmed input unchanged when nothing matches.
    std::string to_iso_datetime(const std::string& s);

    // Calendar date of an ISO timestamp or date; throws std::invalid_argument.
    boost::gregorian::date parse_date(const std::string& s);

    std::string format_date(const boost::gregorian::date& d);

    // Whole calendar days from a to b (timestamps, date part only).
    long days_between(const std::string& a, const std::string& b);

    std::string add_months_iso(const std::string& iso_time, int months);

    // lexicographic comparison, valid for the normalised ISO format
    bool iso_less(const std::string& a, const std::string& b);

    // ---- ordering ----

    // Sorts by Time; for duplicated timestamps the later observation wins.
    TimeSeries sort_and_dedup(TimeSeries series);

    // Keeps [start, end) where the bounds are inclusive/exclusive ISO strings.
    TimeSeries filter_by_date(const TimeSeries& series,
                              const std::optional<std::string>& start,
                              const std::optional<std::string>& end);

    SpreadTable filter_by_date(const SpreadTable& table,
                               const std::optional<std::string>& start,
                               const std::optional<std::string>& end);

    std::vector<double> values_of(const TimeSeries& series);
    std::vector<double> spreads_of(const SpreadTable& table);

    // Drops NaN and keeps the last `lookback` entries (all when lookback is 0).
    std::vector<double> tail_window(const std::vector<double>& v, size_t lookback);

    // ---- numeric helpers ----

    // percentile with linear interpolation between closest ranks, p in [0,100]
    double percentile(std::vector<double> v, double p);

    double round_to(double x, int decimals);

} // namespace bondspread
