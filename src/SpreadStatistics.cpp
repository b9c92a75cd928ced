#include "bondspread/SpreadStatistics.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

#include <boost/math/statistics/univariate_statistics.hpp>

namespace bondspread::stats {

namespace bms = boost::math::statistics;

// mean / sample std; std is NaN below two values
static void mean_std(const std::vector<double>& v, double& m, double& s){
    m = NAN; s = NAN;
    if (v.empty()) return;
    m = bms::mean(v);
    if (v.size() > 1) s = std::sqrt(std::max(0.0, bms::sample_variance(v)));
}

// finite values of series[i+1-window .. i]
static std::vector<double> trailing(const std::vector<double>& series, size_t i, size_t window){
    const size_t from = (i + 1 >= window) ? i + 1 - window : 0;
    std::vector<double> w; w.reserve(i + 1 - from);
    for (size_t k = from; k <= i; ++k)
        if (!std::isnan(series[k])) w.push_back(series[k]);
    return w;
}

double calculate_spread(double ytm_long, double ytm_short){
    return round_to((ytm_long - ytm_short) * 100.0, 2);
}

SpreadTable calculate_spread_series(const TimeSeries& ytm_long, const TimeSeries& ytm_short){
    const TimeSeries a = sort_and_dedup(ytm_long);
    const TimeSeries b = sort_and_dedup(ytm_short);

    SpreadTable out;
    out.reserve(std::min(a.size(), b.size()));
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()){
        if (iso_less(a[i].Time, b[j].Time)) { ++i; continue; }
        if (iso_less(b[j].Time, a[i].Time)) { ++j; continue; }
        if (!std::isnan(a[i].value) && !std::isnan(b[j].value)){
            SpreadRow r;
            r.Time      = a[i].Time;
            r.ytm_long  = a[i].value;
            r.ytm_short = b[j].value;
            r.spread_bp = calculate_spread(r.ytm_long, r.ytm_short);
            out.push_back(r);
        }
        ++i; ++j;
    }
    return out;
}

SpreadStats calculate_spread_stats(const std::vector<double>& series, size_t lookback){
    const std::vector<double> w = tail_window(series, lookback);
    if (w.empty()) throw EmptySeriesError();

    SpreadStats s;
    s.current = w.back();
    mean_std(w, s.mean, s.stddev);
    s.min = *std::min_element(w.begin(), w.end());
    s.max = *std::max_element(w.begin(), w.end());
    s.percentile_10 = percentile(w, 10.0);
    s.percentile_25 = percentile(w, 25.0);
    s.percentile_50 = percentile(w, 50.0);
    s.percentile_75 = percentile(w, 75.0);
    s.percentile_90 = percentile(w, 90.0);
    s.zscore = (s.stddev > 0.0) ? (s.current - s.mean) / s.stddev : 0.0;
    s.lookback_days = w.size();
    return s;
}

double percentile_rank(double current, const std::vector<double>& series, std::optional<size_t> lookback){
    const std::vector<double> w = tail_window(series, lookback.value_or(0));
    if (w.empty()) return 50.0;
    const auto below = std::count_if(w.begin(), w.end(), [&](double x){ return x < current; });
    return round_to(static_cast<double>(below) / w.size() * 100.0, 1);
}

std::vector<bool> detect_anomalies(const std::vector<double>& series, double threshold_std){
    constexpr size_t window = 20;
    const auto m = rolling_mean(series, window, window);
    const auto s = rolling_std(series, window, window);

    std::vector<bool> out(series.size(), false);
    for (size_t i = 0; i < series.size(); ++i){
        const double upper = m[i] + threshold_std * s[i];
        const double lower = m[i] - threshold_std * s[i];
        // any NaN operand makes both comparisons false
        out[i] = (series[i] > upper) || (series[i] < lower);
    }
    return out;
}

double duration_weighted_spread(double ytm_long, double ytm_short,
                                double duration_long, double duration_short){
    const double spread = (ytm_long - ytm_short) * 100.0;
    const double avg_duration = (duration_long + duration_short) / 2.0;
    if (!(avg_duration > 0.0)) return NAN;
    return round_to(spread / avg_duration * 10.0, 2);
}

std::vector<double> spread_change(const std::vector<double>& series, size_t periods){
    std::vector<double> out(series.size(), NAN);
    for (size_t i = periods; i < series.size(); ++i)
        out[i] = series[i] - series[i - periods];
    return out;
}

std::vector<double> rolling_mean(const std::vector<double>& series, size_t window, size_t min_periods){
    std::vector<double> out(series.size(), NAN);
    for (size_t i = 0; i < series.size(); ++i){
        auto w = trailing(series, i, window);
        if (w.size() < std::max<size_t>(min_periods, 1)) continue;
        out[i] = bms::mean(w);
    }
    return out;
}

std::vector<double> rolling_std(const std::vector<double>& series, size_t window, size_t min_periods){
    std::vector<double> out(series.size(), NAN);
    for (size_t i = 0; i < series.size(); ++i){
        auto w = trailing(series, i, window);
        if (w.size() < std::max<size_t>(min_periods, 2)) continue;
        double m, s;
        mean_std(w, m, s);
        out[i] = s;
    }
    return out;
}

std::vector<double> rolling_percentile(const std::vector<double>& series, size_t window,
                                       size_t min_periods, double p){
    std::vector<double> out(series.size(), NAN);
    for (size_t i = 0; i < series.size(); ++i){
        auto w = trailing(series, i, window);
        if (w.empty() || w.size() < min_periods) continue;
        out[i] = percentile(std::move(w), p);
    }
    return out;
}

std::map<std::string, SpreadHistory> build_spread_history(
    const std::map<std::string, TimeSeries>& ytm_by_isin,
    const std::vector<BondPair>& pairs
){
    std::map<std::string, SpreadHistory> out;
    for (const auto& [bond_long, bond_short] : pairs){
        auto it_l = ytm_by_isin.find(bond_long);
        auto it_s = ytm_by_isin.find(bond_short);
        if (it_l == ytm_by_isin.end() || it_s == ytm_by_isin.end()) continue;

        SpreadHistory h;
        h.bond_long  = bond_long;
        h.bond_short = bond_short;
        h.rows       = calculate_spread_series(it_l->second, it_s->second);

        const auto spreads = spreads_of(h.rows);
        h.mean_20 = rolling_mean(spreads, 20, 20);
        h.std_20  = rolling_std(spreads, 20, 20);
        h.mean_60 = rolling_mean(spreads, 60, 60);
        h.std_60  = rolling_std(spreads, 60, 60);

        out.emplace(pair_key(bond_long, bond_short), std::move(h));
    }
    return out;
}

} // namespace bondspread::stats
