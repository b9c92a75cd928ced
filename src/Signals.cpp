#include "bondspread/Signals.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace bondspread {

namespace pt = boost::posix_time;

std::string to_string(SignalType t){
    switch (t){
        case SignalType::StrongBuy:  return "STRONG_BUY";
        case SignalType::Buy:        return "BUY";
        case SignalType::Neutral:    return "NEUTRAL";
        case SignalType::Sell:       return "SELL";
        case SignalType::StrongSell: return "STRONG_SELL";
        case SignalType::NoData:     return "NO_DATA";
    }
    return "NO_DATA";
}

std::string to_string(SignalDirection d){
    switch (d){
        case SignalDirection::LongShort: return "LONG_SHORT";
        case SignalDirection::ShortLong: return "SHORT_LONG";
        case SignalDirection::Flat:      return "FLAT";
    }
    return "FLAT";
}

bool TradingSignal::is_expired(const pt::ptime& now) const {
    return expires_at.has_value() && *expires_at <= now;
}

static double clamp01(double x){
    if (std::isnan(x)) return 0.0;
    return std::min(1.0, std::max(0.0, x));
}

static double extreme_confidence(double zscore){
    return std::max(0.7, std::min(1.0, std::fabs(zscore) / 3.0));
}

// base + 0.3 * depth inside a band; the base alone when the band has no width
static double band_confidence(double depth, double width){
    if (!(width > 0.0)) return 0.4;
    return clamp01(0.4 + 0.3 * depth / width);
}

Classification classify_signal(double current,
                               double p10, double p25,
                               double p75, double p90,
                               double zscore){
    if (current <= p10)
        return {SignalType::StrongBuy, SignalDirection::LongShort, clamp01(extreme_confidence(zscore))};

    if (current <= p25)
        return {SignalType::Buy, SignalDirection::LongShort, band_confidence(p25 - current, p25 - p10)};

    if (current >= p75)
        return {SignalType::Sell, SignalDirection::ShortLong, band_confidence(current - p75, p90 - p75)};

    // shadowed by the branch above whenever p90 >= p75
    if (current >= p90)
        return {SignalType::StrongSell, SignalDirection::ShortLong, clamp01(extreme_confidence(zscore))};

    return {SignalType::Neutral, SignalDirection::Flat, 0.2};
}

double expected_return(double current, double mean, SignalDirection direction){
    if (direction == SignalDirection::Flat) return 0.0;
    const double move = mean - current;
    return round_to(direction == SignalDirection::LongShort ? move : -move, 2);
}

SignalGenerator::SignalGenerator(SignalConfig cfg) : cfg_(cfg) {}

TradingSignal SignalGenerator::no_data(const std::string& bond_long,
                                       const std::string& bond_short,
                                       const std::string& pair_name,
                                       const pt::ptime& now) const {
    TradingSignal s;
    s.pair_name  = pair_name;
    s.bond_long  = bond_long;
    s.bond_short = bond_short;
    s.signal_type = SignalType::NoData;
    s.direction   = SignalDirection::Flat;
    s.timestamp   = now;
    return s;
}

TradingSignal SignalGenerator::generate_signal(const std::vector<double>& spread_series,
                                               const std::string& bond_long,
                                               const std::string& bond_short,
                                               const pt::ptime& now,
                                               const std::string& pair_name) const {
    const std::string name = pair_name.empty() ? pair_key(bond_long, bond_short) : pair_name;

    const std::vector<double> clean = tail_window(spread_series, 0);
    if (clean.size() < cfg_.min_observations)
        return no_data(bond_long, bond_short, name, now);

    stats::SpreadStats st;
    try {
        st = stats::calculate_spread_stats(clean, cfg_.lookback_days);
    } catch (const stats::EmptySeriesError&) {
        return no_data(bond_long, bond_short, name, now);
    }

    // thresholds at the configured levels over the same window as the stats
    const std::vector<double> window = tail_window(clean, cfg_.lookback_days);
    const double p_low  = percentile(window, cfg_.percentile_entry_low);
    const double p_mid  = percentile(window, cfg_.percentile_entry_mid);
    const double p_exit = percentile(window, cfg_.percentile_exit_mid);
    const double p_high = percentile(window, cfg_.percentile_exit_high);

    const Classification c = classify_signal(st.current, p_low, p_mid, p_exit, p_high, st.zscore);

    TradingSignal s;
    s.pair_name   = name;
    s.bond_long   = bond_long;
    s.bond_short  = bond_short;
    s.signal_type = c.type;
    s.direction   = c.direction;
    s.confidence  = c.confidence;
    s.spread_bp   = st.current;
    s.spread_mean = st.mean;
    s.zscore      = st.zscore;
    s.percentile_rank    = stats::percentile_rank(st.current, clean);
    s.expected_return_bp = expected_return(st.current, st.mean, c.direction);
    s.timestamp  = now;
    s.expires_at = now + pt::hours(cfg_.signal_expiry_hours);
    return s;
}

std::vector<TradingSignal> SignalGenerator::generate_all_signals(
    const std::map<std::string, stats::SpreadHistory>& history,
    const std::vector<BondPair>& pairs,
    const pt::ptime& now) const {

    std::vector<TradingSignal> out;
    out.reserve(pairs.size());
    for (const auto& [bond_long, bond_short] : pairs){
        const std::string key = pair_key(bond_long, bond_short);
        auto it = history.find(key);
        if (it == history.end()) continue;
        out.push_back(generate_signal(spreads_of(it->second.rows), bond_long, bond_short, now, key));
    }
    return out;
}

std::vector<TradingSignal> SignalGenerator::filter_signals(const std::vector<TradingSignal>& signals,
                                                           std::optional<double> min_confidence,
                                                           bool exclude_neutral) const {
    const double threshold = min_confidence.value_or(cfg_.min_confidence);
    std::vector<TradingSignal> out;
    for (const auto& s : signals){
        if (s.signal_type == SignalType::NoData) continue;
        if (exclude_neutral && s.signal_type == SignalType::Neutral) continue;
        if (s.confidence < threshold) continue;
        out.push_back(s);
    }
    return out;
}

std::vector<TradingSignal> active_signals(const std::vector<TradingSignal>& signals,
                                          const pt::ptime& now){
    std::vector<TradingSignal> out;
    std::copy_if(signals.begin(), signals.end(), std::back_inserter(out),
                 [&](const TradingSignal& s){ return !s.is_expired(now); });
    return out;
}

} // namespace bondspread
