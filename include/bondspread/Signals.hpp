#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include "bondspread/Bond.hpp"
#include "bondspread/SpreadStatistics.hpp"

namespace bondspread {

    enum class SignalType { StrongBuy, Buy, Neutral, Sell, StrongSell, NoData };

    // LongShort: buy the long bond / sell the short one (profits when the spread widens)
    enum class SignalDirection { LongShort, ShortLong, Flat };

    std::string to_string(SignalType t);
    std::string to_string(SignalDirection d);

    struct SignalConfig {
        double percentile_entry_low  = 10.0;   // strong buy at or below
        double percentile_entry_mid  = 25.0;   // buy at or below
        double percentile_exit_mid   = 75.0;   // sell at or above
        double percentile_exit_high  = 90.0;   // strong sell at or above
        double min_confidence   = 0.3;
        double zscore_threshold = 1.5;
        size_t lookback_days    = 252;
        size_t min_observations = 20;
        int    signal_expiry_hours = 4;
    };

    struct TradingSignal {
        std::string pair_name;
        std::string bond_long;
        std::string bond_short;
        SignalType signal_type = SignalType::NoData;
        SignalDirection direction = SignalDirection::Flat;
        double confidence = 0.0;          // [0, 1]
        double spread_bp = 0.0;
        double spread_mean = 0.0;
        double zscore = 0.0;
        double percentile_rank = 50.0;
        double expected_return_bp = 0.0;
        boost::posix_time::ptime timestamp;
        std::optional<boost::posix_time::ptime> expires_at;

        bool is_expired(const boost::posix_time::ptime& now) const;
    };

    struct Classification {
        SignalType type = SignalType::Neutral;
        SignalDirection direction = SignalDirection::Flat;
        double confidence = 0.2;
    };

    /**
     * Ordered checks, first match wins:
     *   current <= p10 -> STRONG_BUY, <= p25 -> BUY,
     *   current >= p75 -> SELL,       >= p90 -> STRONG_SELL,
     *   otherwise NEUTRAL.
     * The sell side tests p75 before p90, so a spread at or above p90 is
     * reported as SELL and the STRONG_SELL branch is never reached.
     */
    Classification classify_signal(double current,
                                   double p10, double p25,
                                   double p75, double p90,
                                   double zscore);

    // Mean-reversion move toward `mean`, signed for the direction (2 dp).
    double expected_return(double current, double mean, SignalDirection direction);

    class SignalGenerator {
    public:
        explicit SignalGenerator(SignalConfig cfg = SignalConfig{});

        TradingSignal generate_signal(const std::vector<double>& spread_series,
                                      const std::string& bond_long,
                                      const std::string& bond_short,
                                      const boost::posix_time::ptime& now,
                                      const std::string& pair_name = "") const;

        // One signal per pair with history; pairs missing from `history` are skipped.
        std::vector<TradingSignal> generate_all_signals(
            const std::map<std::string, stats::SpreadHistory>& history,
            const std::vector<BondPair>& pairs,
            const boost::posix_time::ptime& now) const;

        // Drops NO_DATA, optionally NEUTRAL, and anything below min_confidence
        // (config value when not given).
        std::vector<TradingSignal> filter_signals(const std::vector<TradingSignal>& signals,
                                                  std::optional<double> min_confidence = std::nullopt,
                                                  bool exclude_neutral = true) const;

        const SignalConfig& config() const { return cfg_; }

    private:
        TradingSignal no_data(const std::string& bond_long,
                              const std::string& bond_short,
                              const std::string& pair_name,
                              const boost::posix_time::ptime& now) const;

        SignalConfig cfg_;
    };

    std::vector<TradingSignal> active_signals(const std::vector<TradingSignal>& signals,
                                              const boost::posix_time::ptime& now);

} // namespace bondspread
