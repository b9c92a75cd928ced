#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/date_time/gregorian/gregorian_types.hpp>

namespace bondspread {

    // Stored per bond but not used by the pricing code, which always
    // measures time as Actual/365.25.
    enum class DayCountBasis { ActAct, Act365, Act360, Thirty360 };

    std::string to_string(DayCountBasis basis);
    DayCountBasis parse_day_count(const std::string& s);

    // Invalid static bond parameters (the only condition the pricing core throws on).
    class BondError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Fixed-coupon bullet bond. Build through make_bond(), which validates;
    // the cash-flow generator re-validates, so a hand-built value with bad
    // parameters raises BondError from every pricing entry point.
    struct BondParams {
        std::string isin;
        std::string name;
        double face_value = 1000.0;
        double coupon_rate = 0.0;           // % per year
        int    coupon_frequency = 2;        // payments per year
        boost::gregorian::date maturity_date;
        std::optional<boost::gregorian::date> issue_date;
        DayCountBasis day_count = DayCountBasis::ActAct;
        std::optional<double> accrued_interest;  // quoted accrued, currency units
    };

    BondParams make_bond(
        const std::string& isin,
        double coupon_rate,
        const boost::gregorian::date& maturity_date,
        double face_value = 1000.0,
        int coupon_frequency = 2,
        const std::optional<boost::gregorian::date>& issue_date = std::nullopt,
        DayCountBasis day_count = DayCountBasis::ActAct,
        std::optional<double> accrued_interest = std::nullopt,
        const std::string& name = ""
    );

    // Re-runs the make_bond() checks on an existing value; throws BondError.
    void validate(const BondParams& bond);

    // (long ISIN, short ISIN)
    using BondPair = std::pair<std::string, std::string>;

    std::string pair_key(const std::string& bond_long, const std::string& bond_short);
    std::string pair_key(const BondPair& pair);

    const BondParams* find_bond(const std::vector<BondParams>& bonds, const std::string& isin);

} // namespace bondspread
