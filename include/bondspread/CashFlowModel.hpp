#pragma once
#include <vector>

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include "bondspread/Bond.hpp"

namespace bondspread {

    struct CashFlow {
        boost::gregorian::date date;
        double amount = 0.0;
    };

    // Strictly increasing dates; the last flow carries coupon + face value.
    using CashFlowSchedule = std::vector<CashFlow>;

    // Days per year used by every year fraction in the pricing code.
    constexpr double kDaysPerYear = 365.25;

    double coupon_per_period(const BondParams& bond);

    // Actual/365.25 year fraction between two dates (negative if to < from).
    double year_fraction(const boost::gregorian::date& from, const boost::gregorian::date& to);

    /**
     * Remaining coupon/principal schedule after `settlement`.
     * Coupon dates roll back from maturity by 12/frequency months, so a
     * period is ~365/frequency days. Empty when settlement >= maturity.
     */
    CashFlowSchedule generate_cash_flows(const BondParams& bond,
                                         const boost::gregorian::date& settlement);

} // namespace bondspread
