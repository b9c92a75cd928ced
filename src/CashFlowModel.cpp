#include "bondspread/CashFlowModel.hpp"
#include <algorithm>

#include <boost/date_time/gregorian/gregorian.hpp>

namespace bondspread {

namespace bg = boost::gregorian;

double coupon_per_period(const BondParams& bond){
    return bond.face_value * bond.coupon_rate / 100.0 / bond.coupon_frequency;
}

double year_fraction(const bg::date& from, const bg::date& to){
    return static_cast<double>((to - from).days()) / kDaysPerYear;
}

CashFlowSchedule generate_cash_flows(const BondParams& bond, const bg::date& settlement){
    // BondParams is a plain aggregate; a hand-built one must not reach the
    // month stepping below with a frequency outside {1, 2, 4, 12}
    validate(bond);

    CashFlowSchedule flows;
    if (settlement.is_special() || settlement >= bond.maturity_date) return flows;

    const int step_months = 12 / bond.coupon_frequency;
    const double coupon   = coupon_per_period(bond);

    // walk back from maturity; offsets are taken from maturity itself so
    // month-end clamping does not accumulate
    std::vector<bg::date> dates;
    for (int k = 0; ; ++k){
        bg::date d = bond.maturity_date - bg::months(k * step_months);
        if (d <= settlement) break;
        if (bond.issue_date && d <= *bond.issue_date) break;
        dates.push_back(d);
    }
    std::reverse(dates.begin(), dates.end());

    flows.reserve(dates.size());
    for (const auto& d : dates) flows.push_back({d, coupon});
    flows.back().amount += bond.face_value;
    return flows;
}

} // namespace bondspread
