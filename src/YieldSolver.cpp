#include "bondspread/YieldSolver.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

#include <boost/math/policies/error_handling.hpp>
#include <boost/math/tools/roots.hpp>
#include <boost/math/tools/toms748_solve.hpp>

namespace bondspread {

namespace bg = boost::gregorian;

static double quoted_accrued(const BondParams& bond){
    return bond.accrued_interest.value_or(0.0);
}

double present_value(const CashFlowSchedule& flows, const bg::date& settlement, double ytm){
    const double base = 1.0 + ytm / 100.0;
    double pv = 0.0;
    for (const auto& cf : flows){
        pv += cf.amount / std::pow(base, year_fraction(settlement, cf.date));
    }
    return pv;
}

// d(PV)/d(ytm) with ytm in percent
static double present_value_slope(const CashFlowSchedule& flows, const bg::date& settlement, double ytm){
    const double base = 1.0 + ytm / 100.0;
    double d = 0.0;
    for (const auto& cf : flows){
        const double t = year_fraction(settlement, cf.date);
        d -= t * cf.amount / std::pow(base, t + 1.0);
    }
    return d / 100.0;
}

std::optional<double> price_from_ytm(double ytm, const BondParams& bond, const bg::date& settlement){
    const auto flows = generate_cash_flows(bond, settlement);
    if (flows.empty() || !std::isfinite(ytm)) return std::nullopt;

    const double dirty = present_value(flows, settlement, ytm);
    if (!std::isfinite(dirty)) return std::nullopt;

    const double clean = (dirty - quoted_accrued(bond)) / bond.face_value * 100.0;
    return round_to(clean, 4);
}

std::optional<double> calculate_ytm(
    double price,
    const BondParams& bond,
    const bg::date& settlement,
    bool dirty_price,
    const SolverConfig& cfg
){
    if (!std::isfinite(price) || price <= 0.0) return std::nullopt;

    const auto flows = generate_cash_flows(bond, settlement);
    if (flows.empty()) return std::nullopt;

    const double price_abs = (price <= 100.0) ? price * bond.face_value / 100.0 : price;
    const double target    = dirty_price ? price_abs : price_abs + quoted_accrued(bond);

    auto npv = [&](double y){ return present_value(flows, settlement, y) - target; };

    // 1) bracketing solver
    const double f_lo = npv(cfg.lower_bound);
    const double f_hi = npv(cfg.upper_bound);
    if (std::isfinite(f_lo) && std::isfinite(f_hi)){
        if (f_lo == 0.0) return cfg.lower_bound;
        if (f_hi == 0.0) return cfg.upper_bound;
        if ((f_lo > 0.0) != (f_hi > 0.0)){
            std::uintmax_t max_iter = static_cast<std::uintmax_t>(cfg.max_iterations);
            const double tol = cfg.tolerance;
            try {
                auto r = boost::math::tools::toms748_solve(
                    npv, cfg.lower_bound, cfg.upper_bound, f_lo, f_hi,
                    [tol](double a, double b){ return std::fabs(b - a) <= tol; },
                    max_iter
                );
                const double y = 0.5 * (r.first + r.second);
                if (std::isfinite(y)) return y;
            } catch (const boost::math::evaluation_error&) {
                // no convergence inside the bracket: Newton below
            } catch (const std::domain_error&) {
                // bracket rejected by the solver: Newton below
            }
        }
    }

    // 2) Newton-Raphson fallback
    auto npv_and_slope = [&](double y){
        return std::make_pair(npv(y), present_value_slope(flows, settlement, y));
    };
    std::uintmax_t max_iter = static_cast<std::uintmax_t>(cfg.max_iterations);
    const int digits = static_cast<int>(std::numeric_limits<double>::digits * 0.6);
    double y = NAN;
    try {
        y = boost::math::tools::newton_raphson_iterate(
            npv_and_slope, cfg.newton_guess, -99.0, 1000.0, digits, max_iter
        );
    } catch (const boost::math::evaluation_error&) {
        return std::nullopt;
    }

    // max_iter now holds the iterations used; convergence is judged on the residual
    if (!std::isfinite(y) || std::fabs(npv(y)) > cfg.fallback_tolerance * target)
        return std::nullopt;
    return y;
}

std::optional<double> macaulay_duration(double ytm, const BondParams& bond, const bg::date& settlement){
    const auto flows = generate_cash_flows(bond, settlement);
    if (flows.empty()) return std::nullopt;

    const double base = 1.0 + ytm / 100.0;
    double price = 0.0, weighted = 0.0;
    for (const auto& cf : flows){
        const double t  = year_fraction(settlement, cf.date);
        const double pv = cf.amount / std::pow(base, t);
        price    += pv;
        weighted += pv * t;
    }
    if (!(price > 0.0)) return std::nullopt;
    return weighted / price;
}

std::optional<double> modified_duration(double ytm, const BondParams& bond, const bg::date& settlement){
    auto d = macaulay_duration(ytm, bond, settlement);
    if (!d) return std::nullopt;
    return *d / (1.0 + ytm / 100.0);
}

std::optional<double> convexity(double ytm, const BondParams& bond, const bg::date& settlement){
    const auto flows = generate_cash_flows(bond, settlement);
    if (flows.empty()) return std::nullopt;

    const double base = 1.0 + ytm / 100.0;
    double price = 0.0, acc = 0.0;
    for (const auto& cf : flows){
        const double t  = year_fraction(settlement, cf.date);
        const double pv = cf.amount / std::pow(base, t);
        price += pv;
        acc   += pv * t * (t + 1.0);
    }
    if (!(price > 0.0)) return std::nullopt;
    return acc / (price * base * base);
}

std::optional<double> accrued_interest(const BondParams& bond, const bg::date& settlement){
    if (generate_cash_flows(bond, settlement).empty()) return std::nullopt;
    if (bond.accrued_interest) return *bond.accrued_interest;
    return round_to(0.5 * coupon_per_period(bond), 2);
}

double approximate_ytm(double price_percent, const BondParams& bond, const bg::date& settlement){
    const double years = year_fraction(settlement, bond.maturity_date);
    if (years <= 0.0) return bond.coupon_rate;

    const double annual_coupon = bond.face_value * bond.coupon_rate / 100.0;
    const double price_abs     = price_percent * bond.face_value / 100.0;

    const double num = annual_coupon + (bond.face_value - price_abs) / years;
    const double den = (bond.face_value + price_abs) / 2.0;
    return round_to(num / den * 100.0, 2);
}

YieldConversion yields_from_prices(const TimeSeries& prices, const BondParams& bond, const SolverConfig& cfg){
    YieldConversion out;
    out.yields.reserve(prices.size());
    for (const auto& p : prices){
        if (std::isnan(p.value)) { ++out.failed; continue; }
        bg::date settlement;
        try {
            settlement = parse_date(p.Time);
        } catch (const std::invalid_argument&) {
            ++out.failed;
            continue;
        }
        auto y = calculate_ytm(p.value, bond, settlement, false, cfg);
        if (!y) { ++out.failed; continue; }
        out.yields.push_back({p.Time, *y});
    }
    return out;
}

} // namespace bondspread
