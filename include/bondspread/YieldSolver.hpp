#pragma once
#include <cstddef>
#include <optional>

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include "bondspread/Bond.hpp"
#include "bondspread/CashFlowModel.hpp"
#include "bondspread/DataOrdering.hpp"

namespace bondspread {

    struct SolverConfig {
        int    max_iterations = 100;
        double tolerance      = 1e-8;   // bracketing solver, yield %
        double fallback_tolerance = 1e-6; // accepted |NPV - price| / price after Newton
        double lower_bound    = 0.1;    // bracket, yield %
        double upper_bound    = 50.0;
        double newton_guess   = 7.0;
    };

    // Yields are in percent per year, prices are clean and in percent of face
    // unless stated otherwise. std::nullopt means "cannot price this bond at
    // this settlement" (no remaining cash flows, or no root).

    // Sum of discounted cash flows (dirty price, currency units).
    double present_value(const CashFlowSchedule& flows,
                         const boost::gregorian::date& settlement,
                         double ytm);

    std::optional<double> price_from_ytm(
        double ytm,
        const BondParams& bond,
        const boost::gregorian::date& settlement
    );

    /**
     * Solve the yield for a quoted price.
     * - price <= 100 is read as percent of face, anything above as currency units
     * - unless `dirty_price`, the bond's quoted accrued interest is added
     *   (0 when none is known)
     * - toms748 bracketing over [lower_bound, upper_bound], then Newton from
     *   `newton_guess` if the bracket does not contain the root
     */
    std::optional<double> calculate_ytm(
        double price,
        const BondParams& bond,
        const boost::gregorian::date& settlement,
        bool dirty_price = false,
        const SolverConfig& cfg = SolverConfig{}
    );

    // Macaulay duration in years.
    std::optional<double> macaulay_duration(double ytm, const BondParams& bond,
                                            const boost::gregorian::date& settlement);

    std::optional<double> modified_duration(double ytm, const BondParams& bond,
                                            const boost::gregorian::date& settlement);

    std::optional<double> convexity(double ytm, const BondParams& bond,
                                    const boost::gregorian::date& settlement);

    // Quoted value when the bond carries one, otherwise half a period's
    // coupon (approximation, not day-count accrual).
    std::optional<double> accrued_interest(const BondParams& bond,
                                           const boost::gregorian::date& settlement);

    // (C + (F - P)/n) / ((F + P)/2); coupon rate when already matured.
    double approximate_ytm(double price_percent, const BondParams& bond,
                           const boost::gregorian::date& settlement);

    struct YieldConversion {
        TimeSeries yields;
        size_t failed = 0;   // points without a solution
    };

    // Clean-price series -> yield series, each point settled on its own date.
    YieldConversion yields_from_prices(const TimeSeries& prices,
                                       const BondParams& bond,
                                       const SolverConfig& cfg = SolverConfig{});

} // namespace bondspread
