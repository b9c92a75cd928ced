// yield_solver_test.cpp: pricing, YTM root finding and risk measures

#include <gtest/gtest.h>

#include "bondspread/YieldSolver.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace bondspread;
using test_helpers::d;

namespace {

const boost::gregorian::date kSettle = d("2025-02-27");

}  // namespace

// ===========================================================================
// calculate_ytm
// ===========================================================================

TEST(YieldSolverTest, ShortOfzFromQuotedPrice) {
    // 86.579% of face, 8.15% semi-annual, matures 2027-02-03
    const auto y = calculate_ytm(86.579, test_helpers::short_ofz(), kSettle);
    ASSERT_TRUE(y.has_value());
    EXPECT_NEAR(*y, 17.2, 1.0);
}

TEST(YieldSolverTest, ParPriceYieldsNearCoupon) {
    const auto bond = test_helpers::long_ofz();
    const auto y = calculate_ytm(100.0, bond, d("2025-03-23"));
    ASSERT_TRUE(y.has_value());
    // annual compounding of a semi-annual coupon sits slightly above the coupon
    EXPECT_NEAR(*y, 7.85, 0.15);
}

TEST(YieldSolverTest, NoneForMalformedInputs) {
    const auto bond = test_helpers::short_ofz();
    EXPECT_FALSE(calculate_ytm(std::numeric_limits<double>::quiet_NaN(), bond, kSettle));
    EXPECT_FALSE(calculate_ytm(0.0, bond, kSettle));
    EXPECT_FALSE(calculate_ytm(-5.0, bond, kSettle));
    EXPECT_FALSE(calculate_ytm(95.0, bond, d("2027-02-03")));   // at maturity
    EXPECT_FALSE(calculate_ytm(95.0, bond, d("2030-01-01")));   // past maturity
}

TEST(YieldSolverTest, InvalidHandBuiltBondRaisesBondError) {
    for (int freq : {0, 24}) {
        BondParams bond = test_helpers::short_ofz();
        bond.coupon_frequency = freq;
        EXPECT_THROW(calculate_ytm(95.0, bond, kSettle), BondError) << freq;
        EXPECT_THROW(price_from_ytm(15.0, bond, kSettle), BondError) << freq;
        EXPECT_THROW(macaulay_duration(15.0, bond, kSettle), BondError) << freq;
    }
}

TEST(YieldSolverTest, AbsolutePriceAboveHundredIsCurrency) {
    const auto bond = test_helpers::long_ofz();
    const auto pct = calculate_ytm(95.0, bond, kSettle);
    const auto abs = calculate_ytm(950.0, bond, kSettle);
    ASSERT_TRUE(pct && abs);
    EXPECT_NEAR(*pct, *abs, 1e-9);
}

TEST(YieldSolverTest, NewtonFallbackForYieldBelowBracket) {
    // 130% of face on a two-year 8.15% bond needs a negative yield
    const auto bond = test_helpers::short_ofz();
    const auto y = calculate_ytm(1300.0, bond, kSettle);
    ASSERT_TRUE(y.has_value());
    EXPECT_LT(*y, 0.1);
    const auto back = price_from_ytm(*y, bond, kSettle);
    ASSERT_TRUE(back.has_value());
    EXPECT_NEAR(*back, 130.0, 0.01);
}

TEST(YieldSolverTest, QuotedAccruedIsAddedForCleanPrices) {
    const auto plain  = test_helpers::short_ofz();
    const auto quoted = make_bond("SU26218RMFS6", 8.15, d("2027-02-03"), 1000.0, 2,
                                  std::nullopt, DayCountBasis::ActAct, 25.0);

    const auto y_plain  = calculate_ytm(90.0, plain, kSettle);
    const auto y_clean  = calculate_ytm(90.0, quoted, kSettle);
    const auto y_dirty  = calculate_ytm(90.0, quoted, kSettle, /*dirty_price=*/true);
    ASSERT_TRUE(y_plain && y_clean && y_dirty);

    // paying accrued on top of the clean price lowers the yield
    EXPECT_LT(*y_clean, *y_dirty);
    EXPECT_NEAR(*y_plain, *y_dirty, 1e-9);
}

// ===========================================================================
// price_from_ytm
// ===========================================================================

TEST(YieldSolverTest, RoundTripPercentPrices) {
    const auto bond = test_helpers::long_ofz();
    for (double price : {50.0, 62.5, 75.0, 88.0, 95.0, 100.0}) {
        const auto y = calculate_ytm(price, bond, kSettle);
        ASSERT_TRUE(y.has_value()) << "price " << price;
        const auto back = price_from_ytm(*y, bond, kSettle);
        ASSERT_TRUE(back.has_value());
        EXPECT_NEAR(*back, price, 0.01) << "price " << price;
    }
}

TEST(YieldSolverTest, RoundTripPremiumPrices) {
    // above 100% the quote is passed in currency units
    const auto bond = test_helpers::long_ofz();
    for (double price_pct : {105.0, 120.0, 135.0, 150.0}) {
        const auto y = calculate_ytm(price_pct * 10.0, bond, kSettle);
        ASSERT_TRUE(y.has_value()) << "price " << price_pct;
        const auto back = price_from_ytm(*y, bond, kSettle);
        ASSERT_TRUE(back.has_value());
        EXPECT_NEAR(*back, price_pct, 0.01) << "price " << price_pct;
    }
}

TEST(YieldSolverTest, RoundTripWithQuotedAccrued) {
    const auto bond = make_bond("SU26221RMFS0", 7.7, d("2033-03-23"), 1000.0, 2,
                                d("2017-02-15"), DayCountBasis::ActAct, 33.84);
    const auto y = calculate_ytm(82.4, bond, kSettle);
    ASSERT_TRUE(y.has_value());
    const auto back = price_from_ytm(*y, bond, kSettle);
    ASSERT_TRUE(back.has_value());
    EXPECT_NEAR(*back, 82.4, 0.01);
}

TEST(YieldSolverTest, PriceStrictlyDecreasingInYield) {
    const auto bond = test_helpers::long_ofz();
    double prev = std::numeric_limits<double>::infinity();
    for (double y = 0.5; y <= 40.0; y += 0.5) {
        const auto p = price_from_ytm(y, bond, kSettle);
        ASSERT_TRUE(p.has_value());
        EXPECT_LT(*p, prev) << "ytm " << y;
        prev = *p;
    }
}

TEST(YieldSolverTest, PriceRoundedToFourDecimals) {
    const auto p = price_from_ytm(13.3333, test_helpers::long_ofz(), kSettle);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(*p * 1e4, std::round(*p * 1e4), 1e-6);
}

TEST(YieldSolverTest, PriceNoneWithoutCashFlows) {
    EXPECT_FALSE(price_from_ytm(10.0, test_helpers::short_ofz(), d("2027-03-01")));
}

// ===========================================================================
// Duration / convexity / accrued
// ===========================================================================

TEST(YieldSolverTest, ZeroCouponDurationIsTimeToMaturity) {
    const auto zero = make_bond("ZCB", 0.0, d("2030-02-27"), 1000.0, 1);
    const auto dur = macaulay_duration(10.0, zero, kSettle);
    ASSERT_TRUE(dur.has_value());
    EXPECT_NEAR(*dur, year_fraction(kSettle, d("2030-02-27")), 1e-12);
}

TEST(YieldSolverTest, DurationOrdering) {
    const auto bond = test_helpers::long_ofz();
    const double ytm = 15.0;
    const auto mac  = macaulay_duration(ytm, bond, kSettle);
    const auto mod  = modified_duration(ytm, bond, kSettle);
    const auto conv = convexity(ytm, bond, kSettle);
    ASSERT_TRUE(mac && mod && conv);

    EXPECT_GT(*mac, 0.0);
    EXPECT_LT(*mac, year_fraction(kSettle, bond.maturity_date));
    EXPECT_NEAR(*mod, *mac / 1.15, 1e-12);
    EXPECT_GT(*conv, 0.0);
}

TEST(YieldSolverTest, RiskMeasuresNoneAfterMaturity) {
    const auto bond = test_helpers::short_ofz();
    const auto late = d("2027-06-01");
    EXPECT_FALSE(macaulay_duration(10.0, bond, late));
    EXPECT_FALSE(modified_duration(10.0, bond, late));
    EXPECT_FALSE(convexity(10.0, bond, late));
    EXPECT_FALSE(accrued_interest(bond, late));
}

TEST(YieldSolverTest, AccruedOverrideOrHalfCoupon) {
    const auto plain = test_helpers::short_ofz();
    const auto acc = accrued_interest(plain, kSettle);
    ASSERT_TRUE(acc.has_value());
    EXPECT_DOUBLE_EQ(*acc, 20.38);   // half of 40.75, rounded

    const auto quoted = make_bond("Q", 8.15, d("2027-02-03"), 1000.0, 2,
                                  std::nullopt, DayCountBasis::ActAct, 4.92);
    EXPECT_DOUBLE_EQ(*accrued_interest(quoted, kSettle), 4.92);
}

// ===========================================================================
// approximate_ytm / yields_from_prices
// ===========================================================================

TEST(YieldSolverTest, ApproximateYtmClosedForm) {
    EXPECT_DOUBLE_EQ(approximate_ytm(86.579, test_helpers::short_ofz(), kSettle), 16.18);
}

TEST(YieldSolverTest, ApproximateYtmAfterMaturityIsCoupon) {
    EXPECT_DOUBLE_EQ(approximate_ytm(99.0, test_helpers::short_ofz(), d("2027-05-01")), 8.15);
}

TEST(YieldSolverTest, YieldsFromPricesCountsFailures) {
    TimeSeries prices = {
        {"2025-02-27 00:00:00", 86.579},
        {"2025-02-28 00:00:00", std::numeric_limits<double>::quiet_NaN()},
        {"not a date", 90.0},
        {"2027-03-01 00:00:00", 99.0},   // matured
    };
    const auto conv = yields_from_prices(prices, test_helpers::short_ofz());
    ASSERT_EQ(conv.yields.size(), 1u);
    EXPECT_EQ(conv.failed, 3u);
    EXPECT_EQ(conv.yields[0].Time, "2025-02-27 00:00:00");
    EXPECT_NEAR(conv.yields[0].value, 17.2, 1.0);
}
