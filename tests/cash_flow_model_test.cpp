// cash_flow_model_test.cpp: coupon schedule and bond parameter validation

#include <gtest/gtest.h>

#include "bondspread/Bond.hpp"
#include "bondspread/CashFlowModel.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <string>

using namespace bondspread;
using test_helpers::d;

// ===========================================================================
// BondParams / make_bond
// ===========================================================================

TEST(BondParamsTest, DefaultsMatchBulletOfz) {
    const auto b = make_bond("SU26218RMFS6", 8.15, d("2027-02-03"));
    EXPECT_DOUBLE_EQ(b.face_value, 1000.0);
    EXPECT_EQ(b.coupon_frequency, 2);
    EXPECT_EQ(b.day_count, DayCountBasis::ActAct);
    EXPECT_FALSE(b.accrued_interest.has_value());
    EXPECT_EQ(b.name, "SU26218RMFS6");
}

TEST(BondParamsTest, RejectsNonPositiveFaceValue) {
    EXPECT_THROW(make_bond("X", 5.0, d("2030-01-01"), 0.0), BondError);
    EXPECT_THROW(make_bond("X", 5.0, d("2030-01-01"), -1000.0), BondError);
}

TEST(BondParamsTest, RejectsNegativeCoupon) {
    EXPECT_THROW(make_bond("X", -0.5, d("2030-01-01")), BondError);
}

TEST(BondParamsTest, RejectsUnsupportedFrequency) {
    EXPECT_THROW(make_bond("X", 5.0, d("2030-01-01"), 1000.0, 3), BondError);
    EXPECT_NO_THROW(make_bond("X", 5.0, d("2030-01-01"), 1000.0, 4));
}

TEST(BondParamsTest, RejectsIssueAfterMaturityAndEmptyIsin) {
    EXPECT_THROW(make_bond("X", 5.0, d("2030-01-01"), 1000.0, 2, d("2031-01-01")), BondError);
    EXPECT_THROW(make_bond("", 5.0, d("2030-01-01")), BondError);
}

TEST(BondParamsTest, BondErrorIsInvalidArgument) {
    try {
        make_bond("X", 5.0, d("2030-01-01"), -1.0);
        FAIL() << "expected BondError";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("face value"), std::string::npos);
    }
}

TEST(BondParamsTest, DayCountRoundTrip) {
    EXPECT_EQ(parse_day_count("act/365"), DayCountBasis::Act365);
    EXPECT_EQ(parse_day_count(to_string(DayCountBasis::Thirty360)), DayCountBasis::Thirty360);
    EXPECT_THROW(parse_day_count("BUS/252"), BondError);
}

TEST(BondParamsTest, PairKeyJoinsIsins) {
    EXPECT_EQ(pair_key("A", "B"), "A_B");
    EXPECT_EQ(pair_key(BondPair{"SU1", "SU2"}), "SU1_SU2");
}

// ===========================================================================
// generate_cash_flows
// ===========================================================================

TEST(CashFlowModelTest, SemiAnnualScheduleRollsBackFromMaturity) {
    const auto bond = test_helpers::short_ofz();
    const auto flows = generate_cash_flows(bond, d("2025-02-27"));

    ASSERT_EQ(flows.size(), 4u);
    EXPECT_EQ(flows[0].date, d("2025-08-03"));
    EXPECT_EQ(flows[1].date, d("2026-02-03"));
    EXPECT_EQ(flows[2].date, d("2026-08-03"));
    EXPECT_EQ(flows[3].date, d("2027-02-03"));

    EXPECT_DOUBLE_EQ(flows[0].amount, 40.75);
    EXPECT_DOUBLE_EQ(flows[3].amount, 40.75 + 1000.0);
}

TEST(CashFlowModelTest, DatesStrictlyIncrease) {
    const auto bond = test_helpers::long_ofz();
    const auto flows = generate_cash_flows(bond, d("2025-01-15"));
    ASSERT_GT(flows.size(), 10u);
    for (size_t i = 1; i < flows.size(); ++i)
        EXPECT_LT(flows[i - 1].date, flows[i].date);
    EXPECT_EQ(flows.back().date, bond.maturity_date);
}

TEST(CashFlowModelTest, EmptyAtOrAfterMaturity) {
    const auto bond = test_helpers::short_ofz();
    EXPECT_TRUE(generate_cash_flows(bond, d("2027-02-03")).empty());
    EXPECT_TRUE(generate_cash_flows(bond, d("2028-01-01")).empty());
}

TEST(CashFlowModelTest, HandBuiltBondIsValidated) {
    BondParams b = test_helpers::short_ofz();
    b.coupon_frequency = 0;
    EXPECT_THROW(generate_cash_flows(b, d("2025-02-27")), BondError);

    b.coupon_frequency = 24;   // would step 0 months
    EXPECT_THROW(generate_cash_flows(b, d("2025-02-27")), BondError);

    BondParams unset;          // no ISIN, no maturity
    EXPECT_THROW(generate_cash_flows(unset, d("2025-02-27")), BondError);
}

TEST(CashFlowModelTest, NoFlowsOnOrBeforeIssueDate) {
    const auto bond = make_bond("NEW", 12.0, d("2027-06-01"), 1000.0, 2, d("2025-10-01"));
    const auto flows = generate_cash_flows(bond, d("2025-01-01"));
    ASSERT_FALSE(flows.empty());
    EXPECT_GT(flows.front().date, d("2025-10-01"));
    EXPECT_EQ(flows.front().date, d("2025-12-01"));
}

TEST(CashFlowModelTest, QuarterlyCouponSize) {
    const auto bond = make_bond("Q", 10.0, d("2026-12-31"), 1000.0, 4);
    const auto flows = generate_cash_flows(bond, d("2026-01-15"));
    ASSERT_EQ(flows.size(), 4u);
    EXPECT_DOUBLE_EQ(flows.front().amount, 25.0);
    // month-end maturity stays clamped to month ends
    EXPECT_EQ(flows.front().date, d("2026-03-31"));
}

TEST(CashFlowModelTest, YearFractionIsActual36525) {
    EXPECT_DOUBLE_EQ(year_fraction(d("2025-01-01"), d("2026-01-01")), 365.0 / 365.25);
    EXPECT_LT(year_fraction(d("2026-01-01"), d("2025-01-01")), 0.0);
}
