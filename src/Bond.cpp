#include "bondspread/Bond.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace bondspread {

std::string to_string(DayCountBasis basis){
    switch (basis){
    case DayCountBasis::ActAct:    return "ACT/ACT";
    case DayCountBasis::Act365:    return "ACT/365";
    case DayCountBasis::Act360:    return "ACT/360";
    case DayCountBasis::Thirty360: return "30/360";
    }
    return "ACT/ACT";
}

DayCountBasis parse_day_count(const std::string& s){
    std::string t;
    for (char c : s) if (!std::isspace((unsigned char)c)) t.push_back((char)std::toupper((unsigned char)c));
    if (t.empty() || t == "ACT/ACT" || t == "ACTUAL/ACTUAL") return DayCountBasis::ActAct;
    if (t == "ACT/365" || t == "ACTUAL/365")                 return DayCountBasis::Act365;
    if (t == "ACT/360" || t == "ACTUAL/360")                 return DayCountBasis::Act360;
    if (t == "30/360")                                       return DayCountBasis::Thirty360;
    throw BondError("Unknown day count basis: '" + s + "'");
}

void validate(const BondParams& b){
    if (b.isin.empty())
        throw BondError("Bond: ISIN must not be empty.");
    if (!std::isfinite(b.face_value) || b.face_value <= 0.0)
        throw BondError(b.isin + ": face value must be positive.");
    if (!std::isfinite(b.coupon_rate) || b.coupon_rate < 0.0)
        throw BondError(b.isin + ": coupon rate must be non-negative.");
    if (b.coupon_frequency != 1 && b.coupon_frequency != 2 &&
        b.coupon_frequency != 4 && b.coupon_frequency != 12)
        throw BondError(b.isin + ": coupon frequency must be 1, 2, 4 or 12.");
    if (b.maturity_date.is_special())
        throw BondError(b.isin + ": maturity date is required.");
    if (b.issue_date && (b.issue_date->is_special() || *b.issue_date >= b.maturity_date))
        throw BondError(b.isin + ": issue date must precede maturity.");
    if (b.accrued_interest && (!std::isfinite(*b.accrued_interest) || *b.accrued_interest < 0.0))
        throw BondError(b.isin + ": accrued interest must be non-negative.");
}

BondParams make_bond(
    const std::string& isin,
    double coupon_rate,
    const boost::gregorian::date& maturity_date,
    double face_value,
    int coupon_frequency,
    const std::optional<boost::gregorian::date>& issue_date,
    DayCountBasis day_count,
    std::optional<double> accrued_interest,
    const std::string& name
){
    BondParams b;
    b.isin             = isin;
    b.name             = name.empty() ? isin : name;
    b.face_value       = face_value;
    b.coupon_rate      = coupon_rate;
    b.coupon_frequency = coupon_frequency;
    b.maturity_date    = maturity_date;
    b.issue_date       = issue_date;
    b.day_count        = day_count;
    b.accrued_interest = accrued_interest;
    validate(b);
    return b;
}

std::string pair_key(const std::string& bond_long, const std::string& bond_short){
    return bond_long + "_" + bond_short;
}

std::string pair_key(const BondPair& pair){
    return pair_key(pair.first, pair.second);
}

const BondParams* find_bond(const std::vector<BondParams>& bonds, const std::string& isin){
    auto it = std::find_if(bonds.begin(), bonds.end(), [&](const BondParams& b){ return b.isin == isin; });
    return it == bonds.end() ? nullptr : &*it;
}

} // namespace bondspread
