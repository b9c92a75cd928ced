#include "bondspread/DataOrdering.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <stdexcept>
#include <utility>

#include <boost/date_time/gregorian/gregorian.hpp>

namespace bondspread {

namespace bg = boost::gregorian;

// ---------------------------
// Utilità interne
// ---------------------------

static bool is_space_like(unsigned char c){
    return std::isspace(c) != 0;
}

// NBSP as UTF-8 (C2 A0) + spazi standard
static std::string trim_spaces(const std::string& s){
    auto nbsp_at = [&](size_t k){
        return k + 1 < s.size() && (unsigned char)s[k] == 0xC2 && (unsigned char)s[k+1] == 0xA0;
    };
    size_t i=0, j=s.size();
    for (;;){
        if (i<j && is_space_like((unsigned char)s[i])) ++i;
        else if (i+1<j && nbsp_at(i)) i += 2;
        else break;
    }
    for (;;){
        if (j>i && is_space_like((unsigned char)s[j-1])) --j;
        else if (j>=i+2 && nbsp_at(j-2)) j -= 2;
        else break;
    }
    return s.substr(i, j-i);
}

static bool looks_like_iso(const std::string& s){
    if (s.size() < 10) return false;
    return std::isdigit((unsigned char)s[0]) &&
           std::isdigit((unsigned char)s[1]) &&
           std::isdigit((unsigned char)s[2]) &&
           std::isdigit((unsigned char)s[3]) &&
           s[4]=='-' && s[7]=='-';
}

static std::string pad2(int x){ char buf[8]; std::snprintf(buf, sizeof(buf), "%02d", x); return buf; }
static std::string pad4(int x){ char buf[8]; std::snprintf(buf, sizeof(buf), "%04d", x); return buf; }

static int yy_to_yyyy(int yy){ return (yy <= 69) ? (2000 + yy) : (1900 + yy); }

// digits only; anything wider than a year reads as -1 (rejected later as a date)
static int to_int(const std::string& digits){
    return digits.size() > 6 ? -1 : std::stoi(digits);
}

static std::vector<int> split_numbers(const std::string& s, const std::string& seps){
    std::vector<int> out; out.reserve(3);
    std::string cur;
    for (char c : s){
        if (seps.find(c) != std::string::npos){
            if (!cur.empty()){ out.push_back(to_int(cur)); cur.clear(); }
        } else if (std::isdigit((unsigned char)c)) {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(to_int(cur));
    return out;
}

static std::string time_part_to_iso(const std::string& time){
    int H=0, M=0, S=0;
    auto t = split_numbers(time, ": ");
    if (!t.empty())   H = t[0];
    if (t.size()>=2)  M = t[1];
    if (t.size()>=3)  S = t[2];
    return pad2(H) + ":" + pad2(M) + ":" + pad2(S);
}

// ---------------------------
// Date / time
// ---------------------------

std::string to_iso_datetime(const std::string& raw){
    std::string s = trim_spaces(raw);
    if (s.empty()) return s;

    if (looks_like_iso(s)) {
        if (s.size()==10) return s + " 00:00:00";
        std::string date = s.substr(0, 10);
        std::string time = trim_spaces(s.substr(11));
        // strip fractional seconds / zone suffix
        size_t cut = time.find_first_of(".Z+");
        if (cut != std::string::npos) time = time.substr(0, cut);
        return date + " " + time_part_to_iso(time);
    }

    std::string date, time;
    {
        size_t sp = s.find(' ');
        if (sp == std::string::npos) { date = s; time = "00:00:00"; }
        else { date = s.substr(0, sp); time = trim_spaces(s.substr(sp+1)); }
    }

    auto parts = split_numbers(date, "/-.");
    if (parts.size() < 3) return s;
    int d = parts[0], m = parts[1], y = parts[2];
    // no day exceeds 31: a wider leading field is the year (YYYY/MM/DD, YYYY.MM.DD)
    if (d > 31) std::swap(d, y);
    if (d < 1 || d > 31 || m < 1 || m > 12 || y < 0) return s;
    if (y < 100) y = yy_to_yyyy(y);

    return pad4(y) + "-" + pad2(m) + "-" + pad2(d) + " " + time_part_to_iso(time);
}

bg::date parse_date(const std::string& s){
    const std::string iso = to_iso_datetime(s);
    if (!looks_like_iso(iso))
        throw std::invalid_argument("Invalid date: '" + s + "'");
    try {
        const int y = std::stoi(iso.substr(0, 4));
        const int m = std::stoi(iso.substr(5, 2));
        const int d = std::stoi(iso.substr(8, 2));
        return bg::date(static_cast<unsigned short>(y),
                        static_cast<unsigned short>(m),
                        static_cast<unsigned short>(d));
    } catch (const std::out_of_range&) {
        // bad_year / bad_month / bad_day_of_month derive from std::out_of_range
        throw std::invalid_argument("Invalid date: '" + s + "'");
    }
}

std::string format_date(const bg::date& d){
    return bg::to_iso_extended_string(d);
}

long days_between(const std::string& a, const std::string& b){
    return (parse_date(b) - parse_date(a)).days();
}

std::string add_months_iso(const std::string& iso_time, int months){
    const std::string iso = to_iso_datetime(iso_time);
    if (!looks_like_iso(iso)) return iso_time;
    // boost snaps to month end when the source day does not exist
    bg::date d = parse_date(iso) + bg::months(months);
    return format_date(d) + iso.substr(10);
}

bool iso_less(const std::string& a, const std::string& b){
    return a < b;
}

// ---------------------------
// Ordering
// ---------------------------

TimeSeries sort_and_dedup(TimeSeries series){
    std::stable_sort(series.begin(), series.end(), [](const SeriesPoint& a, const SeriesPoint& b){
        return iso_less(a.Time, b.Time);
    });
    TimeSeries out; out.reserve(series.size());
    for (auto& p : series){
        if (!out.empty() && out.back().Time == p.Time) out.back() = p;
        else out.push_back(p);
    }
    return out;
}

template <class Row>
static std::vector<Row> filter_rows(const std::vector<Row>& rows,
                                    const std::optional<std::string>& start,
                                    const std::optional<std::string>& end){
    if (!start && !end) return rows;
    const std::string s = start ? to_iso_datetime(*start) : std::string();
    const std::string e = end   ? to_iso_datetime(*end)   : std::string();

    std::vector<Row> out; out.reserve(rows.size());
    for (const auto& r : rows){
        if (start && iso_less(r.Time, s)) continue;
        if (end   && !iso_less(r.Time, e)) continue;
        out.push_back(r);
    }
    return out;
}

TimeSeries filter_by_date(const TimeSeries& series,
                          const std::optional<std::string>& start,
                          const std::optional<std::string>& end){
    return filter_rows(series, start, end);
}

SpreadTable filter_by_date(const SpreadTable& table,
                           const std::optional<std::string>& start,
                           const std::optional<std::string>& end){
    return filter_rows(table, start, end);
}

std::vector<double> values_of(const TimeSeries& series){
    std::vector<double> out; out.reserve(series.size());
    for (const auto& p : series) out.push_back(p.value);
    return out;
}

std::vector<double> spreads_of(const SpreadTable& table){
    std::vector<double> out; out.reserve(table.size());
    for (const auto& r : table) out.push_back(r.spread_bp);
    return out;
}

std::vector<double> tail_window(const std::vector<double>& v, size_t lookback){
    std::vector<double> clean; clean.reserve(v.size());
    for (double x : v) if (!std::isnan(x)) clean.push_back(x);
    if (lookback == 0 || clean.size() <= lookback) return clean;
    return std::vector<double>(clean.end() - static_cast<std::ptrdiff_t>(lookback), clean.end());
}

// ---------------------------
// Numeric
// ---------------------------

double percentile(std::vector<double> v, double p){
    if (v.empty()) return NAN;
    std::sort(v.begin(), v.end());
    double idx = (p/100.0) * (v.size()-1);
    size_t i = static_cast<size_t>(std::floor(idx));
    size_t j = static_cast<size_t>(std::ceil(idx));
    if (i==j) return v[i];
    double w = idx - i;
    return (1.0 - w)*v[i] + w*v[j];
}

double round_to(double x, int decimals){
    if (!std::isfinite(x)) return x;
    const double scale = std::pow(10.0, decimals);
    return std::round(x * scale) / scale;
}

} // namespace bondspread
