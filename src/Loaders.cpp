#include "bondspread/Loaders.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace bondspread {

// --------------------- helpers base ---------------------
static bool is_space_like(unsigned char c){
    return std::isspace(c) != 0;
}

// UTF-8 NBSP (C2 A0); a lone A0 may be the tail of another character (Cyrillic "Р" is D0 A0)
static bool nbsp_at(const std::string& s, size_t i){
    return i + 1 < s.size() && (unsigned char)s[i] == 0xC2 && (unsigned char)s[i+1] == 0xA0;
}

static std::string trim_spaces(const std::string& s){
    size_t i=0, j=s.size();
    for (;;){
        if (i<j && is_space_like((unsigned char)s[i])) ++i;
        else if (i+1<j && nbsp_at(s, i)) i += 2;
        else break;
    }
    for (;;){
        if (j>i && is_space_like((unsigned char)s[j-1])) --j;
        else if (j>=i+2 && nbsp_at(s, j-2)) j -= 2;
        else break;
    }
    return s.substr(i, j-i);
}

static std::vector<std::string> split_with_delim(const std::string& line, char delim){
    std::vector<std::string> out; out.reserve(16);
    std::string cur; bool in_quotes=false;
    for (char ch : line){
        if (ch=='"'){ in_quotes=!in_quotes; continue; }
        if (ch==delim && !in_quotes){ out.push_back(trim_spaces(cur)); cur.clear(); }
        else cur.push_back(ch);
    }
    out.push_back(trim_spaces(cur));
    return out;
}

// the header decides the delimiter for the whole file
static char detect_delim(const std::string& header){
    const auto a = split_with_delim(header, ',');
    const auto b = split_with_delim(header, ';');
    return (b.size() > a.size()) ? ';' : ',';
}

static std::string to_lower(std::string s){
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

static size_t need_index(const std::vector<std::string>& headers, const std::string& name,
                         const std::string& filepath){
    for (size_t i=0;i<headers.size();++i)
        if (headers[i] == name) return i;
    throw std::runtime_error("Missing column '" + name + "' in " + filepath);
}

static bool to_double(std::string s, double& out){
    for (char& ch : s) if (ch==',') ch='.';           // virgola -> punto
    // separatori delle migliaia: spazi e NBSP
    std::string compact; compact.reserve(s.size());
    for (size_t i=0; i<s.size(); ++i){
        if (nbsp_at(s, i)) { ++i; continue; }
        if (s[i]==' ' || s[i]=='\t') continue;
        compact.push_back(s[i]);
    }
    s.swap(compact);
    if (s.empty()) return false;
    const std::string up = to_lower(s);
    if (up=="nan" || up=="na" || up=="null") return false;
    try {
        size_t idx=0;
        out = std::stod(s, &idx);
        return idx == s.size();
    } catch (const std::logic_error&) {
        // std::invalid_argument / std::out_of_range from stod
        return false;
    }
}

// --------------------- funzione principale ---------------------
TimeSeries load_series_csv(
    const std::string& filepath,
    const std::string& time_col,
    const std::string& value_col
){
    std::ifstream fin(filepath);
    if (!fin.is_open()) throw std::runtime_error("Cannot open CSV: " + filepath);

    std::string line;
    while (std::getline(fin, line)){
        if (!line.empty() && line.back()=='\r') line.pop_back();
        if (!trim_spaces(line).empty()) break;
    }
    if (trim_spaces(line).empty()) throw std::runtime_error("Empty CSV: " + filepath);

    // UTF-8 BOM
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);

    const char delim = detect_delim(line);
    const std::vector<std::string> headers = split_with_delim(line, delim);

    std::string time_name = time_col;
    if (time_col == "*"){
        for (const auto& h : headers){
            const std::string l = to_lower(h);
            if (l.find("time") != std::string::npos || l.find("date") != std::string::npos){
                time_name = h; break;
            }
        }
        if (time_name == "*")
            throw std::runtime_error("Auto time_col failed: no time/date column in " + filepath);
    }

    const size_t tcol = need_index(headers, time_name, filepath);
    const size_t vcol = need_index(headers, value_col, filepath);

    TimeSeries out;
    while (std::getline(fin, line)){
        if (!line.empty() && line.back()=='\r') line.pop_back();
        if (trim_spaces(line).empty()) continue;
        const auto cols = split_with_delim(line, delim);
        if (cols.size() <= std::max(tcol, vcol)) continue;

        SeriesPoint p;
        p.Time = to_iso_datetime(cols[tcol]);
        try {
            parse_date(p.Time);
        } catch (const std::invalid_argument&) {
            continue;   // unreadable timestamp
        }
        if (!to_double(cols[vcol], p.value)) continue;
        out.push_back(std::move(p));
    }

    return sort_and_dedup(std::move(out));
}

std::string bond_series_path(const std::string& data_dir, const std::string& isin){
    if (data_dir.empty()) return isin + ".csv";
    const char last = data_dir.back();
    return (last == '/' || last == '\\') ? data_dir + isin + ".csv"
                                         : data_dir + "/" + isin + ".csv";
}

} // namespace bondspread
