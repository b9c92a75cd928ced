#include "bondspread/Config.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace bondspread {

namespace bg = boost::gregorian;
namespace pt = boost::property_tree;

std::string to_string(InputMode m){
    return m == InputMode::Price ? "price" : "ytm";
}

InputMode parse_input_mode(const std::string& s){
    std::string l = s;
    for (char& c : l) c = (char)std::tolower((unsigned char)c);
    if (l == "ytm")   return InputMode::Ytm;
    if (l == "price") return InputMode::Price;
    throw std::runtime_error("Unknown input mode: '" + s + "' (expected ytm or price)");
}

// ---------------------------
// Defaults
// ---------------------------

AppConfig default_app_config(){
    struct Row { const char* isin; const char* name; const char* maturity; double coupon; const char* issue; };
    static const Row ofz[] = {
        {"SU26221RMFS0", "OFZ 26221", "2033-03-23",  7.70, "2017-02-15"},
        {"SU26225RMFS1", "OFZ 26225", "2034-05-10",  7.25, "2018-02-21"},
        {"SU26230RMFS1", "OFZ 26230", "2039-03-16",  7.70, "2019-06-05"},
        {"SU26238RMFS4", "OFZ 26238", "2041-05-15",  7.10, "2021-06-16"},
        {"SU26240RMFS0", "OFZ 26240", "2036-07-30",  7.00, "2021-06-30"},
        {"SU26241RMFS8", "OFZ 26241", "2032-11-17",  9.50, "2022-11-16"},
        {"SU26243RMFS4", "OFZ 26243", "2038-05-19",  9.80, "2023-06-21"},
        {"SU26244RMFS2", "OFZ 26244", "2034-03-15", 11.25, "2023-10-25"},
        {"SU26245RMFS9", "OFZ 26245", "2035-09-26", 12.00, "2024-05-15"},
        {"SU26246RMFS7", "OFZ 26246", "2036-03-12", 12.00, "2024-05-15"},
        {"SU26247RMFS5", "OFZ 26247", "2039-05-11", 12.25, "2024-05-15"},
        {"SU26248RMFS3", "OFZ 26248", "2040-05-16", 12.25, "2024-05-15"},
        {"SU26250RMFS9", "OFZ 26250", "2037-06-10", 12.00, "2025-06-25"},
        {"SU26252RMFS5", "OFZ 26252", "2033-10-12", 12.50, "2025-10-22"},
        {"SU26253RMFS3", "OFZ 26253", "2038-10-06", 13.00, "2025-10-22"},
        {"SU26254RMFS1", "OFZ 26254", "2040-10-03", 13.00, "2025-10-22"},
    };

    AppConfig cfg;
    for (const auto& r : ofz){
        cfg.bonds.push_back(make_bond(
            r.isin, r.coupon, parse_date(r.maturity),
            1000.0, 2, parse_date(r.issue),
            DayCountBasis::ActAct, std::nullopt, r.name
        ));
    }
    cfg.pairs = {
        {"SU26221RMFS0", "SU26225RMFS1"},
        {"SU26230RMFS1", "SU26238RMFS4"},
        {"SU26240RMFS0", "SU26241RMFS8"},
        {"SU26243RMFS4", "SU26244RMFS2"},
    };
    return cfg;
}

// ---------------------------
// INI overlay
// ---------------------------

namespace {

struct Section {
    const pt::ptree& tree;
    std::string name;
    std::string file;

    std::runtime_error error(const std::string& key, const std::string& msg) const {
        return std::runtime_error(file + ": [" + name + "] " + key + ": " + msg);
    }

    std::optional<std::string> raw(const std::string& key) const {
        // literal lookup, no path splitting
        auto it = tree.find(key);
        if (it == tree.not_found()) return std::nullopt;
        return it->second.data();
    }

    template <class T>
    void read(const std::string& key, T& field) const {
        auto v = raw(key);
        if (!v) return;
        try {
            field = boost::lexical_cast<T>(*v);
        } catch (const boost::bad_lexical_cast&) {
            throw error(key, "invalid value '" + *v + "'");
        }
    }

    void read_count(const std::string& key, size_t& field) const {
        long v = static_cast<long>(field);
        read(key, v);
        if (v < 0) throw error(key, "must not be negative");
        field = static_cast<size_t>(v);
    }

    void read_date(const std::string& key, std::optional<bg::date>& field) const {
        auto v = raw(key);
        if (!v) return;
        if (v->empty()) { field.reset(); return; }
        try {
            field = parse_date(*v);
        } catch (const std::invalid_argument& e) {
            throw error(key, e.what());
        }
    }
};

void overlay_signals(const Section& s, SignalConfig& c){
    s.read("percentile_entry_low",  c.percentile_entry_low);
    s.read("percentile_entry_mid",  c.percentile_entry_mid);
    s.read("percentile_exit_mid",   c.percentile_exit_mid);
    s.read("percentile_exit_high",  c.percentile_exit_high);
    s.read("min_confidence",        c.min_confidence);
    s.read("zscore_threshold",      c.zscore_threshold);
    s.read_count("lookback_days",   c.lookback_days);
    s.read_count("min_observations", c.min_observations);
    s.read("signal_expiry_hours",   c.signal_expiry_hours);
}

void overlay_backtest(const Section& s, BacktestConfig& c){
    s.read("initial_capital",       c.initial_capital);
    s.read("position_size_pct",     c.position_size_pct);
    s.read("commission_rate",       c.commission_rate);
    s.read("spread_cost_bp",        c.spread_cost_bp);
    s.read("max_holding_days",      c.max_holding_days);
    s.read("stop_loss_bp",          c.stop_loss_bp);
    s.read("take_profit_bp",        c.take_profit_bp);
    s.read("entry_percentile_low",  c.entry_percentile_low);
    s.read("entry_percentile_high", c.entry_percentile_high);
    s.read("exit_percentile",       c.exit_percentile);
    s.read_count("min_history_days",       c.min_history_days);
    s.read_count("percentile_window",      c.percentile_window);
    s.read_count("percentile_min_periods", c.percentile_min_periods);
}

void overlay_solver(const Section& s, SolverConfig& c){
    s.read("max_iterations",     c.max_iterations);
    s.read("tolerance",          c.tolerance);
    s.read("fallback_tolerance", c.fallback_tolerance);
    s.read("lower_bound",        c.lower_bound);
    s.read("upper_bound",        c.upper_bound);
    s.read("newton_guess",       c.newton_guess);
}

void overlay_data(const Section& s, AppConfig& c){
    s.read("data_dir",   c.data_dir);
    s.read("output_dir", c.output_dir);
    if (auto v = s.raw("input")){
        try {
            c.input = parse_input_mode(*v);
        } catch (const std::runtime_error& e) {
            throw s.error("input", e.what());
        }
    }
    s.read_date("start_date", c.start_date);
    s.read_date("end_date",   c.end_date);
}

BondParams read_bond(const Section& s, const std::string& isin){
    const BondParams defaults;

    std::string name;
    double face_value = defaults.face_value;
    double coupon_rate = 0.0;
    int coupon_frequency = defaults.coupon_frequency;
    std::optional<bg::date> maturity, issue;
    std::string day_count = to_string(defaults.day_count);
    std::optional<double> accrued;

    s.read("name", name);
    s.read("face_value", face_value);
    s.read("coupon_rate", coupon_rate);
    s.read("coupon_frequency", coupon_frequency);
    s.read_date("maturity_date", maturity);
    s.read_date("issue_date", issue);
    s.read("day_count", day_count);
    if (s.raw("accrued_interest")){
        double a = 0.0;
        s.read("accrued_interest", a);
        accrued = a;
    }

    if (!maturity) throw s.error("maturity_date", "missing");
    try {
        return make_bond(isin, coupon_rate, *maturity, face_value, coupon_frequency,
                         issue, parse_day_count(day_count), accrued, name);
    } catch (const BondError& e) {
        throw s.error(isin, e.what());
    }
}

BondPair read_pair(const Section& s, const std::string& key, const std::string& value){
    const auto comma = value.find(',');
    if (comma == std::string::npos) throw s.error(key, "expected LONG_ISIN,SHORT_ISIN");

    auto trim = [](std::string x){
        x.erase(x.begin(), std::find_if(x.begin(), x.end(), [](unsigned char c){ return !std::isspace(c); }));
        x.erase(std::find_if(x.rbegin(), x.rend(), [](unsigned char c){ return !std::isspace(c); }).base(), x.end());
        return x;
    };
    BondPair p{trim(value.substr(0, comma)), trim(value.substr(comma + 1))};
    if (p.first.empty() || p.second.empty()) throw s.error(key, "expected LONG_ISIN,SHORT_ISIN");
    return p;
}

} // namespace

AppConfig load_app_config(const std::string& path){
    pt::ptree root;
    try {
        pt::ini_parser::read_ini(path, root);
    } catch (const pt::ini_parser_error& e) {
        throw std::runtime_error("Cannot read config " + path + ": " + e.message());
    }

    AppConfig cfg = default_app_config();
    std::vector<BondPair> pairs;
    bool has_pairs = false;

    for (const auto& [name, tree] : root){
        const Section s{tree, name, path};
        if (name == "signals")       overlay_signals(s, cfg.signals);
        else if (name == "backtest") overlay_backtest(s, cfg.backtest);
        else if (name == "solver")   overlay_solver(s, cfg.solver);
        else if (name == "data")     overlay_data(s, cfg);
        else if (name == "pairs"){
            has_pairs = true;
            for (const auto& [key, v] : tree) pairs.push_back(read_pair(s, key, v.data()));
        }
        else if (name.rfind("bond.", 0) == 0){
            BondParams b = read_bond(s, name.substr(5));
            auto it = std::find_if(cfg.bonds.begin(), cfg.bonds.end(),
                                   [&](const BondParams& x){ return x.isin == b.isin; });
            if (it != cfg.bonds.end()) *it = std::move(b);
            else cfg.bonds.push_back(std::move(b));
        }
        else {
            throw std::runtime_error(path + ": unknown section [" + name + "]");
        }
    }
    if (has_pairs) cfg.pairs = std::move(pairs);

    validate(cfg);
    return cfg;
}

void validate(const AppConfig& cfg){
    auto check_level = [](double p, const char* key){
        if (!(p >= 0.0 && p <= 100.0))
            throw std::runtime_error(std::string("Percentile level out of [0, 100]: ") + key);
    };
    const auto& s = cfg.signals;
    check_level(s.percentile_entry_low,  "signals.percentile_entry_low");
    check_level(s.percentile_entry_mid,  "signals.percentile_entry_mid");
    check_level(s.percentile_exit_mid,   "signals.percentile_exit_mid");
    check_level(s.percentile_exit_high,  "signals.percentile_exit_high");
    if (s.signal_expiry_hours < 0) throw std::runtime_error("signals.signal_expiry_hours must not be negative");

    const auto& b = cfg.backtest;
    check_level(b.entry_percentile_low,  "backtest.entry_percentile_low");
    check_level(b.entry_percentile_high, "backtest.entry_percentile_high");
    check_level(b.exit_percentile,       "backtest.exit_percentile");
    if (!(b.initial_capital > 0.0))  throw std::runtime_error("backtest.initial_capital must be positive");
    if (!(b.position_size_pct > 0.0 && b.position_size_pct <= 1.0))
        throw std::runtime_error("backtest.position_size_pct must be in (0, 1]");
    if (b.commission_rate < 0.0 || b.spread_cost_bp < 0.0)
        throw std::runtime_error("backtest costs must not be negative");
    if (b.percentile_window == 0) throw std::runtime_error("backtest.percentile_window must be positive");

    const auto& v = cfg.solver;
    if (!(v.lower_bound < v.upper_bound)) throw std::runtime_error("solver.lower_bound must be below solver.upper_bound");
    if (v.max_iterations <= 0) throw std::runtime_error("solver.max_iterations must be positive");
}

} // namespace bondspread
