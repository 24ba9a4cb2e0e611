#include "core/config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

using json = nlohmann::json;

namespace {

template <class T>
void read(const json& section, const char* key, T& field, const char* where){
    if (!section.contains(key)) return;
    if constexpr (std::is_same_v<T, std::size_t>) {
        // get<size_t> would wrap a negative number
        if (!section.at(key).is_number_unsigned())
            throw std::runtime_error(fmt::format("config {}.{}: expected a non-negative integer", where, key));
    }
    try {
        field = section.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(fmt::format("config {}.{}: {}", where, key, e.what()));
    }
}

const json& section_of(const json& root, const char* name){
    static const json empty = json::object();
    if (!root.contains(name)) return empty;
    const json& s = root.at(name);
    if (!s.is_object())
        throw std::runtime_error(fmt::format("config section '{}' must be an object", name));
    return s;
}

} // namespace

void validate(const AnalysisConfig& c){
    const auto& i = c.indicators;
    if (i.ema_fast == 0 || i.ema_slow == 0 || i.rsi_period == 0 || i.atr_period == 0)
        throw std::invalid_argument("indicator periods must be positive");
    if (i.ema_fast == i.ema_slow)
        throw std::invalid_argument(fmt::format("ema_fast and ema_slow are both {}", i.ema_fast));
    const auto& p = c.patterns;
    if (p.wick_body_ratio < 0 || p.opposite_wick_ratio < 0 || p.doji_body_ratio < 0 ||
        p.doji_wick_ratio < 0 || p.star_body_ratio < 0)
        throw std::invalid_argument("pattern ratios must be non-negative");
    const auto& cp = c.chart_patterns;
    if (cp.tolerance < 0 || cp.min_retrace < 0 || cp.min_head < 0)
        throw std::invalid_argument("chart pattern ratios must be non-negative");
    if (cp.max_swings == 0) throw std::invalid_argument("chart pattern max_swings must be positive");
    if (c.structure.pivot_legs > kMaxWindow || c.structure.sweep_lookback > kMaxWindow)
        throw std::invalid_argument(fmt::format("pivot_legs and sweep_lookback must not exceed {}", kMaxWindow));
    if (c.zones.tolerance < 0) throw std::invalid_argument("zone tolerance must be non-negative");
    if (c.zones.min_touches == 0) throw std::invalid_argument("zone min_touches must be positive");
    if (c.zones.max_zones == 0) throw std::invalid_argument("zone max_zones must be positive");
}

AnalysisConfig parse_config(const std::string& text){
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(fmt::format("config parse error: {}", e.what()));
    }
    if (!root.is_object()) throw std::runtime_error("config root must be an object");

    AnalysisConfig cfg;
    const json& ic = section_of(root, "indicators");
    read(ic, "ema_fast",   cfg.indicators.ema_fast,   "indicators");
    read(ic, "ema_slow",   cfg.indicators.ema_slow,   "indicators");
    read(ic, "rsi_period", cfg.indicators.rsi_period, "indicators");
    read(ic, "atr_period", cfg.indicators.atr_period, "indicators");

    const json& pc = section_of(root, "patterns");
    read(pc, "wick_body_ratio",     cfg.patterns.wick_body_ratio,     "patterns");
    read(pc, "opposite_wick_ratio", cfg.patterns.opposite_wick_ratio, "patterns");
    read(pc, "doji_body_ratio",     cfg.patterns.doji_body_ratio,     "patterns");
    read(pc, "doji_wick_ratio",     cfg.patterns.doji_wick_ratio,     "patterns");
    read(pc, "star_body_ratio",     cfg.patterns.star_body_ratio,     "patterns");

    const json& cp = section_of(root, "chart_patterns");
    read(cp, "tolerance",   cfg.chart_patterns.tolerance,   "chart_patterns");
    read(cp, "min_retrace", cfg.chart_patterns.min_retrace, "chart_patterns");
    read(cp, "min_head",    cfg.chart_patterns.min_head,    "chart_patterns");
    read(cp, "max_swings",  cfg.chart_patterns.max_swings,  "chart_patterns");

    const json& st = section_of(root, "structure");
    read(st, "pivot_legs",     cfg.structure.pivot_legs,     "structure");
    read(st, "sweep_lookback", cfg.structure.sweep_lookback, "structure");

    const json& zn = section_of(root, "zones");
    read(zn, "tolerance",   cfg.zones.tolerance,   "zones");
    read(zn, "min_touches", cfg.zones.min_touches, "zones");
    read(zn, "max_zones",   cfg.zones.max_zones,   "zones");

    const json& out = section_of(root, "output");
    read(out, "undefined_as_null", cfg.output.undefined_as_null, "output");

    validate(cfg);
    return cfg;
}

AnalysisConfig load_config(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error(fmt::format("cannot open config file: {}", path));
    std::stringstream ss; ss << f.rdbuf();
    auto cfg = parse_config(ss.str());
    spdlog::info("config loaded from {} (ema {}/{}, rsi {}, atr {}, legs {}, lookback {})",
                 path, cfg.indicators.ema_fast, cfg.indicators.ema_slow,
                 cfg.indicators.rsi_period, cfg.indicators.atr_period,
                 cfg.structure.pivot_legs, cfg.structure.sweep_lookback);
    return cfg;
}
