#include "io/json_codec.hpp"
#include <fmt/format.h>

using json = nlohmann::json;

namespace smc {
void to_json(json& j, const FvgZone& z){
    j = json{{"zone_type", to_string(z.bias)}, {"top", z.top}, {"bottom", z.bottom},
             {"index", z.index}, {"gap_size", z.gap_size}};
}
void to_json(json& j, const OrderBlock& z){
    j = json{{"zone_type", to_string(z.bias)}, {"top", z.top}, {"bottom", z.bottom},
             {"index", z.index}};
}
void to_json(json& j, const LiquiditySweep& s){
    j = json{{"bias", to_string(s.bias)}, {"index", s.index}, {"level", s.level}};
}
} // namespace smc

namespace sr {
void to_json(json& j, const SrZone& z){
    j = json{{"level", z.level}, {"zone_type", to_string(z.type)}, {"strength", z.strength},
             {"top", z.top}, {"bottom", z.bottom}, {"distance", z.distance}};
}
} // namespace sr

namespace io {

static json zone_or_null(const std::optional<sr::SrZone>& z){
    return z ? json(*z) : json(nullptr);
}

static json series_json(const ind::Series& s, bool undefined_as_null){
    json a = json::array();
    for (const auto& v : s){
        if (v) a.push_back(*v);
        else if (undefined_as_null) a.push_back(nullptr);
        else a.push_back(0.0);
    }
    return a;
}

json levels_json(const smc::Levels& levels){
    json a = json::array();
    for (const auto& v : levels){
        if (v) a.push_back(*v); else a.push_back(nullptr);
    }
    return a;
}

json indicators_json(const analysis::IndicatorSet& s, const OutputConfig& out){
    const auto& p = s.periods;
    json j = json::object();
    j[fmt::format("ema_{}", p.ema_fast)] = series_json(s.ema_fast, out.undefined_as_null);
    j[fmt::format("ema_{}", p.ema_slow)] = series_json(s.ema_slow, out.undefined_as_null);
    j[fmt::format("rsi_{}", p.rsi_period)] = series_json(s.rsi, out.undefined_as_null);
    j[fmt::format("atr_{}", p.atr_period)] = series_json(s.atr, out.undefined_as_null);
    return j;
}

} // namespace io

namespace analysis {
void to_json(json& j, const PatternSet& p){
    j = json::object();
    for (const auto& [id, flags] : p.flags) j[id] = flags;
}

void to_json(json& j, const StructureReport& r){
    j = json{
        {"swing_highs",   io::levels_json(r.swing_highs)},
        {"swing_lows",    io::levels_json(r.swing_lows)},
        {"fvg_bullish",   r.fvg_bullish},
        {"fvg_bearish",   r.fvg_bearish},
        {"ob_bullish",    r.ob_bullish},
        {"ob_bearish",    r.ob_bearish},
        {"sweep_bullish", r.sweep_bullish},
        {"sweep_bearish", r.sweep_bearish},
        {"fvg_zones",     r.fvg_zones},
        {"ob_zones",      r.ob_zones},
        {"sr_zones",      r.sr_zones},
        {"sweeps",        r.sweeps},
        {"double_top",         r.double_top},
        {"double_bottom",      r.double_bottom},
        {"head_shoulders",     r.head_shoulders},
        {"inv_head_shoulders", r.inv_head_shoulders},
        {"nearest_support",    io::zone_or_null(r.nearest_support)},
        {"nearest_resistance", io::zone_or_null(r.nearest_resistance)},
    };
}
} // namespace analysis
