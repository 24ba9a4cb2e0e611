#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/types.hpp"
#include "core/config.hpp"
#include "indicators/series.hpp"
#include "structure/smc.hpp"
#include "structure/swing_points.hpp"
#include "zones/sr_zones.hpp"

namespace analysis {

struct IndicatorSet {
    IndicatorConfig periods;
    ind::Series ema_fast;
    ind::Series ema_slow;
    ind::Series rsi;
    ind::Series atr;
};

// pattern id -> one flag per candle
struct PatternSet { std::unordered_map<std::string, std::vector<bool>> flags; };

struct StructureReport {
    smc::Levels swing_highs;
    smc::Levels swing_lows;
    std::vector<bool> fvg_bullish, fvg_bearish;
    std::vector<bool> ob_bullish, ob_bearish;
    std::vector<bool> sweep_bullish, sweep_bearish;
    std::vector<smc::FvgZone> fvg_zones;
    std::vector<smc::OrderBlock> ob_zones;
    std::vector<sr::SrZone> sr_zones;
    std::vector<smc::LiquiditySweep> sweeps;
    std::vector<bool> double_top, double_bottom;
    std::vector<bool> head_shoulders, inv_head_shoulders;
    std::optional<sr::SrZone> nearest_support, nearest_resistance;
};

// EMA/RSI over `prices`, ATR over high/low/close. Arrays are expected to have
// equal length.
IndicatorSet compute_indicators(const std::vector<double>& prices,
                                const std::vector<double>& high,
                                const std::vector<double>& low,
                                const std::vector<double>& close,
                                const AnalysisConfig& cfg = {});

PatternSet detect_patterns(const std::vector<Candle>& candles, const AnalysisConfig& cfg = {});

// SR zones are ranked against the close of the last candle.
StructureReport analyze_structure(const std::vector<Candle>& candles, const AnalysisConfig& cfg = {});

} // namespace analysis
