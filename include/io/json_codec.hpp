#pragma once
#include <nlohmann/json.hpp>
#include "analysis/analyzer.hpp"

namespace smc {
void to_json(nlohmann::json& j, const FvgZone& z);
void to_json(nlohmann::json& j, const OrderBlock& z);
void to_json(nlohmann::json& j, const LiquiditySweep& s);
} // namespace smc

namespace sr {
void to_json(nlohmann::json& j, const SrZone& z);
} // namespace sr

namespace analysis {
void to_json(nlohmann::json& j, const PatternSet& p);
void to_json(nlohmann::json& j, const StructureReport& r);
} // namespace analysis

namespace io {

// Keys ema_<fast>, ema_<slow>, rsi_<period>, atr_<period>
nlohmann::json indicators_json(const analysis::IndicatorSet& s, const OutputConfig& out = {});

// number-or-null array
nlohmann::json levels_json(const smc::Levels& levels);

} // namespace io
