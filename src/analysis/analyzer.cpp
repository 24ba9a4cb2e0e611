#include "analysis/analyzer.hpp"
#include <spdlog/spdlog.h>
#include "indicators/sma_ema.hpp"
#include "indicators/rsi.hpp"
#include "indicators/atr.hpp"
#include "patterns/candlestick.hpp"
#include "patterns/chart_patterns.hpp"

namespace analysis {

IndicatorSet compute_indicators(const std::vector<double>& prices,
                                const std::vector<double>& high,
                                const std::vector<double>& low,
                                const std::vector<double>& close,
                                const AnalysisConfig& cfg){
    const auto& p = cfg.indicators;
    IndicatorSet out{p,
                     ind::ema_series(prices, p.ema_fast),
                     ind::ema_series(prices, p.ema_slow),
                     ind::rsi_series(prices, p.rsi_period),
                     ind::atr_series(high, low, close, p.atr_period)};
    spdlog::debug("indicators: {} prices, ema {}/{}, rsi {}, atr {}",
                  prices.size(), p.ema_fast, p.ema_slow, p.rsi_period, p.atr_period);
    return out;
}

PatternSet detect_patterns(const std::vector<Candle>& candles, const AnalysisConfig& cfg){
    PatternSet ps;
    std::size_t hits = 0;
    for (const auto& p : pat::default_patterns(cfg.patterns)){
        auto flags = pat::scan(*p, candles);
        for (bool f : flags) hits += f ? 1 : 0;
        ps.flags[p->id()] = std::move(flags);
    }
    spdlog::debug("patterns: {} candles, {} matches", candles.size(), hits);
    return ps;
}

StructureReport analyze_structure(const std::vector<Candle>& candles, const AnalysisConfig& cfg){
    const std::size_t n = candles.size();
    StructureReport r;

    auto sp = smc::swing_points(highs(candles), lows(candles), cfg.structure.pivot_legs);
    r.swing_highs = std::move(sp.highs);
    r.swing_lows  = std::move(sp.lows);

    r.fvg_zones = smc::fair_value_gaps(candles);
    auto fvg = smc::project(r.fvg_zones, n);
    r.fvg_bullish = std::move(fvg.bullish);
    r.fvg_bearish = std::move(fvg.bearish);

    r.ob_zones = smc::order_blocks(candles);
    auto ob = smc::project(r.ob_zones, n);
    r.ob_bullish = std::move(ob.bullish);
    r.ob_bearish = std::move(ob.bearish);

    r.sweeps = smc::liquidity_sweeps(candles, cfg.structure.sweep_lookback);
    auto sw = smc::project(r.sweeps, n);
    r.sweep_bullish = std::move(sw.bullish);
    r.sweep_bearish = std::move(sw.bearish);

    const double price = candles.empty() ? 0.0 : candles.back().close;
    r.sr_zones = sr::identify_zones(r.swing_highs, r.swing_lows, price, cfg.zones);
    r.nearest_support    = sr::nearest_zone(r.sr_zones, sr::ZoneType::Support);
    r.nearest_resistance = sr::nearest_zone(r.sr_zones, sr::ZoneType::Resistance);

    r.double_top         = pat::double_top(candles, r.swing_highs, cfg.chart_patterns);
    r.double_bottom      = pat::double_bottom(candles, r.swing_lows, cfg.chart_patterns);
    r.head_shoulders     = pat::head_and_shoulders(candles, r.swing_highs, cfg.chart_patterns);
    r.inv_head_shoulders = pat::inverse_head_and_shoulders(candles, r.swing_lows, cfg.chart_patterns);

    spdlog::debug("structure: {} candles, {} fvg, {} ob, {} sweeps, {} sr zones",
                  n, r.fvg_zones.size(), r.ob_zones.size(), r.sweeps.size(), r.sr_zones.size());
    return r;
}

} // namespace analysis
