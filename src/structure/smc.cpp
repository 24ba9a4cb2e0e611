#include "structure/smc.hpp"
#include <algorithm>

namespace smc {

std::vector<FvgZone> fair_value_gaps(const std::vector<Candle>& c){
    std::vector<FvgZone> zones;
    for (std::size_t i=2; i<c.size(); ++i){
        const Candle& first = c[i-2];
        const Candle& third = c[i];
        if (third.low > first.high && is_bullish(third))
            zones.push_back({Bias::Bullish, third.low, first.high, i, third.low - first.high});
        if (third.high < first.low && is_bearish(third))
            zones.push_back({Bias::Bearish, first.low, third.high, i, first.low - third.high});
    }
    return zones;
}

std::vector<OrderBlock> order_blocks(const std::vector<Candle>& c){
    std::vector<OrderBlock> blocks;
    for (std::size_t i=1; i<c.size(); ++i){
        const Candle& block = c[i-1];
        const Candle& move  = c[i];
        // red block, green move closing above the block's open
        if (block.open > block.close && is_bullish(move) && move.close > block.open)
            blocks.push_back({Bias::Bullish, block.open, block.close, i-1});
        // green block, red move closing below the block's open
        if (block.close > block.open && move.open > move.close && move.close < block.open)
            blocks.push_back({Bias::Bearish, block.close, block.open, i-1});
    }
    return blocks;
}

std::vector<LiquiditySweep> liquidity_sweeps(const std::vector<Candle>& c, std::size_t lookback){
    std::vector<LiquiditySweep> sweeps;
    if (lookback == 0) return sweeps;
    for (std::size_t i=lookback; i<c.size(); ++i){
        double lo = c[i-lookback].low, hi = c[i-lookback].high;
        for (std::size_t j=i-lookback+1; j<i; ++j){
            lo = std::min(lo, c[j].low);
            hi = std::max(hi, c[j].high);
        }
        const Candle& k = c[i];
        if (k.low < lo && k.close > lo) sweeps.push_back({Bias::Bullish, i, lo});
        if (k.high > hi && k.close < hi) sweeps.push_back({Bias::Bearish, i, hi});
    }
    return sweeps;
}

} // namespace smc
