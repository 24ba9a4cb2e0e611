#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace smc {

enum class Bias { Bullish, Bearish };

inline const char* to_string(Bias b) {
    return b == Bias::Bullish ? "bullish" : "bearish";
}

// Three-candle imbalance anchored at the third candle
struct FvgZone {
    Bias bias{Bias::Bullish};
    double top{};
    double bottom{};
    std::size_t index{};
    double gap_size{};
};

// Last opposing candle before an engulfing move; anchored at that candle
struct OrderBlock {
    Bias bias{Bias::Bullish};
    double top{};
    double bottom{};
    std::size_t index{};
};

// Break of the rolling extreme of the previous `lookback` candles with a close back inside
struct LiquiditySweep {
    Bias bias{Bias::Bullish};
    std::size_t index{};
    double level{};  // the rolling min (bullish) or max (bearish) that was swept
};

// Boolean views, one flag per candle, set at the record's anchor index
struct Flags {
    std::vector<bool> bullish;
    std::vector<bool> bearish;
};

std::vector<FvgZone> fair_value_gaps(const std::vector<Candle>& candles);
std::vector<OrderBlock> order_blocks(const std::vector<Candle>& candles);
std::vector<LiquiditySweep> liquidity_sweeps(const std::vector<Candle>& candles, std::size_t lookback);

template <class Record>
Flags project(const std::vector<Record>& records, std::size_t n){
    Flags f{std::vector<bool>(n, false), std::vector<bool>(n, false)};
    for (const auto& r : records){
        if (r.index >= n) continue;
        (r.bias == Bias::Bullish ? f.bullish : f.bearish)[r.index] = true;
    }
    return f;
}

} // namespace smc
