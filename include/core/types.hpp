#pragma once
#include <cmath>
#include <cstddef>
#include <vector>
#include <algorithm>

// OHLC candle; high >= max(open,close) and low <= min(open,close) are assumed
struct Candle {
    double open{};
    double high{};
    double low{};
    double close{};
};

// Candle shape
inline double body(const Candle& c)       { return std::abs(c.close - c.open); }
inline double upper_wick(const Candle& c) { return c.high - std::max(c.open, c.close); }
inline double lower_wick(const Candle& c) { return std::min(c.open, c.close) - c.low; }
inline double range(const Candle& c)      { return c.high - c.low; }
inline bool is_bullish(const Candle& c)   { return c.close > c.open; }
inline bool is_bearish(const Candle& c)   { return c.close < c.open; }

// Column views for the array-based indicators
std::vector<double> opens(const std::vector<Candle>& candles);
std::vector<double> highs(const std::vector<Candle>& candles);
std::vector<double> lows(const std::vector<Candle>& candles);
std::vector<double> closes(const std::vector<Candle>& candles);
