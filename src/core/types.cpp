#include "core/types.hpp"

namespace {
template <class F>
std::vector<double> column(const std::vector<Candle>& candles, F field){
    std::vector<double> out; out.reserve(candles.size());
    for (const auto& c : candles) out.push_back(field(c));
    return out;
}
} // namespace

std::vector<double> opens(const std::vector<Candle>& c)  { return column(c, [](const Candle& x){ return x.open; }); }
std::vector<double> highs(const std::vector<Candle>& c)  { return column(c, [](const Candle& x){ return x.high; }); }
std::vector<double> lows(const std::vector<Candle>& c)   { return column(c, [](const Candle& x){ return x.low; }); }
std::vector<double> closes(const std::vector<Candle>& c) { return column(c, [](const Candle& x){ return x.close; }); }
