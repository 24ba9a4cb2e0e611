#include "patterns/candlestick.hpp"

namespace pat {

std::vector<bool> scan(const IPattern& p, const std::vector<Candle>& candles){
    std::vector<bool> out(candles.size(), false);
    for (std::size_t i=p.warmup_bars(); i<candles.size(); ++i)
        out[i] = p.matches(candles, i);
    return out;
}

bool Hammer::matches(const std::vector<Candle>& c, std::size_t i) const {
    const Candle& k = c[i];
    if (range(k) <= 0.0) return false;
    const double b = body(k);
    return lower_wick(k) > cfg_.wick_body_ratio*b && upper_wick(k) < cfg_.opposite_wick_ratio*b;
}

bool InvertedHammer::matches(const std::vector<Candle>& c, std::size_t i) const {
    const Candle& k = c[i];
    if (range(k) <= 0.0) return false;
    const double b = body(k);
    return upper_wick(k) > cfg_.wick_body_ratio*b && lower_wick(k) < cfg_.opposite_wick_ratio*b;
}

bool DragonflyDoji::matches(const std::vector<Candle>& c, std::size_t i) const {
    const Candle& k = c[i];
    const double r = range(k);
    if (r <= 0.0) return false;
    return body(k) < cfg_.doji_body_ratio*r
        && lower_wick(k) > cfg_.doji_wick_ratio*r
        && upper_wick(k) < cfg_.doji_body_ratio*r;
}

bool GravestoneDoji::matches(const std::vector<Candle>& c, std::size_t i) const {
    const Candle& k = c[i];
    const double r = range(k);
    if (r <= 0.0) return false;
    return body(k) < cfg_.doji_body_ratio*r
        && upper_wick(k) > cfg_.doji_wick_ratio*r
        && lower_wick(k) < cfg_.doji_body_ratio*r;
}

bool BullishEngulfing::matches(const std::vector<Candle>& c, std::size_t i) const {
    const Candle& prev = c[i-1];
    const Candle& cur  = c[i];
    return is_bearish(prev) && is_bullish(cur)
        && cur.open < prev.close && cur.close > prev.open;
}

bool BearishEngulfing::matches(const std::vector<Candle>& c, std::size_t i) const {
    const Candle& prev = c[i-1];
    const Candle& cur  = c[i];
    return is_bullish(prev) && is_bearish(cur)
        && cur.open > prev.close && cur.close < prev.open;
}

bool MorningStar::matches(const std::vector<Candle>& c, std::size_t i) const {
    const Candle& d1 = c[i-2];
    const Candle& d2 = c[i-1];
    const Candle& d3 = c[i];
    if (range(d2) <= 0.0) return false;
    const double mid1 = (d1.open + d1.close)/2.0;
    return is_bearish(d1)
        && body(d2) < cfg_.star_body_ratio*range(d2)
        && is_bullish(d3) && d3.close > mid1;
}

bool EveningStar::matches(const std::vector<Candle>& c, std::size_t i) const {
    const Candle& d1 = c[i-2];
    const Candle& d2 = c[i-1];
    const Candle& d3 = c[i];
    if (range(d2) <= 0.0) return false;
    const double mid1 = (d1.open + d1.close)/2.0;
    return is_bullish(d1)
        && body(d2) < cfg_.star_body_ratio*range(d2)
        && is_bearish(d3) && d3.close < mid1;
}

std::vector<std::unique_ptr<IPattern>> default_patterns(const PatternConfig& cfg){
    std::vector<std::unique_ptr<IPattern>> v;
    v.push_back(std::make_unique<Hammer>(cfg));
    v.push_back(std::make_unique<InvertedHammer>(cfg));
    v.push_back(std::make_unique<HangingMan>(cfg));
    v.push_back(std::make_unique<BullishEngulfing>());
    v.push_back(std::make_unique<BearishEngulfing>());
    v.push_back(std::make_unique<DragonflyDoji>(cfg));
    v.push_back(std::make_unique<GravestoneDoji>(cfg));
    v.push_back(std::make_unique<MorningStar>(cfg));
    v.push_back(std::make_unique<EveningStar>(cfg));
    return v;
}

} // namespace pat
