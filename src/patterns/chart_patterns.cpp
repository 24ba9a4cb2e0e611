#include "patterns/chart_patterns.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace pat {

namespace {

constexpr std::size_t kMinCandles = 10;

struct Swing { std::size_t index; double price; };

std::vector<Swing> collect(const smc::Levels& levels){
    std::vector<Swing> out;
    for (std::size_t i=0; i<levels.size(); ++i)
        if (levels[i]) out.push_back({i, *levels[i]});
    return out;
}

// Shared by double top (sign +1) and double bottom (sign -1). `between` is the
// extreme of the opposite side over [a, b].
template <class Between>
std::vector<bool> double_formation(std::size_t n, const smc::Levels& levels,
                                   const ChartPatternConfig& cfg, double sign, Between between){
    std::vector<bool> flags(n, false);
    if (n < kMinCandles) return flags;
    const auto sw = collect(levels);
    if (sw.size() < 2) return flags;

    const std::size_t first = sw.size() - std::min(cfg.max_swings, sw.size());
    for (std::size_t i=first; i+1<sw.size(); ++i){
        const Swing& a = sw[i];
        if (a.price <= 0.0) continue;
        for (std::size_t j=i+1; j<std::min(i+3, sw.size()); ++j){
            const Swing& b = sw[j];
            if (b.index >= n) break;
            if (std::abs(b.price - a.price)/a.price > cfg.tolerance) continue;
            const double depth = sign*(a.price - between(a.index, b.index))/a.price;
            if (depth >= cfg.min_retrace){
                flags[b.index] = true;
                return flags;
            }
        }
    }
    return flags;
}

// sign +1: head above shoulders; sign -1: head below.
std::vector<bool> head_formation(std::size_t n, const smc::Levels& levels,
                                 const ChartPatternConfig& cfg, double sign){
    std::vector<bool> flags(n, false);
    if (n < kMinCandles) return flags;
    const auto sw = collect(levels);
    if (sw.size() < 3) return flags;

    for (std::size_t i=0; i+2<sw.size(); ++i){
        const double left = sw[i].price;
        if (left <= 0.0) continue;
        for (std::size_t j=i+1; j<std::min(i+4, sw.size()-1); ++j){
            const double head = sw[j].price;
            for (std::size_t k=j+1; k<std::min(j+4, sw.size()); ++k){
                const double right = sw[k].price;
                if (sw[k].index >= n) continue;
                if (sign*(head - left) > 0.0 && sign*(head - right) > 0.0
                    && std::abs(right - left)/left <= cfg.tolerance
                    && sign*(head - left)/left >= cfg.min_head)
                    flags[sw[k].index] = true;
            }
        }
    }
    return flags;
}

} // namespace

std::vector<bool> double_top(const std::vector<Candle>& c, const smc::Levels& swing_highs,
                             const ChartPatternConfig& cfg){
    return double_formation(c.size(), swing_highs, cfg, 1.0, [&c](std::size_t a, std::size_t b){
        double lo = c[a].low;
        for (std::size_t k=a+1; k<=b; ++k) lo = std::min(lo, c[k].low);
        return lo;
    });
}

std::vector<bool> double_bottom(const std::vector<Candle>& c, const smc::Levels& swing_lows,
                                const ChartPatternConfig& cfg){
    return double_formation(c.size(), swing_lows, cfg, -1.0, [&c](std::size_t a, std::size_t b){
        double hi = c[a].high;
        for (std::size_t k=a+1; k<=b; ++k) hi = std::max(hi, c[k].high);
        return hi;
    });
}

std::vector<bool> head_and_shoulders(const std::vector<Candle>& c, const smc::Levels& swing_highs,
                                     const ChartPatternConfig& cfg){
    return head_formation(c.size(), swing_highs, cfg, 1.0);
}

std::vector<bool> inverse_head_and_shoulders(const std::vector<Candle>& c, const smc::Levels& swing_lows,
                                             const ChartPatternConfig& cfg){
    return head_formation(c.size(), swing_lows, cfg, -1.0);
}

} // namespace pat
