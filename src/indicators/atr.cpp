#include "indicators/atr.hpp"
#include "indicators/sma_ema.hpp"
#include <algorithm>
#include <cmath>

namespace ind {
std::vector<double> true_range(const std::vector<double>& h, const std::vector<double>& l,
                               const std::vector<double>& c){
    std::vector<double> tr(h.size(), 0.0);  // index 0 has no previous close
    for (std::size_t i=1; i<h.size(); ++i){
        const double hl = h[i]-l[i];
        const double hc = std::abs(h[i]-c[i-1]);
        const double lc = std::abs(l[i]-c[i-1]);
        tr[i] = std::max({hl, hc, lc});
    }
    return tr;
}

Series atr_series(const std::vector<double>& h, const std::vector<double>& l,
                  const std::vector<double>& c, std::size_t p){
    Series out(h.size());
    if (p==0 || h.size()<p+1) return out;

    const auto tr = true_range(h, l, c);
    double atr = sma(tr, 1, p);
    out[p] = atr;
    const double a = 1.0/static_cast<double>(p);
    for (std::size_t i=p+1; i<h.size(); ++i){
        atr = atr*(1.0-a) + tr[i]*a;
        out[i] = atr;
    }
    return out;
}

std::vector<double> compute_atr(const std::vector<double>& h, const std::vector<double>& l,
                                const std::vector<double>& c, std::size_t p){
    return with_sentinel(atr_series(h, l, c, p));
}
} // namespace ind
