#include "indicators/rsi.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {
Series rsi_series(const std::vector<double>& c, std::size_t p){
    Series out(c.size());
    if (p==0 || c.size()<p+1) return out;

    std::vector<double> gain(c.size(), 0.0), loss(c.size(), 0.0);
    for (std::size_t i=1; i<c.size(); ++i){
        const double d = c[i]-c[i-1];
        if (d>0) gain[i] = d; else loss[i] = -d;
    }

    double avg_g = sma(gain, 1, p);
    double avg_l = sma(loss, 1, p);
    const double a = 1.0/static_cast<double>(p);
    for (std::size_t i=p; i<c.size(); ++i){
        avg_g = avg_g*(1.0-a) + gain[i]*a;
        avg_l = avg_l*(1.0-a) + loss[i]*a;
        if (avg_l==0.0) { out[i] = 100.0; continue; }
        const double rs = avg_g/avg_l;
        out[i] = 100.0 - (100.0/(1.0+rs));
    }
    return out;
}

std::vector<double> compute_rsi(const std::vector<double>& prices, std::size_t p){
    return with_sentinel(rsi_series(prices, p));
}
} // namespace ind
