#include "indicators/sma_ema.hpp"
#include <numeric>

namespace ind {
double sma(const std::vector<double>& v, std::size_t first, std::size_t count){
    const double s = std::accumulate(v.begin()+first, v.begin()+first+count, 0.0);
    return s/static_cast<double>(count);
}

Series ema_series(const std::vector<double>& prices, std::size_t p){
    Series out(prices.size());
    if (p==0 || prices.size()<p) return out;
    const double k = 2.0/(p+1.0);
    double e = sma(prices, 0, p);
    out[p-1] = e;
    for (std::size_t i=p; i<prices.size(); ++i){
        e = (prices[i]-e)*k + e;
        out[i] = e;
    }
    return out;
}

std::vector<double> compute_ema(const std::vector<double>& prices, std::size_t p){
    return with_sentinel(ema_series(prices, p));
}
} // namespace ind
