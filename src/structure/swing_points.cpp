#include "structure/swing_points.hpp"

namespace smc {

namespace {
template <class Disqualifies>
bool unique_extreme(const std::vector<double>& v, std::size_t i, std::size_t legs, Disqualifies beaten){
    for (std::size_t j=i-legs; j<=i+legs; ++j){
        if (j!=i && beaten(v[j], v[i])) return false;
    }
    return true;
}
} // namespace

SwingPoints swing_points(const std::vector<double>& high, const std::vector<double>& low,
                         std::size_t legs){
    const std::size_t n = high.size();
    SwingPoints sp{Levels(n), Levels(n)};
    if (legs >= n || n-legs <= legs) return sp;  // n < 2*legs+1, without the overflow

    for (std::size_t i=legs; i<n-legs; ++i){
        if (unique_extreme(high, i, legs, [](double other, double x){ return other >= x; }))
            sp.highs[i] = high[i];
        if (unique_extreme(low, i, legs, [](double other, double x){ return other <= x; }))
            sp.lows[i] = low[i];
    }
    return sp;
}

} // namespace smc
