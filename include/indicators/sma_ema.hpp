#pragma once
#include <cstddef>
#include <vector>
#include "indicators/series.hpp"

namespace ind {

// Mean of v[first, first+count); count must be > 0
double sma(const std::vector<double>& v, std::size_t first, std::size_t count);

// EMA seeded with the SMA of the first `period` prices at index period-1,
// then ema[i] = (p[i]-ema[i-1])*k + ema[i-1], k = 2/(period+1).
Series ema_series(const std::vector<double>& prices, std::size_t period);
std::vector<double> compute_ema(const std::vector<double>& prices, std::size_t period);

} // namespace ind
