#pragma once
#include <cstddef>
#include <vector>
#include "indicators/series.hpp"

namespace ind {

// Wilder RSI. Gains/losses seeded with the mean of changes 1..period, smoothed
// with alpha=1/period from index `period` on. 100 when the average loss is 0.
Series rsi_series(const std::vector<double>& prices, std::size_t period);
std::vector<double> compute_rsi(const std::vector<double>& prices, std::size_t period);

} // namespace ind
