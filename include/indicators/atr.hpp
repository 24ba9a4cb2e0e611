#pragma once
#include <cstddef>
#include <vector>
#include "indicators/series.hpp"

namespace ind {

// True range at i>=1: max(h-l, |h-prev_close|, |l-prev_close|)
std::vector<double> true_range(const std::vector<double>& high,
                               const std::vector<double>& low,
                               const std::vector<double>& close);

// Wilder ATR; first value at index `period` (mean of TR[1..period]).
Series atr_series(const std::vector<double>& high, const std::vector<double>& low,
                  const std::vector<double>& close, std::size_t period);
std::vector<double> compute_atr(const std::vector<double>& high, const std::vector<double>& low,
                                const std::vector<double>& close, std::size_t period);

} // namespace ind
