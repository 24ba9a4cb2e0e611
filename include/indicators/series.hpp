#pragma once
#include <optional>
#include <vector>

namespace ind {

// Indicator output; empty where the warm-up is not yet complete.
using Series = std::vector<std::optional<double>>;

// Boundary projection: undefined -> 0.0
std::vector<double> with_sentinel(const Series& s);

Series as_series(const std::vector<double>& v);

} // namespace ind
