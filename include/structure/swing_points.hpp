#pragma once
#include <cstddef>
#include <optional>
#include <vector>

namespace smc {

using Levels = std::vector<std::optional<double>>;

struct SwingPoints {
    Levels highs;
    Levels lows;
};

// Pivot window of 2*legs+1 candles. A swing high is strictly above every other
// high in the window, a swing low strictly below every other low; ties never
// qualify. The first and last `legs` indices are not evaluated.
SwingPoints swing_points(const std::vector<double>& high, const std::vector<double>& low,
                         std::size_t legs);

} // namespace smc
