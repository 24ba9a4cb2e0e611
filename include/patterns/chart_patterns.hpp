#pragma once
#include <vector>
#include "core/types.hpp"
#include "core/config.hpp"
#include "structure/swing_points.hpp"

namespace pat {

// Multi-swing formations. Each returns one flag per candle, set on the swing
// that completes the formation. Fewer than 10 candles never match.

// Two swing highs within tolerance of each other, the lowest low between them
// (inclusive) at least min_retrace below the first. Only the oldest match
// among the last max_swings swing highs is reported; the second peak of a
// pair is one of the next two swing highs.
std::vector<bool> double_top(const std::vector<Candle>& candles, const smc::Levels& swing_highs,
                             const ChartPatternConfig& cfg = {});

// Mirror of double_top over swing lows and the highest high between them.
std::vector<bool> double_bottom(const std::vector<Candle>& candles, const smc::Levels& swing_lows,
                                const ChartPatternConfig& cfg = {});

// Three swing highs, the middle one above both shoulders and at least
// min_head above the left one, shoulders within tolerance. Each of head and
// right shoulder is one of the next three swing highs. Every match is marked
// on its right shoulder.
std::vector<bool> head_and_shoulders(const std::vector<Candle>& candles, const smc::Levels& swing_highs,
                                     const ChartPatternConfig& cfg = {});

std::vector<bool> inverse_head_and_shoulders(const std::vector<Candle>& candles, const smc::Levels& swing_lows,
                                             const ChartPatternConfig& cfg = {});

} // namespace pat
