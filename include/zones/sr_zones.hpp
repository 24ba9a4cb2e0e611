#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "structure/swing_points.hpp"

namespace sr {

enum class ZoneType { Support, Resistance };

inline const char* to_string(ZoneType t) {
    return t == ZoneType::Support ? "support" : "resistance";
}

struct SrZone {
    double level{};     // cluster mean, 2 decimals
    ZoneType type{ZoneType::Resistance};
    std::size_t strength{};  // cluster size
    double top{};       // cluster max, 2 decimals
    double bottom{};    // cluster min, 2 decimals
    double distance{};  // |price - unrounded mean|
};

double round2(double v);

// Clusters swing levels (highs first, then lows, both in index order). Each
// unclaimed seed v takes the later unclaimed levels within v*tolerance; clusters
// with fewer than min_touches members are dropped and leave their levels free.
// The strongest max_zones survive, then they are ordered by distance.
std::vector<SrZone> identify_zones(const smc::Levels& swing_highs, const smc::Levels& swing_lows,
                                   double current_price, const ZoneConfig& cfg);

// First zone of the given type in a distance-ordered list (any type when
// `type` is empty); nothing when there is none.
std::optional<SrZone> nearest_zone(const std::vector<SrZone>& zones,
                                   std::optional<ZoneType> type = std::nullopt);

} // namespace sr
