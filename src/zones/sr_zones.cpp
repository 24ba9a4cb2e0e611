#include "zones/sr_zones.hpp"
#include <algorithm>
#include <cmath>

namespace sr {

double round2(double v){ return std::round(v*100.0)/100.0; }

std::vector<SrZone> identify_zones(const smc::Levels& swing_highs, const smc::Levels& swing_lows,
                                   double price, const ZoneConfig& cfg){
    std::vector<double> levels;
    for (const auto& v : swing_highs) if (v) levels.push_back(*v);
    for (const auto& v : swing_lows)  if (v) levels.push_back(*v);

    std::vector<SrZone> zones;
    std::vector<bool> used(levels.size(), false);
    for (std::size_t i=0; i<levels.size(); ++i){
        if (used[i]) continue;
        const double seed = levels[i];
        const double tol = seed*cfg.tolerance;
        std::vector<std::size_t> members{i};
        for (std::size_t j=i+1; j<levels.size(); ++j){
            if (!used[j] && std::abs(levels[j]-seed) <= tol) members.push_back(j);
        }
        if (members.size() < cfg.min_touches) continue;

        double sum = 0.0, hi = seed, lo = seed;
        for (auto m : members){
            sum += levels[m];
            hi = std::max(hi, levels[m]);
            lo = std::min(lo, levels[m]);
            used[m] = true;
        }
        const double mean = sum/static_cast<double>(members.size());
        zones.push_back({round2(mean),
                         mean < price ? ZoneType::Support : ZoneType::Resistance,
                         members.size(), round2(hi), round2(lo), std::abs(price-mean)});
    }

    // survival by strength, presentation by distance; two separate passes
    std::stable_sort(zones.begin(), zones.end(),
                     [](const SrZone& a, const SrZone& b){ return a.strength > b.strength; });
    if (zones.size() > cfg.max_zones) zones.resize(cfg.max_zones);
    std::stable_sort(zones.begin(), zones.end(),
                     [](const SrZone& a, const SrZone& b){ return a.distance < b.distance; });
    return zones;
}

std::optional<SrZone> nearest_zone(const std::vector<SrZone>& zones, std::optional<ZoneType> type){
    for (const auto& z : zones)
        if (!type || z.type == *type) return z;
    return std::nullopt;
}

} // namespace sr
