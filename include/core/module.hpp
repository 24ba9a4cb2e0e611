#pragma once
#include <string>
#include <cstddef>
#include "core/types.hpp"

// Common face of every analysis module (patterns, detectors).
class IModule {
public:
    virtual ~IModule() = default;

    // Output name, e.g. "hammer", "morning_star"
    virtual std::string id() const = 0;

    // Preceding candles needed before the first index that can be evaluated
    virtual std::size_t warmup_bars() const = 0;
};
