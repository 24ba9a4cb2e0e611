#pragma once
#include <cstddef>
#include <string>

// Indicator periods
struct IndicatorConfig {
    std::size_t ema_fast{50};
    std::size_t ema_slow{200};
    std::size_t rsi_period{14};
    std::size_t atr_period{14};
};

// Candle shape thresholds, all relative (body or range multiples)
struct PatternConfig {
    double wick_body_ratio{2.0};      // hammer family: long wick > ratio*body
    double opposite_wick_ratio{0.5};  // hammer family: other wick < ratio*body
    double doji_body_ratio{0.05};     // doji: body and short wick < ratio*range
    double doji_wick_ratio{0.7};      // doji: long wick > ratio*range
    double star_body_ratio{0.3};      // star: middle body < ratio*range
};

// Swing-based chart patterns
struct ChartPatternConfig {
    double tolerance{0.02};        // peak/trough or shoulder match, fraction of the first one
    double min_retrace{0.01};      // double top/bottom: trough/peak in between, fraction of the first
    double min_head{0.015};        // head and shoulders: head beyond the left shoulder, fraction
    std::size_t max_swings{20};    // double top/bottom only look at the most recent swings
};

// Windows larger than this are rejected on load
constexpr std::size_t kMaxWindow = 1000000;

struct StructureConfig {
    std::size_t pivot_legs{5};
    std::size_t sweep_lookback{20};
};

struct ZoneConfig {
    double tolerance{0.002};  // fraction of the seed level
    std::size_t min_touches{2};
    std::size_t max_zones{5};
};

struct OutputConfig {
    bool undefined_as_null{false};  // false: warm-up positions are written as 0
};

struct AnalysisConfig {
    IndicatorConfig indicators;
    PatternConfig patterns;
    ChartPatternConfig chart_patterns;
    StructureConfig structure;
    ZoneConfig zones;
    OutputConfig output;
};

// Throws std::invalid_argument on values no detector can work with.
void validate(const AnalysisConfig& cfg);

// JSON config file; missing keys keep their defaults.
// Throws std::runtime_error on I/O or parse errors.
AnalysisConfig load_config(const std::string& path);
AnalysisConfig parse_config(const std::string& json_text);
