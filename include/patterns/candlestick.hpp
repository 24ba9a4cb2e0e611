#pragma once
#include <memory>
#include <string>
#include <vector>
#include "core/module.hpp"
#include "core/config.hpp"

namespace pat {

// A candle shape evaluated at index i, looking back warmup_bars() candles.
class IPattern : public IModule {
public:
    // Only called with i >= warmup_bars()
    virtual bool matches(const std::vector<Candle>& c, std::size_t i) const = 0;
};

// One flag per candle; false where the history is too short.
std::vector<bool> scan(const IPattern& p, const std::vector<Candle>& candles);

// --- single candle (a zero-range candle never matches)

class Hammer final : public IPattern {
    PatternConfig cfg_;
public:
    explicit Hammer(PatternConfig cfg = {}) : cfg_(cfg) {}
    std::string id() const override { return "hammer"; }
    std::size_t warmup_bars() const override { return 0; }
    bool matches(const std::vector<Candle>& c, std::size_t i) const override;
};

class InvertedHammer final : public IPattern {
    PatternConfig cfg_;
public:
    explicit InvertedHammer(PatternConfig cfg = {}) : cfg_(cfg) {}
    std::string id() const override { return "inverted_hammer"; }
    std::size_t warmup_bars() const override { return 0; }
    bool matches(const std::vector<Candle>& c, std::size_t i) const override;
};

// Same shape as the hammer. The preceding uptrend that separates the two is
// not evaluated.
class HangingMan final : public IPattern {
    Hammer shape_;
public:
    explicit HangingMan(PatternConfig cfg = {}) : shape_(cfg) {}
    std::string id() const override { return "hanging_man"; }
    std::size_t warmup_bars() const override { return 0; }
    bool matches(const std::vector<Candle>& c, std::size_t i) const override { return shape_.matches(c, i); }
};

class DragonflyDoji final : public IPattern {
    PatternConfig cfg_;
public:
    explicit DragonflyDoji(PatternConfig cfg = {}) : cfg_(cfg) {}
    std::string id() const override { return "dragonfly_doji"; }
    std::size_t warmup_bars() const override { return 0; }
    bool matches(const std::vector<Candle>& c, std::size_t i) const override;
};

class GravestoneDoji final : public IPattern {
    PatternConfig cfg_;
public:
    explicit GravestoneDoji(PatternConfig cfg = {}) : cfg_(cfg) {}
    std::string id() const override { return "gravestone_doji"; }
    std::size_t warmup_bars() const override { return 0; }
    bool matches(const std::vector<Candle>& c, std::size_t i) const override;
};

// --- two candles

class BullishEngulfing final : public IPattern {
public:
    std::string id() const override { return "bullish_engulfing"; }
    std::size_t warmup_bars() const override { return 1; }
    bool matches(const std::vector<Candle>& c, std::size_t i) const override;
};

class BearishEngulfing final : public IPattern {
public:
    std::string id() const override { return "bearish_engulfing"; }
    std::size_t warmup_bars() const override { return 1; }
    bool matches(const std::vector<Candle>& c, std::size_t i) const override;
};

// --- three candles

class MorningStar final : public IPattern {
    PatternConfig cfg_;
public:
    explicit MorningStar(PatternConfig cfg = {}) : cfg_(cfg) {}
    std::string id() const override { return "morning_star"; }
    std::size_t warmup_bars() const override { return 2; }
    bool matches(const std::vector<Candle>& c, std::size_t i) const override;
};

class EveningStar final : public IPattern {
    PatternConfig cfg_;
public:
    explicit EveningStar(PatternConfig cfg = {}) : cfg_(cfg) {}
    std::string id() const override { return "evening_star"; }
    std::size_t warmup_bars() const override { return 2; }
    bool matches(const std::vector<Candle>& c, std::size_t i) const override;
};

// hammer, inverted_hammer, hanging_man, bullish_engulfing, bearish_engulfing,
// dragonfly_doji, gravestone_doji, morning_star, evening_star
std::vector<std::unique_ptr<IPattern>> default_patterns(const PatternConfig& cfg);

} // namespace pat
