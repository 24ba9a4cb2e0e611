#include <gtest/gtest.h>
#include <vector>

#include "zones/sr_zones.hpp"

using sr::ZoneType;

namespace {
smc::Levels levels(std::initializer_list<double> v){
    smc::Levels out;
    out.push_back(std::nullopt);  // interleave absent entries like a real swing series
    for (double x : v) { out.push_back(x); out.push_back(std::nullopt); }
    return out;
}
} // namespace

TEST(SrZonesTest, ClustersNearbyLevelsAndDropsLoners) {
    const auto zones = sr::identify_zones(levels({100.0, 100.1, 100.15, 150.0}), {}, 120.0, ZoneConfig{});
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].strength, 3u);
    EXPECT_DOUBLE_EQ(zones[0].level, 100.08);
    EXPECT_DOUBLE_EQ(zones[0].top, 100.15);
    EXPECT_DOUBLE_EQ(zones[0].bottom, 100.0);
    EXPECT_EQ(zones[0].type, ZoneType::Support);
    EXPECT_NEAR(zones[0].distance, 120.0 - (100.0 + 100.1 + 100.15)/3.0, 1e-9);
}

TEST(SrZonesTest, BandEdgeFollowsDoubleArithmetic) {
    // 100.2 - 100 is 0.2000000000000028 in doubles, just past 100*0.002
    const auto zones = sr::identify_zones(levels({100.0, 100.1, 100.2, 150.0}), {}, 120.0, ZoneConfig{});
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].strength, 2u);
    EXPECT_NEAR(zones[0].level, 100.05, 1e-9);
    EXPECT_DOUBLE_EQ(zones[0].top, 100.1);
    EXPECT_DOUBLE_EQ(zones[0].bottom, 100.0);
    EXPECT_EQ(zones[0].type, ZoneType::Support);
}

TEST(SrZonesTest, NearestZoneByType) {
    const auto zones = sr::identify_zones(levels({90.0, 90.0, 130.0, 130.0, 110.0, 110.0}), {}, 100.0, ZoneConfig{});
    ASSERT_EQ(zones.size(), 3u);

    const auto any = sr::nearest_zone(zones);
    ASSERT_TRUE(any.has_value());
    EXPECT_DOUBLE_EQ(any->level, 90.0);  // tie on distance keeps creation order

    const auto res = sr::nearest_zone(zones, ZoneType::Resistance);
    ASSERT_TRUE(res.has_value());
    EXPECT_DOUBLE_EQ(res->level, 110.0);

    EXPECT_FALSE(sr::nearest_zone({}, ZoneType::Support).has_value());
    const auto only_resistance = sr::identify_zones(levels({110.0, 110.0}), {}, 100.0, ZoneConfig{});
    EXPECT_FALSE(sr::nearest_zone(only_resistance, ZoneType::Support).has_value());
}

TEST(SrZonesTest, BandIsMeasuredFromTheSeed) {
    // 100.3 is within reach of 100.15 but not of the seed 100
    const auto zones = sr::identify_zones(levels({100.0, 100.15, 100.3}), {}, 90.0, ZoneConfig{});
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].strength, 2u);
    EXPECT_DOUBLE_EQ(zones[0].top, 100.15);
    EXPECT_EQ(zones[0].type, ZoneType::Resistance);
}

TEST(SrZonesTest, HighsSeedBeforeLows) {
    const auto zones = sr::identify_zones(levels({100.3}), levels({100.1, 100.5}), 50.0, ZoneConfig{});
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].strength, 3u);
    EXPECT_DOUBLE_EQ(zones[0].level, 100.3);
    EXPECT_DOUBLE_EQ(zones[0].bottom, 100.1);
    EXPECT_DOUBLE_EQ(zones[0].top, 100.5);

    // lows first would have split them
    const auto swapped = sr::identify_zones(levels({100.1, 100.5}), levels({100.3}), 50.0, ZoneConfig{});
    ASSERT_EQ(swapped.size(), 1u);
    EXPECT_EQ(swapped[0].strength, 2u);
}

TEST(SrZonesTest, LevelAtPriceIsResistance) {
    const auto zones = sr::identify_zones(levels({100.0, 100.0}), {}, 100.0, ZoneConfig{});
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].type, ZoneType::Resistance);
    EXPECT_EQ(zones[0].distance, 0.0);
}

TEST(SrZonesTest, StrengthDecidesSurvivalDistanceDecidesOrder) {
    ZoneConfig cfg;
    cfg.max_zones = 2;
    const auto zones = sr::identify_zones(
        levels({200.0, 200.0, 200.0, 150.0, 150.0, 101.0, 101.0}), {}, 100.0, cfg);
    ASSERT_EQ(zones.size(), 2u);
    // the nearest cluster (101) loses the strength tie to the earlier 150 cluster
    EXPECT_DOUBLE_EQ(zones[0].level, 150.0);
    EXPECT_EQ(zones[0].strength, 2u);
    EXPECT_DOUBLE_EQ(zones[1].level, 200.0);
    EXPECT_EQ(zones[1].strength, 3u);
}

TEST(SrZonesTest, KeepsAtMostFiveByDefault) {
    const auto zones = sr::identify_zones(
        levels({10, 10, 20, 20, 30, 30, 40, 40, 50, 50, 60, 60, 70, 70}), {}, 35.0, ZoneConfig{});
    ASSERT_EQ(zones.size(), 5u);
    for (std::size_t i=1; i<zones.size(); ++i)
        EXPECT_LE(zones[i-1].distance, zones[i].distance);
    // all strength 2: the first five clusters survive
    EXPECT_DOUBLE_EQ(zones[0].level, 30.0);
    EXPECT_DOUBLE_EQ(zones[1].level, 40.0);
    EXPECT_DOUBLE_EQ(zones[4].level, 10.0);
}

TEST(SrZonesTest, RoundsToCents) {
    const auto zones = sr::identify_zones(levels({100.111, 100.121}), {}, 90.0, ZoneConfig{});
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_DOUBLE_EQ(zones[0].level, 100.12);
    EXPECT_DOUBLE_EQ(zones[0].top, 100.12);
    EXPECT_DOUBLE_EQ(zones[0].bottom, 100.11);
}

TEST(SrZonesTest, MinTouchesFromConfig) {
    ZoneConfig cfg;
    cfg.min_touches = 3;
    EXPECT_TRUE(sr::identify_zones(levels({100.0, 100.0}), {}, 90.0, cfg).empty());
    EXPECT_TRUE(sr::identify_zones({}, {}, 90.0, ZoneConfig{}).empty());
}
