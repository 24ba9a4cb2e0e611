#include <gtest/gtest.h>
#include <vector>

#include "structure/swing_points.hpp"

TEST(SwingPointsTest, SinglePeakOfUnimodalSeries) {
    const std::vector<double> high{1, 2, 3, 4, 5, 6, 5, 4, 3, 2, 1};
    std::vector<double> low;
    for (double h : high) low.push_back(h - 0.5);

    const auto sp = smc::swing_points(high, low, 5);
    ASSERT_EQ(sp.highs.size(), high.size());
    for (std::size_t i=0; i<high.size(); ++i) {
        if (i == 5) {
            ASSERT_TRUE(sp.highs[i].has_value());
            EXPECT_EQ(*sp.highs[i], 6.0);
        } else {
            EXPECT_FALSE(sp.highs[i].has_value()) << i;
        }
        EXPECT_FALSE(sp.lows[i].has_value()) << i;
    }
}

TEST(SwingPointsTest, SwingLow) {
    const std::vector<double> high{6, 5, 4, 5, 6};
    const std::vector<double> low{5, 4, 3, 4, 5};
    const auto sp = smc::swing_points(high, low, 2);
    ASSERT_TRUE(sp.lows[2].has_value());
    EXPECT_EQ(*sp.lows[2], 3.0);
    EXPECT_FALSE(sp.highs[2].has_value());
}

TEST(SwingPointsTest, TiesNeverQualify) {
    const std::vector<double> high{1, 2, 6, 6, 2, 1};
    const std::vector<double> low{5, 4, 1, 1, 4, 5};
    const auto sp = smc::swing_points(high, low, 1);
    for (std::size_t i=0; i<high.size(); ++i) {
        EXPECT_FALSE(sp.highs[i].has_value()) << i;
        EXPECT_FALSE(sp.lows[i].has_value()) << i;
    }
}

TEST(SwingPointsTest, EdgesAreNotEvaluated) {
    const std::vector<double> high{10, 1, 2, 1, 10};
    const std::vector<double> low{0, 5, 4, 5, 0};
    const auto sp = smc::swing_points(high, low, 2);
    EXPECT_FALSE(sp.highs[0].has_value());
    EXPECT_FALSE(sp.highs[4].has_value());
    EXPECT_FALSE(sp.lows[0].has_value());
    EXPECT_FALSE(sp.lows[4].has_value());
    // index 2 is neither above 10 nor below 0
    EXPECT_FALSE(sp.highs[2].has_value());
    EXPECT_FALSE(sp.lows[2].has_value());
}

TEST(SwingPointsTest, ShorterThanWindow) {
    const std::vector<double> v{1, 3, 1};
    const auto sp = smc::swing_points(v, v, 2);
    EXPECT_EQ(sp.highs.size(), 3u);
    for (const auto& h : sp.highs) EXPECT_FALSE(h.has_value());
    for (const auto& l : sp.lows) EXPECT_FALSE(l.has_value());
}

TEST(SwingPointsTest, HugeLegsYieldNothing) {
    const std::vector<double> v{1, 3, 1, 2, 1};
    const std::size_t legs = std::size_t{1} << (8*sizeof(std::size_t) - 1);
    const auto sp = smc::swing_points(v, v, legs);
    ASSERT_EQ(sp.highs.size(), v.size());
    for (const auto& h : sp.highs) EXPECT_FALSE(h.has_value());
    for (const auto& l : sp.lows) EXPECT_FALSE(l.has_value());
}
