#include <gtest/gtest.h>
#include "EwmaStat.h"

using namespace BehaviorSentinel;

TEST(EwmaStatTest, StartsAtZero) {
    EwmaStat stat;
    EXPECT_DOUBLE_EQ(stat.mean(), 0.0);
    EXPECT_DOUBLE_EQ(stat.variance(), 0.0);
    EXPECT_DOUBLE_EQ(stat.alpha(), EwmaStat::DEFAULT_ALPHA);
}

TEST(EwmaStatTest, VarianceUsesUpdatedMean) {
    EwmaStat stat;
    auto first = stat.update(10.0);
    EXPECT_NEAR(first.mean, 1.0, 1e-12);
    EXPECT_NEAR(first.variance, 0.1 * 9.0 * 9.0, 1e-9);

    auto second = stat.update(10.0);
    EXPECT_NEAR(second.mean, 1.9, 1e-12);
    EXPECT_NEAR(second.variance, 0.1 * 8.1 * 8.1 + 0.9 * 8.1, 1e-9);
}

TEST(EwmaStatTest, ConvergesOnRepeatedValue) {
    EwmaStat stat;
    for (int i = 0; i < 400; ++i) {
        stat.update(42.0);
    }
    EXPECT_NEAR(stat.mean(), 42.0, 1e-6);
    EXPECT_NEAR(stat.variance(), 0.0, 1e-6);
}

TEST(EwmaStatTest, StddevHasFloor) {
    EwmaStat stat;
    EXPECT_DOUBLE_EQ(stat.stddev(), EwmaStat::STDDEV_EPSILON);
    EXPECT_NEAR(stat.zScore(1.0), 1.0 / EwmaStat::STDDEV_EPSILON, 1.0);
}

TEST(EwmaStatTest, ZScoreIsAbsolute) {
    EwmaStat stat;
    stat.restore(100.0, 25.0);
    EXPECT_DOUBLE_EQ(stat.zScore(110.0), 2.0);
    EXPECT_DOUBLE_EQ(stat.zScore(90.0), 2.0);
}

TEST(EwmaStatTest, RestoreAndReset) {
    EwmaStat stat(0.5);
    stat.restore(3.0, 4.0);
    EXPECT_DOUBLE_EQ(stat.mean(), 3.0);
    EXPECT_DOUBLE_EQ(stat.variance(), 4.0);
    EXPECT_DOUBLE_EQ(stat.stddev(), 2.0);

    stat.reset();
    EXPECT_DOUBLE_EQ(stat.mean(), 0.0);
    EXPECT_DOUBLE_EQ(stat.variance(), 0.0);
    EXPECT_DOUBLE_EQ(stat.alpha(), 0.5);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
