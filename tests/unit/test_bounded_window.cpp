#include <gtest/gtest.h>
#include "BoundedWindow.h"

using namespace BehaviorSentinel;

TEST(BoundedWindowTest, EvictsOldestPastCapacity) {
    BoundedWindow<int> window(3);
    for (int i = 1; i <= 4; ++i) {
        window.push(i);
    }
    ASSERT_EQ(window.size(), 3u);
    EXPECT_EQ(window.front(), 2);
    EXPECT_EQ(window.back(), 4);
    EXPECT_EQ(window.snapshot(), (std::vector<int>{2, 3, 4}));
}

TEST(BoundedWindowTest, ZeroCapacityHoldsOne) {
    BoundedWindow<int> window(0);
    EXPECT_EQ(window.capacity(), 1u);
    window.push(7);
    window.push(8);
    ASSERT_EQ(window.size(), 1u);
    EXPECT_EQ(window.front(), 8);
}

TEST(BoundedWindowTest, EmptyStatisticsAreZero) {
    BoundedWindow<double> window(5);
    EXPECT_TRUE(window.empty());
    EXPECT_DOUBLE_EQ(window.mean(), 0.0);
    EXPECT_DOUBLE_EQ(window.variance(), 0.0);
}

TEST(BoundedWindowTest, PopulationVariance) {
    BoundedWindow<double> window(10);
    for (double v : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) {
        window.push(v);
    }
    EXPECT_DOUBLE_EQ(window.mean(), 5.0);
    EXPECT_DOUBLE_EQ(window.variance(), 4.0);
}

TEST(BoundedWindowTest, ProjectionAndCount) {
    struct Item {
        int kind;
        double value;
    };
    BoundedWindow<Item> window(4);
    window.push({1, 10.0});
    window.push({2, 20.0});
    window.push({1, 30.0});

    EXPECT_DOUBLE_EQ(window.mean([](const Item& i) { return i.value; }), 20.0);
    EXPECT_EQ(window.countIf([](const Item& i) { return i.kind == 1; }), 2u);

    window.clear();
    EXPECT_TRUE(window.empty());
    EXPECT_EQ(window.capacity(), 4u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
