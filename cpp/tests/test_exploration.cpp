#include "../include/table/exploration.hpp"
#include <gtest/gtest.h>

TEST(ExplorationRateTest, FirstEpisodeAlwaysExplores) {
    EXPECT_DOUBLE_EQ(qtable::exploration_rate(0.01, 0), 1.01);
    EXPECT_GT(qtable::exploration_rate(0.0, 0), 1.0 - 1e-12);
}

TEST(ExplorationRateTest, DecaysTowardEpsilon) {
    EXPECT_NEAR(qtable::exploration_rate(0.01, 995), 0.015, 1e-9);
    EXPECT_NEAR(qtable::exploration_rate(0.01, 100000000), 0.01, 1e-6);
    EXPECT_GT(qtable::exploration_rate(0.01, 100000000), 0.01);
}

/**
 * For a fixed epsilon, the rate strictly decreases with the episode number
 */
TEST(ExplorationRateTest, StrictlyDecreasing) {
    for (double epsilon : {0.0, 0.01, 0.3}) {
        double previous = qtable::exploration_rate(epsilon, 0);
        for (int episode = 1; episode <= 5000; episode++) {
            double current = qtable::exploration_rate(epsilon, episode);
            EXPECT_LT(current, previous) << "epsilon=" << epsilon << " episode=" << episode;
            previous = current;
        }
    }
}

TEST(ExplorationRateTest, CustomDropoff) {
    EXPECT_DOUBLE_EQ(qtable::exploration_rate(0.1, 10, 10.0f), 0.6);
    EXPECT_DOUBLE_EQ(qtable::exploration_rate(0.1, 10), 0.1 + 5.0 / 15.0);
}
