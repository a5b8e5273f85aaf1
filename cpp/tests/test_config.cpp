#include "../include/table/config.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace {

// Sets or clears QTABLE_* variables for the duration of a test
class ConfigEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        unsetenv("QTABLE_EPSILON");
        unsetenv("QTABLE_SEED");
    }
};

} // namespace

TEST_F(ConfigEnvTest, DefaultsWhenUnset) {
    auto config = qtable::QTableConfig::from_env();
    EXPECT_DOUBLE_EQ(config.epsilon, qtable::kDefaultEpsilon);
    EXPECT_FALSE(config.seed.has_value());
}

TEST_F(ConfigEnvTest, ReadsOverrides) {
    setenv("QTABLE_EPSILON", "0.25", 1);
    setenv("QTABLE_SEED", "4242", 1);

    auto config = qtable::QTableConfig::from_env();
    EXPECT_DOUBLE_EQ(config.epsilon, 0.25);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(config.seed.value(), 4242u);
}

TEST_F(ConfigEnvTest, RejectsMalformedValues) {
    setenv("QTABLE_EPSILON", "lots", 1);
    EXPECT_THROW(qtable::QTableConfig::from_env(), std::invalid_argument);

    setenv("QTABLE_EPSILON", "0.1x", 1);
    EXPECT_THROW(qtable::QTableConfig::from_env(), std::invalid_argument);

    setenv("QTABLE_EPSILON", "-0.5", 1);
    EXPECT_THROW(qtable::QTableConfig::from_env(), std::invalid_argument);

    unsetenv("QTABLE_EPSILON");
    setenv("QTABLE_SEED", "-3", 1);
    EXPECT_THROW(qtable::QTableConfig::from_env(), std::invalid_argument);

    setenv("QTABLE_SEED", "99999999999", 1);
    EXPECT_THROW(qtable::QTableConfig::from_env(), std::invalid_argument);
}

TEST(ConfigTest, SeededEnginesMatch) {
    qtable::QTableConfig config;
    config.seed = 7u;
    auto first = config.make_engine();
    auto second = config.make_engine();
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(first(), second());
    }
}

TEST(ConfigTest, ValidateRejectsBadEpsilon) {
    qtable::QTableConfig config;
    EXPECT_NO_THROW(config.validate());

    config.epsilon = -0.01;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config.epsilon = std::numeric_limits<double>::infinity();
    EXPECT_THROW(config.validate(), std::invalid_argument);
}
