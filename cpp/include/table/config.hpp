#pragma once
#include "../common.hpp"
#include <cstdint>
#include <optional>
#include <random>

namespace qtable {

struct QTableConfig {
    double epsilon = kDefaultEpsilon;   // Base exploration rate
    std::optional<uint32_t> seed;       // Fixed seed for reproducible runs

    /**
     * Build a config from the environment.
     *
     * Reads QTABLE_EPSILON and QTABLE_SEED; unset variables keep the defaults.
     * Throws std::invalid_argument on malformed or out-of-range values.
     */
    static QTableConfig from_env();

    // Throws std::invalid_argument if epsilon is negative or not finite
    void validate() const;

    // Engine seeded from `seed`, or from std::random_device when unset
    std::mt19937 make_engine() const;
};

} // namespace qtable
