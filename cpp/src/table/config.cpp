#include "../../include/table/config.hpp"
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace qtable {

namespace {

void read_env_double(const char* name, double& target) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return;
    }
    try {
        size_t consumed = 0;
        double value = std::stod(raw, &consumed);
        if (consumed != std::string(raw).size()) {
            throw std::invalid_argument("trailing characters");
        }
        target = value;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not a number: " + raw);
    }
}

void read_env_seed(const char* name, std::optional<uint32_t>& target) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return;
    }
    std::string text(raw);
    if (text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string(name) + " is not an unsigned integer: " + text);
    }
    try {
        unsigned long long value = std::stoull(text);
        if (value > std::numeric_limits<uint32_t>::max()) {
            throw std::out_of_range("seed");
        }
        target = static_cast<uint32_t>(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is out of range: " + text);
    }
}

} // namespace

QTableConfig QTableConfig::from_env() {
    QTableConfig config;
    read_env_double("QTABLE_EPSILON", config.epsilon);
    read_env_seed("QTABLE_SEED", config.seed);
    config.validate();
    return config;
}

void QTableConfig::validate() const {
    if (!std::isfinite(epsilon) || epsilon < 0.0) {
        throw std::invalid_argument("epsilon must be a non-negative finite number");
    }
}

std::mt19937 QTableConfig::make_engine() const {
    if (seed.has_value()) {
        return std::mt19937(seed.value());
    }
    std::random_device rd;
    return std::mt19937(rd());
}

} // namespace qtable
