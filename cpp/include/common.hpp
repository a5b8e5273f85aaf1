#pragma once
#include <utility>
#include <vector>

// Debug tracing level: 0 = silent, 1 = construction and updates, 2 = also exploration
#ifndef QTABLE_DEBUG
#define QTABLE_DEBUG 0
#endif

namespace qtable {

// Action paired with its current estimated value
template <typename Action>
using ActionValue = std::pair<Action, float>;

template <typename Action>
using ActionValueList = std::vector<ActionValue<Action>>;

// Base exploration rate added on top of the episode dropoff
constexpr double kDefaultEpsilon = 0.01;

// Exploration decays as kEpsilonDropoff / (episode + kEpsilonDropoff)
constexpr float kEpsilonDropoff = 5.0f;

} // namespace qtable
