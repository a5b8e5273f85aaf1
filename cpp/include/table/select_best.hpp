#pragma once
#include "../common.hpp"
#include <random>
#include <stdexcept>
#include <vector>

namespace qtable {

// Highest-valued entry; ties broken uniformly with rng
template <typename Action>
ActionValue<Action> select_max_value(const ActionValueList<Action>& actions, std::mt19937& rng) {
    std::vector<size_t> best;
    for (size_t i = 0; i < actions.size(); ++i) {
        if (best.empty() || actions[i].second > actions[best[0]].second) {
            best.assign(1, i);
        } else if (actions[i].second == actions[best[0]].second) {
            best.push_back(i);
        }
    }
    if (best.empty()) {
        throw std::invalid_argument("select_max_value: no actions to select from");
    }
    std::uniform_int_distribution<size_t> pick(0, best.size() - 1);
    return actions[best[pick(rng)]];
}

} // namespace qtable
