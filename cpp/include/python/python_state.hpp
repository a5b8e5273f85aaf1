#pragma once

#include "../common.hpp"
#include <pybind11/pybind11.h>
#include <functional>
#include <ostream>
#include <random>
#include <vector>

namespace py = pybind11;

namespace qtable::python {

// Python object used as an action key (hashed and compared by Python)
class PyAction {
public:
    explicit PyAction(py::object action) : action_(std::move(action)) {}

    const py::object& object() const { return action_; }
    bool operator==(const PyAction& other) const { return action_.equal(other.action_); }

private:
    py::object action_;
};

/**
 * State backed by a Python object.
 *
 * This lets a Python environment drive the C++ table without writing any C++.
 * The Python object must provide:
 *   get_legal_actions() -> iterable of hashable actions
 *   make_transition(action) -> next state
 *   reward_for_last_move() -> float
 * and may provide select_best_action(pairs, rnd) -> (action, value), where
 * rnd is a random.Random seeded from the table's engine. Without it the
 * highest value wins and ties are broken uniformly.
 * The object must be hashable, and equal states must compare equal.
 */
class PyState {
public:
    using Action = PyAction;

    /**
     * Wrap a Python state.
     *
     * @param state Python object implementing the state protocol
     * @throws std::runtime_error if a required method is missing
     */
    explicit PyState(py::object state);

    std::vector<Action> get_legal_actions() const;
    PyState make_transition(const Action& action) const;
    float reward_for_last_move() const;
    ActionValue<Action> select_best_action(const ActionValueList<Action>& actions,
                                           std::mt19937& rng) const;

    const py::object& object() const { return state_; }
    bool operator==(const PyState& other) const { return state_.equal(other.state_); }

private:
    py::object state_;  // Python state object
};

std::ostream& operator<<(std::ostream& os, const PyAction& action);
std::ostream& operator<<(std::ostream& os, const PyState& state);

} // namespace qtable::python

namespace std {

template <>
struct hash<qtable::python::PyAction> {
    size_t operator()(const qtable::python::PyAction& action) const {
        return static_cast<size_t>(py::hash(action.object()));
    }
};

template <>
struct hash<qtable::python::PyState> {
    size_t operator()(const qtable::python::PyState& state) const {
        return static_cast<size_t>(py::hash(state.object()));
    }
};

} // namespace std
