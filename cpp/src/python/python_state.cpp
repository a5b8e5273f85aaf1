#include "python/python_state.hpp"
#include "table/select_best.hpp"
#include <stdexcept>
#include <string>

namespace qtable::python {

PyState::PyState(py::object state)
    : state_(std::move(state)) {

    // Verify the Python object implements the required protocol
    for (const char* method : {"get_legal_actions", "make_transition", "reward_for_last_move"}) {
        if (!py::hasattr(state_, method)) {
            throw std::runtime_error(std::string("Python state must have a '") + method + "' method");
        }
    }
}

std::vector<PyAction> PyState::get_legal_actions() const {
    std::vector<PyAction> actions;
    for (py::handle action : state_.attr("get_legal_actions")()) {
        actions.emplace_back(py::reinterpret_borrow<py::object>(action));
    }
    return actions;
}

PyState PyState::make_transition(const PyAction& action) const {
    return PyState(state_.attr("make_transition")(action.object()));
}

float PyState::reward_for_last_move() const {
    return state_.attr("reward_for_last_move")().cast<float>();
}

ActionValue<PyAction> PyState::select_best_action(const ActionValueList<PyAction>& actions,
                                                  std::mt19937& rng) const {
    if (!py::hasattr(state_, "select_best_action")) {
        return select_max_value(actions, rng);
    }

    // Convert pairs to a Python list of (action, value) tuples
    py::list pairs;
    for (const auto& entry : actions) {
        pairs.append(py::make_tuple(entry.first.object(), entry.second));
    }
    py::object rnd = py::module_::import("random").attr("Random")(rng());

    py::object result = state_.attr("select_best_action")(pairs, rnd);
    py::tuple py_result = result.cast<py::tuple>();
    if (py_result.size() != 2) {
        throw std::runtime_error("Python select_best_action() must return (action, value) tuple");
    }

    return {PyAction(py_result[0].cast<py::object>()), py_result[1].cast<float>()};
}

std::ostream& operator<<(std::ostream& os, const PyAction& action) {
    return os << py::repr(action.object()).cast<std::string>();
}

std::ostream& operator<<(std::ostream& os, const PyState& state) {
    return os << py::repr(state.object()).cast<std::string>();
}

} // namespace qtable::python
