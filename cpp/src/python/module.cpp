#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include "../../include/common.hpp"
#include "../../include/table/config.hpp"
#include "../../include/table/errors.hpp"
#include "../../include/table/exploration.hpp"
#include "../../include/table/q_table.hpp"
#include "../../include/python/python_state.hpp"
#include "../../include/python/module.hpp"

namespace py = pybind11;

namespace qtable::python {

using PyQTable = qtable::QTable<PyState>;

namespace {

py::tuple to_tuple(const qtable::ActionValue<PyAction>& entry) {
    return py::make_tuple(entry.first.object(), entry.second);
}

py::list to_list(const qtable::ActionValueList<PyAction>& entries) {
    py::list result;
    for (const auto& entry : entries) {
        result.append(to_tuple(entry));
    }
    return result;
}

// dict[state, dict[action, float]] -> table
PyQTable::Table to_table(const py::dict& py_table) {
    PyQTable::Table table;
    for (auto item : py_table) {
        PyQTable::ActionValues values;
        for (auto action : item.second.cast<py::dict>()) {
            values.emplace(PyAction(py::reinterpret_borrow<py::object>(action.first)),
                           action.second.cast<float>());
        }
        table.emplace(PyState(py::reinterpret_borrow<py::object>(item.first)), std::move(values));
    }
    return table;
}

std::unique_ptr<PyQTable> make_table(py::object initial_state,
                                     std::optional<py::dict> py_table,
                                     double epsilon,
                                     std::optional<uint32_t> seed) {
    qtable::QTableConfig config;
    config.epsilon = epsilon;
    config.seed = seed;

    std::optional<PyQTable::Table> table;
    if (py_table.has_value()) {
        table = to_table(py_table.value());
    }
    return std::make_unique<PyQTable>(PyState(std::move(initial_state)), std::move(table), config);
}

} // namespace

void register_bindings(py::module_& m) {
    m.doc() = "Tabular Q-learning action-value store";

    py::register_exception<qtable::UnknownStateError>(m, "UnknownStateError", PyExc_KeyError);
    py::register_exception<qtable::UnknownActionError>(m, "UnknownActionError", PyExc_KeyError);
    py::register_exception<qtable::TerminalStateError>(m, "TerminalStateError", PyExc_RuntimeError);

    m.attr("DEFAULT_EPSILON") = qtable::kDefaultEpsilon;
    m.attr("EPSILON_DROPOFF") = qtable::kEpsilonDropoff;

    m.def("exploration_rate",
          [](double epsilon, int episode_number) {
              return qtable::exploration_rate(epsilon, episode_number);
          },
          py::arg("epsilon"),
          py::arg("episode_number"),
          "Effective exploration probability for an episode");

    // QTable over Python-defined states
    py::class_<PyQTable>(m, "QTable")
        .def(py::init(&make_table),
             py::arg("initial_state"),
             py::arg("table") = py::none(),
             py::arg("epsilon") = qtable::kDefaultEpsilon,
             py::arg("seed") = py::none(),
             "Create a table, discovering all states reachable from initial_state unless table is given")
        .def("get_best_move",
             [](PyQTable& self, py::object state) {
                 return to_tuple(self.get_best_move(PyState(std::move(state))));
             },
             py::arg("state"),
             "Best (action, value) for a state")
        .def("get_possible_actions",
             [](const PyQTable& self, py::object state) {
                 return to_list(self.get_possible_actions(PyState(std::move(state))));
             },
             py::arg("state"),
             "All (action, value) pairs for a state")
        .def("get_next_action",
             [](PyQTable& self, py::object state, int episode_number) {
                 return to_tuple(self.get_next_action(PyState(std::move(state)), episode_number));
             },
             py::arg("state"),
             py::arg("episode_number"),
             "Epsilon-greedy (action, value) for a state")
        .def("update",
             [](PyQTable& self, py::object state, py::object action, py::object next_state,
                float learning_rate, float future_reward_discount) {
                 self.update(PyState(std::move(state)), PyAction(std::move(action)),
                             PyState(std::move(next_state)), learning_rate, future_reward_discount);
             },
             py::arg("state"),
             py::arg("action"),
             py::arg("next_state"),
             py::arg("learning_rate"),
             py::arg("future_reward_discount") = 1.0f,
             "Apply the one-step Q-learning update")
        .def("update_pair",
             [](PyQTable& self, py::object state, py::tuple action_value, py::object next_state,
                float learning_rate, float future_reward_discount) {
                 if (action_value.size() != 2) {
                     throw std::invalid_argument("update_pair expects an (action, value) tuple");
                 }
                 qtable::ActionValue<PyAction> pair(PyAction(action_value[0].cast<py::object>()),
                                                    action_value[1].cast<float>());
                 self.update(PyState(std::move(state)), pair, PyState(std::move(next_state)),
                             learning_rate, future_reward_discount);
             },
             py::arg("state"),
             py::arg("action_value"),
             py::arg("next_state"),
             py::arg("learning_rate"),
             py::arg("future_reward_discount") = 1.0f,
             "Update with an (action, value) pair as returned by get_next_action; the stored value is used")
        .def("get_actions",
             [](const PyQTable& self, py::object state) {
                 py::dict result;
                 for (const auto& entry : self.get_actions(PyState(std::move(state)))) {
                     result[entry.first.object()] = entry.second;
                 }
                 return result;
             },
             py::arg("state"),
             "Copy of the action -> value map for a state")
        .def("get_first_n_entries_with_nonzero_actions",
             &PyQTable::get_first_n_entries_with_nonzero_actions,
             py::arg("n"),
             "Diagnostic rendering of entries with positive value sums")
        .def_property_readonly("epsilon", &PyQTable::epsilon)
        .def("__contains__",
             [](const PyQTable& self, py::object state) { return self.contains(PyState(std::move(state))); })
        .def("__len__", &PyQTable::size)
        .def("__repr__", &PyQTable::to_string);

    m.attr("__version__") = "0.1.0";
}

} // namespace qtable::python
