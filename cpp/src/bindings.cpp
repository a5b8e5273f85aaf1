#include <pybind11/pybind11.h>
#include "../include/python/module.hpp"

PYBIND11_MODULE(qtable_cpp, m) {
    qtable::python::register_bindings(m);
}
