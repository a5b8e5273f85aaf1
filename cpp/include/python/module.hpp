#pragma once

#include <pybind11/pybind11.h>

namespace qtable::python {

/**
 * Define the qtable_cpp module contents on m.
 *
 * Shared by the extension module and by embedded-interpreter tests.
 */
void register_bindings(pybind11::module_& m);

} // namespace qtable::python
