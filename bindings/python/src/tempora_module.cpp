// TEMPORA Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "clock_bindings.hpp"
#include "core_bindings.hpp"
#include "error_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace tempora_python {
PyObject* time_overflow_error_type = nullptr;
PyObject* calendar_field_error_type = nullptr;
} // namespace tempora_python

NB_MODULE(tempora, m) {
    m.doc() = "TEMPORA - strongly-typed durations, clocks and calendar dates";

    // 1. Error types (sets the exception pointers used by every later binding)
    tempora_python::bind_errors(m);

    // 2. Calendar types and functions
    tempora_python::bind_core(m);

    // 3. Clock reads and time scale conversions
    tempora_python::bind_clocks(m);
}
