#pragma once
// Python-side helpers for TEMPORA bindings

#include <nanobind/nanobind.h>

#include <tempora/error.hpp>

#include <utility>

namespace nb = nanobind;

namespace tempora_python {

// Exception type pointers (set during module init)
extern PyObject* time_overflow_error_type;
extern PyObject* calendar_field_error_type;

/// Python exception class raised for a TimeError
inline PyObject* exception_type_for(tempora::TimeError e) {
    switch (e) {
        case tempora::TimeError::overflow:
            return time_overflow_error_type;
        case tempora::TimeError::invalid_calendar_field:
            return calendar_field_error_type;
        case tempora::TimeError::division_by_zero:
            return PyExc_ZeroDivisionError;
        case tempora::TimeError::invalid_period:
        case tempora::TimeError::unsorted_leap_table:
            return PyExc_ValueError;
    }
    return PyExc_ValueError;
}

/**
 * @brief Return the value of a TimeResult or raise the matching Python error
 */
template <typename T>
T unwrap(tempora::TimeResult<T> result) {
    if (!result.has_value()) {
        PyErr_SetString(exception_type_for(result.error()),
                        tempora::time_error_string(result.error()));
        throw nb::python_error();
    }
    return std::move(*result);
}

} // namespace tempora_python
