#pragma once
// Error bindings: TimeError, TimeOverflowError, CalendarFieldError

#include <nanobind/nanobind.h>

#include <tempora/error.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace tempora_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // TimeError enum
    // =========================================================================

    nb::enum_<tempora::TimeError>(m, "TimeError", "Failure kinds of tempora operations")
        .value("invalid_period", tempora::TimeError::invalid_period,
               "Zero/negative denominator or non-positive numerator")
        .value("overflow", tempora::TimeError::overflow,
               "Result exceeds the tick range")
        .value("invalid_calendar_field", tempora::TimeError::invalid_calendar_field,
               "Year/month/day combination is not a calendar date")
        .value("division_by_zero", tempora::TimeError::division_by_zero,
               "Divisor is zero")
        .value("unsorted_leap_table", tempora::TimeError::unsorted_leap_table,
               "Leap second insertions are not strictly increasing")
        .def("__str__",
             [](tempora::TimeError e) { return std::string(tempora::time_error_string(e)); })
        .def("__repr__", [](tempora::TimeError e) {
            return std::string("TimeError.") + tempora::time_error_string(e);
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // TimeOverflowError - a tick count left its representable range
    auto overflow_error =
        nb::exception<std::overflow_error>(m, "TimeOverflowError", PyExc_OverflowError);
    time_overflow_error_type = overflow_error.ptr();

    // CalendarFieldError - conversion of an invalid year/month/day
    auto calendar_error =
        nb::exception<std::domain_error>(m, "CalendarFieldError", PyExc_ValueError);
    calendar_field_error_type = calendar_error.ptr();
}

} // namespace tempora_python
