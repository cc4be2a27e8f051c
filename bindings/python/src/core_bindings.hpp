#pragma once
// Core bindings: Weekday, YearMonthDay, calendar functions

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/tuple.h>

#include <tempora/calendar.hpp>

#include "py_types.hpp"

#include <sstream>
#include <tuple>

namespace nb = nanobind;
using namespace nb::literals;

namespace tempora_python {

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // Enums
    // =========================================================================

    nb::enum_<tempora::Weekday>(m, "Weekday", "Day of the week")
        .value("sunday", tempora::Weekday::sunday)
        .value("monday", tempora::Weekday::monday)
        .value("tuesday", tempora::Weekday::tuesday)
        .value("wednesday", tempora::Weekday::wednesday)
        .value("thursday", tempora::Weekday::thursday)
        .value("friday", tempora::Weekday::friday)
        .value("saturday", tempora::Weekday::saturday)
        .def("__str__",
             [](tempora::Weekday w) { return std::string(tempora::weekday_string(w)); });

    // =========================================================================
    // Calendar functions
    // =========================================================================

    m.def("is_leap", &tempora::is_leap, "year"_a, "True for a Gregorian leap year");

    m.def("days_in_month", &tempora::days_in_month, "year"_a, "month"_a,
          "Length of the month in days (0 for a month outside 1..12)");

    m.def("is_valid", &tempora::is_valid, "year"_a, "month"_a, "day"_a,
          "True if the fields name a real calendar date");

    m.def(
        "days_from_civil",
        [](int32_t year, int32_t month, int32_t day) {
            return tempora::days_from_civil(year, month, day);
        },
        "year"_a, "month"_a, "day"_a,
        "Days since 1970-01-01; out-of-range fields carry into the neighbouring "
        "months and years");

    m.def(
        "civil_from_days",
        [](int32_t days) {
            auto date = tempora::civil_from_days(days);
            return std::make_tuple(date.year, date.month, date.day);
        },
        "days"_a, "(year, month, day) for a day count since 1970-01-01");

    m.def(
        "weekday_from_days", [](int64_t days) { return tempora::weekday_from_days(days); },
        "days"_a, "Day of the week for a day count since 1970-01-01");

    // =========================================================================
    // YearMonthDay
    // =========================================================================

    nb::class_<tempora::YearMonthDay>(m, "YearMonthDay",
                                      "Field-layout calendar date (validity is not enforced)")
        .def(nb::init<>(), "1970-01-01")
        .def(nb::init<int32_t, int32_t, int32_t>(), "year"_a, "month"_a, "day"_a)
        .def_static(
            "from_days",
            [](int32_t days) {
                return tempora::YearMonthDay(tempora::SysDays(tempora::Days(days)));
            },
            "days"_a, "Date of a day count since 1970-01-01")
        .def_prop_ro("year", &tempora::YearMonthDay::year)
        .def_prop_ro("month", &tempora::YearMonthDay::month)
        .def_prop_ro("day", &tempora::YearMonthDay::day)
        .def("ok", &tempora::YearMonthDay::ok, "True if the fields name a real date")
        .def(
            "to_days",
            [](const tempora::YearMonthDay& ymd) {
                return unwrap(ymd.to_sys_days()).since_epoch().count();
            },
            "Days since 1970-01-01 (raises CalendarFieldError for an invalid date)")
        .def(
            "weekday",
            [](const tempora::YearMonthDay& ymd) { return unwrap(ymd.weekday()); },
            "Day of the week (raises CalendarFieldError for an invalid date)")
        .def(
            "add_months",
            [](const tempora::YearMonthDay& ymd, int32_t n) {
                return unwrap(ymd + tempora::CalendarMonths(n));
            },
            "n"_a, "Move the month field, carrying into the year; the day is kept")
        .def(
            "add_years",
            [](const tempora::YearMonthDay& ymd, int32_t n) {
                return unwrap(ymd + tempora::CalendarYears(n));
            },
            "n"_a, "Move the year field; month and day are kept")
        .def(
            "clamp_to_month_end",
            [](const tempora::YearMonthDay& ymd) { return tempora::clamp_to_month_end(ymd); },
            "Clamp the day to the last day of the month")
        .def(
            "roll_over",
            [](const tempora::YearMonthDay& ymd) { return unwrap(tempora::roll_over(ymd)); },
            "Spill excess days and months into the following ones")
        .def("__eq__", [](const tempora::YearMonthDay& a,
                          const tempora::YearMonthDay& b) { return a == b; })
        .def("__lt__", [](const tempora::YearMonthDay& a,
                          const tempora::YearMonthDay& b) { return a < b; })
        .def("__le__", [](const tempora::YearMonthDay& a,
                          const tempora::YearMonthDay& b) { return a <= b; })
        .def("__repr__", [](const tempora::YearMonthDay& ymd) {
            std::ostringstream oss;
            oss << "YearMonthDay(" << ymd.year() << ", " << ymd.month() << ", " << ymd.day()
                << (ymd.ok() ? ")" : ", invalid)");
            return oss.str();
        });
}

} // namespace tempora_python
