#pragma once
// Clock bindings: clock reads and time scale conversions in integer ticks

#include <nanobind/nanobind.h>
#include <nanobind/stl/tuple.h>

#include <tempora/clock.hpp>
#include <tempora/time_scales.hpp>

#include "py_types.hpp"

#include <tuple>

namespace nb = nanobind;
using namespace nb::literals;

namespace tempora_python {

inline void bind_clocks(nb::module_& m) {
    // =========================================================================
    // Clock reads
    // =========================================================================

    m.def(
        "steady_now_ns", [] { return tempora::SteadyClock::now().since_epoch().count(); },
        "Monotonic clock reading in nanoseconds (unspecified epoch)");
    m.def(
        "system_now_ns", [] { return tempora::SystemClock::now().since_epoch().count(); },
        "Nanoseconds since 1970-01-01, leap seconds not counted");
    m.def(
        "utc_now_ns", [] { return tempora::UtcClock::now().since_epoch().count(); },
        "Nanoseconds since 1970-01-01, leap seconds counted");
    m.def(
        "tai_now_ns", [] { return tempora::TaiClock::now().since_epoch().count(); },
        "Nanoseconds since 1958-01-01 TAI");
    m.def(
        "gps_now_ns", [] { return tempora::GpsClock::now().since_epoch().count(); },
        "Nanoseconds since 1980-01-06");
    m.def(
        "file_now_ticks", [] { return tempora::FileClock::now().since_epoch().count(); },
        "100 ns ticks since 1601-01-01");

    // =========================================================================
    // Conversions (nanoseconds in, nanoseconds out; builtin leap second table)
    // =========================================================================

    using tempora::Nanoseconds;

    m.def(
        "utc_from_sys",
        [](int64_t ns) {
            return unwrap(tempora::utc_from_sys(tempora::SysTime<Nanoseconds>(Nanoseconds(ns))))
                .since_epoch()
                .count();
        },
        "ns"_a);
    m.def(
        "sys_from_utc",
        [](int64_t ns) {
            return unwrap(tempora::sys_from_utc(tempora::UtcTime<Nanoseconds>(Nanoseconds(ns))))
                .since_epoch()
                .count();
        },
        "ns"_a);
    m.def(
        "tai_from_utc",
        [](int64_t ns) {
            return unwrap(tempora::tai_from_utc(tempora::UtcTime<Nanoseconds>(Nanoseconds(ns))))
                .since_epoch()
                .count();
        },
        "ns"_a);
    m.def(
        "utc_from_tai",
        [](int64_t ns) {
            return unwrap(tempora::utc_from_tai(tempora::TaiTime<Nanoseconds>(Nanoseconds(ns))))
                .since_epoch()
                .count();
        },
        "ns"_a);
    m.def(
        "gps_from_utc",
        [](int64_t ns) {
            return unwrap(tempora::gps_from_utc(tempora::UtcTime<Nanoseconds>(Nanoseconds(ns))))
                .since_epoch()
                .count();
        },
        "ns"_a);
    m.def(
        "utc_from_gps",
        [](int64_t ns) {
            return unwrap(tempora::utc_from_gps(tempora::GpsTime<Nanoseconds>(Nanoseconds(ns))))
                .since_epoch()
                .count();
        },
        "ns"_a);

    m.def(
        "leap_second_info",
        [](int64_t utc_ns) {
            auto info = unwrap(
                tempora::leap_second_info(tempora::UtcTime<Nanoseconds>(Nanoseconds(utc_ns))));
            return std::make_tuple(info.is_leap_second, info.elapsed.count());
        },
        "utc_ns"_a, "(is_leap_second, elapsed leap seconds) of a UTC instant");
}

} // namespace tempora_python
