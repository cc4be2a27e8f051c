#pragma once

/**
 * @file tempora.hpp
 * @brief Strongly-typed durations, clocks, time points and calendar dates
 *
 * Types provided:
 * - Ratio / RationalPeriod - compile-time and runtime tick periods
 * - Duration - tick count with a compile-time period (Seconds, Milliseconds, ...)
 * - TimePoint - Duration since the epoch of a clock type
 * - SteadyClock, SystemClock, LocalClock - clocks read from the host
 * - UtcClock, TaiClock, GpsClock, FileClock - derived time scales
 * - YearMonthDay, Weekday, TimeOfDay - field-layout calendar types
 *
 * Every fallible operation returns TimeResult<T> (expected<T, TimeError>).
 */

#include "tempora/calendar.hpp"
#include "tempora/clock.hpp"
#include "tempora/duration.hpp"
#include "tempora/error.hpp"
#include "tempora/expected.hpp"
#include "tempora/leap_seconds.hpp"
#include "tempora/period.hpp"
#include "tempora/time_of_day.hpp"
#include "tempora/time_point.hpp"
#include "tempora/time_scales.hpp"
