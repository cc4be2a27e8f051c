#pragma once

#include "tempora/clock.hpp"
#include "tempora/detail/tick_math.hpp"
#include "tempora/duration.hpp"
#include "tempora/error.hpp"
#include "tempora/time_point.hpp"

#include <compare>

#include <cstdint>

namespace tempora {

// =============================================================================
// Serial <-> field conversion
// =============================================================================
//
// Proleptic Gregorian calendar, day 0 = 1970-01-01. The algorithms work on
// 400-year eras (146097 days) with March as the first month of the internal
// year so that the leap day falls at the end; no loops over months or years.

/**
 * @brief Year/month/day triple as produced by civil_from_days()
 */
struct CivilDate {
    std::int32_t year{1970};
    std::int32_t month{1};
    std::int32_t day{1};

    constexpr bool operator==(const CivilDate&) const noexcept = default;
};

/// Gregorian leap year: divisible by 4, and not by 100 unless by 400
constexpr bool is_leap(std::int64_t year) noexcept {
    return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

/// Length of a month in days, or 0 if month is outside [1, 12]
constexpr std::int32_t days_in_month(std::int64_t year, std::int64_t month) noexcept {
    switch (month) {
        case 1:
        case 3:
        case 5:
        case 7:
        case 8:
        case 10:
        case 12:
            return 31;
        case 4:
        case 6:
        case 9:
        case 11:
            return 30;
        case 2:
            return is_leap(year) ? 29 : 28;
        default:
            return 0;
    }
}

constexpr bool is_valid(std::int64_t year, std::int64_t month, std::int64_t day) noexcept {
    return month >= 1 && month <= 12 && day >= 1 && day <= days_in_month(year, month);
}

/**
 * Days since 1970-01-01 for a year/month/day triple.
 *
 * Fields are not validated. An out-of-range month carries into the year
 * (month 13 is January of the next year, month 0 December of the previous
 * one); an out-of-range day continues linearly into the neighbouring months
 * (April 31 == May 1, March 0 == last day of February).
 *
 * The result always fits int64 for int32 fields.
 */
constexpr std::int64_t days_from_civil(std::int64_t year, std::int64_t month,
                                       std::int64_t day) noexcept {
    year += detail::floor_div(month - 1, 12);
    month = detail::floor_mod(month - 1, 12) + 1;

    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = detail::floor_div(year, 400);
    const std::int64_t yoe = year - era * 400;                      // [0, 399]
    const std::int64_t mp = (month + 9) % 12;                       // March == 0
    const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;          // [0, 365] for valid days
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy; // [0, 146096]
    return era * 146097 + doe - 719468;
}

/// Exact inverse of days_from_civil() for every int32 day count
constexpr CivilDate civil_from_days(std::int32_t days) noexcept {
    const std::int64_t z = static_cast<std::int64_t>(days) + 719468;
    const std::int64_t era = detail::floor_div(z, 146097);
    const std::int64_t doe = z - era * 146097;                                    // [0, 146096]
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365; // [0, 399]
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);             // [0, 365]
    const std::int64_t mp = (5 * doy + 2) / 153;                                  // [0, 11]
    const std::int64_t day = doy - (153 * mp + 2) / 5 + 1;                        // [1, 31]
    const std::int64_t month = mp < 10 ? mp + 3 : mp - 9;                         // [1, 12]
    const std::int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);

    return CivilDate{static_cast<std::int32_t>(year), static_cast<std::int32_t>(month),
                     static_cast<std::int32_t>(day)};
}

// =============================================================================
// Weekday
// =============================================================================

enum class Weekday : uint8_t {
    sunday = 0,
    monday = 1,
    tuesday = 2,
    wednesday = 3,
    thursday = 4,
    friday = 5,
    saturday = 6
};

[[nodiscard]] constexpr const char* weekday_string(Weekday w) noexcept {
    switch (w) {
        case Weekday::sunday:
            return "Sunday";
        case Weekday::monday:
            return "Monday";
        case Weekday::tuesday:
            return "Tuesday";
        case Weekday::wednesday:
            return "Wednesday";
        case Weekday::thursday:
            return "Thursday";
        case Weekday::friday:
            return "Friday";
        case Weekday::saturday:
            return "Saturday";
    }
    return "Unknown";
}

/// Day of the week of a day count since 1970-01-01 (a Thursday)
constexpr Weekday weekday_from_days(std::int64_t days) noexcept {
    return static_cast<Weekday>(detail::floor_mod(days + 4, 7));
}

// =============================================================================
// Calendar-exact month and year counts
// =============================================================================

/**
 * @brief Whole calendar months for field arithmetic
 *
 * Distinct from the averaged Months duration: adding CalendarMonths moves the
 * month field and leaves the day field alone.
 */
class CalendarMonths {
public:
    constexpr explicit CalendarMonths(std::int32_t count) noexcept : count_(count) {}
    constexpr std::int32_t count() const noexcept { return count_; }

private:
    std::int32_t count_;
};

/// Whole calendar years for field arithmetic (see CalendarMonths)
class CalendarYears {
public:
    constexpr explicit CalendarYears(std::int32_t count) noexcept : count_(count) {}
    constexpr std::int32_t count() const noexcept { return count_; }

private:
    std::int32_t count_;
};

// =============================================================================
// YearMonthDay
// =============================================================================

/**
 * Field-layout calendar date.
 *
 * ## Validity
 * Construction never fails: any field combination is stored as given and
 * ok() reports whether it names a real date. Conversion back to a day count
 * (to_sys_days / to_local_days) refuses invalid fields with
 * TimeError::invalid_calendar_field; roll_over() and clamp_to_month_end() are
 * the explicit policies for turning an invalid date into a valid one.
 *
 * ## Field arithmetic
 * Adding CalendarMonths or CalendarYears changes only the month/year fields,
 * carrying months into the year. The day is never adjusted, so
 * 2024-01-31 + 1 month is the invalid 2024-02-31.
 *
 * Adding a Duration (including the averaged Months and Years) is rejected at
 * compile time; convert to SysDays for serial arithmetic instead.
 *
 * Ordering is lexicographic on (year, month, day).
 */
class YearMonthDay {
public:
    /// 1970-01-01
    constexpr YearMonthDay() noexcept = default;

    constexpr YearMonthDay(std::int32_t year, std::int32_t month, std::int32_t day) noexcept
        : year_(year),
          month_(month),
          day_(day) {}

    constexpr explicit YearMonthDay(const CivilDate& date) noexcept
        : YearMonthDay(date.year, date.month, date.day) {}

    constexpr explicit YearMonthDay(const SysDays& days) noexcept
        : YearMonthDay(civil_from_days(days.since_epoch().count())) {}

    constexpr explicit YearMonthDay(const LocalDays& days) noexcept
        : YearMonthDay(civil_from_days(days.since_epoch().count())) {}

    constexpr std::int32_t year() const noexcept { return year_; }
    constexpr std::int32_t month() const noexcept { return month_; }
    constexpr std::int32_t day() const noexcept { return day_; }

    constexpr bool ok() const noexcept { return is_valid(year_, month_, day_); }

    /// Serial day count, or invalid_calendar_field / overflow
    constexpr TimeResult<SysDays> to_sys_days() const noexcept {
        return serial_days().map([](Days d) { return SysDays(d); });
    }

    constexpr TimeResult<LocalDays> to_local_days() const noexcept {
        return serial_days().map([](Days d) { return LocalDays(d); });
    }

    /// Day of the week; invalid_calendar_field for an invalid date
    constexpr TimeResult<Weekday> weekday() const noexcept {
        if (!ok()) {
            return make_time_error(TimeError::invalid_calendar_field);
        }
        return weekday_from_days(days_from_civil(year_, month_, day_));
    }

    friend constexpr auto operator<=>(const YearMonthDay&, const YearMonthDay&) noexcept = default;
    friend constexpr bool operator==(const YearMonthDay&, const YearMonthDay&) noexcept = default;

private:
    constexpr TimeResult<Days> serial_days() const noexcept {
        if (!ok()) {
            return make_time_error(TimeError::invalid_calendar_field);
        }
        auto n = detail::narrow<Days::rep>(days_from_civil(year_, month_, day_));
        if (!n) {
            return make_time_error(TimeError::overflow);
        }
        return Days(*n);
    }

    std::int32_t year_{1970};
    std::int32_t month_{1};
    std::int32_t day_{1};
};

namespace detail {

constexpr TimeResult<YearMonthDay> shift_months(const YearMonthDay& ymd,
                                                std::int64_t months) noexcept {
    const std::int64_t total = static_cast<std::int64_t>(ymd.year()) * 12 + (ymd.month() - 1) + months;
    auto year = narrow<std::int32_t>(floor_div(total, 12));
    if (!year) {
        return make_time_error(TimeError::overflow);
    }
    return YearMonthDay(*year, static_cast<std::int32_t>(floor_mod(total, 12) + 1), ymd.day());
}

constexpr TimeResult<YearMonthDay> shift_years(const YearMonthDay& ymd, std::int64_t years) noexcept {
    auto year = narrow<std::int32_t>(static_cast<std::int64_t>(ymd.year()) + years);
    if (!year) {
        return make_time_error(TimeError::overflow);
    }
    return YearMonthDay(*year, ymd.month(), ymd.day());
}

} // namespace detail

constexpr TimeResult<YearMonthDay> operator+(const YearMonthDay& ymd, CalendarMonths m) noexcept {
    return detail::shift_months(ymd, m.count());
}

constexpr TimeResult<YearMonthDay> operator+(CalendarMonths m, const YearMonthDay& ymd) noexcept {
    return detail::shift_months(ymd, m.count());
}

constexpr TimeResult<YearMonthDay> operator-(const YearMonthDay& ymd, CalendarMonths m) noexcept {
    return detail::shift_months(ymd, -static_cast<std::int64_t>(m.count()));
}

constexpr TimeResult<YearMonthDay> operator+(const YearMonthDay& ymd, CalendarYears y) noexcept {
    return detail::shift_years(ymd, y.count());
}

constexpr TimeResult<YearMonthDay> operator+(CalendarYears y, const YearMonthDay& ymd) noexcept {
    return detail::shift_years(ymd, y.count());
}

constexpr TimeResult<YearMonthDay> operator-(const YearMonthDay& ymd, CalendarYears y) noexcept {
    return detail::shift_years(ymd, -static_cast<std::int64_t>(y.count()));
}

// Averaged units do not track month boundaries; mixing them with field
// layout would silently pick a rounding rule.
template <typename Rep, typename Period>
void operator+(const YearMonthDay&, const Duration<Rep, Period>&) = delete;

template <typename Rep, typename Period>
void operator+(const Duration<Rep, Period>&, const YearMonthDay&) = delete;

template <typename Rep, typename Period>
void operator-(const YearMonthDay&, const Duration<Rep, Period>&) = delete;

// =============================================================================
// Day overflow policies
// =============================================================================

/**
 * Clamp the day to the last day of the month (2023-02-31 -> 2023-02-28).
 *
 * Only the day field is adjusted: a date with a month outside [1, 12] or a
 * day below 1 is returned unchanged and stays !ok().
 */
constexpr YearMonthDay clamp_to_month_end(const YearMonthDay& ymd) noexcept {
    const std::int32_t last = days_in_month(ymd.year(), ymd.month());
    if (last == 0 || ymd.day() <= last) {
        return ymd;
    }
    return YearMonthDay(ymd.year(), ymd.month(), last);
}

/**
 * Normalize any field combination the way days_from_civil() reads it.
 *
 * Excess months carry into the year and excess days spill into the following
 * months (2023-02-31 -> 2023-03-03). The result is always ok().
 *
 * @return Valid date, or TimeError::overflow if it lies outside the Days range
 */
constexpr TimeResult<YearMonthDay> roll_over(const YearMonthDay& ymd) noexcept {
    auto n = detail::narrow<Days::rep>(days_from_civil(ymd.year(), ymd.month(), ymd.day()));
    if (!n) {
        return make_time_error(TimeError::overflow);
    }
    return YearMonthDay(civil_from_days(*n));
}

} // namespace tempora
