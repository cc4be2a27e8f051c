#pragma once

#include "tempora/detail/tick_math.hpp"
#include "tempora/error.hpp"
#include "tempora/period.hpp"

#include <compare>
#include <concepts>
#include <limits>
#include <numeric>
#include <type_traits>

#include <cstdint>

namespace tempora {

/// Tick storage: signed integers or floating point
template <typename T>
concept TickRep = std::signed_integral<T> || std::floating_point<T>;

template <TickRep Rep, PeriodType Period = Ratio<1>>
class Duration;

template <typename T>
struct is_duration : std::false_type {};

template <TickRep Rep, PeriodType Period>
struct is_duration<Duration<Rep, Period>> : std::true_type {};

template <typename T>
inline constexpr bool is_duration_v = is_duration<T>::value;

template <typename T>
concept DurationType = is_duration_v<T>;

/**
 * Duration type used to combine D1 and D2.
 *
 * Period is CommonPeriod of both periods; Rep is the wider of the two reps,
 * or floating point if either one is.
 */
template <DurationType D1, DurationType D2>
using CommonDuration = Duration<std::common_type_t<typename D1::rep, typename D2::rep>,
                                CommonPeriod<typename D1::period, typename D2::period>>;

/**
 * Signed tick count with a compile-time tick period.
 *
 * ## Representation
 * `count() * Period::num / Period::den` seconds. The period is part of the
 * type: a Duration never converts implicitly into another (Rep, Period).
 * Cross-unit work goes through duration_cast/floor/ceil/round, or through
 * the arithmetic and comparison operators, which re-express both operands
 * in CommonDuration first.
 *
 * ## Overflow Policy
 * Every operator that produces a new duration returns TimeResult:
 * - TimeError::overflow when a rescaled operand or the result leaves the
 *   Rep range (never wraps)
 * - TimeError::division_by_zero for a zero divisor
 *
 * Rescaling is done in 128-bit integers for integer reps and in long double
 * for floating reps.
 *
 * Comparison never fails: operands are compared exactly in the common period.
 *
 * This is a core library type: constexpr, noexcept, no allocation.
 */
template <TickRep Rep, PeriodType Period>
class Duration {
public:
    using rep = Rep;
    using period = typename Period::type;

    constexpr Duration() noexcept = default;

    constexpr explicit Duration(Rep ticks) noexcept : ticks_(ticks) {}

    /// Raw tick count, no conversion
    constexpr Rep count() const noexcept { return ticks_; }

    // Named constants
    static constexpr Duration zero() noexcept { return Duration(Rep{0}); }

    static constexpr Duration min() noexcept {
        return Duration(std::numeric_limits<Rep>::lowest());
    }

    static constexpr Duration max() noexcept { return Duration(std::numeric_limits<Rep>::max()); }

    // Predicates
    constexpr bool is_zero() const noexcept { return ticks_ == Rep{0}; }
    constexpr bool is_negative() const noexcept { return ticks_ < Rep{0}; }
    constexpr bool is_positive() const noexcept { return ticks_ > Rep{0}; }

    constexpr Duration operator+() const noexcept { return *this; }

private:
    Rep ticks_{0};
};

// Named units. Months and Years are averaged Gregorian lengths, not calendar months/years.
using Nanoseconds = Duration<std::int64_t, Nano>;
using Microseconds = Duration<std::int64_t, Micro>;
using Milliseconds = Duration<std::int64_t, Milli>;
using Seconds = Duration<std::int64_t>;
using Minutes = Duration<std::int64_t, Ratio<60>>;
using Hours = Duration<std::int64_t, Ratio<3600>>;
using Days = Duration<std::int32_t, Ratio<86400>>;
using Weeks = Duration<std::int32_t, Ratio<604800>>;
using Years = Duration<std::int32_t, Ratio<31556952>>;
using Months = Duration<std::int32_t, Ratio<2629746>>;

namespace detail {

/**
 * FromPeriod / ToPeriod as a reduced fraction of wide integers.
 *
 * Cross-reducing before multiplying keeps each term below 2^126.
 */
template <PeriodType FromPeriod, PeriodType ToPeriod>
struct PeriodRatio {
    static constexpr std::intmax_t g_num = std::gcd(FromPeriod::num, ToPeriod::num);
    static constexpr std::intmax_t g_den = std::gcd(FromPeriod::den, ToPeriod::den);

    static constexpr wide_int num =
        static_cast<wide_int>(FromPeriod::num / g_num) * (ToPeriod::den / g_den);
    static constexpr wide_int den =
        static_cast<wide_int>(ToPeriod::num / g_num) * (FromPeriod::den / g_den);
};

/**
 * Integer factor that re-expresses one tick of Period in CommonPeriod ticks.
 *
 * Bounded to intmax_t so that count * factor always fits in 128 bits.
 */
template <PeriodType Period, PeriodType Common>
struct CommonFactor {
    using R = PeriodRatio<Period, Common>;
    static_assert(R::den == 1, "common period must divide the operand period");
    static_assert(R::num <= static_cast<wide_int>(std::numeric_limits<std::intmax_t>::max()),
                  "tick periods are too far apart to combine exactly");

    static constexpr wide_int value = R::num;
};

template <DurationType To, typename Rep, typename Period>
constexpr TimeResult<To> convert(const Duration<Rep, Period>& d, RoundMode mode) noexcept {
    using R = PeriodRatio<typename Duration<Rep, Period>::period, typename To::period>;
    using ToRep = typename To::rep;

    if constexpr (std::floating_point<Rep> || std::floating_point<ToRep>) {
        const long double src = static_cast<long double>(d.count());
        long double v = src;
        if (R::num != 1) {
            v *= static_cast<long double>(R::num);
        }
        if (R::den != 1) {
            v /= static_cast<long double>(R::den);
        }
        auto out = round_floating<ToRep>(v, is_finite(src), mode);
        if (!out) {
            return make_time_error(TimeError::overflow);
        }
        return To(*out);
    } else {
        auto scaled = scale(static_cast<wide_int>(d.count()), R::num, R::den, mode);
        if (!scaled) {
            return make_time_error(TimeError::overflow);
        }
        auto out = narrow<ToRep>(*scaled);
        if (!out) {
            return make_time_error(TimeError::overflow);
        }
        return To(*out);
    }
}

/// Store a wide intermediate as D, failing on range violation
template <DurationType D>
constexpr TimeResult<D> from_wide(wide_int ticks) noexcept {
    auto out = narrow<typename D::rep>(ticks);
    if (!out) {
        return make_time_error(TimeError::overflow);
    }
    return D(*out);
}

/// Store a floating intermediate as D; finite inputs must stay finite
template <DurationType D>
constexpr TimeResult<D> from_floating(long double ticks, bool inputs_finite) noexcept {
    constexpr long double hi = static_cast<long double>(std::numeric_limits<typename D::rep>::max());
    if (inputs_finite && !(ticks >= -hi && ticks <= hi)) {
        return make_time_error(TimeError::overflow);
    }
    return D(static_cast<typename D::rep>(ticks));
}

template <typename Rep>
constexpr bool finite_rep(Rep v) noexcept {
    return is_finite(static_cast<long double>(v));
}

} // namespace detail

// =============================================================================
// Casting and rounding
// =============================================================================

/**
 * Convert to another duration type, truncating toward zero.
 *
 * Integer targets drop any remainder toward zero (integer division semantics).
 * Floating targets keep the exact value when representable.
 *
 * @return Converted duration, or TimeError::overflow if the value does not fit
 *         To::rep (or is non-finite for an integer target)
 */
template <DurationType To, typename Rep, typename Period>
constexpr TimeResult<To> duration_cast(const Duration<Rep, Period>& d) noexcept {
    return detail::convert<To>(d, detail::RoundMode::toward_zero);
}

/// Greatest To not greater than d (exact value for floating targets)
template <DurationType To, typename Rep, typename Period>
constexpr TimeResult<To> floor(const Duration<Rep, Period>& d) noexcept {
    return detail::convert<To>(d, detail::RoundMode::floor);
}

/// Least To not less than d (exact value for floating targets)
template <DurationType To, typename Rep, typename Period>
constexpr TimeResult<To> ceil(const Duration<Rep, Period>& d) noexcept {
    return detail::convert<To>(d, detail::RoundMode::ceil);
}

/// Nearest To; an exact half goes to the even candidate
template <DurationType To, typename Rep, typename Period>
    requires std::signed_integral<typename To::rep>
constexpr TimeResult<To> round(const Duration<Rep, Period>& d) noexcept {
    return detail::convert<To>(d, detail::RoundMode::nearest_even);
}

/// Absolute value; TimeError::overflow for an integer min()
template <typename Rep, typename Period>
constexpr TimeResult<Duration<Rep, Period>> abs(const Duration<Rep, Period>& d) noexcept {
    if constexpr (std::signed_integral<Rep>) {
        if (d.count() == std::numeric_limits<Rep>::min()) {
            return make_time_error(TimeError::overflow);
        }
    }
    return d.count() < Rep{0} ? Duration<Rep, Period>(-d.count()) : d;
}

// =============================================================================
// Arithmetic
// =============================================================================

/// Negation; TimeError::overflow for an integer min()
template <typename Rep, typename Period>
constexpr TimeResult<Duration<Rep, Period>> operator-(const Duration<Rep, Period>& d) noexcept {
    if constexpr (std::signed_integral<Rep>) {
        if (d.count() == std::numeric_limits<Rep>::min()) {
            return make_time_error(TimeError::overflow);
        }
    }
    return Duration<Rep, Period>(-d.count());
}

template <typename R1, typename P1, typename R2, typename P2>
constexpr TimeResult<CommonDuration<Duration<R1, P1>, Duration<R2, P2>>>
operator+(const Duration<R1, P1>& lhs, const Duration<R2, P2>& rhs) noexcept {
    using CD = CommonDuration<Duration<R1, P1>, Duration<R2, P2>>;

    auto a = duration_cast<CD>(lhs);
    if (!a) {
        return make_time_error(a.error());
    }
    auto b = duration_cast<CD>(rhs);
    if (!b) {
        return make_time_error(b.error());
    }

    if constexpr (std::floating_point<typename CD::rep>) {
        return detail::from_floating<CD>(
            static_cast<long double>(a->count()) + static_cast<long double>(b->count()),
            detail::finite_rep(a->count()) && detail::finite_rep(b->count()));
    } else {
        return detail::from_wide<CD>(static_cast<detail::wide_int>(a->count()) +
                                     static_cast<detail::wide_int>(b->count()));
    }
}

template <typename R1, typename P1, typename R2, typename P2>
constexpr TimeResult<CommonDuration<Duration<R1, P1>, Duration<R2, P2>>>
operator-(const Duration<R1, P1>& lhs, const Duration<R2, P2>& rhs) noexcept {
    using CD = CommonDuration<Duration<R1, P1>, Duration<R2, P2>>;

    auto a = duration_cast<CD>(lhs);
    if (!a) {
        return make_time_error(a.error());
    }
    auto b = duration_cast<CD>(rhs);
    if (!b) {
        return make_time_error(b.error());
    }

    if constexpr (std::floating_point<typename CD::rep>) {
        return detail::from_floating<CD>(
            static_cast<long double>(a->count()) - static_cast<long double>(b->count()),
            detail::finite_rep(a->count()) && detail::finite_rep(b->count()));
    } else {
        return detail::from_wide<CD>(static_cast<detail::wide_int>(a->count()) -
                                     static_cast<detail::wide_int>(b->count()));
    }
}

template <typename Rep, typename Period, TickRep S>
constexpr TimeResult<Duration<std::common_type_t<Rep, S>, Period>>
operator*(const Duration<Rep, Period>& d, const S& scalar) noexcept {
    using Result = Duration<std::common_type_t<Rep, S>, Period>;

    if constexpr (std::floating_point<typename Result::rep>) {
        return detail::from_floating<Result>(
            static_cast<long double>(d.count()) * static_cast<long double>(scalar),
            detail::finite_rep(d.count()) && detail::finite_rep(scalar));
    } else {
        // int64 * int64 always fits in 128 bits
        return detail::from_wide<Result>(static_cast<detail::wide_int>(d.count()) *
                                         static_cast<detail::wide_int>(scalar));
    }
}

template <TickRep S, typename Rep, typename Period>
constexpr TimeResult<Duration<std::common_type_t<Rep, S>, Period>>
operator*(const S& scalar, const Duration<Rep, Period>& d) noexcept {
    return d * scalar;
}

template <typename Rep, typename Period, TickRep S>
constexpr TimeResult<Duration<std::common_type_t<Rep, S>, Period>>
operator/(const Duration<Rep, Period>& d, const S& scalar) noexcept {
    using Result = Duration<std::common_type_t<Rep, S>, Period>;

    if (scalar == S{0}) {
        return make_time_error(TimeError::division_by_zero);
    }
    if constexpr (std::floating_point<typename Result::rep>) {
        return detail::from_floating<Result>(
            static_cast<long double>(d.count()) / static_cast<long double>(scalar),
            detail::finite_rep(d.count()) && detail::finite_rep(scalar));
    } else {
        // min / -1 is caught by the range check
        return detail::from_wide<Result>(static_cast<detail::wide_int>(d.count()) /
                                         static_cast<detail::wide_int>(scalar));
    }
}

/// Ratio of two durations, truncated toward zero for integer reps
template <typename R1, typename P1, typename R2, typename P2>
constexpr TimeResult<std::common_type_t<R1, R2>> operator/(const Duration<R1, P1>& lhs,
                                                           const Duration<R2, P2>& rhs) noexcept {
    using CD = CommonDuration<Duration<R1, P1>, Duration<R2, P2>>;
    using CR = typename CD::rep;

    auto a = duration_cast<CD>(lhs);
    if (!a) {
        return make_time_error(a.error());
    }
    auto b = duration_cast<CD>(rhs);
    if (!b) {
        return make_time_error(b.error());
    }
    if (b->is_zero()) {
        return make_time_error(TimeError::division_by_zero);
    }

    if constexpr (std::floating_point<CR>) {
        return static_cast<CR>(static_cast<long double>(a->count()) /
                               static_cast<long double>(b->count()));
    } else {
        auto q = detail::narrow<CR>(static_cast<detail::wide_int>(a->count()) /
                                    static_cast<detail::wide_int>(b->count()));
        if (!q) {
            return make_time_error(TimeError::overflow);
        }
        return *q;
    }
}

template <typename Rep, typename Period, std::signed_integral S>
    requires std::signed_integral<Rep>
constexpr TimeResult<Duration<std::common_type_t<Rep, S>, Period>>
operator%(const Duration<Rep, Period>& d, const S& scalar) noexcept {
    using Result = Duration<std::common_type_t<Rep, S>, Period>;

    if (scalar == S{0}) {
        return make_time_error(TimeError::division_by_zero);
    }
    return detail::from_wide<Result>(static_cast<detail::wide_int>(d.count()) %
                                     static_cast<detail::wide_int>(scalar));
}

template <typename R1, typename P1, typename R2, typename P2>
    requires std::signed_integral<R1> && std::signed_integral<R2>
constexpr TimeResult<CommonDuration<Duration<R1, P1>, Duration<R2, P2>>>
operator%(const Duration<R1, P1>& lhs, const Duration<R2, P2>& rhs) noexcept {
    using CD = CommonDuration<Duration<R1, P1>, Duration<R2, P2>>;

    auto a = duration_cast<CD>(lhs);
    if (!a) {
        return make_time_error(a.error());
    }
    auto b = duration_cast<CD>(rhs);
    if (!b) {
        return make_time_error(b.error());
    }
    if (b->is_zero()) {
        return make_time_error(TimeError::division_by_zero);
    }
    return detail::from_wide<CD>(static_cast<detail::wide_int>(a->count()) %
                                 static_cast<detail::wide_int>(b->count()));
}

// =============================================================================
// Comparison
// =============================================================================

template <typename R1, typename P1, typename R2, typename P2>
constexpr auto operator<=>(const Duration<R1, P1>& lhs, const Duration<R2, P2>& rhs) noexcept {
    using Common = CommonPeriod<typename Duration<R1, P1>::period, typename Duration<R2, P2>::period>;
    constexpr detail::wide_int fa =
        detail::CommonFactor<typename Duration<R1, P1>::period, Common>::value;
    constexpr detail::wide_int fb =
        detail::CommonFactor<typename Duration<R2, P2>::period, Common>::value;

    if constexpr (std::floating_point<R1> || std::floating_point<R2>) {
        const long double a = static_cast<long double>(lhs.count()) * static_cast<long double>(fa);
        const long double b = static_cast<long double>(rhs.count()) * static_cast<long double>(fb);
        return a <=> b;
    } else {
        const detail::wide_int a = static_cast<detail::wide_int>(lhs.count()) * fa;
        const detail::wide_int b = static_cast<detail::wide_int>(rhs.count()) * fb;
        if (a < b) {
            return std::strong_ordering::less;
        }
        if (a > b) {
            return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }
}

template <typename R1, typename P1, typename R2, typename P2>
constexpr bool operator==(const Duration<R1, P1>& lhs, const Duration<R2, P2>& rhs) noexcept {
    return (lhs <=> rhs) == 0;
}

} // namespace tempora
