#pragma once

#include "tempora/detail/tick_math.hpp"
#include "tempora/error.hpp"

#include <compare>
#include <concepts>
#include <numeric>
#include <type_traits>

#include <cstdint>

namespace tempora {

/**
 * Reduced positive fraction of a second: the length of one tick.
 *
 * ## Invariants
 * - num() > 0 and den() > 0
 * - gcd(num(), den()) == 1
 *
 * Instances can only be obtained through reduce() or Ratio<N, D>::value, so an
 * unreduced or zero-denominator period is never observable.
 *
 * Ordering compares the represented fractions by cross-multiplication in
 * 128-bit integers (no floating-point rounding).
 *
 * This is a core library type: constexpr, noexcept, no allocation.
 */
class RationalPeriod {
public:
    /// One second per tick
    constexpr RationalPeriod() noexcept = default;

    /**
     * Build a period from an arbitrary fraction, reducing to lowest terms.
     *
     * @return Reduced period, or TimeError::invalid_period if den == 0, den < 0
     *         or num <= 0
     */
    static constexpr TimeResult<RationalPeriod> reduce(std::intmax_t num,
                                                       std::intmax_t den) noexcept {
        if (den <= 0 || num <= 0) {
            return make_time_error(TimeError::invalid_period);
        }
        const std::intmax_t g = std::gcd(num, den);
        return RationalPeriod(num / g, den / g);
    }

    constexpr std::intmax_t num() const noexcept { return num_; }
    constexpr std::intmax_t den() const noexcept { return den_; }

    /// Period length in seconds (lossy, for display only)
    constexpr double seconds() const noexcept {
        return static_cast<double>(num_) / static_cast<double>(den_);
    }

    constexpr bool operator==(const RationalPeriod&) const noexcept = default;

    friend constexpr std::strong_ordering operator<=>(RationalPeriod lhs,
                                                      RationalPeriod rhs) noexcept {
        const detail::wide_int a = static_cast<detail::wide_int>(lhs.num_) * rhs.den_;
        const detail::wide_int b = static_cast<detail::wide_int>(rhs.num_) * lhs.den_;
        if (a < b) {
            return std::strong_ordering::less;
        }
        if (a > b) {
            return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }

private:
    constexpr RationalPeriod(std::intmax_t num, std::intmax_t den) noexcept
        : num_(num),
          den_(den) {}

    std::intmax_t num_{1};
    std::intmax_t den_{1};
};

namespace detail {

/// lcm that reports overflow as 0 instead of invoking undefined behavior
constexpr std::intmax_t checked_lcm(std::intmax_t a, std::intmax_t b) noexcept {
    const std::intmax_t g = std::gcd(a, b);
    const wide_int r = static_cast<wide_int>(a / g) * b;
    if (r > static_cast<wide_int>(std::numeric_limits<std::intmax_t>::max())) {
        return 0;
    }
    return static_cast<std::intmax_t>(r);
}

} // namespace detail

/**
 * Common period of two periods: gcd of the numerators over lcm of the
 * denominators.
 *
 * The result is the coarsest period in which both inputs are a whole number
 * of ticks.
 *
 * @return Common period, or TimeError::overflow if the lcm of the
 *         denominators exceeds intmax_t
 */
constexpr TimeResult<RationalPeriod> common_period(RationalPeriod a, RationalPeriod b) noexcept {
    const std::intmax_t den = detail::checked_lcm(a.den(), b.den());
    if (den == 0) {
        return make_time_error(TimeError::overflow);
    }
    return RationalPeriod::reduce(std::gcd(a.num(), b.num()), den);
}

/**
 * Compile-time tick period, the type-level form of RationalPeriod.
 *
 * Ratio<2, 4> and Ratio<1, 2> have the same num/den and value; Duration
 * normalizes its period to Ratio<num, den> through the nested `type`.
 */
template <std::intmax_t Num, std::intmax_t Den = 1>
struct Ratio {
    static_assert(Den != 0, "tick period denominator must not be zero");
    static_assert(Num > 0 && Den > 0, "tick period must be positive");

    static constexpr std::intmax_t num = Num / std::gcd(Num, Den);
    static constexpr std::intmax_t den = Den / std::gcd(Num, Den);
    static constexpr RationalPeriod value = *RationalPeriod::reduce(Num, Den);

    using type = Ratio<num, den>;
};

template <typename T>
struct is_ratio : std::false_type {};

template <std::intmax_t Num, std::intmax_t Den>
struct is_ratio<Ratio<Num, Den>> : std::true_type {};

template <typename T>
inline constexpr bool is_ratio_v = is_ratio<T>::value;

/// Satisfied by every Ratio<N, D> instantiation
template <typename T>
concept PeriodType = is_ratio_v<T>;

namespace detail {

template <PeriodType P1, PeriodType P2>
struct CommonPeriodImpl {
    static constexpr std::intmax_t den = checked_lcm(P1::den, P2::den);
    static_assert(den != 0, "common tick period denominator overflows intmax_t");

    using type = typename Ratio<std::gcd(P1::num, P2::num), den>::type;
};

} // namespace detail

/// Type-level common_period()
template <PeriodType P1, PeriodType P2>
using CommonPeriod = typename detail::CommonPeriodImpl<P1, P2>::type;

// SI prefixes
using Nano = Ratio<1, 1'000'000'000>;
using Micro = Ratio<1, 1'000'000>;
using Milli = Ratio<1, 1'000>;
using Kilo = Ratio<1'000, 1>;

} // namespace tempora
