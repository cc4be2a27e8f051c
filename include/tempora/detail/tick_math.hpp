// include/tempora/detail/tick_math.hpp
#pragma once

#include <limits>
#include <optional>

#include <cmath>
#include <cstdint>

namespace tempora::detail {

/**
 * Centralized tick arithmetic for Duration, TimePoint and the calendar layer.
 *
 * Design rationale:
 * - Single source of truth for rescaling, rounding and range checks
 * - Integer ticks are widened to 128 bits before any multiplication, so an
 *   intermediate value never wraps; the result is range-checked on the way
 *   back into the storage type
 * - Floating ticks are rescaled in long double
 *
 * Overflow policy:
 * - Helpers return std::nullopt when a value cannot be represented
 * - Public operations translate that into TimeError::overflow
 */

using wide_int = __int128;

inline constexpr wide_int WIDE_MAX =
    static_cast<wide_int>(~static_cast<unsigned __int128>(0) >> 1);
inline constexpr wide_int WIDE_MIN = -WIDE_MAX - 1;

/// Rounding applied when a rescaled tick count has a remainder
enum class RoundMode : uint8_t {
    toward_zero, ///< Integer division semantics (duration_cast)
    floor,       ///< Toward negative infinity
    ceil,        ///< Toward positive infinity
    nearest_even ///< Nearest value, exact halves go to the even candidate
};

constexpr wide_int wide_abs(wide_int v) noexcept { return v < 0 ? -v : v; }

/**
 * Multiply two wide values, failing instead of wrapping.
 *
 * @param a Any wide value except WIDE_MIN
 * @param b Any wide value except WIDE_MIN
 * @return Product, or nullopt if it exceeds the 128-bit range
 */
constexpr std::optional<wide_int> checked_mul(wide_int a, wide_int b) noexcept {
    if (a == 0 || b == 0) {
        return wide_int{0};
    }
    if (wide_abs(a) > WIDE_MAX / wide_abs(b)) {
        return std::nullopt;
    }
    return a * b;
}

/**
 * Narrow a wide value back into a storage type.
 *
 * @return Value as Rep, or nullopt if outside [Rep::min, Rep::max]
 */
template <typename Rep>
constexpr std::optional<Rep> narrow(wide_int v) noexcept {
    if (v < static_cast<wide_int>(std::numeric_limits<Rep>::min()) ||
        v > static_cast<wide_int>(std::numeric_limits<Rep>::max())) {
        return std::nullopt;
    }
    return static_cast<Rep>(v);
}

/**
 * Compute t * num / den with the requested rounding.
 *
 * This is the single rescaling routine behind duration_cast, floor, ceil and
 * round for integer ticks.
 *
 * @param t Tick count in the source period
 * @param num Numerator of (source period / target period), > 0
 * @param den Denominator of (source period / target period), > 0
 * @param mode Rounding applied to a non-zero remainder
 * @return Tick count in the target period (NOT narrowed to a storage type),
 *         or nullopt if t * num exceeds the 128-bit range
 */
constexpr std::optional<wide_int> scale(wide_int t, wide_int num, wide_int den,
                                        RoundMode mode) noexcept {
    auto product = checked_mul(t, num);
    if (!product) {
        return std::nullopt;
    }

    // Built-in division truncates toward zero; remainder carries the sign of t
    wide_int quot = *product / den;
    wide_int rem = *product % den;
    if (rem == 0) {
        return quot;
    }

    switch (mode) {
        case RoundMode::toward_zero:
            return quot;

        case RoundMode::floor:
            return rem < 0 ? quot - 1 : quot;

        case RoundMode::ceil:
            return rem > 0 ? quot + 1 : quot;

        case RoundMode::nearest_even: {
            // |rem| < den <= 2^126, so doubling stays in range
            wide_int twice = wide_abs(rem) * 2;
            wide_int away = rem < 0 ? quot - 1 : quot + 1;
            if (twice < den) {
                return quot;
            }
            if (twice > den) {
                return away;
            }
            return (quot % 2 == 0) ? quot : away;
        }
    }
    return quot;
}

/// constexpr-friendly finiteness test (inf - inf and NaN - NaN are NaN)
constexpr bool is_finite(long double v) noexcept {
    return (v - v) == (v - v);
}

/**
 * Round a rescaled floating value and store it as Rep.
 *
 * Floating targets keep the exact value (no rounding) and only fail when a
 * finite source leaves the target's finite range. Integer targets reject
 * non-finite values and apply the rounding mode before the range check.
 *
 * @param v Rescaled value in target ticks
 * @param source_finite Whether the source tick count was finite
 * @param mode Rounding for integer targets
 */
template <typename Rep>
std::optional<Rep> round_floating(long double v, bool source_finite, RoundMode mode) noexcept {
    if constexpr (std::numeric_limits<Rep>::is_integer) {
        if (!is_finite(v)) {
            return std::nullopt;
        }

        long double r = v;
        switch (mode) {
            case RoundMode::toward_zero:
                r = std::trunc(v);
                break;
            case RoundMode::floor:
                r = std::floor(v);
                break;
            case RoundMode::ceil:
                r = std::ceil(v);
                break;
            case RoundMode::nearest_even: {
                long double lower = std::floor(v);
                long double diff = v - lower;
                if (diff > 0.5L) {
                    r = lower + 1;
                } else if (diff < 0.5L) {
                    r = lower;
                } else {
                    r = (std::fmod(lower, 2.0L) == 0) ? lower : lower + 1;
                }
                break;
            }
        }

        // Rep::min is a power of two and exact in long double; -min is one past max
        constexpr long double lo = static_cast<long double>(std::numeric_limits<Rep>::min());
        if (!(r >= lo && r < -lo)) {
            return std::nullopt;
        }
        return static_cast<Rep>(r);
    } else {
        constexpr long double hi = static_cast<long double>(std::numeric_limits<Rep>::max());
        if (source_finite && !(v >= -hi && v <= hi)) {
            return std::nullopt;
        }
        return static_cast<Rep>(v);
    }
}

/// Floor division for day and month carries (b > 0)
constexpr int64_t floor_div(int64_t a, int64_t b) noexcept {
    int64_t q = a / b;
    return (a % b != 0 && a < 0) ? q - 1 : q;
}

/// Remainder matching floor_div, always in [0, b)
constexpr int64_t floor_mod(int64_t a, int64_t b) noexcept {
    return a - floor_div(a, b) * b;
}

} // namespace tempora::detail
