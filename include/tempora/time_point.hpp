#pragma once

#include "tempora/duration.hpp"
#include "tempora/error.hpp"

#include <compare>
#include <type_traits>

namespace tempora {

/**
 * Instant on a clock: a Duration since that clock's epoch.
 *
 * The clock is a type parameter, so time points of different clocks cannot
 * be compared, subtracted or mixed; crossing clocks requires one of the
 * explicit conversion functions in time_scales.hpp or clock.hpp.
 *
 * ## Overflow Policy
 * Same as Duration: arithmetic returns TimeResult and fails with
 * TimeError::overflow instead of wrapping.
 *
 * @tparam Clock Clock tag; only used for type identity (may be incomplete)
 * @tparam Dur Duration since the epoch
 */
template <typename Clock, DurationType Dur = typename Clock::duration>
class TimePoint {
public:
    using clock = Clock;
    using duration = Dur;
    using rep = typename Dur::rep;
    using period = typename Dur::period;

    /// The clock's epoch
    constexpr TimePoint() noexcept = default;

    constexpr explicit TimePoint(const Dur& since_epoch) noexcept : since_epoch_(since_epoch) {}

    constexpr Dur since_epoch() const noexcept { return since_epoch_; }

    static constexpr TimePoint min() noexcept { return TimePoint(Dur::min()); }
    static constexpr TimePoint max() noexcept { return TimePoint(Dur::max()); }

private:
    Dur since_epoch_{};
};

template <typename T>
struct is_time_point : std::false_type {};

template <typename Clock, DurationType Dur>
struct is_time_point<TimePoint<Clock, Dur>> : std::true_type {};

template <typename T>
inline constexpr bool is_time_point_v = is_time_point<T>::value;

// =============================================================================
// Arithmetic with durations
// =============================================================================

template <typename Clock, typename D1, typename R2, typename P2>
constexpr TimeResult<TimePoint<Clock, CommonDuration<D1, Duration<R2, P2>>>>
operator+(const TimePoint<Clock, D1>& tp, const Duration<R2, P2>& d) noexcept {
    using Result = TimePoint<Clock, CommonDuration<D1, Duration<R2, P2>>>;
    return (tp.since_epoch() + d).map([](auto sum) { return Result(sum); });
}

template <typename R1, typename P1, typename Clock, typename D2>
constexpr TimeResult<TimePoint<Clock, CommonDuration<Duration<R1, P1>, D2>>>
operator+(const Duration<R1, P1>& d, const TimePoint<Clock, D2>& tp) noexcept {
    using Result = TimePoint<Clock, CommonDuration<Duration<R1, P1>, D2>>;
    return (d + tp.since_epoch()).map([](auto sum) { return Result(sum); });
}

template <typename Clock, typename D1, typename R2, typename P2>
constexpr TimeResult<TimePoint<Clock, CommonDuration<D1, Duration<R2, P2>>>>
operator-(const TimePoint<Clock, D1>& tp, const Duration<R2, P2>& d) noexcept {
    using Result = TimePoint<Clock, CommonDuration<D1, Duration<R2, P2>>>;
    return (tp.since_epoch() - d).map([](auto diff) { return Result(diff); });
}

/// Elapsed time between two points of the same clock
template <typename Clock, typename D1, typename D2>
constexpr TimeResult<CommonDuration<D1, D2>> operator-(const TimePoint<Clock, D1>& lhs,
                                                       const TimePoint<Clock, D2>& rhs) noexcept {
    return lhs.since_epoch() - rhs.since_epoch();
}

// =============================================================================
// Comparison (same clock only)
// =============================================================================

template <typename Clock, typename D1, typename D2>
constexpr auto operator<=>(const TimePoint<Clock, D1>& lhs,
                           const TimePoint<Clock, D2>& rhs) noexcept {
    return lhs.since_epoch() <=> rhs.since_epoch();
}

template <typename Clock, typename D1, typename D2>
constexpr bool operator==(const TimePoint<Clock, D1>& lhs,
                          const TimePoint<Clock, D2>& rhs) noexcept {
    return lhs.since_epoch() == rhs.since_epoch();
}

// =============================================================================
// Casting and rounding
// =============================================================================

template <DurationType To, typename Clock, typename D>
constexpr TimeResult<TimePoint<Clock, To>> time_point_cast(const TimePoint<Clock, D>& tp) noexcept {
    return duration_cast<To>(tp.since_epoch()).map([](To d) { return TimePoint<Clock, To>(d); });
}

template <DurationType To, typename Clock, typename D>
constexpr TimeResult<TimePoint<Clock, To>> floor(const TimePoint<Clock, D>& tp) noexcept {
    return floor<To>(tp.since_epoch()).map([](To d) { return TimePoint<Clock, To>(d); });
}

template <DurationType To, typename Clock, typename D>
constexpr TimeResult<TimePoint<Clock, To>> ceil(const TimePoint<Clock, D>& tp) noexcept {
    return ceil<To>(tp.since_epoch()).map([](To d) { return TimePoint<Clock, To>(d); });
}

template <DurationType To, typename Clock, typename D>
    requires std::signed_integral<typename To::rep>
constexpr TimeResult<TimePoint<Clock, To>> round(const TimePoint<Clock, D>& tp) noexcept {
    return round<To>(tp.since_epoch()).map([](To d) { return TimePoint<Clock, To>(d); });
}

} // namespace tempora
