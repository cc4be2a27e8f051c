#pragma once

#include "tempora/detail/tick_math.hpp"
#include "tempora/duration.hpp"

#include <concepts>

#include <cstdint>

namespace tempora {

/**
 * Hours, minutes, seconds and subseconds of a duration since midnight.
 *
 * The split is done on the magnitude; the sign is kept separately in
 * is_negative(). Durations of 24 h or more are not wrapped, so hours() may
 * exceed 23.
 *
 * The split works on 128-bit tick counts and cannot fail.
 *
 * @tparam D Precision; one second must be a whole number of its ticks
 */
template <DurationType D>
    requires std::signed_integral<typename D::rep>
class TimeOfDay {
    using TicksPerSecond = detail::PeriodRatio<Ratio<1>, typename D::period>;
    static_assert(TicksPerSecond::den == 1, "TimeOfDay precision must divide one second");

public:
    using precision = D;

    /// Midnight
    constexpr TimeOfDay() noexcept = default;

    constexpr explicit TimeOfDay(const D& since_midnight) noexcept
        : negative_(since_midnight.is_negative()) {
        constexpr detail::wide_int tps = TicksPerSecond::num;

        detail::wide_int t = detail::wide_abs(since_midnight.count());
        const detail::wide_int secs = t / tps;

        hours_ = Hours(static_cast<Hours::rep>(secs / 3600));
        minutes_ = Minutes(static_cast<Minutes::rep>((secs / 60) % 60));
        seconds_ = Seconds(static_cast<Seconds::rep>(secs % 60));
        subseconds_ = D(static_cast<typename D::rep>(t % tps));
    }

    constexpr Hours hours() const noexcept { return hours_; }
    constexpr Minutes minutes() const noexcept { return minutes_; }
    constexpr Seconds seconds() const noexcept { return seconds_; }

    /// Remainder below one second, in ticks of D
    constexpr D subseconds() const noexcept { return subseconds_; }

    constexpr bool is_negative() const noexcept { return negative_; }

    /// Reassemble the original duration
    constexpr D to_duration() const noexcept {
        constexpr detail::wide_int tps = TicksPerSecond::num;

        const detail::wide_int secs = static_cast<detail::wide_int>(hours_.count()) * 3600 +
                                      static_cast<detail::wide_int>(minutes_.count()) * 60 +
                                      seconds_.count();
        const detail::wide_int t = secs * tps + subseconds_.count();
        // Magnitude came from a D, so the signed value fits D::rep again
        return D(static_cast<typename D::rep>(negative_ ? -t : t));
    }

private:
    Hours hours_{};
    Minutes minutes_{};
    Seconds seconds_{};
    D subseconds_{};
    bool negative_{false};
};

} // namespace tempora
