#pragma once

#include "tempora/duration.hpp"
#include "tempora/error.hpp"
#include "tempora/time_point.hpp"

#include <chrono>
#include <concepts>

#include <cstdint>
#include <ctime>

namespace tempora {

/**
 * Capability contract for clocks.
 *
 * A clock names its tick storage and period, the time point type it produces,
 * whether it is steady, and a now() read of an external time source.
 *
 * now() must be callable concurrently from any number of threads without
 * external locking. For clocks with is_steady == true, a call that completes
 * before another begins never returns a later value.
 *
 * There is deliberately no "shortest available period" alias clock: pick
 * SteadyClock for intervals or SystemClock for wall time.
 */
template <typename C>
concept Clock = requires {
    typename C::rep;
    typename C::period;
    typename C::duration;
    typename C::time_point;
    { C::is_steady } -> std::convertible_to<bool>;
    { C::now() } -> std::same_as<typename C::time_point>;
};

/**
 * @brief Monotonic clock for measuring intervals
 *
 * Never runs backward and is not adjusted by wall-clock corrections. The
 * epoch is unspecified (typically boot time), so its time points are only
 * meaningful relative to each other.
 */
struct SteadyClock {
    using rep = std::int64_t;
    using period = Nano;
    using duration = Nanoseconds;
    using time_point = TimePoint<SteadyClock, duration>;
    static constexpr bool is_steady = true;

    static time_point now() noexcept {
        auto ticks = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch());
        return time_point(duration(ticks.count()));
    }
};

/**
 * @brief Realtime (wall) clock
 *
 * Epoch 1970-01-01 00:00:00 UTC, leap seconds not counted (Unix time). May
 * jump when the system time is adjusted.
 */
struct SystemClock {
    using rep = std::int64_t;
    using period = Nano;
    using duration = Nanoseconds;
    using time_point = TimePoint<SystemClock, duration>;
    static constexpr bool is_steady = false;

    static time_point now() noexcept {
        auto ticks = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch());
        return time_point(duration(ticks.count()));
    }

    /// Whole seconds since the epoch, rounded toward negative infinity
    static std::time_t to_time_t(const time_point& tp) noexcept {
        // Nanoseconds -> Seconds only shrinks the magnitude, so floor cannot fail
        return static_cast<std::time_t>(floor<Seconds>(tp.since_epoch())->count());
    }

    static constexpr TimePoint<SystemClock, Seconds> from_time_t(std::time_t t) noexcept {
        return TimePoint<SystemClock, Seconds>(Seconds(static_cast<std::int64_t>(t)));
    }
};

template <DurationType D>
using SysTime = TimePoint<SystemClock, D>;
using SysSeconds = SysTime<Seconds>;
using SysDays = SysTime<Days>;

/**
 * @brief Source of UTC offsets for local time
 *
 * Implemented by the caller (typically a time-zone lookup). The offset is
 * local time minus UTC at the given system instant.
 */
template <typename S>
concept UtcOffsetSource = requires(const S& source, SysSeconds tp) {
    { source.utc_offset(tp) } -> std::convertible_to<Seconds>;
};

/// UtcOffsetSource with a constant offset
class FixedOffset {
public:
    constexpr explicit FixedOffset(Seconds offset) noexcept : offset_(offset) {}

    constexpr Seconds utc_offset(SysSeconds) const noexcept { return offset_; }

private:
    Seconds offset_;
};

/**
 * @brief Tag for local (civil) time
 *
 * Local time has no epoch of its own: a LocalTime is a SystemClock time point
 * shifted by a caller-supplied UTC offset. LocalClock therefore does not model
 * Clock; its now() needs an offset source.
 */
struct LocalClock {
    using rep = SystemClock::rep;
    using period = SystemClock::period;
    using duration = SystemClock::duration;
    using time_point = TimePoint<LocalClock, duration>;
    static constexpr bool is_steady = false;

    template <UtcOffsetSource Source>
    static TimeResult<time_point> now(const Source& source) noexcept;
};

template <DurationType D>
using LocalTime = TimePoint<LocalClock, D>;
using LocalSeconds = LocalTime<Seconds>;
using LocalDays = LocalTime<Days>;

/**
 * Reinterpret a system time point as local time.
 *
 * @param offset Local time minus UTC
 * @return Local time point, or TimeError::overflow
 */
template <typename D, typename R, typename P>
constexpr TimeResult<LocalTime<CommonDuration<D, Duration<R, P>>>>
local_from_sys(const SysTime<D>& tp, const Duration<R, P>& offset) noexcept {
    using Result = LocalTime<CommonDuration<D, Duration<R, P>>>;
    return (tp.since_epoch() + offset).map([](auto d) { return Result(d); });
}

/// local_from_sys() with the offset looked up at tp
template <typename D, UtcOffsetSource Source>
constexpr TimeResult<LocalTime<CommonDuration<D, Seconds>>>
local_from_sys(const SysTime<D>& tp, const Source& source) noexcept {
    auto at = floor<Seconds>(tp);
    if (!at) {
        return make_time_error(at.error());
    }
    return local_from_sys(tp, Seconds(source.utc_offset(*at)));
}

/**
 * Map a local time point back to system time.
 *
 * @param offset Local time minus UTC, as used to produce tp
 * @return System time point, or TimeError::overflow
 */
template <typename D, typename R, typename P>
constexpr TimeResult<SysTime<CommonDuration<D, Duration<R, P>>>>
sys_from_local(const LocalTime<D>& tp, const Duration<R, P>& offset) noexcept {
    using Result = SysTime<CommonDuration<D, Duration<R, P>>>;
    return (tp.since_epoch() - offset).map([](auto d) { return Result(d); });
}

template <UtcOffsetSource Source>
TimeResult<LocalClock::time_point> LocalClock::now(const Source& source) noexcept {
    return local_from_sys(SystemClock::now(), source);
}

} // namespace tempora
