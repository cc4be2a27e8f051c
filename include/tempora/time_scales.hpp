#pragma once

#include "tempora/clock.hpp"
#include "tempora/duration.hpp"
#include "tempora/error.hpp"
#include "tempora/leap_seconds.hpp"
#include "tempora/time_point.hpp"

#include <cstdint>
#include <type_traits>

namespace tempora {

/**
 * Time scales related to UTC, and the explicit conversions between them.
 *
 * Every conversion is a pure function of one time point (and, for the
 * UTC <-> system pair, a leap second table). UTC is the pivot: TAI, GPS and
 * file time convert to and from UTC only. A TAI -> GPS conversion is written
 * as gps_from_utc(utc_from_tai(t)); nothing chains conversions implicitly.
 *
 * All conversions return TimeResult and fail with TimeError::overflow when
 * the shifted value leaves the duration range.
 */

/**
 * @brief Coordinated Universal Time, counting leap seconds
 *
 * Epoch 1970-01-01 00:00:00 UTC. Unlike SystemClock, the count includes every
 * inserted leap second, so it advances by exactly one second per SI second.
 */
struct UtcClock {
    using rep = std::int64_t;
    using period = Nano;
    using duration = Nanoseconds;
    using time_point = TimePoint<UtcClock, duration>;
    static constexpr bool is_steady = false;

    static time_point now() noexcept;
};

/**
 * @brief International Atomic Time
 *
 * Epoch 1958-01-01 00:00:00 TAI. TAI - UTC was 10 s on 1972-01-01 and grows
 * by one second per leap second.
 */
struct TaiClock {
    using rep = std::int64_t;
    using period = Nano;
    using duration = Nanoseconds;
    using time_point = TimePoint<TaiClock, duration>;
    static constexpr bool is_steady = false;

    static time_point now() noexcept;
};

/**
 * @brief GPS time
 *
 * Epoch 1980-01-06 00:00:00 UTC; no leap seconds after the epoch, so GPS
 * time runs a constant 19 s behind TAI.
 */
struct GpsClock {
    using rep = std::int64_t;
    using period = Nano;
    using duration = Nanoseconds;
    using time_point = TimePoint<GpsClock, duration>;
    static constexpr bool is_steady = false;

    static time_point now() noexcept;
};

/**
 * @brief File system timestamps
 *
 * 100 ns ticks since 1601-01-01 00:00:00 UTC (NTFS / FILETIME layout),
 * leap seconds not counted.
 */
struct FileClock {
    using rep = std::int64_t;
    using period = Ratio<1, 10'000'000>;
    using duration = Duration<rep, period>;
    using time_point = TimePoint<FileClock, duration>;
    static constexpr bool is_steady = false;

    static time_point now() noexcept;
};

template <DurationType D>
using UtcTime = TimePoint<UtcClock, D>;
using UtcSeconds = UtcTime<Seconds>;

template <DurationType D>
using TaiTime = TimePoint<TaiClock, D>;
using TaiSeconds = TaiTime<Seconds>;

template <DurationType D>
using GpsTime = TimePoint<GpsClock, D>;
using GpsSeconds = GpsTime<Seconds>;

template <DurationType D>
using FileTime = TimePoint<FileClock, D>;

/// UTC seconds between 1958-01-01 (TAI epoch) and 1970-01-01, plus the initial 10 s
inline constexpr Seconds TAI_UTC_EPOCH_OFFSET{378691210};

/// UTC seconds between 1970-01-01 and 1980-01-06 (GPS epoch), plus 9 leap seconds
inline constexpr Seconds GPS_UTC_EPOCH_OFFSET{315964809};

/// System seconds between 1601-01-01 and 1970-01-01
inline constexpr Seconds FILE_SYS_EPOCH_OFFSET{11644473600};

// =============================================================================
// UTC <-> system (table-driven)
// =============================================================================

/**
 * Leap second state of a UTC instant.
 *
 * @return Info, or TimeError::overflow if t cannot be floored to seconds
 */
template <typename D>
constexpr TimeResult<LeapSecondInfo>
leap_second_info(const UtcTime<D>& t,
                     const LeapSecondTable& table = LeapSecondTable::builtin()) noexcept {
    return floor<Seconds>(t.since_epoch()).map([&table](Seconds s) {
        return table.classify_utc(s);
    });
}

template <typename D>
constexpr TimeResult<UtcTime<CommonDuration<D, Seconds>>>
utc_from_sys(const SysTime<D>& t,
             const LeapSecondTable& table = LeapSecondTable::builtin()) noexcept {
    using Result = UtcTime<CommonDuration<D, Seconds>>;

    auto whole = floor<Seconds>(t);
    if (!whole) {
        return make_time_error(whole.error());
    }
    return (t.since_epoch() + table.inserted_through(*whole)).map([](auto d) {
        return Result(d);
    });
}

/**
 * Map UTC to system time.
 *
 * An instant inside an inserted leap second has no system time; it maps to
 * the last representable instant of the preceding second (23:59:59.999...).
 */
template <typename D>
constexpr TimeResult<SysTime<CommonDuration<D, Seconds>>>
sys_from_utc(const UtcTime<D>& t,
             const LeapSecondTable& table = LeapSecondTable::builtin()) noexcept {
    using CD = CommonDuration<D, Seconds>;
    using Result = SysTime<CD>;

    auto info = leap_second_info(t, table);
    if (!info) {
        return make_time_error(info.error());
    }
    auto shifted = t.since_epoch() - info->elapsed;
    if (!shifted) {
        return make_time_error(shifted.error());
    }
    if (!info->is_leap_second) {
        return Result(*shifted);
    }

    // Start of the following second, minus one tick
    auto whole = floor<Seconds>(*shifted);
    if (!whole) {
        return make_time_error(whole.error());
    }
    auto next = *whole + Seconds(1);
    if (!next) {
        return make_time_error(next.error());
    }
    return (*next - CD(1)).map([](auto d) { return Result(d); });
}

// =============================================================================
// UTC <-> TAI, GPS (fixed offsets)
// =============================================================================

template <typename D>
constexpr TimeResult<TaiTime<CommonDuration<D, Seconds>>> tai_from_utc(const UtcTime<D>& t) noexcept {
    using Result = TaiTime<CommonDuration<D, Seconds>>;
    return (t.since_epoch() + TAI_UTC_EPOCH_OFFSET).map([](auto d) { return Result(d); });
}

template <typename D>
constexpr TimeResult<UtcTime<CommonDuration<D, Seconds>>> utc_from_tai(const TaiTime<D>& t) noexcept {
    using Result = UtcTime<CommonDuration<D, Seconds>>;
    return (t.since_epoch() - TAI_UTC_EPOCH_OFFSET).map([](auto d) { return Result(d); });
}

template <typename D>
constexpr TimeResult<GpsTime<CommonDuration<D, Seconds>>> gps_from_utc(const UtcTime<D>& t) noexcept {
    using Result = GpsTime<CommonDuration<D, Seconds>>;
    return (t.since_epoch() - GPS_UTC_EPOCH_OFFSET).map([](auto d) { return Result(d); });
}

template <typename D>
constexpr TimeResult<UtcTime<CommonDuration<D, Seconds>>> utc_from_gps(const GpsTime<D>& t) noexcept {
    using Result = UtcTime<CommonDuration<D, Seconds>>;
    return (t.since_epoch() + GPS_UTC_EPOCH_OFFSET).map([](auto d) { return Result(d); });
}

// =============================================================================
// UTC <-> file time (via the leap second table)
// =============================================================================

/// File times are held in FileClock ticks; finer inputs are floored onto them
template <typename D>
using FileDuration =
    Duration<std::common_type_t<typename D::rep, FileClock::rep>, FileClock::period>;

template <typename D>
constexpr TimeResult<FileTime<FileDuration<D>>>
file_from_utc(const UtcTime<D>& t,
              const LeapSecondTable& table = LeapSecondTable::builtin()) noexcept {
    using Result = FileTime<FileDuration<D>>;

    auto sys = sys_from_utc(t, table);
    if (!sys) {
        return make_time_error(sys.error());
    }
    // Narrow to file ticks before shifting: the 1601 offset alone is past
    // the int64 nanosecond range.
    auto ticks = floor<FileDuration<D>>(sys->since_epoch());
    if (!ticks) {
        return make_time_error(ticks.error());
    }
    auto shifted = *ticks + FILE_SYS_EPOCH_OFFSET;
    if (!shifted) {
        return make_time_error(shifted.error());
    }
    return duration_cast<FileDuration<D>>(*shifted).map([](auto d) { return Result(d); });
}

template <typename D>
constexpr TimeResult<UtcTime<CommonDuration<D, Seconds>>>
utc_from_file(const FileTime<D>& t,
              const LeapSecondTable& table = LeapSecondTable::builtin()) noexcept {
    auto shifted = t.since_epoch() - FILE_SYS_EPOCH_OFFSET;
    if (!shifted) {
        return make_time_error(shifted.error());
    }
    return utc_from_sys(SysTime<CommonDuration<D, Seconds>>(*shifted), table);
}

// =============================================================================
// now()
// =============================================================================
//
// The conversions below shift a present-day SystemClock reading by at most a
// few hundred years, far inside the int64 nanosecond range. The value_or()
// saturation keeps now() infallible should that ever stop holding.

inline UtcClock::time_point UtcClock::now() noexcept {
    return utc_from_sys(SystemClock::now()).value_or(time_point::max());
}

inline TaiClock::time_point TaiClock::now() noexcept {
    return tai_from_utc(UtcClock::now()).value_or(time_point::max());
}

inline GpsClock::time_point GpsClock::now() noexcept {
    return gps_from_utc(UtcClock::now()).value_or(time_point::max());
}

inline FileClock::time_point FileClock::now() noexcept {
    auto ticks = floor<duration>(SystemClock::now().since_epoch());
    if (!ticks) {
        return time_point::max();
    }
    return (*ticks + FILE_SYS_EPOCH_OFFSET)
        .and_then([](auto d) { return duration_cast<duration>(d); })
        .map([](duration d) { return time_point(d); })
        .value_or(time_point::max());
}

} // namespace tempora
