#pragma once

#include "tempora/clock.hpp"
#include "tempora/duration.hpp"
#include "tempora/error.hpp"

#include <array>
#include <span>

#include <cstddef>
#include <cstdint>

namespace tempora {

/**
 * @brief Leap second state of a UTC instant
 */
struct LeapSecondInfo {
    bool is_leap_second{false}; ///< Instant lies inside an inserted second (23:59:60)
    Seconds elapsed{};          ///< Leap seconds inserted up to and including this instant
};

namespace detail {

// System time (00:00:00 of the following day) of every positive leap second
// announced by the IERS up to Bulletin C 68 (no insertion after 2017-01-01).
inline constexpr std::array<SysSeconds, 27> iers_leap_seconds{{
    SysSeconds(Seconds(78796800)),   // 1 Jul 1972
    SysSeconds(Seconds(94694400)),   // 1 Jan 1973
    SysSeconds(Seconds(126230400)),  // 1 Jan 1974
    SysSeconds(Seconds(157766400)),  // 1 Jan 1975
    SysSeconds(Seconds(189302400)),  // 1 Jan 1976
    SysSeconds(Seconds(220924800)),  // 1 Jan 1977
    SysSeconds(Seconds(252460800)),  // 1 Jan 1978
    SysSeconds(Seconds(283996800)),  // 1 Jan 1979
    SysSeconds(Seconds(315532800)),  // 1 Jan 1980
    SysSeconds(Seconds(362793600)),  // 1 Jul 1981
    SysSeconds(Seconds(394329600)),  // 1 Jul 1982
    SysSeconds(Seconds(425865600)),  // 1 Jul 1983
    SysSeconds(Seconds(489024000)),  // 1 Jul 1985
    SysSeconds(Seconds(567993600)),  // 1 Jan 1988
    SysSeconds(Seconds(631152000)),  // 1 Jan 1990
    SysSeconds(Seconds(662688000)),  // 1 Jan 1991
    SysSeconds(Seconds(709948800)),  // 1 Jul 1992
    SysSeconds(Seconds(741484800)),  // 1 Jul 1993
    SysSeconds(Seconds(773020800)),  // 1 Jul 1994
    SysSeconds(Seconds(820454400)),  // 1 Jan 1996
    SysSeconds(Seconds(867715200)),  // 1 Jul 1997
    SysSeconds(Seconds(915148800)),  // 1 Jan 1999
    SysSeconds(Seconds(1136073600)), // 1 Jan 2006
    SysSeconds(Seconds(1230768000)), // 1 Jan 2009
    SysSeconds(Seconds(1341100800)), // 1 Jul 2012
    SysSeconds(Seconds(1435708800)), // 1 Jul 2015
    SysSeconds(Seconds(1483228800)), // 1 Jan 2017
}};

} // namespace detail

/**
 * @brief Immutable list of leap second insertions
 *
 * Each entry is the system time at which UTC resumes after an inserted
 * second, i.e. 00:00:00 of the day following 23:59:60. Keeping the list up
 * to date is the caller's responsibility; builtin() carries the IERS list
 * known at release time.
 *
 * The table does not own its entries: a table built with from_sorted() views
 * the caller's storage, which must outlive it.
 *
 * @note Only positive leap seconds are modeled.
 */
class LeapSecondTable {
public:
    /// Table over the compiled-in IERS list
    static constexpr LeapSecondTable builtin() noexcept {
        return LeapSecondTable(std::span<const SysSeconds>(detail::iers_leap_seconds));
    }

    /// Table with no insertions (UTC == system time)
    static constexpr LeapSecondTable empty() noexcept { return LeapSecondTable({}); }

    /**
     * Build a table from caller-supplied insertions.
     *
     * @return Table, or unsorted_leap_table if the entries are not strictly
     *         increasing
     */
    static constexpr TimeResult<LeapSecondTable>
    from_sorted(std::span<const SysSeconds> insertions) noexcept {
        for (std::size_t i = 1; i < insertions.size(); ++i) {
            if (!(insertions[i - 1] < insertions[i])) {
                return make_time_error(TimeError::unsorted_leap_table);
            }
        }
        return LeapSecondTable(insertions);
    }

    constexpr std::span<const SysSeconds> insertions() const noexcept { return insertions_; }
    constexpr std::size_t size() const noexcept { return insertions_.size(); }

    /// Number of insertions at or before a system instant (whole seconds)
    constexpr Seconds inserted_through(SysSeconds sys) const noexcept {
        std::int64_t n = 0;
        for (const auto& at : insertions_) {
            if (at > sys) {
                break;
            }
            ++n;
        }
        return Seconds(n);
    }

    /**
     * Classify a UTC second count (seconds since 1970 including leap seconds).
     *
     * The k-th insertion (0-based) at system second L occupies UTC second
     * L + k; every later UTC second is offset by k + 1 from system time.
     */
    constexpr LeapSecondInfo classify_utc(Seconds utc) const noexcept {
        LeapSecondInfo info;
        std::int64_t k = 0;
        for (const auto& at : insertions_) {
            const std::int64_t inserted = at.since_epoch().count() + k;
            if (inserted > utc.count()) {
                break;
            }
            if (inserted == utc.count()) {
                info.is_leap_second = true;
            }
            ++k;
        }
        info.elapsed = Seconds(k);
        return info;
    }

private:
    constexpr explicit LeapSecondTable(std::span<const SysSeconds> insertions) noexcept
        : insertions_(insertions) {}

    std::span<const SysSeconds> insertions_;
};

} // namespace tempora
