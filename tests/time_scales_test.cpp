#include <array>
#include <type_traits>

#include <gtest/gtest.h>
#include <tempora.hpp>

using namespace tempora;

// Test fixture for time scale conversions
class TimeScalesTest : public ::testing::Test {
protected:
    // 2017-01-01 00:00:00 UTC as Unix time (the most recent leap second ends here)
    static constexpr int64_t NEW_YEAR_2017 = 1'483'228'800;
    // The 27th leap second, 2016-12-31 23:59:60, counted in UTC seconds since 1970
    static constexpr int64_t LEAP_2016_UTC = NEW_YEAR_2017 + 26;
    static constexpr int64_t NS_PER_SEC = 1'000'000'000LL;
};

// ==============================================================================
// LeapSecondTable
// ==============================================================================

TEST_F(TimeScalesTest, BuiltinTableContents) {
    auto table = LeapSecondTable::builtin();
    ASSERT_EQ(table.size(), 27u);
    EXPECT_EQ(table.insertions().front().since_epoch().count(), 78'796'800);
    EXPECT_EQ(table.insertions().back().since_epoch().count(), NEW_YEAR_2017);
}

TEST_F(TimeScalesTest, InsertedThrough) {
    auto table = LeapSecondTable::builtin();
    EXPECT_EQ(table.inserted_through(SysSeconds(Seconds(0))).count(), 0);
    EXPECT_EQ(table.inserted_through(SysSeconds(Seconds(78'796'799))).count(), 0);
    EXPECT_EQ(table.inserted_through(SysSeconds(Seconds(78'796'800))).count(), 1);
    EXPECT_EQ(table.inserted_through(SysSeconds(Seconds(NEW_YEAR_2017 - 1))).count(), 26);
    EXPECT_EQ(table.inserted_through(SysSeconds(Seconds(NEW_YEAR_2017))).count(), 27);
}

TEST_F(TimeScalesTest, FromSortedRejectsUnsorted) {
    static constexpr std::array<SysSeconds, 2> unsorted{SysSeconds(Seconds(200)),
                                                        SysSeconds(Seconds(100))};
    auto a = LeapSecondTable::from_sorted(unsorted);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error(), TimeError::unsorted_leap_table);

    static constexpr std::array<SysSeconds, 2> duplicate{SysSeconds(Seconds(100)),
                                                         SysSeconds(Seconds(100))};
    auto b = LeapSecondTable::from_sorted(duplicate);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error(), TimeError::unsorted_leap_table);
}

TEST_F(TimeScalesTest, CustomTable) {
    static constexpr std::array<SysSeconds, 2> entries{SysSeconds(Seconds(100)),
                                                       SysSeconds(Seconds(200))};
    auto table = LeapSecondTable::from_sorted(entries);
    ASSERT_TRUE(table.has_value());

    auto utc = utc_from_sys(SysSeconds(Seconds(250)), *table);
    ASSERT_TRUE(utc.has_value());
    EXPECT_EQ(utc->since_epoch().count(), 252);

    // First insertion occupies UTC second 100, the second one UTC second 201
    auto first = leap_second_info(UtcSeconds(Seconds(100)), *table);
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->is_leap_second);
    EXPECT_EQ(first->elapsed.count(), 1);

    auto second = leap_second_info(UtcSeconds(Seconds(201)), *table);
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second->is_leap_second);
    EXPECT_EQ(second->elapsed.count(), 2);

    auto between = leap_second_info(UtcSeconds(Seconds(200)), *table);
    ASSERT_TRUE(between.has_value());
    EXPECT_FALSE(between->is_leap_second);
    EXPECT_EQ(between->elapsed.count(), 1);
}

TEST_F(TimeScalesTest, EmptyTableIsIdentity) {
    auto table = LeapSecondTable::empty();
    EXPECT_EQ(table.size(), 0u);

    SysSeconds sys{Seconds(NEW_YEAR_2017)};
    auto utc = utc_from_sys(sys, table);
    ASSERT_TRUE(utc.has_value());
    EXPECT_EQ(utc->since_epoch().count(), NEW_YEAR_2017);
}

// ==============================================================================
// UTC <-> system
// ==============================================================================

TEST_F(TimeScalesTest, UtcFromSysBefore1972) {
    auto utc = utc_from_sys(SysSeconds(Seconds(0)));
    ASSERT_TRUE(utc.has_value());
    EXPECT_EQ(utc->since_epoch().count(), 0);

    auto neg = utc_from_sys(SysSeconds(Seconds(-86'400)));
    ASSERT_TRUE(neg.has_value());
    EXPECT_EQ(neg->since_epoch().count(), -86'400);
}

TEST_F(TimeScalesTest, UtcFromSys2017) {
    auto utc = utc_from_sys(SysSeconds(Seconds(NEW_YEAR_2017)));
    static_assert(std::is_same_v<decltype(utc)::value_type, UtcSeconds>);
    ASSERT_TRUE(utc.has_value());
    EXPECT_EQ(utc->since_epoch().count(), NEW_YEAR_2017 + 27);
}

TEST_F(TimeScalesTest, UtcFromSysSubsecond) {
    // 2016-12-31 23:59:59.5 has 26 leap seconds behind it
    SysTime<Milliseconds> sys(Milliseconds(NEW_YEAR_2017 * 1000 - 500));
    auto utc = utc_from_sys(sys);
    ASSERT_TRUE(utc.has_value());
    EXPECT_EQ(utc->since_epoch().count(), (NEW_YEAR_2017 + 26) * 1000 - 500);
}

TEST_F(TimeScalesTest, LeapSecondInfo2016) {
    auto before = leap_second_info(UtcSeconds(Seconds(LEAP_2016_UTC - 1)));
    ASSERT_TRUE(before.has_value());
    EXPECT_FALSE(before->is_leap_second);
    EXPECT_EQ(before->elapsed.count(), 26);

    auto leap = leap_second_info(UtcSeconds(Seconds(LEAP_2016_UTC)));
    ASSERT_TRUE(leap.has_value());
    EXPECT_TRUE(leap->is_leap_second);
    EXPECT_EQ(leap->elapsed.count(), 27);

    auto after = leap_second_info(UtcSeconds(Seconds(LEAP_2016_UTC + 1)));
    ASSERT_TRUE(after.has_value());
    EXPECT_FALSE(after->is_leap_second);
    EXPECT_EQ(after->elapsed.count(), 27);
}

TEST_F(TimeScalesTest, SysFromUtcAroundLeapSecond) {
    // 23:59:59
    auto a = sys_from_utc(UtcSeconds(Seconds(LEAP_2016_UTC - 1)));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->since_epoch().count(), NEW_YEAR_2017 - 1);

    // 23:59:60 has no system time; it maps to the last instant of 23:59:59
    auto b = sys_from_utc(UtcSeconds(Seconds(LEAP_2016_UTC)));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->since_epoch().count(), NEW_YEAR_2017 - 1);

    // 00:00:00
    auto c = sys_from_utc(UtcSeconds(Seconds(LEAP_2016_UTC + 1)));
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->since_epoch().count(), NEW_YEAR_2017);
}

TEST_F(TimeScalesTest, SysFromUtcInsideLeapSecondNanoseconds) {
    UtcTime<Nanoseconds> utc(Nanoseconds(LEAP_2016_UTC * NS_PER_SEC + NS_PER_SEC / 2));
    auto sys = sys_from_utc(utc);
    ASSERT_TRUE(sys.has_value());
    EXPECT_EQ(sys->since_epoch().count(), NEW_YEAR_2017 * NS_PER_SEC - 1);
}

TEST_F(TimeScalesTest, SysUtcRoundTripAroundEveryInsertion) {
    for (const auto& at : LeapSecondTable::builtin().insertions()) {
        for (int64_t delta = -3; delta <= 3; ++delta) {
            SysSeconds sys(Seconds(at.since_epoch().count() + delta));
            auto utc = utc_from_sys(sys);
            ASSERT_TRUE(utc.has_value());
            auto back = sys_from_utc(*utc);
            ASSERT_TRUE(back.has_value());
            EXPECT_TRUE(*back == sys) << at.since_epoch().count() << " + " << delta;
        }
    }
}

TEST_F(TimeScalesTest, UtcIsContinuousAcrossLeapSecond) {
    // System 23:59:59 and 00:00:00 are two UTC seconds apart
    auto a = utc_from_sys(SysSeconds(Seconds(NEW_YEAR_2017 - 1)));
    auto b = utc_from_sys(SysSeconds(Seconds(NEW_YEAR_2017)));
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    auto gap = *b - *a;
    ASSERT_TRUE(gap.has_value());
    EXPECT_EQ(gap->count(), 2);
}

TEST_F(TimeScalesTest, UtcFromSysOverflow) {
    auto utc = utc_from_sys(SystemClock::time_point::max());
    ASSERT_FALSE(utc.has_value());
    EXPECT_EQ(utc.error(), TimeError::overflow);
}

// ==============================================================================
// TAI and GPS
// ==============================================================================

TEST_F(TimeScalesTest, TaiFromUtc2017) {
    auto utc = utc_from_sys(SysSeconds(Seconds(NEW_YEAR_2017)));
    ASSERT_TRUE(utc.has_value());
    auto tai = tai_from_utc(*utc);
    ASSERT_TRUE(tai.has_value());
    EXPECT_EQ(tai->since_epoch().count(), 1'861'920'037);
}

TEST_F(TimeScalesTest, GpsFromUtc2017) {
    auto utc = utc_from_sys(SysSeconds(Seconds(NEW_YEAR_2017)));
    ASSERT_TRUE(utc.has_value());
    auto gps = gps_from_utc(*utc);
    ASSERT_TRUE(gps.has_value());
    EXPECT_EQ(gps->since_epoch().count(), 1'167'264'018);
}

TEST_F(TimeScalesTest, GpsEpoch) {
    // 1980-01-06 00:00:00 UTC is GPS time zero
    auto utc = utc_from_sys(SysSeconds(Seconds(315'964'800)));
    ASSERT_TRUE(utc.has_value());
    auto gps = gps_from_utc(*utc);
    ASSERT_TRUE(gps.has_value());
    EXPECT_EQ(gps->since_epoch().count(), 0);
}

TEST_F(TimeScalesTest, TaiGpsRoundTrip) {
    TaiTime<Nanoseconds> tai(Nanoseconds(1'861'920'037 * NS_PER_SEC + 123));
    auto utc = utc_from_tai(tai);
    ASSERT_TRUE(utc.has_value());
    auto gps = gps_from_utc(*utc);
    ASSERT_TRUE(gps.has_value());

    // GPS runs a constant 19 s behind TAI
    EXPECT_EQ(tai.since_epoch().count() - gps->since_epoch().count() -
                  (TAI_UTC_EPOCH_OFFSET.count() + GPS_UTC_EPOCH_OFFSET.count()) * NS_PER_SEC,
              0);

    auto utc_again = utc_from_gps(*gps);
    ASSERT_TRUE(utc_again.has_value());
    auto tai_again = tai_from_utc(*utc_again);
    ASSERT_TRUE(tai_again.has_value());
    EXPECT_TRUE(*tai_again == tai);
}

TEST_F(TimeScalesTest, TaiOverflow) {
    auto tai = tai_from_utc(UtcClock::time_point::max());
    ASSERT_FALSE(tai.has_value());
    EXPECT_EQ(tai.error(), TimeError::overflow);

    auto utc = utc_from_gps(GpsClock::time_point::max());
    ASSERT_FALSE(utc.has_value());
    EXPECT_EQ(utc.error(), TimeError::overflow);
}

// ==============================================================================
// File time
// ==============================================================================

TEST_F(TimeScalesTest, FileTimeOfUnixEpoch) {
    auto file = file_from_utc(UtcSeconds(Seconds(0)));
    ASSERT_TRUE(file.has_value());
    // Seconds and 100 ns ticks combine into 100 ns ticks
    static_assert(std::is_same_v<decltype(file)::value_type::duration, FileClock::duration>);
    EXPECT_EQ(file->since_epoch().count(), 116'444'736'000'000'000LL);
}

TEST_F(TimeScalesTest, FileTimeRoundTrip) {
    auto utc = utc_from_sys(SysSeconds(Seconds(NEW_YEAR_2017)));
    ASSERT_TRUE(utc.has_value());
    auto file = file_from_utc(*utc);
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->since_epoch().count(), (NEW_YEAR_2017 + 11'644'473'600LL) * 10'000'000LL);

    auto back = utc_from_file(*file);
    ASSERT_TRUE(back.has_value());
    EXPECT_TRUE(*back == *utc);
}

TEST_F(TimeScalesTest, FileTimeOfPresentDayNanoseconds) {
    // 2023-11-14 22:13:20.123456789 UTC (27 leap seconds in effect)
    UtcTime<Nanoseconds> utc{Nanoseconds(1'700'000'000'123'456'789LL)};
    auto file = file_from_utc(utc);
    ASSERT_TRUE(file.has_value()) << time_error_string(file.error());
    static_assert(std::is_same_v<decltype(file)::value_type::duration, FileClock::duration>);
    // (1'700'000'000.123456789 - 27 + 11'644'473'600) s, floored to 100 ns
    EXPECT_EQ(file->since_epoch().count(), 133'444'735'731'234'567LL);
}

TEST_F(TimeScalesTest, FileTimeFloorsSubTickInstants) {
    UtcTime<Nanoseconds> utc{Nanoseconds(-1)};
    auto file = file_from_utc(utc);
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->since_epoch().count(), 116'444'735'999'999'999LL);
}

TEST_F(TimeScalesTest, FileTimeOfMilliseconds) {
    UtcTime<Milliseconds> utc{Milliseconds(1'500)};
    auto file = file_from_utc(utc);
    ASSERT_TRUE(file.has_value());
    static_assert(std::is_same_v<decltype(file)::value_type::duration, FileClock::duration>);
    EXPECT_EQ(file->since_epoch().count(), 116'444'736'015'000'000LL);
}

TEST_F(TimeScalesTest, FileTimeOfUtcNow) {
    auto file = file_from_utc(UtcClock::now());
    ASSERT_TRUE(file.has_value()) << time_error_string(file.error());

    auto back = utc_from_file(*file);
    ASSERT_TRUE(back.has_value());
    auto lag = UtcClock::now() - *back;
    ASSERT_TRUE(lag.has_value());
    EXPECT_TRUE(*lag >= Nanoseconds(0));
    EXPECT_TRUE(*lag < Seconds(5));
}

// ==============================================================================
// now()
// ==============================================================================

TEST_F(TimeScalesTest, NowReadingsAreConsistent) {
    auto sys = SystemClock::now();
    auto utc = UtcClock::now();
    auto tai = TaiClock::now();

    // UTC is at least 27 s ahead of system time after 2017
    auto utc_of_sys = utc_from_sys(sys);
    ASSERT_TRUE(utc_of_sys.has_value());
    auto skew = utc - *utc_of_sys;
    ASSERT_TRUE(skew.has_value());
    EXPECT_TRUE(*skew >= Nanoseconds(0));
    EXPECT_TRUE(*skew < Seconds(5));

    auto utc_of_tai = utc_from_tai(tai);
    ASSERT_TRUE(utc_of_tai.has_value());
    EXPECT_TRUE(*utc_of_tai >= utc);
}
