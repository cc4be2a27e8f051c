#include <limits>

#include <gtest/gtest.h>
#include <tempora.hpp>

using namespace tempora;

template <typename To, typename From>
concept RoundableTo = requires(From d) { round<To>(d); };

// ==============================================================================
// floor / ceil
// ==============================================================================

TEST(DurationRoundingTest, FloorPositive) {
    auto s = floor<Seconds>(Milliseconds(1999));
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count(), 1);
}

TEST(DurationRoundingTest, FloorNegativeRoundsDown) {
    auto s = floor<Seconds>(Milliseconds(-1));
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count(), -1);

    auto exact = floor<Seconds>(Milliseconds(-2000));
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->count(), -2);
}

TEST(DurationRoundingTest, CeilPositiveRoundsUp) {
    auto s = ceil<Seconds>(Milliseconds(1001));
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count(), 2);
}

TEST(DurationRoundingTest, CeilNegative) {
    auto s = ceil<Seconds>(Milliseconds(-1999));
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count(), -1);
}

TEST(DurationRoundingTest, FloorAndCeilBracketValue) {
    for (int64_t ms = -2500; ms <= 2500; ms += 37) {
        Milliseconds d(ms);
        auto lo = floor<Seconds>(d);
        auto hi = ceil<Seconds>(d);
        ASSERT_TRUE(lo.has_value());
        ASSERT_TRUE(hi.has_value());
        EXPECT_TRUE(*lo <= d) << ms;
        EXPECT_TRUE(*hi >= d) << ms;
        EXPECT_LE(hi->count() - lo->count(), 1) << ms;
    }
}

TEST(DurationRoundingTest, FloorFromFloating) {
    auto s = floor<Seconds>(Duration<double>(-0.5));
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count(), -1);

    auto c = ceil<Seconds>(Duration<double>(0.25));
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->count(), 1);
}

TEST(DurationRoundingTest, CeilOverflowAtMax) {
    // Seconds::max() is far outside the int32 day range
    auto d = ceil<Days>(Seconds::max());
    ASSERT_FALSE(d.has_value());
    EXPECT_EQ(d.error(), TimeError::overflow);
}

// ==============================================================================
// round (ties to even)
// ==============================================================================

TEST(DurationRoundingTest, RoundToNearest) {
    auto a = round<Seconds>(Milliseconds(1400));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->count(), 1);

    auto b = round<Seconds>(Milliseconds(1600));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->count(), 2);
}

TEST(DurationRoundingTest, RoundTiesToEven) {
    auto a = round<Seconds>(Milliseconds(1500));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->count(), 2);

    auto b = round<Seconds>(Milliseconds(2500));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->count(), 2);

    auto c = round<Seconds>(Milliseconds(500));
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->count(), 0);
}

TEST(DurationRoundingTest, RoundNegativeTiesToEven) {
    auto a = round<Seconds>(Milliseconds(-1500));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->count(), -2);

    auto b = round<Seconds>(Milliseconds(-2500));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->count(), -2);

    auto c = round<Seconds>(Milliseconds(-600));
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->count(), -1);
}

TEST(DurationRoundingTest, RoundFromFloatingTiesToEven) {
    auto a = round<Seconds>(Duration<double>(2.5));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->count(), 2);

    auto b = round<Seconds>(Duration<double>(3.5));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->count(), 4);

    auto c = round<Seconds>(Duration<double>(-0.5));
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->count(), 0);
}

TEST(DurationRoundingTest, RoundNonDecimalPeriod) {
    using Thirds = Duration<int64_t, Ratio<1, 3>>;
    // 4 thirds = 1.33 s -> 1; 5 thirds = 1.67 s -> 2
    auto a = round<Seconds>(Thirds(4));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->count(), 1);

    auto b = round<Seconds>(Thirds(5));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->count(), 2);
}

TEST(DurationRoundingTest, RoundRequiresIntegerTarget) {
    static_assert(!RoundableTo<Duration<double>, Milliseconds>);
    static_assert(RoundableTo<Seconds, Milliseconds>);
}

TEST(DurationRoundingTest, RoundingIsConstexpr) {
    constexpr auto s = round<Seconds>(Milliseconds(1500));
    static_assert(s.has_value());
    static_assert((*s).count() == 2);
}
