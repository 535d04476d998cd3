#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "logwire/timestamp.hpp"

using namespace logwire;

TEST(Timestamp, WallClockReasonableRange)
{
  uint64_t now = wall_clock_now_ns();
  uint64_t year_2020_ns = 1577836800ULL * 1'000'000'000ULL;
  uint64_t year_2100_ns = 4102444800ULL * 1'000'000'000ULL;
  EXPECT_GT(now, year_2020_ns);
  EXPECT_LT(now, year_2100_ns);
}

TEST(Timestamp, WallTimeSplitsIntoSecondsAndNanos)
{
  SecondsNanos pair = to_seconds_nanos(WallTime{1'500'000'000LL});
  EXPECT_EQ(pair.seconds, 1);
  EXPECT_EQ(pair.nanos, 500'000'000);
}

TEST(Timestamp, WholeMillisecondInstant)
{
  SecondsNanos pair = to_seconds_nanos(WallTime{1739692200123LL * 1'000'000LL});
  EXPECT_EQ(pair.seconds, 1739692200);
  EXPECT_EQ(pair.nanos, 123'000'000);
}

TEST(Timestamp, NegativeInstantKeepsNanosPositive)
{
  SecondsNanos pair = to_seconds_nanos(WallTime{-1});
  EXPECT_EQ(pair.seconds, -1);
  EXPECT_EQ(pair.nanos, 999'999'999);
  WallTime wall;
  ASSERT_TRUE(to_wall_time(pair, wall));
  EXPECT_EQ(wall.unix_ns, -1);
}

TEST(Timestamp, WallTimeBackAndForth)
{
  WallTime wall{1577836800123456789LL};
  WallTime back;
  ASSERT_TRUE(to_wall_time(to_seconds_nanos(wall), back));
  EXPECT_EQ(back.unix_ns, wall.unix_ns);
}

TEST(Timestamp, WallTimeRangeLimits)
{
  WallTime wall{42};
  EXPECT_FALSE(to_wall_time(SecondsNanos{253402300799LL, 0}, wall));
  EXPECT_FALSE(to_wall_time(SecondsNanos{-62135596800LL, 0}, wall));
  EXPECT_FALSE(to_wall_time(SecondsNanos{9223372036LL, 854775808}, wall));
  EXPECT_FALSE(to_wall_time(SecondsNanos{0, 1'000'000'000}, wall));
  EXPECT_FALSE(to_wall_time(SecondsNanos{0, -1}, wall));
  EXPECT_EQ(wall.unix_ns, 42);

  ASSERT_TRUE(to_wall_time(SecondsNanos{9223372036LL, 854775807}, wall));
  EXPECT_EQ(wall.unix_ns, std::numeric_limits<int64_t>::max());
  ASSERT_TRUE(to_wall_time(SecondsNanos{-9223372036LL, 0}, wall));
  EXPECT_EQ(wall.unix_ns, -9223372036000000000LL);
}

TEST(Timestamp, ParseUtcSecondsDateOnly)
{
  int64_t seconds = -1;
  ASSERT_TRUE(parse_utc_seconds("2020-01-01", seconds));
  EXPECT_EQ(seconds, 1577836800);
}

TEST(Timestamp, ParseUtcSecondsFullPrecision)
{
  int64_t seconds = 0;
  ASSERT_TRUE(parse_utc_seconds("2024-02-29T12:34:56", seconds));
  EXPECT_EQ(seconds, 1709210096);
}

TEST(Timestamp, ParseUtcSecondsRejectsInvalid)
{
  int64_t seconds = 0;
  EXPECT_FALSE(parse_utc_seconds("2023-02-29", seconds));
  EXPECT_FALSE(parse_utc_seconds("2020-13-01", seconds));
  EXPECT_FALSE(parse_utc_seconds("2020-01-01T25:00:00", seconds));
  EXPECT_FALSE(parse_utc_seconds("2020/01/01", seconds));
  EXPECT_FALSE(parse_utc_seconds("", seconds));
  EXPECT_FALSE(parse_utc_seconds("not-a-date", seconds));
}

TEST(Timestamp, Rfc3339WithNanos)
{
  SecondsNanos pair = parse_rfc3339("2020-01-01T00:00:00.123456789Z");
  EXPECT_EQ(pair.seconds, 1577836800);
  EXPECT_EQ(pair.nanos, 123456789);
}

TEST(Timestamp, Rfc3339ShortFractionIsRightPadded)
{
  SecondsNanos pair = parse_rfc3339("2020-01-01T00:00:01.5Z");
  EXPECT_EQ(pair.seconds, 1577836801);
  EXPECT_EQ(pair.nanos, 500'000'000);
}

TEST(Timestamp, Rfc3339WithoutFraction)
{
  SecondsNanos pair = parse_rfc3339("2020-01-01T00:00:00Z");
  EXPECT_EQ(pair.seconds, 1577836800);
  EXPECT_EQ(pair.nanos, 0);
}

TEST(Timestamp, Rfc3339CommaSeparator)
{
  SecondsNanos pair = parse_rfc3339("2020-01-01T00:00:00,25Z");
  EXPECT_EQ(pair.seconds, 1577836800);
  EXPECT_EQ(pair.nanos, 250'000'000);
}

TEST(Timestamp, Rfc3339OverlongFractionIgnored)
{
  SecondsNanos pair = parse_rfc3339("2020-01-01T00:00:00.1234567891Z");
  EXPECT_EQ(pair.seconds, 1577836800);
  EXPECT_EQ(pair.nanos, 0);
}

TEST(Timestamp, Rfc3339UnparseableIsEpoch)
{
  SecondsNanos pair = parse_rfc3339("yesterday");
  EXPECT_EQ(pair.seconds, 0);
  EXPECT_EQ(pair.nanos, 0);
}

TEST(Timestamp, NormalizeEachForm)
{
  EXPECT_EQ(normalize_timestamp(Timestamp(WallTime{2'000'000'001LL})), (SecondsNanos{2, 1}));
  EXPECT_EQ(normalize_timestamp(Timestamp(std::string("1970-01-01T00:01:00.25Z"))),
            (SecondsNanos{60, 250'000'000}));
  EXPECT_EQ(normalize_timestamp(Timestamp(SecondsNanos{7, 8})), (SecondsNanos{7, 8}));
}
