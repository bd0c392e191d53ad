#include "gtest/gtest.h"

#include "date/date.h"
#include "date/tz.h"

#include "TimeNormalizer.hpp"

using namespace date;
using namespace std::chrono_literals;

TEST(TimeNormalizer, ParsesNumericOffset)
{
    EXPECT_EQ(Instant{sys_days{2025_y / July / 3} + 9h + 21min},
              TimeNormalizer::parse(std::string("2025-07-03T11:21:00+02:00")));
}

TEST(TimeNormalizer, ParsesZuluSuffix)
{
    EXPECT_EQ(Instant{sys_days{2024_y / March / 1} + 8h},
              TimeNormalizer::parse(std::string("2024-03-01T08:00:00Z")));
}

TEST(TimeNormalizer, DropsFractionalSeconds)
{
    EXPECT_EQ(Instant{sys_days{2024_y / March / 1} + 8h + 12s},
              TimeNormalizer::parse(std::string("2024-03-01T08:00:12.750-00:00")));
    EXPECT_EQ(Instant{sys_days{2024_y / March / 1} + 13h + 12s},
              TimeNormalizer::parse(std::string("2024-03-01T08:00:12.123456-05:00")));
    EXPECT_EQ(Instant{sys_days{2024_y / March / 1} + 13h + 12s},
              TimeNormalizer::parse(std::string("2024-03-01T08:00:12.123456789-05:00")));
}

TEST(TimeNormalizer, AbsentOrInvalidIsNullopt)
{
    EXPECT_FALSE(TimeNormalizer::parse(std::nullopt));
    EXPECT_FALSE(TimeNormalizer::parse(std::string()));
    EXPECT_FALSE(TimeNormalizer::parse(std::string("invalid")));
    EXPECT_FALSE(TimeNormalizer::parse(std::string("2024-03-01 08:00")));
    EXPECT_FALSE(TimeNormalizer::parse(std::string("2024-03-01T08:00:00+00:00 extra")));
}

TEST(TimeNormalizer, MinutesTruncateTowardZero)
{
    Instant now{sys_days{2024_y / March / 1} + 8h};
    EXPECT_EQ(4min, TimeNormalizer::minutesBetween(now, now + 4min + 59s));
    EXPECT_EQ(-4min, TimeNormalizer::minutesBetween(now, now - 4min - 59s));
    EXPECT_EQ(0min, TimeNormalizer::minutesBetween(now, now - 30s));
}

TEST(TimeNormalizer, FormatsInGivenZone)
{
    Instant t{sys_days{2024_y / March / 1} + 13h + 5min + 7s};
    EXPECT_EQ("13:05", TimeNormalizer::formatClock(t, locate_zone("UTC")));
    EXPECT_EQ("13:05:07", TimeNormalizer::formatClock(t, locate_zone("UTC"), true));
    EXPECT_EQ("08:05", TimeNormalizer::formatClock(t, locate_zone("America/New_York")));
}
