#include <gtest/gtest.h>
#include "../core/TimeUtil.hpp"
#include "../core/Errors.hpp"

using namespace fleetsense;

TEST(TimeUtilTest, ParsesIsoVariants) {
    auto base = parseIso8601("2025-01-10T08:00:00Z");
    EXPECT_EQ(toEpochSeconds(base), 1736496000);

    EXPECT_EQ(parseIso8601("2025-01-10T08:00:00"), base);
    EXPECT_EQ(parseIso8601("2025-01-10 08:00:00"), base);
    EXPECT_EQ(parseIso8601("2025-01-10T08:00:00.250Z"), base);
    EXPECT_EQ(parseIso8601("2025-01-10T10:00:00+02:00"), base);
    EXPECT_EQ(parseIso8601("2025-01-10T05:30:00-02:30"), base);
}

TEST(TimeUtilTest, RejectsMalformedTimestamps) {
    EXPECT_THROW(parseIso8601("yesterday"), InputError);
    EXPECT_THROW(parseIso8601("2025-02-30T00:00:00Z"), InputError);
    EXPECT_THROW(parseIso8601("2025-01-10T25:00:00Z"), InputError);
    EXPECT_THROW(parseIso8601("2025-01-10T08:00:00Zjunk"), InputError);
}

TEST(TimeUtilTest, FormatsUtc) {
    EXPECT_EQ(formatIso8601(fromEpochSeconds(0)), "1970-01-01T00:00:00Z");
    EXPECT_EQ(formatIso8601(fromEpochSeconds(1736496000)), "2025-01-10T08:00:00Z");
    EXPECT_EQ(formatIso8601(fromEpochSeconds(-1)), "1969-12-31T23:59:59Z");
}

TEST(TimeUtilTest, MinutesBetween) {
    auto a = parseIso8601("2025-01-10T08:00:00Z");
    auto b = parseIso8601("2025-01-10T08:01:30Z");
    EXPECT_DOUBLE_EQ(minutesBetween(a, b), 1.5);
    EXPECT_DOUBLE_EQ(minutesBetween(b, a), -1.5);
}

TEST(TimeUtilTest, CalendarDateArithmetic) {
    auto date = CalendarDate::parse("2024-02-28");
    EXPECT_EQ(date.addDays(1).toString(), "2024-02-29");
    EXPECT_EQ(date.addDays(2).toString(), "2024-03-01");
    EXPECT_EQ(CalendarDate::parse("2025-01-01").addDays(-1).toString(), "2024-12-31");
    EXPECT_EQ(CalendarDate::fromDays(0).toString(), "1970-01-01");
    EXPECT_TRUE(date < date.addDays(1));
    EXPECT_TRUE(date <= date);
    EXPECT_THROW(CalendarDate::parse("2025-13-01"), InputError);
    EXPECT_THROW(CalendarDate::parse("2025-01-01x"), InputError);
}

TEST(TimeUtilTest, LocalDateUsesOffset) {
    auto lateUtc = parseIso8601("2025-01-10T23:30:00Z");

    EXPECT_EQ(CalendarDate::localDateOf(lateUtc, 0).toString(), "2025-01-10");
    EXPECT_EQ(CalendarDate::localDateOf(lateUtc, 120).toString(), "2025-01-11");
    EXPECT_EQ(CalendarDate::localDateOf(lateUtc, -600).toString(), "2025-01-10");
    EXPECT_EQ(localHourOf(lateUtc, 120), 1);
    EXPECT_EQ(localHourOf(lateUtc, -60), 22);

    auto date = CalendarDate::parse("2025-01-11");
    EXPECT_EQ(date.startOfDay(120), parseIso8601("2025-01-10T22:00:00Z"));
    EXPECT_EQ(CalendarDate::localDateOf(date.startOfDay(120), 120), date);
}
