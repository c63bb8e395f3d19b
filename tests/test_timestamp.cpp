#include <gtest/gtest.h>

#include "core/timestamp.h"

using namespace std::chrono;

TEST(Timestamp, ParsesIsoVariants) {
    auto z = parseIsoTimestamp("2024-03-01T10:00:00Z");
    ASSERT_TRUE(z);
    EXPECT_EQ(formatIsoTimestamp(*z), "2024-03-01T10:00:00+00:00");

    auto offset = parseIsoTimestamp("2024-03-01T12:00:00+02:00");
    ASSERT_TRUE(offset);
    EXPECT_EQ(*offset, *z);

    auto compactOffset = parseIsoTimestamp("2024-03-01T05:30:00-0430");
    ASSERT_TRUE(compactOffset);
    EXPECT_EQ(*compactOffset, *z);

    auto frac = parseIsoTimestamp("2024-03-01T10:00:00.123Z");
    ASSERT_TRUE(frac);
    EXPECT_EQ(duration_cast<milliseconds>(*frac - *z).count(), 123);

    auto spaced = parseIsoTimestamp("2024-03-01 10:00:00");
    ASSERT_TRUE(spaced);
    EXPECT_EQ(*spaced, *z);

    auto dateOnly = parseIsoTimestamp("2024-03-01");
    ASSERT_TRUE(dateOnly);
    EXPECT_EQ(formatIsoTimestamp(*dateOnly), "2024-03-01T00:00:00+00:00");
}

TEST(Timestamp, RejectsGarbage) {
    EXPECT_FALSE(parseIsoTimestamp(""));
    EXPECT_FALSE(parseIsoTimestamp("yesterday"));
    EXPECT_FALSE(parseIsoTimestamp("2024-02-30"));
    EXPECT_FALSE(parseIsoTimestamp("2024-13-01T00:00:00Z"));
    EXPECT_FALSE(parseIsoTimestamp("2024-03-01T25:00:00Z"));
    EXPECT_FALSE(parseIsoTimestamp("2024-03-01T10:00:00Z trailing"));
}

TEST(Timestamp, ParsesCertificateDates) {
    auto t = parseCertTimestamp("Jun  1 12:00:00 2025 GMT");
    ASSERT_TRUE(t);
    EXPECT_EQ(formatIsoTimestamp(*t), "2025-06-01T12:00:00+00:00");

    EXPECT_FALSE(parseCertTimestamp("Jun  1 12:00:00 2025 PST"));
    EXPECT_FALSE(parseCertTimestamp("2025-06-01"));
}

TEST(Timestamp, DaysBetweenFloors) {
    auto a = *parseIsoTimestamp("2025-01-01T00:00:00Z");
    EXPECT_EQ(daysBetween(a, a), 0);
    EXPECT_EQ(daysBetween(a, a + hours(23)), 0);
    EXPECT_EQ(daysBetween(a, a + hours(24)), 1);
    EXPECT_EQ(daysBetween(a, a + hours(24 * 400 + 5)), 400);
    EXPECT_EQ(daysBetween(a, a - hours(1)), -1);
}

TEST(Timestamp, ParsesWhoisDayMonthYear) {
    auto uk = parseWhoisTimestamp("12-Feb-1999");
    ASSERT_TRUE(uk);
    EXPECT_EQ(formatIsoTimestamp(*uk), "1999-02-12T00:00:00+00:00");

    auto oneDigit = parseWhoisTimestamp(" 3-jun-2030 ");
    ASSERT_TRUE(oneDigit);
    EXPECT_EQ(formatIsoTimestamp(*oneDigit), "2030-06-03T00:00:00+00:00");

    auto iso = parseWhoisTimestamp("1995-08-14T04:00:00Z");
    ASSERT_TRUE(iso);
    EXPECT_EQ(formatIsoTimestamp(*iso), "1995-08-14T04:00:00+00:00");

    EXPECT_FALSE(parseWhoisTimestamp("30-Feb-2024"));
    EXPECT_FALSE(parseWhoisTimestamp("12-Fbr-1999"));
    EXPECT_FALSE(parseWhoisTimestamp("12-Feb-99"));
    EXPECT_FALSE(parseWhoisTimestamp("before Aug-1996"));
}
