#include <gtest/gtest.h>
#include "TestDatabase.h"
#include "DateParser.h"

TEST(DateParserTest, FullDates) {
    const QDate expected(2024, 3, 5);
    EXPECT_EQ(DateParser::parse("2024-03-05", DateParser::RangeStart), expected);
    EXPECT_EQ(DateParser::parse("5/3/2024", DateParser::RangeStart), expected);
    EXPECT_EQ(DateParser::parse("05-03-2024", DateParser::RangeStart), expected);
    EXPECT_EQ(DateParser::parse("5 Mar 2024", DateParser::RangeStart), expected);
    EXPECT_EQ(DateParser::parse("5 march 2024", DateParser::RangeEnd), expected);
    EXPECT_EQ(DateParser::parse("2024/3/5", DateParser::RangeEnd), expected);
}

TEST(DateParserTest, MonthOnlyResolvesToBounds) {
    EXPECT_EQ(DateParser::parse("2024-02", DateParser::RangeStart), QDate(2024, 2, 1));
    EXPECT_EQ(DateParser::parse("2024-02", DateParser::RangeEnd), QDate(2024, 2, 29));
    EXPECT_EQ(DateParser::parse("3/2024", DateParser::RangeEnd), QDate(2024, 3, 31));
    EXPECT_EQ(DateParser::parse("Feb-2023", DateParser::RangeEnd), QDate(2023, 2, 28));
    EXPECT_EQ(DateParser::parse("September-2023", DateParser::RangeStart), QDate(2023, 9, 1));
}

TEST(DateParserTest, YearOnly) {
    EXPECT_EQ(DateParser::parse("2023", DateParser::RangeStart), QDate(2023, 1, 1));
    EXPECT_EQ(DateParser::parse("2023", DateParser::RangeEnd), QDate(2023, 12, 31));
}

TEST(DateParserTest, UnparsableIsNoBound) {
    EXPECT_FALSE(DateParser::parse("", DateParser::RangeStart).isValid());
    EXPECT_FALSE(DateParser::parse("yesterday", DateParser::RangeStart).isValid());
    EXPECT_FALSE(DateParser::parse("31/02/2024", DateParser::RangeEnd).isValid());
    EXPECT_FALSE(DateParser::parse("5 Foo 2024", DateParser::RangeEnd).isValid());
}

TEST(DateParserTest, RangeSwapsAndClamps) {
    const QDate today(2024, 6, 15);
    QDate from, to;

    DateParser::resolveRange("2024-05-01", "2024-01-01", today, &from, &to);
    EXPECT_EQ(from, QDate(2024, 1, 1));
    EXPECT_EQ(to, QDate(2024, 5, 1));

    DateParser::resolveRange("2024-01", "2025", today, &from, &to);
    EXPECT_EQ(from, QDate(2024, 1, 1));
    EXPECT_EQ(to, today);

    // the end is clamped before the swap, so reversed future bounds keep today
    DateParser::resolveRange("2025-03-01", "2024-12-01", today, &from, &to);
    EXPECT_EQ(from, today);
    EXPECT_EQ(to, QDate(2025, 3, 1));

    DateParser::resolveRange("nonsense", QString(), today, &from, &to);
    EXPECT_FALSE(from.isValid());
    EXPECT_FALSE(to.isValid());
}

TEST(DateParserTest, MonthNames) {
    EXPECT_EQ(DateParser::monthFromName("jan"), 1);
    EXPECT_EQ(DateParser::monthFromName("DECEMBER"), 12);
    EXPECT_EQ(DateParser::monthFromName("Juneteenth"), 0);
}
