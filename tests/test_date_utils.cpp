#include <gtest/gtest.h>
#include "DateUtils.hpp"

using namespace portsim;

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Разбор и форматирование
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DateUtilsTest, ParseAndFormat) {
    auto date = parseDate("2024-03-15");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(formatDate(*date), "2024-03-15");
    EXPECT_EQ(yearOf(*date), 2024);
    EXPECT_EQ(monthOf(*date), 3u);
    EXPECT_EQ(dayOf(*date), 15u);
}

TEST(DateUtilsTest, ParseIgnoresTimePart) {
    auto date = parseDate("2024-01-02 00:00:00");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(*date, makeDate(2024, 1, 2));
}

TEST(DateUtilsTest, ParseRejectsGarbage) {
    EXPECT_FALSE(parseDate("not a date").has_value());
    EXPECT_FALSE(parseDate("2024-02-30").has_value());
    EXPECT_FALSE(parseDate("").has_value());
}

TEST(DateUtilsTest, NormalizeDropsTimeOfDay) {
    auto date = makeDate(2024, 5, 10);
    auto withTime = date + std::chrono::hours(13) + std::chrono::minutes(7);
    EXPECT_EQ(normalizeDate(withTime), date);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Календарная арифметика
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DateUtilsTest, Weekdays) {
    EXPECT_EQ(weekdayOf(makeDate(2024, 1, 1)), 1u);   // Понедельник
    EXPECT_TRUE(isWeekend(makeDate(2024, 1, 6)));
    EXPECT_TRUE(isWeekend(makeDate(2024, 1, 7)));
    EXPECT_FALSE(isWeekend(makeDate(2024, 1, 8)));
}

TEST(DateUtilsTest, Quarters) {
    EXPECT_EQ(quarterOf(makeDate(2024, 1, 31)), 1u);
    EXPECT_EQ(quarterOf(makeDate(2024, 4, 1)), 2u);
    EXPECT_EQ(quarterOf(makeDate(2024, 9, 30)), 3u);
    EXPECT_EQ(quarterOf(makeDate(2024, 12, 1)), 4u);
}

TEST(DateUtilsTest, AddDaysAndDaysBetween) {
    auto start = makeDate(2024, 1, 1);
    EXPECT_EQ(addDays(start, 31), makeDate(2024, 2, 1));
    EXPECT_EQ(addDays(start, -1), makeDate(2023, 12, 31));

    EXPECT_EQ(daysBetween(makeDate(2024, 1, 1), makeDate(2025, 1, 2)), 367);
    EXPECT_EQ(daysBetween(makeDate(2024, 1, 2), makeDate(2025, 1, 2)), 366);
    EXPECT_EQ(daysBetween(makeDate(2024, 6, 1), makeDate(2024, 1, 2)), -151);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
