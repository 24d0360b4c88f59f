#include <gtest/gtest.h>
#include "TradingCalendar.hpp"

using namespace portsim;

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class TradingCalendarTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Январь-февраль 2024 без 15 января (MLK day)
        std::set<TimePoint> spyDates;
        for (auto day = makeDate(2024, 1, 2); day <= makeDate(2024, 2, 29); day = addDays(day, 1)) {
            if (!isWeekend(day) && day != makeDate(2024, 1, 15)) {
                spyDates.insert(day);
            }
        }

        auto result = TradingCalendar::create({{"SPY", spyDates}}, false);
        ASSERT_TRUE(result.has_value());
        calendar = std::move(*result);
    }

    std::unique_ptr<TradingCalendar> calendar;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Создание
// ═══════════════════════════════════════════════════════════════════════════════

TEST(TradingCalendarCreateTest, FailsWithoutInstruments) {
    auto result = TradingCalendar::create({}, false);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("No instruments"), std::string::npos);
}

TEST(TradingCalendarCreateTest, FailsWithoutDates) {
    auto result = TradingCalendar::create({{"SPY", {}}}, false);
    ASSERT_FALSE(result.has_value());
}

TEST(TradingCalendarCreateTest, UnionOfSymbolDates) {
    auto result = TradingCalendar::create({
        {"SPY", {makeDate(2024, 1, 2), makeDate(2024, 1, 4)}},
        {"AGG", {makeDate(2024, 1, 3), makeDate(2024, 1, 4)}}}, false);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)->getTradingDaysCount(), 3u);
    EXPECT_EQ((*result)->getFirstDay(), makeDate(2024, 1, 2));
    EXPECT_EQ((*result)->getLastDay(), makeDate(2024, 1, 4));
}

TEST(TradingCalendarCreateTest, WeekdayCalendar) {
    auto calendar = TradingCalendar::weekdays(makeDate(2024, 1, 1), makeDate(2024, 1, 31));
    EXPECT_EQ(calendar->getTradingDaysCount(), 23u);
    EXPECT_FALSE(calendar->isTradingDay(makeDate(2024, 1, 6)));
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Запросы
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TradingCalendarTest, HolidayIsNotTradingDay) {
    EXPECT_FALSE(calendar->isTradingDay(makeDate(2024, 1, 15)));
    EXPECT_TRUE(calendar->isTradingDay(makeDate(2024, 1, 16)));
    EXPECT_FALSE(calendar->isTradingDay(makeDate(2024, 1, 13)));
}

TEST_F(TradingCalendarTest, AfterRangeFallsBackToWeekdays) {
    EXPECT_TRUE(calendar->isTradingDay(makeDate(2024, 3, 4)));
    EXPECT_FALSE(calendar->isTradingDay(makeDate(2024, 3, 2)));
}

TEST_F(TradingCalendarTest, NoTradingDaysBeforeFirstQuote) {
    // 1 января - будний день, но котировок ещё нет
    EXPECT_FALSE(calendar->isTradingDay(makeDate(2024, 1, 1)));
    EXPECT_FALSE(calendar->isTradingDay(makeDate(2023, 12, 29)));

    auto days = calendar->tradingDays(makeDate(2024, 1, 1), makeDate(2024, 1, 5));
    ASSERT_EQ(days.size(), 4u);
    EXPECT_EQ(days.front(), makeDate(2024, 1, 2));

    EXPECT_EQ(calendar->firstTradingDayOfMonth(2024, 1), makeDate(2024, 1, 2));
    EXPECT_EQ(calendar->firstTradingDayOfQuarter(2024, 1), makeDate(2024, 1, 2));
    EXPECT_EQ(calendar->firstTradingDayOfYear(2024), makeDate(2024, 1, 2));
    EXPECT_EQ(calendar->nextTradingDay(makeDate(2023, 12, 29)), makeDate(2024, 1, 2));
    EXPECT_EQ(calendar->previousTradingDay(makeDate(2024, 1, 2)), makeDate(2023, 12, 29));
}

TEST_F(TradingCalendarTest, TradingDaysInclusiveRange) {
    auto days = calendar->tradingDays(makeDate(2024, 1, 12), makeDate(2024, 1, 17));

    ASSERT_EQ(days.size(), 3u);
    EXPECT_EQ(days[0], makeDate(2024, 1, 12));
    EXPECT_EQ(days[1], makeDate(2024, 1, 16));
    EXPECT_EQ(days[2], makeDate(2024, 1, 17));
}

TEST_F(TradingCalendarTest, NextAndPreviousSkipHoliday) {
    EXPECT_EQ(calendar->nextTradingDay(makeDate(2024, 1, 12)), makeDate(2024, 1, 16));
    EXPECT_EQ(calendar->previousTradingDay(makeDate(2024, 1, 16)), makeDate(2024, 1, 12));
    EXPECT_EQ(calendar->nextTradingDay(makeDate(2024, 2, 29)), makeDate(2024, 3, 1));
}

TEST_F(TradingCalendarTest, FirstAndLastTradingDayOfMonth) {
    EXPECT_EQ(calendar->firstTradingDayOfMonth(2024, 2), makeDate(2024, 2, 1));
    EXPECT_EQ(calendar->lastTradingDayOfMonth(2024, 1), makeDate(2024, 1, 31));
    EXPECT_EQ(calendar->firstTradingDayOfMonth(2024, 6), makeDate(2024, 6, 3));
}

TEST_F(TradingCalendarTest, FirstTradingDayOfQuarterAndYear) {
    EXPECT_EQ(calendar->firstTradingDayOfQuarter(2024, 2), makeDate(2024, 4, 1));
    EXPECT_EQ(calendar->firstTradingDayOfYear(2025), makeDate(2025, 1, 1));
}

TEST_F(TradingCalendarTest, AlignRules) {
    auto holiday = makeDate(2024, 1, 15);
    EXPECT_EQ(calendar->alignToBusinessDay(holiday, AlignRule::FirstBusinessDay), makeDate(2024, 1, 16));
    EXPECT_EQ(calendar->alignToBusinessDay(holiday, AlignRule::LastBusinessDay), makeDate(2024, 1, 12));

    auto tradingDay = makeDate(2024, 1, 17);
    EXPECT_EQ(calendar->alignToBusinessDay(tradingDay, AlignRule::FirstBusinessDay), tradingDay);
    EXPECT_EQ(calendar->alignToBusinessDay(tradingDay, AlignRule::Next), makeDate(2024, 1, 18));
    EXPECT_EQ(calendar->alignToBusinessDay(tradingDay, AlignRule::Previous), makeDate(2024, 1, 16));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
