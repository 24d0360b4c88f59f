#include "TradingCalendar.hpp"
#include <iostream>
#include <iterator>

namespace portsim {

TradingCalendar::TradingCalendar(std::set<TimePoint> tradingDays)
{
    for (const auto& day : tradingDays) {
        tradingDays_.insert(normalizeDate(day));
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Создание календаря
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<std::unique_ptr<TradingCalendar>, std::string>
TradingCalendar::create(
    const std::map<std::string, std::set<TimePoint>>& symbolDates,
    bool printSummary)
{
    if (symbolDates.empty()) {
        return std::unexpected("No instruments provided");
    }

    if (printSummary) {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "Trading Calendar Initialization" << std::endl;
        std::cout << std::string(70, '=') << std::endl;
    }

    std::set<TimePoint> days;

    for (const auto& [symbol, dates] : symbolDates) {
        if (printSummary) {
            std::cout << "  • " << symbol << ": " << dates.size() << " days" << std::endl;
        }
        for (const auto& date : dates) {
            days.insert(normalizeDate(date));
        }
    }

    if (days.empty()) {
        return std::unexpected(
            "No instruments have price data in the specified period");
    }

    auto calendar = std::make_unique<TradingCalendar>(std::move(days));

    if (printSummary) {
        std::cout << "✓ Trading days: " << calendar->getTradingDaysCount()
                  << " (" << formatDate(calendar->getFirstDay())
                  << " .. " << formatDate(calendar->getLastDay()) << ")"
                  << std::endl;
    }

    return calendar;
}

std::unique_ptr<TradingCalendar> TradingCalendar::weekdays(
    const TimePoint& startDate,
    const TimePoint& endDate)
{
    std::set<TimePoint> days;

    for (TimePoint day = normalizeDate(startDate);
         day <= normalizeDate(endDate);
         day = addDays(day, 1)) {
        if (!isWeekend(day)) {
            days.insert(day);
        }
    }

    return std::make_unique<TradingCalendar>(std::move(days));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Основная функциональность
// ═══════════════════════════════════════════════════════════════════════════════

bool TradingCalendar::isInKnownRange(const TimePoint& date) const noexcept
{
    if (tradingDays_.empty()) {
        return false;
    }
    return date >= *tradingDays_.begin() && date <= *tradingDays_.rbegin();
}

bool TradingCalendar::isBeforeKnownRange(const TimePoint& date) const noexcept
{
    return !tradingDays_.empty() && date < *tradingDays_.begin();
}

bool TradingCalendar::isTradingDay(const TimePoint& date) const noexcept
{
    auto normalized = normalizeDate(date);

    if (isInKnownRange(normalized)) {
        return tradingDays_.count(normalized) > 0;
    }

    // До первой котировки торговых дней нет, после последней - будние дни
    if (isBeforeKnownRange(normalized)) {
        return false;
    }

    return !isWeekend(normalized);
}

std::vector<TimePoint> TradingCalendar::tradingDays(
    const TimePoint& startDate,
    const TimePoint& endDate) const
{
    std::vector<TimePoint> result;

    for (TimePoint day = normalizeDate(startDate);
         day <= normalizeDate(endDate);
         day = addDays(day, 1)) {
        if (isTradingDay(day)) {
            result.push_back(day);
        }
    }

    return result;
}

TimePoint TradingCalendar::nextTradingDay(const TimePoint& date) const
{
    auto normalized = normalizeDate(date);

    if (isInKnownRange(normalized) || isBeforeKnownRange(normalized)) {
        auto it = tradingDays_.upper_bound(normalized);
        if (it != tradingDays_.end()) {
            return *it;
        }
    }

    // За пределами известного диапазона - ближайший будний день
    TimePoint day = addDays(normalized, 1);
    while (!isTradingDay(day)) {
        day = addDays(day, 1);
    }
    return day;
}

TimePoint TradingCalendar::previousTradingDay(const TimePoint& date) const
{
    auto normalized = normalizeDate(date);

    if (isInKnownRange(normalized)) {
        auto it = tradingDays_.lower_bound(normalized);
        if (it != tradingDays_.begin()) {
            return *std::prev(it);
        }
    }

    // Раньше первой котировки - ближайший предыдущий будний день
    if (!tradingDays_.empty() && normalized <= *tradingDays_.begin()) {
        TimePoint day = addDays(normalized, -1);
        while (isWeekend(day)) {
            day = addDays(day, -1);
        }
        return day;
    }

    TimePoint day = addDays(normalized, -1);
    while (!isTradingDay(day)) {
        day = addDays(day, -1);
    }
    return day;
}

TimePoint TradingCalendar::firstTradingDayOfMonth(int year, unsigned month) const
{
    return alignToBusinessDay(makeDate(year, month, 1), AlignRule::FirstBusinessDay);
}

TimePoint TradingCalendar::lastTradingDayOfMonth(int year, unsigned month) const
{
    TimePoint firstOfNext = month == 12
        ? makeDate(year + 1, 1, 1)
        : makeDate(year, month + 1, 1);

    return alignToBusinessDay(addDays(firstOfNext, -1), AlignRule::LastBusinessDay);
}

TimePoint TradingCalendar::firstTradingDayOfQuarter(int year, unsigned quarter) const
{
    return firstTradingDayOfMonth(year, (quarter - 1) * 3 + 1);
}

TimePoint TradingCalendar::firstTradingDayOfYear(int year) const
{
    return firstTradingDayOfMonth(year, 1);
}

TimePoint TradingCalendar::alignToBusinessDay(
    const TimePoint& date,
    AlignRule rule) const
{
    switch (rule) {
        case AlignRule::FirstBusinessDay:
            return isTradingDay(date) ? normalizeDate(date) : nextTradingDay(date);
        case AlignRule::LastBusinessDay:
            return isTradingDay(date) ? normalizeDate(date) : previousTradingDay(date);
        case AlignRule::Next:
            return nextTradingDay(date);
        case AlignRule::Previous:
            return previousTradingDay(date);
    }
    return normalizeDate(date);
}

TimePoint TradingCalendar::getFirstDay() const noexcept
{
    return tradingDays_.empty() ? TimePoint{} : *tradingDays_.begin();
}

TimePoint TradingCalendar::getLastDay() const noexcept
{
    return tradingDays_.empty() ? TimePoint{} : *tradingDays_.rbegin();
}

} // namespace portsim
