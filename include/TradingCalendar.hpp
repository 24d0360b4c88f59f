#pragma once

#include "DateUtils.hpp"
#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace portsim {

// ═══════════════════════════════════════════════════════════════════════════════
// Правило выравнивания даты на торговый день
// ═══════════════════════════════════════════════════════════════════════════════

enum class AlignRule {
    FirstBusinessDay,   // Сама дата если торговая, иначе следующий торговый день
    LastBusinessDay,    // Сама дата если торговая, иначе предыдущий торговый день
    Next,               // Строго следующий торговый день
    Previous            // Строго предыдущий торговый день
};

// ═══════════════════════════════════════════════════════════════════════════════
// Trading Calendar - торговые дни по данным котировок
//
// Внутри известного диапазона торговыми считаются только даты из набора.
// До первой даты торговых дней нет, после последней - будние дни
// (понедельник-пятница).
// ═══════════════════════════════════════════════════════════════════════════════

class TradingCalendar {
public:
    explicit TradingCalendar(std::set<TimePoint> tradingDays);

    TradingCalendar(const TradingCalendar&) = delete;
    TradingCalendar& operator=(const TradingCalendar&) = delete;

    TradingCalendar(TradingCalendar&&) noexcept = default;
    TradingCalendar& operator=(TradingCalendar&&) noexcept = default;

    // ───────────────────────────────────────────────────────────────────────────
    // Создание календаря
    // ───────────────────────────────────────────────────────────────────────────

    // Объединение дат котировок всех инструментов
    static std::expected<std::unique_ptr<TradingCalendar>, std::string> create(
        const std::map<std::string, std::set<TimePoint>>& symbolDates,
        bool printSummary = true);

    // Все будние дни диапазона
    static std::unique_ptr<TradingCalendar> weekdays(
        const TimePoint& startDate,
        const TimePoint& endDate);

    // ───────────────────────────────────────────────────────────────────────────
    // Запросы
    // ───────────────────────────────────────────────────────────────────────────

    std::vector<TimePoint> tradingDays(
        const TimePoint& startDate,
        const TimePoint& endDate) const;

    bool isTradingDay(const TimePoint& date) const noexcept;

    TimePoint nextTradingDay(const TimePoint& date) const;
    TimePoint previousTradingDay(const TimePoint& date) const;

    TimePoint firstTradingDayOfMonth(int year, unsigned month) const;
    TimePoint lastTradingDayOfMonth(int year, unsigned month) const;
    TimePoint firstTradingDayOfQuarter(int year, unsigned quarter) const;
    TimePoint firstTradingDayOfYear(int year) const;

    TimePoint alignToBusinessDay(
        const TimePoint& date,
        AlignRule rule = AlignRule::FirstBusinessDay) const;

    std::size_t getTradingDaysCount() const noexcept { return tradingDays_.size(); }
    bool empty() const noexcept { return tradingDays_.empty(); }

    TimePoint getFirstDay() const noexcept;
    TimePoint getLastDay() const noexcept;

private:
    bool isInKnownRange(const TimePoint& date) const noexcept;
    bool isBeforeKnownRange(const TimePoint& date) const noexcept;

    std::set<TimePoint> tradingDays_;  // Нормализованные даты
};

} // namespace portsim
