#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace portsim {

using TimePoint = std::chrono::system_clock::time_point;

// ═══════════════════════════════════════════════════════════════════════════════
// Календарная арифметика (все даты нормализованы к полуночи UTC)
// ═══════════════════════════════════════════════════════════════════════════════

TimePoint makeDate(int year, unsigned month, unsigned day);

// Убрать время, оставить только день
TimePoint normalizeDate(const TimePoint& date) noexcept;

// YYYY-MM-DD
std::expected<TimePoint, std::string> parseDate(std::string_view dateStr);
std::string formatDate(const TimePoint& date);

int yearOf(const TimePoint& date) noexcept;
unsigned monthOf(const TimePoint& date) noexcept;
unsigned dayOf(const TimePoint& date) noexcept;
unsigned quarterOf(const TimePoint& date) noexcept;

// 0 = Sunday ... 6 = Saturday
unsigned weekdayOf(const TimePoint& date) noexcept;
bool isWeekend(const TimePoint& date) noexcept;

TimePoint addDays(const TimePoint& date, int days) noexcept;

// Полных календарных дней от from до to (отрицательное если to < from)
int daysBetween(const TimePoint& from, const TimePoint& to) noexcept;

} // namespace portsim
