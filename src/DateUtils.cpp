#include "DateUtils.hpp"
#include <iomanip>
#include <regex>
#include <sstream>

namespace portsim {

namespace {

std::chrono::year_month_day toYmd(const TimePoint& date) noexcept
{
    return std::chrono::year_month_day{
        std::chrono::floor<std::chrono::days>(date)};
}

} // namespace

TimePoint makeDate(int year, unsigned month, unsigned day)
{
    std::chrono::year_month_day ymd{
        std::chrono::year{year},
        std::chrono::month{month},
        std::chrono::day{day}};
    return std::chrono::sys_days{ymd};
}

TimePoint normalizeDate(const TimePoint& date) noexcept
{
    return std::chrono::floor<std::chrono::days>(date);
}

std::expected<TimePoint, std::string> parseDate(std::string_view dateStr)
{
    static const std::regex dateRegex(R"((\d{4})-(\d{1,2})-(\d{1,2}))");

    std::string dateString(dateStr);
    // Отрезаем время, если оно есть: "2024-01-02 00:00:00"
    auto spacePos = dateString.find_first_of(" T");
    if (spacePos != std::string::npos) {
        dateString.resize(spacePos);
    }

    std::smatch matches;
    if (!std::regex_match(dateString, matches, dateRegex)) {
        return std::unexpected("Invalid date format: '" + std::string(dateStr) +
                               "'. Expected YYYY-MM-DD");
    }

    std::chrono::year_month_day ymd{
        std::chrono::year{std::stoi(matches[1])},
        std::chrono::month{static_cast<unsigned>(std::stoi(matches[2]))},
        std::chrono::day{static_cast<unsigned>(std::stoi(matches[3]))}};

    if (!ymd.ok()) {
        return std::unexpected("Invalid calendar date: " + std::string(dateStr));
    }

    return std::chrono::sys_days{ymd};
}

std::string formatDate(const TimePoint& date)
{
    auto ymd = toYmd(date);
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day());
    return oss.str();
}

int yearOf(const TimePoint& date) noexcept
{
    return static_cast<int>(toYmd(date).year());
}

unsigned monthOf(const TimePoint& date) noexcept
{
    return static_cast<unsigned>(toYmd(date).month());
}

unsigned dayOf(const TimePoint& date) noexcept
{
    return static_cast<unsigned>(toYmd(date).day());
}

unsigned quarterOf(const TimePoint& date) noexcept
{
    return (monthOf(date) - 1) / 3 + 1;
}

unsigned weekdayOf(const TimePoint& date) noexcept
{
    return std::chrono::weekday{
        std::chrono::floor<std::chrono::days>(date)}.c_encoding();
}

bool isWeekend(const TimePoint& date) noexcept
{
    auto wd = weekdayOf(date);
    return wd == 0 || wd == 6;
}

TimePoint addDays(const TimePoint& date, int days) noexcept
{
    return normalizeDate(date) + std::chrono::days{days};
}

int daysBetween(const TimePoint& from, const TimePoint& to) noexcept
{
    auto diff = std::chrono::floor<std::chrono::days>(to) -
                std::chrono::floor<std::chrono::days>(from);
    return static_cast<int>(diff.count());
}

} // namespace portsim
