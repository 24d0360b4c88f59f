#pragma once

#include "DateUtils.hpp"
#include <boost/program_options.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portsim {

using Result = std::expected<void, std::string>;

// ═══════════════════════════════════════════════════════════════════════════════
// Рыночные данные
// ═══════════════════════════════════════════════════════════════════════════════

struct Bar {
    TimePoint date;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double adjClose = 0.0;     // Учитывает сплиты
    double volume = 0.0;
};

struct DividendEvent {
    TimePoint exDate;
    std::optional<TimePoint> payDate;
    double amount = 0.0;                  // На одну акцию
    std::optional<double> qualifiedPct;   // Доля квалифицированного дивиденда, по умолчанию 1.0
};

struct SplitEvent {
    TimePoint exDate;
    double ratio = 1.0;    // 2.0 = сплит 2 к 1
};

struct SymbolInfo {
    std::string symbol;
    std::size_t barCount = 0;
    std::size_t dividendCount = 0;
    std::size_t splitCount = 0;
    std::optional<TimePoint> firstBar;
    std::optional<TimePoint> lastBar;
    std::optional<double> expenseRatio;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ИНТЕРФЕЙС: IMarketDataStore
// ═══════════════════════════════════════════════════════════════════════════════

class IMarketDataStore {
public:
    virtual ~IMarketDataStore() = default;

    // Инициализация из опций командной строки (по умолчанию ничего не требуется)
    virtual Result initializeFromOptions(
        [[maybe_unused]] const boost::program_options::variables_map& options) {
        return {};
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Запись
    // ═══════════════════════════════════════════════════════════════════════

    virtual Result saveSymbol(std::string_view symbol) = 0;

    virtual Result saveBars(
        std::string_view symbol,
        const std::vector<Bar>& bars) = 0;

    virtual Result saveDividends(
        std::string_view symbol,
        const std::vector<DividendEvent>& dividends) = 0;

    virtual Result saveSplits(
        std::string_view symbol,
        const std::vector<SplitEvent>& splits) = 0;

    virtual Result saveExpenseRatio(
        std::string_view symbol,
        double expenseRatio) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Чтение (диапазоны дат включительно)
    // ═══════════════════════════════════════════════════════════════════════

    virtual std::expected<std::vector<std::string>, std::string> listSymbols() = 0;

    virtual std::expected<bool, std::string> symbolExists(std::string_view symbol) = 0;

    virtual std::expected<std::vector<Bar>, std::string> getBars(
        std::string_view symbol,
        const TimePoint& startDate,
        const TimePoint& endDate) = 0;

    virtual std::expected<std::vector<DividendEvent>, std::string> getDividends(
        std::string_view symbol,
        const TimePoint& startDate,
        const TimePoint& endDate) = 0;

    virtual std::expected<std::vector<SplitEvent>, std::string> getSplits(
        std::string_view symbol,
        const TimePoint& startDate,
        const TimePoint& endDate) = 0;

    virtual std::expected<std::optional<double>, std::string> getExpenseRatio(
        std::string_view symbol) = 0;

    virtual std::expected<SymbolInfo, std::string> getSymbolInfo(
        std::string_view symbol) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Удаление
    // ═══════════════════════════════════════════════════════════════════════

    virtual Result deleteSymbol(std::string_view symbol) = 0;
};

} // namespace portsim
