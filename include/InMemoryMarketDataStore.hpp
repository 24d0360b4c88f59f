#pragma once

#include "IMarketDataStore.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace portsim {

// ═══════════════════════════════════════════════════════════════════════════════
// Реализация: InMemoryMarketDataStore
// ═══════════════════════════════════════════════════════════════════════════════

class InMemoryMarketDataStore : public IMarketDataStore {
private:
    struct SymbolData {
        std::map<TimePoint, Bar> bars;
        std::map<TimePoint, DividendEvent> dividends;
        std::map<TimePoint, SplitEvent> splits;
        std::optional<double> expenseRatio;
    };

    // symbol -> данные
    std::map<std::string, SymbolData, std::less<>> symbols_;

public:
    InMemoryMarketDataStore() = default;
    ~InMemoryMarketDataStore() override = default;

    Result saveSymbol(std::string_view symbol) override;

    Result saveBars(
        std::string_view symbol,
        const std::vector<Bar>& bars) override;

    Result saveDividends(
        std::string_view symbol,
        const std::vector<DividendEvent>& dividends) override;

    Result saveSplits(
        std::string_view symbol,
        const std::vector<SplitEvent>& splits) override;

    Result saveExpenseRatio(
        std::string_view symbol,
        double expenseRatio) override;

    std::expected<std::vector<std::string>, std::string> listSymbols() override;

    std::expected<bool, std::string> symbolExists(std::string_view symbol) override;

    std::expected<std::vector<Bar>, std::string> getBars(
        std::string_view symbol,
        const TimePoint& startDate,
        const TimePoint& endDate) override;

    std::expected<std::vector<DividendEvent>, std::string> getDividends(
        std::string_view symbol,
        const TimePoint& startDate,
        const TimePoint& endDate) override;

    std::expected<std::vector<SplitEvent>, std::string> getSplits(
        std::string_view symbol,
        const TimePoint& startDate,
        const TimePoint& endDate) override;

    std::expected<std::optional<double>, std::string> getExpenseRatio(
        std::string_view symbol) override;

    std::expected<SymbolInfo, std::string> getSymbolInfo(
        std::string_view symbol) override;

    Result deleteSymbol(std::string_view symbol) override;

    // Вспомогательные методы для тестирования
    std::size_t getSymbolCount() const { return symbols_.size(); }
};

} // namespace portsim
