#pragma once

#include "IMarketDataStore.hpp"
#include <sqlite3.h>
#include <boost/program_options.hpp>
#include <string>

namespace portsim {

class SQLiteMarketDataStore : public IMarketDataStore {
public:
    // ═════════════════════════════════════════════════════════════════════════
    // Конструкторы и деструктор
    // ═════════════════════════════════════════════════════════════════════════

    // Пустой путь - отложенная инициализация через initializeFromOptions
    explicit SQLiteMarketDataStore(std::string_view dbPath = "");
    ~SQLiteMarketDataStore() override;

    SQLiteMarketDataStore(const SQLiteMarketDataStore&) = delete;
    SQLiteMarketDataStore& operator=(const SQLiteMarketDataStore&) = delete;

    Result initializeFromOptions(
        const boost::program_options::variables_map& options) override;

    // ═════════════════════════════════════════════════════════════════════════
    // IMarketDataStore interface
    // ═════════════════════════════════════════════════════════════════════════

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

    bool isInitialized() const noexcept { return initialized_; }

private:
    sqlite3* db_ = nullptr;
    std::string dbPath_;
    bool initialized_ = false;

    Result initializeDatabase(std::string_view path);
    Result createTables();

    Result ensureReady() const;
    std::expected<sqlite3_int64, std::string> symbolKey(std::string_view symbol);

    Result beginTransaction();
    Result commitTransaction();
    void rollbackTransaction();

    std::expected<std::size_t, std::string> countRows(
        const char* table,
        sqlite3_int64 symbolPk);
};

}  // namespace portsim
