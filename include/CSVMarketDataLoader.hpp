#pragma once

#include "IMarketDataStore.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace portsim {

// ═══════════════════════════════════════════════════════════════════════════════
// Чтение файлов (подменяется в тестах)
// ═══════════════════════════════════════════════════════════════════════════════

class IFileReader {
public:
    virtual ~IFileReader() = default;

    virtual std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) = 0;

    virtual bool exists(std::string_view filePath) = 0;

    // Имена файлов (без каталога) с данным расширением
    virtual std::expected<std::vector<std::string>, std::string> listFiles(
        std::string_view directory,
        std::string_view extension) = 0;
};

class FileReader : public IFileReader {
public:
    std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) override;

    bool exists(std::string_view filePath) override;

    std::expected<std::vector<std::string>, std::string> listFiles(
        std::string_view directory,
        std::string_view extension) override;
};

// ═══════════════════════════════════════════════════════════════════════════════
// CSVMarketDataLoader
//
// Ожидаемая структура каталога:
//   bars/SYM.csv       date,open,high,low,close[,adj_close],volume
//   dividends/SYM.csv  ex_date[,pay_date],amount[,qualified_pct]
//   splits/SYM.csv     ex_date,ratio
//   metadata.csv       symbol,expense_ratio,...
//
// Колонки ищутся по заголовку, порядок не важен.
// ═══════════════════════════════════════════════════════════════════════════════

struct ImportReport {
    std::size_t symbolsLoaded = 0;
    std::size_t barsLoaded = 0;
    std::size_t dividendsLoaded = 0;
    std::size_t splitsLoaded = 0;
    std::size_t rowsSkipped = 0;
    std::vector<std::string> failedSymbols;
};

class CSVMarketDataLoader {
public:
    explicit CSVMarketDataLoader(
        std::string_view dataDir,
        std::shared_ptr<IFileReader> reader = nullptr,
        char delimiter = ',');

    // Символы, для которых есть bars/SYM.csv
    std::expected<std::vector<std::string>, std::string> discoverSymbols();

    std::expected<std::vector<Bar>, std::string> loadBars(std::string_view symbol);

    // Отсутствующий файл - пустой список
    std::expected<std::vector<DividendEvent>, std::string> loadDividends(
        std::string_view symbol);

    std::expected<std::vector<SplitEvent>, std::string> loadSplits(
        std::string_view symbol);

    std::expected<std::map<std::string, double>, std::string> loadExpenseRatios();

    // Пустой список символов - импортировать всё найденное
    std::expected<ImportReport, std::string> importInto(
        IMarketDataStore& store,
        const std::vector<std::string>& symbols = {});

    std::size_t skippedRows() const noexcept { return skippedRows_; }

private:
    using ColumnMap = std::map<std::string, std::size_t>;

    std::shared_ptr<IFileReader> reader_;
    std::string dataDir_;
    char delimiter_;
    std::size_t skippedRows_ = 0;

    std::string pathFor(std::string_view subdir, std::string_view symbol) const;

    std::vector<std::string> parseCSVLine(std::string_view line) const;

    ColumnMap parseHeader(std::string_view line) const;

    std::expected<double, std::string> parseNumber(std::string_view valueStr) const;
};

}  // namespace portsim
