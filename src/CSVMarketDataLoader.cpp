#include "CSVMarketDataLoader.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace portsim {

namespace {

// Значение колонки по имени, пустая строка если колонки нет
std::string fieldOf(
    const std::vector<std::string>& fields,
    const std::map<std::string, std::size_t>& columns,
    const std::string& name)
{
    auto it = columns.find(name);
    if (it == columns.end() || it->second >= fields.size()) {
        return {};
    }
    return fields[it->second];
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// FileReader Implementation
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<std::vector<std::string>, std::string> FileReader::readLines(
    std::string_view filePath)
{
    std::vector<std::string> lines;
    std::ifstream file{std::string(filePath)};

    if (!file.is_open()) {
        return std::unexpected(std::string("Failed to open file: ") + std::string(filePath));
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    if (lines.empty()) {
        return std::unexpected(std::string("File is empty: ") + std::string(filePath));
    }

    return lines;
}

bool FileReader::exists(std::string_view filePath)
{
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(filePath), ec);
}

std::expected<std::vector<std::string>, std::string> FileReader::listFiles(
    std::string_view directory,
    std::string_view extension)
{
    std::filesystem::path dir(directory);
    std::error_code ec;

    if (!std::filesystem::is_directory(dir, ec)) {
        return std::unexpected("Directory not found: " + dir.string());
    }

    std::vector<std::string> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == extension) {
            files.push_back(entry.path().filename().string());
        }
    }

    if (ec) {
        return std::unexpected("Failed to list directory " + dir.string() + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

// ═══════════════════════════════════════════════════════════════════════════════
// CSVMarketDataLoader Implementation
// ═══════════════════════════════════════════════════════════════════════════════

CSVMarketDataLoader::CSVMarketDataLoader(
    std::string_view dataDir,
    std::shared_ptr<IFileReader> reader,
    char delimiter)
    : reader_(reader ? reader : std::make_shared<FileReader>()),
      dataDir_(dataDir),
      delimiter_(delimiter)
{
}

std::string CSVMarketDataLoader::pathFor(
    std::string_view subdir,
    std::string_view symbol) const
{
    return (std::filesystem::path(dataDir_) / subdir / (std::string(symbol) + ".csv")).string();
}

std::expected<std::vector<std::string>, std::string> CSVMarketDataLoader::discoverSymbols()
{
    auto files = reader_->listFiles(
        (std::filesystem::path(dataDir_) / "bars").string(), ".csv");
    if (!files) {
        return std::unexpected(files.error());
    }

    std::vector<std::string> symbols;
    for (const auto& file : *files) {
        symbols.push_back(std::filesystem::path(file).stem().string());
    }

    return symbols;
}

std::expected<std::vector<Bar>, std::string> CSVMarketDataLoader::loadBars(
    std::string_view symbol)
{
    auto linesResult = reader_->readLines(pathFor("bars", symbol));
    if (!linesResult) {
        return std::unexpected(linesResult.error());
    }

    const auto& lines = *linesResult;
    auto columns = parseHeader(lines.front());

    if (!columns.contains("date") || !columns.contains("close")) {
        return std::unexpected(
            "Bars file for " + std::string(symbol) + " must have 'date' and 'close' columns");
    }

    std::map<TimePoint, Bar> byDate;

    for (std::size_t i = 1; i < lines.size(); ++i) {
        auto fields = parseCSVLine(lines[i]);

        auto date = parseDate(fieldOf(fields, columns, "date"));
        auto close = parseNumber(fieldOf(fields, columns, "close"));
        if (!date || !close || *close <= 0.0) {
            ++skippedRows_;
            continue;
        }

        Bar bar;
        bar.date = *date;
        bar.close = *close;

        auto numberOr = [&](const std::string& name, double fallback) {
            auto value = parseNumber(fieldOf(fields, columns, name));
            return value ? *value : fallback;
        };

        bar.open = numberOr("open", bar.close);
        bar.high = numberOr("high", bar.close);
        bar.low = numberOr("low", bar.close);
        bar.adjClose = numberOr("adj_close", bar.close);
        bar.volume = numberOr("volume", 0.0);

        if (bar.adjClose <= 0.0) {
            bar.adjClose = bar.close;
        }

        // При повторе даты побеждает последняя строка
        byDate[bar.date] = bar;
    }

    std::vector<Bar> bars;
    bars.reserve(byDate.size());
    for (const auto& [date, bar] : byDate) {
        bars.push_back(bar);
    }

    return bars;
}

std::expected<std::vector<DividendEvent>, std::string> CSVMarketDataLoader::loadDividends(
    std::string_view symbol)
{
    std::string path = pathFor("dividends", symbol);
    if (!reader_->exists(path)) {
        return std::vector<DividendEvent>{};
    }

    auto linesResult = reader_->readLines(path);
    if (!linesResult) {
        return std::unexpected(linesResult.error());
    }

    const auto& lines = *linesResult;
    auto columns = parseHeader(lines.front());

    if (!columns.contains("ex_date") || !columns.contains("amount")) {
        return std::unexpected(
            "Dividends file for " + std::string(symbol) +
            " must have 'ex_date' and 'amount' columns");
    }

    std::vector<DividendEvent> dividends;

    for (std::size_t i = 1; i < lines.size(); ++i) {
        auto fields = parseCSVLine(lines[i]);

        auto exDate = parseDate(fieldOf(fields, columns, "ex_date"));
        auto amount = parseNumber(fieldOf(fields, columns, "amount"));
        if (!exDate || !amount || *amount < 0.0) {
            ++skippedRows_;
            continue;
        }

        DividendEvent dividend;
        dividend.exDate = *exDate;
        dividend.amount = *amount;

        if (auto payDate = parseDate(fieldOf(fields, columns, "pay_date"))) {
            dividend.payDate = *payDate;
        }

        if (auto pct = parseNumber(fieldOf(fields, columns, "qualified_pct"))) {
            dividend.qualifiedPct = std::clamp(*pct, 0.0, 1.0);
        }

        dividends.push_back(dividend);
    }

    std::stable_sort(dividends.begin(), dividends.end(),
        [](const auto& a, const auto& b) { return a.exDate < b.exDate; });

    return dividends;
}

std::expected<std::vector<SplitEvent>, std::string> CSVMarketDataLoader::loadSplits(
    std::string_view symbol)
{
    std::string path = pathFor("splits", symbol);
    if (!reader_->exists(path)) {
        return std::vector<SplitEvent>{};
    }

    auto linesResult = reader_->readLines(path);
    if (!linesResult) {
        return std::unexpected(linesResult.error());
    }

    const auto& lines = *linesResult;
    auto columns = parseHeader(lines.front());

    if (!columns.contains("ex_date") || !columns.contains("ratio")) {
        return std::unexpected(
            "Splits file for " + std::string(symbol) +
            " must have 'ex_date' and 'ratio' columns");
    }

    std::vector<SplitEvent> splits;

    for (std::size_t i = 1; i < lines.size(); ++i) {
        auto fields = parseCSVLine(lines[i]);

        auto exDate = parseDate(fieldOf(fields, columns, "ex_date"));
        auto ratio = parseNumber(fieldOf(fields, columns, "ratio"));
        if (!exDate || !ratio || *ratio <= 0.0) {
            ++skippedRows_;
            continue;
        }

        splits.push_back(SplitEvent{*exDate, *ratio});
    }

    std::stable_sort(splits.begin(), splits.end(),
        [](const auto& a, const auto& b) { return a.exDate < b.exDate; });

    return splits;
}

std::expected<std::map<std::string, double>, std::string>
CSVMarketDataLoader::loadExpenseRatios()
{
    std::map<std::string, double> ratios;

    std::string path = (std::filesystem::path(dataDir_) / "metadata.csv").string();
    if (!reader_->exists(path)) {
        return ratios;
    }

    auto linesResult = reader_->readLines(path);
    if (!linesResult) {
        return std::unexpected(linesResult.error());
    }

    const auto& lines = *linesResult;
    auto columns = parseHeader(lines.front());

    if (!columns.contains("symbol") || !columns.contains("expense_ratio")) {
        return std::unexpected("metadata.csv must have 'symbol' and 'expense_ratio' columns");
    }

    for (std::size_t i = 1; i < lines.size(); ++i) {
        auto fields = parseCSVLine(lines[i]);

        std::string symbol = fieldOf(fields, columns, "symbol");
        auto ratio = parseNumber(fieldOf(fields, columns, "expense_ratio"));
        if (symbol.empty() || !ratio || *ratio < 0.0) {
            ++skippedRows_;
            continue;
        }

        ratios[symbol] = *ratio;
    }

    return ratios;
}

std::expected<ImportReport, std::string> CSVMarketDataLoader::importInto(
    IMarketDataStore& store,
    const std::vector<std::string>& symbols)
{
    skippedRows_ = 0;

    std::vector<std::string> toLoad = symbols;
    if (toLoad.empty()) {
        auto discovered = discoverSymbols();
        if (!discovered) {
            return std::unexpected(discovered.error());
        }
        toLoad = std::move(*discovered);
    }

    if (toLoad.empty()) {
        return std::unexpected("No symbols found in " + dataDir_);
    }

    auto ratios = loadExpenseRatios();
    if (!ratios) {
        return std::unexpected(ratios.error());
    }

    ImportReport report;

    for (const auto& symbol : toLoad) {
        auto bars = loadBars(symbol);
        if (!bars) {
            std::cerr << "⚠️  " << symbol << ": " << bars.error() << std::endl;
            report.failedSymbols.push_back(symbol);
            continue;
        }

        auto dividends = loadDividends(symbol);
        if (!dividends) {
            std::cerr << "⚠️  " << symbol << ": " << dividends.error() << std::endl;
            report.failedSymbols.push_back(symbol);
            continue;
        }

        auto splits = loadSplits(symbol);
        if (!splits) {
            std::cerr << "⚠️  " << symbol << ": " << splits.error() << std::endl;
            report.failedSymbols.push_back(symbol);
            continue;
        }

        if (auto r = store.saveSymbol(symbol); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = store.saveBars(symbol, *bars); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = store.saveDividends(symbol, *dividends); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = store.saveSplits(symbol, *splits); !r) {
            return std::unexpected(r.error());
        }

        auto ratioIt = ratios->find(symbol);
        if (ratioIt != ratios->end()) {
            if (auto r = store.saveExpenseRatio(symbol, ratioIt->second); !r) {
                return std::unexpected(r.error());
            }
        }

        ++report.symbolsLoaded;
        report.barsLoaded += bars->size();
        report.dividendsLoaded += dividends->size();
        report.splitsLoaded += splits->size();
    }

    report.rowsSkipped = skippedRows_;
    return report;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Разбор CSV
// ═══════════════════════════════════════════════════════════════════════════════

std::vector<std::string> CSVMarketDataLoader::parseCSVLine(std::string_view line) const
{
    std::vector<std::string> fields;
    std::istringstream iss{std::string(line)};
    std::string field;

    while (std::getline(iss, field, delimiter_)) {
        auto start = field.find_first_not_of(" \t\r\n");
        auto end = field.find_last_not_of(" \t\r\n");

        if (start == std::string::npos) {
            fields.emplace_back();
        } else {
            fields.push_back(field.substr(start, end - start + 1));
        }
    }

    return fields;
}

CSVMarketDataLoader::ColumnMap CSVMarketDataLoader::parseHeader(
    std::string_view line) const
{
    ColumnMap columns;
    auto names = parseCSVLine(line);

    for (std::size_t i = 0; i < names.size(); ++i) {
        std::string name = names[i];
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::replace(name.begin(), name.end(), ' ', '_');
        columns.emplace(name, i);
    }

    return columns;
}

std::expected<double, std::string> CSVMarketDataLoader::parseNumber(
    std::string_view valueStr) const
{
    if (valueStr.empty()) {
        return std::unexpected("Empty value");
    }

    try {
        std::size_t idx;
        double value = std::stod(std::string(valueStr), &idx);
        if (idx == valueStr.length()) {
            return value;
        }
    } catch (const std::exception&) {
    }

    return std::unexpected("Not a number: " + std::string(valueStr));
}

}  // namespace portsim
