#include "InMemoryMarketDataStore.hpp"

namespace portsim {

namespace {

template <typename Event, typename Map>
std::vector<Event> collectRange(
    const Map& events,
    const TimePoint& startDate,
    const TimePoint& endDate)
{
    std::vector<Event> result;

    auto first = events.lower_bound(normalizeDate(startDate));
    auto last = events.upper_bound(normalizeDate(endDate));

    for (auto it = first; it != last; ++it) {
        result.push_back(it->second);
    }

    return result;
}

} // namespace

Result InMemoryMarketDataStore::saveSymbol(std::string_view symbol)
{
    if (symbol.empty()) {
        return std::unexpected("Symbol cannot be empty");
    }

    if (symbols_.find(symbol) == symbols_.end()) {
        symbols_.emplace(std::string(symbol), SymbolData{});
    }
    return Result{};
}

Result InMemoryMarketDataStore::saveBars(
    std::string_view symbol,
    const std::vector<Bar>& bars)
{
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::unexpected("Symbol not found: " + std::string(symbol));
    }

    for (const auto& bar : bars) {
        Bar normalized = bar;
        normalized.date = normalizeDate(bar.date);
        it->second.bars[normalized.date] = normalized;
    }

    return Result{};
}

Result InMemoryMarketDataStore::saveDividends(
    std::string_view symbol,
    const std::vector<DividendEvent>& dividends)
{
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::unexpected("Symbol not found: " + std::string(symbol));
    }

    for (const auto& dividend : dividends) {
        DividendEvent normalized = dividend;
        normalized.exDate = normalizeDate(dividend.exDate);
        it->second.dividends[normalized.exDate] = normalized;
    }

    return Result{};
}

Result InMemoryMarketDataStore::saveSplits(
    std::string_view symbol,
    const std::vector<SplitEvent>& splits)
{
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::unexpected("Symbol not found: " + std::string(symbol));
    }

    for (const auto& split : splits) {
        SplitEvent normalized = split;
        normalized.exDate = normalizeDate(split.exDate);
        it->second.splits[normalized.exDate] = normalized;
    }

    return Result{};
}

Result InMemoryMarketDataStore::saveExpenseRatio(
    std::string_view symbol,
    double expenseRatio)
{
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::unexpected("Symbol not found: " + std::string(symbol));
    }

    if (expenseRatio < 0.0) {
        return std::unexpected("Expense ratio cannot be negative");
    }

    it->second.expenseRatio = expenseRatio;
    return Result{};
}

std::expected<std::vector<std::string>, std::string> InMemoryMarketDataStore::listSymbols()
{
    std::vector<std::string> result;
    for (const auto& [symbol, data] : symbols_) {
        result.push_back(symbol);
    }
    return result;
}

std::expected<bool, std::string> InMemoryMarketDataStore::symbolExists(
    std::string_view symbol)
{
    return symbols_.find(symbol) != symbols_.end();
}

std::expected<std::vector<Bar>, std::string> InMemoryMarketDataStore::getBars(
    std::string_view symbol,
    const TimePoint& startDate,
    const TimePoint& endDate)
{
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::vector<Bar>{};
    }
    return collectRange<Bar>(it->second.bars, startDate, endDate);
}

std::expected<std::vector<DividendEvent>, std::string> InMemoryMarketDataStore::getDividends(
    std::string_view symbol,
    const TimePoint& startDate,
    const TimePoint& endDate)
{
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::vector<DividendEvent>{};
    }
    return collectRange<DividendEvent>(it->second.dividends, startDate, endDate);
}

std::expected<std::vector<SplitEvent>, std::string> InMemoryMarketDataStore::getSplits(
    std::string_view symbol,
    const TimePoint& startDate,
    const TimePoint& endDate)
{
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::vector<SplitEvent>{};
    }
    return collectRange<SplitEvent>(it->second.splits, startDate, endDate);
}

std::expected<std::optional<double>, std::string> InMemoryMarketDataStore::getExpenseRatio(
    std::string_view symbol)
{
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::optional<double>{};
    }
    return it->second.expenseRatio;
}

std::expected<SymbolInfo, std::string> InMemoryMarketDataStore::getSymbolInfo(
    std::string_view symbol)
{
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::unexpected("Symbol not found: " + std::string(symbol));
    }

    const auto& data = it->second;

    SymbolInfo info;
    info.symbol = std::string(symbol);
    info.barCount = data.bars.size();
    info.dividendCount = data.dividends.size();
    info.splitCount = data.splits.size();
    info.expenseRatio = data.expenseRatio;

    if (!data.bars.empty()) {
        info.firstBar = data.bars.begin()->first;
        info.lastBar = data.bars.rbegin()->first;
    }

    return info;
}

Result InMemoryMarketDataStore::deleteSymbol(std::string_view symbol)
{
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::unexpected("Symbol not found: " + std::string(symbol));
    }

    symbols_.erase(it);
    return Result{};
}

} // namespace portsim
