#pragma once

#include "IMarketDataStore.hpp"
#include "Portfolio.hpp"
#include "Rebalancer.hpp"
#include "StrategyConfig.hpp"
#include "TaxCalculator.hpp"
#include "TradingCalendar.hpp"
#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace portsim {

// ═══════════════════════════════════════════════════════════════════════════════
// Предупреждения симуляции
// ═══════════════════════════════════════════════════════════════════════════════

enum class WarningKind {
    InsufficientCash,
    InsufficientShares,
    NoPriceData,
    ContributionCapExceeded,
    DividendReinvestFailed,
    DataLoad,
    NegativeCash
};

std::string_view toString(WarningKind kind) noexcept;

struct Warning {
    TimePoint date;
    WarningKind kind = WarningKind::DataLoad;
    std::string symbol;
    std::string message;
};

// Журнал предупреждений одного запуска. Передаётся по ссылке через все шаги дня.
class WarningLog {
public:
    explicit WarningLog(bool echo = true) : echo_(echo) {}

    void add(
        WarningKind kind,
        const TimePoint& date,
        std::string_view symbol,
        std::string message);

    const std::vector<Warning>& entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    std::size_t count(WarningKind kind) const;

private:
    std::vector<Warning> entries_;
    bool echo_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Подготовленные рыночные данные
// ═══════════════════════════════════════════════════════════════════════════════

struct SymbolMarketData {
    std::map<TimePoint, double> prices;       // Дата -> скорректированное закрытие
    std::vector<DividendEvent> dividends;
    double expenseRatio = 0.0;
};

using MarketData = std::map<std::string, SymbolMarketData>;

// ═══════════════════════════════════════════════════════════════════════════════
// Результат симуляции
// ═══════════════════════════════════════════════════════════════════════════════

struct EquityPoint {
    TimePoint date;
    double totalValue = 0.0;
    double cash = 0.0;
    double positionsValue = 0.0;
};

struct PositionsSnapshot {
    TimePoint date;
    std::vector<Position> positions;
};

struct BenchmarkPoint {
    TimePoint date;
    double value = 0.0;
};

struct Diagnostics {
    std::size_t totalTrades = 0;
    std::size_t totalSymbols = 0;
    std::size_t tradingDays = 0;
    std::size_t simulatedDays = 0;
};

struct SimulationResult {
    StrategyConfig config;

    std::vector<EquityPoint> equityCurve;
    std::vector<Trade> trades;
    std::vector<PositionsSnapshot> positionsHistory;
    std::vector<TaxSummary> taxSummaries;
    std::vector<TaxLot> lots;
    std::vector<Warning> warnings;
    std::map<std::string, std::vector<BenchmarkPoint>> benchmarkEquity;
    Diagnostics diagnostics;

    double finalValue = 0.0;
    double afterTaxValue = 0.0;
    double totalDeposits = 0.0;
    double totalTaxes = 0.0;
};

struct RunnerOptions {
    bool verbose = false;           // Строка на каждую сделку
    bool quiet = false;             // Полная тишина (кроме предупреждений в cerr)
    bool includeBenchmark = true;
};

// ═══════════════════════════════════════════════════════════════════════════════
// SimulationContext - изменяемое состояние одного запуска
// ═══════════════════════════════════════════════════════════════════════════════

struct SimulationContext {
    SimulationContext(
        const StrategyConfig& strategy,
        const MarketData& data,
        std::shared_ptr<const TradingCalendar> tradingCalendar,
        WarningLog& warningLog);

    SimulationContext(const SimulationContext&) = delete;
    SimulationContext& operator=(const SimulationContext&) = delete;

    const StrategyConfig& config;
    const MarketData& marketData;
    std::shared_ptr<const TradingCalendar> calendar;
    WarningLog& warnings;

    Portfolio portfolio;
    Rebalancer rebalancer;
    TaxCalculator taxCalculator;
    WeightMap targetWeights;

    TimePoint currentDate;
    std::size_t dayIndex = 0;
    bool isFirstSimulatedDay = true;
    bool isYearEnd = false;

    PriceMap prices;        // Цены текущего дня
    PriceMap lastPrices;    // Последние известные цены для оценки

    double totalDeposits = 0.0;
    double totalTaxes = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// SimulationRunner - дневной конвейер
//
// Порядок шагов дня фиксирован:
//   цены -> дивиденды -> пополнение -> комиссия фондов ->
//   (покупка на пополнение | ребалансировка) -> снимок -> налог за год
// ═══════════════════════════════════════════════════════════════════════════════

class SimulationRunner {
public:
    explicit SimulationRunner(
        std::shared_ptr<IMarketDataStore> store = nullptr,
        RunnerOptions options = {});

    virtual ~SimulationRunner() = default;

    SimulationRunner(const SimulationRunner&) = delete;
    SimulationRunner& operator=(const SimulationRunner&) = delete;

    // Загрузка данных из хранилища и запуск
    std::expected<SimulationResult, std::string> run(const StrategyConfig& config);

    // Запуск на уже подготовленных данных
    std::expected<SimulationResult, std::string> run(
        const StrategyConfig& config,
        const MarketData& marketData);

    // Вселенная + бенчмарки. Символы без баров дают предупреждение DataLoad.
    static std::expected<MarketData, std::string> loadMarketData(
        IMarketDataStore& store,
        const StrategyConfig& config,
        WarningLog& warnings);

    static bool isDepositDay(
        const TimePoint& date,
        DepositCadence cadence,
        const TradingCalendar& calendar);

    const RunnerOptions& getOptions() const noexcept { return options_; }

protected:
    std::expected<SimulationResult, std::string> simulate(
        const StrategyConfig& config,
        const MarketData& marketData,
        WarningLog& warnings);

    // ════════════════════════════════════════════════════════════════════════
    // Шаги торгового дня
    // ════════════════════════════════════════════════════════════════════════

    virtual void processDividends(SimulationContext& context);

    // Возвращает сумму внесённого пополнения (0 если его не было)
    virtual double processDeposit(SimulationContext& context);

    virtual void applyExpenseRatios(SimulationContext& context);

    virtual void deployCapital(SimulationContext& context, double depositAmount);

    virtual void executeTrades(
        SimulationContext& context,
        const std::vector<TradeIntent>& intents);

    virtual void processYearEndTax(SimulationContext& context);

    // ════════════════════════════════════════════════════════════════════════
    // Вспомогательные
    // ════════════════════════════════════════════════════════════════════════

    std::map<std::string, std::vector<BenchmarkPoint>> runBenchmarks(
        const StrategyConfig& config,
        const MarketData& marketData,
        const TradingCalendar& calendar,
        const std::vector<TimePoint>& tradingDays) const;

    void printSimulationHeader(const StrategyConfig& config) const;
    void printFinalSummary(const SimulationResult& result) const;
    void logTrade(const Trade& trade) const;

private:
    std::shared_ptr<IMarketDataStore> store_;
    RunnerOptions options_;
};

} // namespace portsim
