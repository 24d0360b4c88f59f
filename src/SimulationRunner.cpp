#include "SimulationRunner.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace portsim {

namespace {

// Доля денежных средств, доступная для одной покупки
constexpr double kCashUsageLimit = 0.9999;

constexpr double kTradingDaysPerYear = 252.0;

std::string formatMoney(double value)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// WarningLog
// ═══════════════════════════════════════════════════════════════════════════════

std::string_view toString(WarningKind kind) noexcept
{
    switch (kind) {
        case WarningKind::InsufficientCash:        return "InsufficientCash";
        case WarningKind::InsufficientShares:      return "InsufficientShares";
        case WarningKind::NoPriceData:             return "NoPriceData";
        case WarningKind::ContributionCapExceeded: return "ContributionCapExceeded";
        case WarningKind::DividendReinvestFailed:  return "DividendReinvestFailed";
        case WarningKind::DataLoad:                return "DataLoad";
        case WarningKind::NegativeCash:            return "NegativeCash";
    }
    return "Unknown";
}

void WarningLog::add(
    WarningKind kind,
    const TimePoint& date,
    std::string_view symbol,
    std::string message)
{
    if (echo_) {
        std::cerr << "⚠️  [" << toString(kind) << "] " << formatDate(date);
        if (!symbol.empty()) {
            std::cerr << " " << symbol;
        }
        std::cerr << ": " << message << std::endl;
    }

    entries_.push_back(Warning{normalizeDate(date), kind, std::string(symbol), std::move(message)});
}

std::size_t WarningLog::count(WarningKind kind) const
{
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(),
        [kind](const Warning& w) { return w.kind == kind; }));
}

// ═══════════════════════════════════════════════════════════════════════════════
// SimulationContext
// ═══════════════════════════════════════════════════════════════════════════════

SimulationContext::SimulationContext(
    const StrategyConfig& strategy,
    const MarketData& data,
    std::shared_ptr<const TradingCalendar> tradingCalendar,
    WarningLog& warningLog)
    : config(strategy),
      marketData(data),
      calendar(std::move(tradingCalendar)),
      warnings(warningLog),
      portfolio(strategy.initialCash,
                strategy.account.type,
                strategy.lotMethod,
                strategy.account.tax.applyWashSale),
      rebalancer(strategy.rebalancing, calendar, strategy.account.type),
      taxCalculator(strategy.account.tax),
      targetWeights(strategy.targetWeights())
{
}

// ═══════════════════════════════════════════════════════════════════════════════
// SimulationRunner
// ═══════════════════════════════════════════════════════════════════════════════

SimulationRunner::SimulationRunner(
    std::shared_ptr<IMarketDataStore> store,
    RunnerOptions options)
    : store_(std::move(store)),
      options_(options)
{
}

std::expected<SimulationResult, std::string> SimulationRunner::run(
    const StrategyConfig& config)
{
    if (!store_) {
        return std::unexpected("Market data store not set");
    }

    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    WarningLog warnings(!options_.quiet);

    auto marketData = loadMarketData(*store_, config, warnings);
    if (!marketData) {
        return std::unexpected(marketData.error());
    }

    return simulate(config, *marketData, warnings);
}

std::expected<SimulationResult, std::string> SimulationRunner::run(
    const StrategyConfig& config,
    const MarketData& marketData)
{
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    WarningLog warnings(!options_.quiet);
    return simulate(config, marketData, warnings);
}

std::expected<MarketData, std::string> SimulationRunner::loadMarketData(
    IMarketDataStore& store,
    const StrategyConfig& config,
    WarningLog& warnings)
{
    MarketData data;

    std::vector<std::string> symbols = config.symbols;
    for (const auto& symbol : config.benchmark) {
        if (std::find(symbols.begin(), symbols.end(), symbol) == symbols.end()) {
            symbols.push_back(symbol);
        }
    }

    std::set<std::string> universe(config.symbols.begin(), config.symbols.end());

    for (const auto& symbol : symbols) {
        bool inUniverse = universe.contains(symbol);

        auto bars = store.getBars(symbol, config.startDate, config.endDate);
        if (!bars) {
            return std::unexpected("Failed to load bars for " + symbol + ": " + bars.error());
        }

        if (bars->empty()) {
            if (inUniverse) {
                warnings.add(WarningKind::DataLoad, config.startDate, symbol,
                             "No price data in the simulation period");
            }
            continue;
        }

        SymbolMarketData symbolData;
        for (const auto& bar : *bars) {
            symbolData.prices[normalizeDate(bar.date)] = bar.adjClose;
        }

        auto dividends = store.getDividends(symbol, config.startDate, config.endDate);
        if (!dividends) {
            warnings.add(WarningKind::DataLoad, config.startDate, symbol,
                         "Failed to load dividends: " + dividends.error());
        } else {
            symbolData.dividends = std::move(*dividends);
        }

        if (config.frictions.useActualEtfEr) {
            auto ratio = store.getExpenseRatio(symbol);
            if (!ratio) {
                warnings.add(WarningKind::DataLoad, config.startDate, symbol,
                             "Failed to load expense ratio: " + ratio.error());
            } else {
                symbolData.expenseRatio = ratio->value_or(0.0);
            }
        }

        data.emplace(symbol, std::move(symbolData));
    }

    bool anyUniverseData = std::any_of(
        config.symbols.begin(), config.symbols.end(),
        [&data](const std::string& symbol) { return data.contains(symbol); });

    if (!anyUniverseData) {
        return std::unexpected("No market data loaded for any symbol of the universe");
    }

    return data;
}

bool SimulationRunner::isDepositDay(
    const TimePoint& date,
    DepositCadence cadence,
    const TradingCalendar& calendar)
{
    auto day = normalizeDate(date);

    switch (cadence) {
        case DepositCadence::None:
            return false;

        case DepositCadence::Daily:
        case DepositCadence::EveryMarketDay:
            return true;

        case DepositCadence::Weekly:
            return weekdayOf(day) == 1;

        case DepositCadence::Monthly:
            return day == calendar.firstTradingDayOfMonth(yearOf(day), monthOf(day));

        case DepositCadence::Quarterly:
            return day == calendar.firstTradingDayOfQuarter(yearOf(day), quarterOf(day));

        case DepositCadence::Yearly:
            return day == calendar.firstTradingDayOfYear(yearOf(day));
    }

    return false;
}

// ═══════════════════════════════════════════════════════════════════════════════
// ГЛАВНЫЙ ЦИКЛ
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<SimulationResult, std::string> SimulationRunner::simulate(
    const StrategyConfig& config,
    const MarketData& marketData,
    WarningLog& warnings)
{
    if (!options_.quiet) {
        printSimulationHeader(config);
    }

    // ════════════════════════════════════════════════════════════════════════
    // 1. Календарь по датам котировок вселенной
    // ════════════════════════════════════════════════════════════════════════

    std::map<std::string, std::set<TimePoint>> symbolDates;
    for (const auto& symbol : config.symbols) {
        auto it = marketData.find(symbol);
        if (it == marketData.end()) {
            continue;
        }

        auto& dates = symbolDates[symbol];
        for (const auto& [date, price] : it->second.prices) {
            dates.insert(date);
        }
    }

    auto calendarResult = TradingCalendar::create(symbolDates, !options_.quiet);
    if (!calendarResult) {
        return std::unexpected(calendarResult.error());
    }

    std::shared_ptr<const TradingCalendar> calendar = std::move(*calendarResult);

    auto tradingDays = calendar->tradingDays(config.startDate, config.endDate);
    if (tradingDays.empty()) {
        return std::unexpected("No trading days in the simulation period");
    }

    // ════════════════════════════════════════════════════════════════════════
    // 2. Состояние запуска
    // ════════════════════════════════════════════════════════════════════════

    SimulationContext context(config, marketData, calendar, warnings);

    SimulationResult result;
    result.config = config;

    // ════════════════════════════════════════════════════════════════════════
    // 3. Дневной конвейер
    // ════════════════════════════════════════════════════════════════════════

    for (std::size_t i = 0; i < tradingDays.size(); ++i) {
        context.currentDate = tradingDays[i];
        context.dayIndex = i;
        context.isYearEnd = (i + 1 == tradingDays.size()) ||
                            yearOf(tradingDays[i + 1]) != yearOf(tradingDays[i]);

        // Шаг 1: цены дня
        context.prices.clear();
        for (const auto& symbol : config.symbols) {
            auto dataIt = marketData.find(symbol);
            if (dataIt == marketData.end()) {
                continue;
            }

            auto priceIt = dataIt->second.prices.find(context.currentDate);
            if (priceIt != dataIt->second.prices.end() && priceIt->second > 0.0) {
                context.prices[symbol] = priceIt->second;
            }
        }

        if (context.prices.empty()) {
            // Налог за год не должен теряться из-за пустого последнего дня
            if (context.isYearEnd && !context.isFirstSimulatedDay) {
                processYearEndTax(context);
            }
            continue;
        }

        for (const auto& [symbol, price] : context.prices) {
            context.lastPrices[symbol] = price;
        }

        // Шаг 2: дивиденды
        processDividends(context);

        // Шаг 3: пополнение
        double depositAmount = processDeposit(context);

        // Шаг 4: комиссия фондов
        applyExpenseRatios(context);

        // Шаг 5: покупка на пополнение или ребалансировка
        deployCapital(context, depositAmount);

        // Шаг 6: снимок
        double totalValue = context.portfolio.totalValue(context.lastPrices);
        double cash = context.portfolio.cash();

        result.equityCurve.push_back(EquityPoint{
            context.currentDate, totalValue, cash, totalValue - cash});

        result.positionsHistory.push_back(PositionsSnapshot{
            context.currentDate, context.portfolio.positions(context.lastPrices)});

        context.isFirstSimulatedDay = false;

        // Шаг 7: налог за год
        if (context.isYearEnd) {
            processYearEndTax(context);
        }
    }

    if (result.equityCurve.empty()) {
        return std::unexpected("No prices available on any trading day of the period");
    }

    // ════════════════════════════════════════════════════════════════════════
    // 4. Итоги
    // ════════════════════════════════════════════════════════════════════════

    std::set<int> years;
    for (const auto& point : result.equityCurve) {
        years.insert(yearOf(point.date));
    }

    for (int year : years) {
        result.taxSummaries.push_back(
            context.taxCalculator.calculateAnnualTax(year, context.portfolio));
    }

    if (options_.includeBenchmark) {
        result.benchmarkEquity = runBenchmarks(config, marketData, *calendar, tradingDays);
    }

    result.trades = context.portfolio.trades();
    result.lots = context.portfolio.allLots();
    result.warnings = warnings.entries();

    result.finalValue = context.portfolio.totalValue(context.lastPrices);
    result.afterTaxValue = context.taxCalculator.calculateAfterTaxValue(
        context.portfolio, context.lastPrices);
    result.totalDeposits = context.totalDeposits;
    result.totalTaxes = context.totalTaxes;

    result.diagnostics.totalTrades = result.trades.size();
    result.diagnostics.totalSymbols = config.symbols.size();
    result.diagnostics.tradingDays = tradingDays.size();
    result.diagnostics.simulatedDays = result.equityCurve.size();

    if (!options_.quiet) {
        printFinalSummary(result);
    }

    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// ДИВИДЕНДЫ
// ═══════════════════════════════════════════════════════════════════════════════

void SimulationRunner::processDividends(SimulationContext& context)
{
    auto& portfolio = context.portfolio;

    for (const auto& symbol : context.config.symbols) {
        auto dataIt = context.marketData.find(symbol);
        if (dataIt == context.marketData.end()) {
            continue;
        }

        for (const auto& dividend : dataIt->second.dividends) {
            if (normalizeDate(dividend.exDate) != context.currentDate) {
                continue;
            }

            double shares = portfolio.heldQuantity(symbol);
            if (shares <= kQuantityTolerance || dividend.amount <= 0.0) {
                continue;
            }

            double total = shares * dividend.amount;
            double qualifiedPct = dividend.qualifiedPct.value_or(1.0);

            const auto& record = portfolio.logDividendPayment(
                symbol, shares, dividend.amount, context.currentDate);
            logTrade(record);

            portfolio.recordDividend(symbol, total, context.currentDate, qualifiedPct);

            if (context.config.dividendMode != DividendMode::Drip) {
                continue;
            }

            auto priceIt = context.prices.find(symbol);
            if (priceIt == context.prices.end()) {
                context.warnings.add(
                    WarningKind::DividendReinvestFailed, context.currentDate, symbol,
                    "No price to reinvest dividend of $" + formatMoney(total) +
                    ", kept as cash");
                continue;
            }

            double price = priceIt->second;
            double amount = std::min(total, portfolio.cash());
            double quantity = amount / price;

            if (quantity <= kQuantityTolerance) {
                context.warnings.add(
                    WarningKind::DividendReinvestFailed, context.currentDate, symbol,
                    "Dividend of $" + formatMoney(total) + " too small to reinvest");
                continue;
            }

            auto trade = portfolio.buy(
                symbol, quantity, price, context.currentDate, 0.0, 0.0, TradeAction::Drip);

            if (!trade) {
                context.warnings.add(
                    WarningKind::DividendReinvestFailed, context.currentDate, symbol,
                    trade.error().message + ", dividend kept as cash");
                continue;
            }

            logTrade(*trade);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// ПОПОЛНЕНИЕ
// ═══════════════════════════════════════════════════════════════════════════════

double SimulationRunner::processDeposit(SimulationContext& context)
{
    const auto& deposits = context.config.deposits;
    if (!deposits || deposits->amount <= 0.0) {
        return 0.0;
    }

    if (!isDepositDay(context.currentDate, deposits->cadence, *context.calendar)) {
        return 0.0;
    }

    double amount = deposits->amount;
    int year = yearOf(context.currentDate);

    auto cap = context.config.account.caps.capFor(context.config.account.type);
    if (cap) {
        double contributed = context.portfolio.yearTotals(year).contributions;
        if (contributed + amount > *cap + 1e-9) {
            context.warnings.add(
                WarningKind::ContributionCapExceeded, context.currentDate, "",
                "Contribution cap $" + formatMoney(*cap) + " for " +
                std::to_string(year) + " reached, deposit of $" +
                formatMoney(amount) + " skipped");
            return 0.0;
        }
    }

    context.portfolio.addDeposit(amount, context.currentDate);
    context.totalDeposits += amount;

    if (options_.verbose && !options_.quiet) {
        std::cout << "  💵 DEPOSIT " << formatDate(context.currentDate)
                  << " $" << formatMoney(amount) << std::endl;
    }

    return amount;
}

// ═══════════════════════════════════════════════════════════════════════════════
// КОМИССИЯ ФОНДОВ
// ═══════════════════════════════════════════════════════════════════════════════

void SimulationRunner::applyExpenseRatios(SimulationContext& context)
{
    if (!context.config.frictions.useActualEtfEr) {
        return;
    }

    for (const auto& [symbol, data] : context.marketData) {
        if (data.expenseRatio <= 0.0) {
            continue;
        }

        double dailyDrag = std::pow(1.0 + data.expenseRatio, 1.0 / kTradingDaysPerYear) - 1.0;
        context.portfolio.applyExpenseDrag(symbol, dailyDrag);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// РАЗМЕЩЕНИЕ КАПИТАЛА
// ═══════════════════════════════════════════════════════════════════════════════

void SimulationRunner::deployCapital(SimulationContext& context, double depositAmount)
{
    std::vector<TradeIntent> intents;

    if (depositAmount > 0.0) {
        // Пополнение вкладывается по целевым весам, позиции не трогаются
        intents = context.rebalancer.generateDepositTrades(
            context.targetWeights, depositAmount, context.prices);
    } else {
        auto weights = Rebalancer::currentWeights(context.portfolio, context.prices);
        auto decision = context.rebalancer.shouldRebalance(
            context.currentDate, weights, context.targetWeights, false);

        if (!decision.triggered && !context.isFirstSimulatedDay) {
            return;
        }

        if (options_.verbose && !options_.quiet) {
            std::cout << "  ⚖️  REBALANCE " << formatDate(context.currentDate) << " ("
                      << (decision.triggered ? decision.reason : "initial") << ")"
                      << std::endl;
        }

        intents = context.rebalancer.generateRebalanceTrades(
            context.portfolio, context.targetWeights, context.prices);
    }

    for (const auto& [symbol, weight] : context.targetWeights) {
        if (weight > 0.0 && !context.prices.contains(symbol)) {
            context.warnings.add(
                WarningKind::NoPriceData, context.currentDate, symbol,
                "No price, trade skipped");
        }
    }

    executeTrades(context, intents);
}

void SimulationRunner::executeTrades(
    SimulationContext& context,
    const std::vector<TradeIntent>& intents)
{
    const auto& frictions = context.config.frictions;
    double slippagePct = frictions.slippageBps / 10000.0;
    double commission = frictions.commissionPerTrade;

    for (const auto& intent : intents) {
        if (intent.quantity <= kQuantityTolerance) {
            continue;
        }

        auto priceIt = context.prices.find(intent.symbol);
        if (priceIt == context.prices.end()) {
            context.warnings.add(
                WarningKind::NoPriceData, context.currentDate, intent.symbol,
                "No price, trade skipped");
            continue;
        }

        double price = priceIt->second;
        double quantity = intent.quantity;

        if (intent.side == TradeSide::Buy) {
            double totalCost = quantity * price * (1.0 + slippagePct) + commission;
            double available = context.portfolio.cash() * kCashUsageLimit;

            // Не хватает денег - покупаем максимум доступного
            if (totalCost >= available) {
                quantity = std::max(0.0, (available - commission) / (price * (1.0 + slippagePct)));
            }

            if (quantity <= kQuantityTolerance) {
                continue;
            }

            auto trade = context.portfolio.buy(
                intent.symbol, quantity, price, context.currentDate,
                commission, frictions.slippageFor(quantity, price));

            if (!trade) {
                context.warnings.add(
                    trade.error().code == LedgerErrorCode::InvalidPrice
                        ? WarningKind::NoPriceData
                        : WarningKind::InsufficientCash,
                    context.currentDate, intent.symbol, trade.error().message);
                continue;
            }

            logTrade(*trade);
        } else {
            auto trade = context.portfolio.sell(
                intent.symbol, quantity, price, context.currentDate,
                commission, frictions.slippageFor(quantity, price));

            if (!trade) {
                context.warnings.add(
                    trade.error().code == LedgerErrorCode::InvalidPrice
                        ? WarningKind::NoPriceData
                        : WarningKind::InsufficientShares,
                    context.currentDate, intent.symbol, trade.error().message);
                continue;
            }

            logTrade(*trade);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// НАЛОГ ЗА ГОД
// ═══════════════════════════════════════════════════════════════════════════════

void SimulationRunner::processYearEndTax(SimulationContext& context)
{
    int year = yearOf(context.currentDate);

    double tax = context.taxCalculator.applyYearEndTax(
        year, context.portfolio, context.config.account.tax.payTaxesFromExternal);

    if (tax <= 0.0) {
        return;
    }

    context.totalTaxes += tax;

    if (!options_.quiet) {
        std::cout << "  🧾 TAX " << year << ": $" << formatMoney(tax)
                  << (context.config.account.tax.payTaxesFromExternal ? " (paid externally)" : "")
                  << std::endl;
    }

    if (context.portfolio.cash() < 0.0) {
        context.warnings.add(
            WarningKind::NegativeCash, context.currentDate, "",
            "Cash balance $" + formatMoney(context.portfolio.cash()) +
            " after paying " + std::to_string(year) + " taxes");
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// БЕНЧМАРК (купить и держать с теми же пополнениями)
// ═══════════════════════════════════════════════════════════════════════════════

std::map<std::string, std::vector<BenchmarkPoint>> SimulationRunner::runBenchmarks(
    const StrategyConfig& config,
    const MarketData& marketData,
    const TradingCalendar& calendar,
    const std::vector<TimePoint>& tradingDays) const
{
    std::map<std::string, std::vector<BenchmarkPoint>> curves;

    for (const auto& symbol : config.benchmark) {
        auto dataIt = marketData.find(symbol);
        if (dataIt == marketData.end() || dataIt->second.prices.empty()) {
            continue;
        }

        const auto& prices = dataIt->second.prices;

        double shares = 0.0;
        double cash = config.initialCash;
        std::vector<BenchmarkPoint> curve;

        for (const auto& day : tradingDays) {
            auto priceIt = prices.find(day);
            if (priceIt == prices.end() || priceIt->second <= 0.0) {
                continue;
            }

            double price = priceIt->second;

            if (config.deposits && config.deposits->amount > 0.0 &&
                isDepositDay(day, config.deposits->cadence, calendar)) {
                cash += config.deposits->amount;
            }

            if (cash > 0.0) {
                shares += cash / price;
                cash = 0.0;
            }

            curve.push_back(BenchmarkPoint{day, shares * price + cash});
        }

        if (!curve.empty()) {
            curves.emplace(symbol, std::move(curve));
        }
    }

    return curves;
}

// ═══════════════════════════════════════════════════════════════════════════════
// ВЫВОД
// ═══════════════════════════════════════════════════════════════════════════════

void SimulationRunner::printSimulationHeader(const StrategyConfig& config) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "SIMULATION STARTED: " << config.name << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    std::cout << "Period: " << formatDate(config.startDate)
              << " to " << formatDate(config.endDate) << std::endl;
    std::cout << "Account: " << toString(config.account.type)
              << ", lots: " << toString(config.lotMethod) << std::endl;
    std::cout << "Initial cash: $" << formatMoney(config.initialCash) << std::endl;

    if (config.deposits && config.deposits->cadence != DepositCadence::None) {
        std::cout << "Deposits: $" << formatMoney(config.deposits->amount)
                  << " " << toString(config.deposits->cadence) << std::endl;
    }

    std::cout << "Rebalancing: " << toString(config.rebalancing.type);
    if (config.rebalancing.period) {
        std::cout << " (" << toString(*config.rebalancing.period) << ")";
    }
    std::cout << std::endl;

    auto weights = config.targetWeights();
    std::cout << "Universe: ";
    bool first = true;
    for (const auto& symbol : config.symbols) {
        if (!first) std::cout << ", ";
        first = false;
        std::cout << symbol << " (" << std::fixed << std::setprecision(1)
                  << weights[symbol] * 100.0 << "%)";
    }
    std::cout << std::endl;

    std::cout << std::string(70, '=') << std::endl;
}

void SimulationRunner::printFinalSummary(const SimulationResult& result) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "SIMULATION RESULTS" << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    std::cout << "Summary:" << std::endl;
    std::cout << "  Simulated Days:      " << result.diagnostics.simulatedDays
              << " of " << result.diagnostics.tradingDays << std::endl;
    std::cout << "  Trades:              " << result.diagnostics.totalTrades << std::endl;
    std::cout << "  Total Deposits:      $" << formatMoney(result.totalDeposits) << std::endl;
    std::cout << "  Final Value:         $" << formatMoney(result.finalValue) << std::endl;
    std::cout << "  After-Tax Value:     $" << formatMoney(result.afterTaxValue) << std::endl;
    std::cout << "  Total Taxes:         $" << formatMoney(result.totalTaxes) << std::endl;
    std::cout << std::endl;

    bool hasTaxes = std::any_of(
        result.taxSummaries.begin(), result.taxSummaries.end(),
        [](const TaxSummary& s) { return s.totalTax > 0.0 || s.washSaleCount > 0; });

    if (hasTaxes) {
        std::cout << "Taxes by year:" << std::endl;
        for (const auto& summary : result.taxSummaries) {
            std::cout << "  " << summary.year
                      << "  ST: $" << formatMoney(summary.shortTermGains)
                      << "  LT: $" << formatMoney(summary.longTermGains)
                      << "  Div: $" << formatMoney(summary.qualifiedDividends +
                                                   summary.ordinaryDividends)
                      << "  Tax: $" << formatMoney(summary.totalTax);
            if (summary.washSaleCount > 0) {
                std::cout << "  (wash sales: " << summary.washSaleCount << ")";
            }
            std::cout << std::endl;
        }
        std::cout << std::endl;
    }

    for (const auto& [symbol, curve] : result.benchmarkEquity) {
        std::cout << "Benchmark " << symbol << ": $"
                  << formatMoney(curve.back().value) << std::endl;
    }

    if (!result.warnings.empty()) {
        std::cout << "Warnings: " << result.warnings.size() << std::endl;
    }

    std::cout << std::string(70, '=') << std::endl;
}

void SimulationRunner::logTrade(const Trade& trade) const
{
    if (!options_.verbose || options_.quiet) {
        return;
    }

    const char* icon = "📥";
    switch (trade.action) {
        case TradeAction::Buy:
        case TradeAction::Drip:
            icon = "📥";
            break;
        case TradeAction::Sell:
            icon = "📤";
            break;
        case TradeAction::Dividend:
            icon = "💰";
            break;
    }

    std::cout << "  " << icon << " " << toString(trade.action) << " "
              << formatDate(trade.date) << " "
              << std::fixed << std::setprecision(4) << trade.quantity << " "
              << trade.symbol << " @ $" << formatMoney(trade.price)
              << " = $" << formatMoney(std::abs(trade.totalCost)) << std::endl;
}

} // namespace portsim
