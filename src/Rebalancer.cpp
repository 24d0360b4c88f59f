#include "Rebalancer.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace portsim {

namespace {

// Минимальная сумма сделки при прямой ребалансировке
constexpr double kMinTradeValue = 1.0;

// Запас на проскальзывание при покупке
constexpr double kBuyBuffer = 0.999;

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Преобразование перечислений
// ═══════════════════════════════════════════════════════════════════════════════

std::string_view toString(RebalanceType type) noexcept
{
    switch (type) {
        case RebalanceType::Calendar:     return "calendar";
        case RebalanceType::Drift:        return "drift";
        case RebalanceType::Both:         return "both";
        case RebalanceType::CashflowOnly: return "cashflow_only";
    }
    return "unknown";
}

std::expected<RebalanceType, std::string> parseRebalanceType(std::string_view value)
{
    if (value == "calendar" || value == "CALENDAR") return RebalanceType::Calendar;
    if (value == "drift" || value == "DRIFT") return RebalanceType::Drift;
    if (value == "both" || value == "BOTH") return RebalanceType::Both;
    if (value == "cashflow_only" || value == "CASHFLOW_ONLY") {
        return RebalanceType::CashflowOnly;
    }
    return std::unexpected("Unknown rebalance type: " + std::string(value));
}

std::string_view toString(CalendarPeriod period) noexcept
{
    switch (period) {
        case CalendarPeriod::Daily:     return "D";
        case CalendarPeriod::Weekly:    return "W";
        case CalendarPeriod::Monthly:   return "M";
        case CalendarPeriod::Quarterly: return "Q";
        case CalendarPeriod::Yearly:    return "A";
    }
    return "?";
}

std::expected<CalendarPeriod, std::string> parseCalendarPeriod(std::string_view value)
{
    if (value == "D") return CalendarPeriod::Daily;
    if (value == "W") return CalendarPeriod::Weekly;
    if (value == "M") return CalendarPeriod::Monthly;
    if (value == "Q") return CalendarPeriod::Quarterly;
    if (value == "A" || value == "Y") return CalendarPeriod::Yearly;
    return std::unexpected("Unknown calendar period: " + std::string(value));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Rebalancer
// ═══════════════════════════════════════════════════════════════════════════════

Rebalancer::Rebalancer(
    RebalanceConfig config,
    std::shared_ptr<const TradingCalendar> calendar,
    AccountKind accountKind)
    : config_(std::move(config)),
      calendar_(std::move(calendar)),
      accountKind_(accountKind)
{
}

RebalanceDecision Rebalancer::shouldRebalance(
    const TimePoint& currentDate,
    const WeightMap& currentWeights,
    const WeightMap& targetWeights,
    bool isDepositDay)
{
    if (config_.type == RebalanceType::CashflowOnly) {
        if (isDepositDay) {
            return {true, "deposit"};
        }
        return {};
    }

    bool calendarTrigger = false;
    if ((config_.type == RebalanceType::Calendar || config_.type == RebalanceType::Both) &&
        config_.period) {
        calendarTrigger = checkCalendarTrigger(currentDate);
    }

    bool driftTrigger = false;
    if ((config_.type == RebalanceType::Drift || config_.type == RebalanceType::Both) &&
        config_.drift) {
        driftTrigger = checkDriftTrigger(currentWeights, targetWeights);
    }

    if (calendarTrigger) {
        return {true, "calendar"};
    }

    if (driftTrigger) {
        return {true, "drift"};
    }

    if (isDepositDay) {
        return {true, "deposit"};
    }

    return {};
}

bool Rebalancer::checkCalendarTrigger(const TimePoint& currentDate)
{
    auto today = normalizeDate(currentDate);

    if (!nextCalendarRebalance_) {
        nextCalendarRebalance_ = nextCalendarDate(today, *config_.period);
        return false;
    }

    if (today >= *nextCalendarRebalance_) {
        nextCalendarRebalance_ = nextCalendarDate(today, *config_.period);
        return true;
    }

    return false;
}

TimePoint Rebalancer::nextCalendarDate(
    const TimePoint& currentDate,
    CalendarPeriod period) const
{
    int year = yearOf(currentDate);
    unsigned month = monthOf(currentDate);

    switch (period) {
        case CalendarPeriod::Daily:
            return calendar_->nextTradingDay(currentDate);

        case CalendarPeriod::Weekly:
            return calendar_->alignToBusinessDay(
                addDays(currentDate, 7), AlignRule::FirstBusinessDay);

        case CalendarPeriod::Monthly:
            if (month == 12) {
                return calendar_->firstTradingDayOfMonth(year + 1, 1);
            }
            return calendar_->firstTradingDayOfMonth(year, month + 1);

        case CalendarPeriod::Quarterly: {
            unsigned nextQuarter = quarterOf(currentDate) + 1;
            if (nextQuarter > 4) {
                return calendar_->firstTradingDayOfQuarter(year + 1, 1);
            }
            return calendar_->firstTradingDayOfQuarter(year, nextQuarter);
        }

        case CalendarPeriod::Yearly:
            return calendar_->firstTradingDayOfYear(year + 1);
    }

    return calendar_->nextTradingDay(currentDate);
}

bool Rebalancer::checkDriftTrigger(
    const WeightMap& currentWeights,
    const WeightMap& targetWeights) const
{
    const auto& drift = *config_.drift;

    for (const auto& [symbol, target] : targetWeights) {
        auto it = currentWeights.find(symbol);
        double current = it != currentWeights.end() ? it->second : 0.0;
        double deviation = std::abs(current - target);

        if (drift.absPct && deviation > *drift.absPct) {
            return true;
        }

        if (drift.relPct && target > 0.0 && deviation / target > *drift.relPct) {
            return true;
        }
    }

    return false;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Генерация сделок
// ═══════════════════════════════════════════════════════════════════════════════

WeightMap Rebalancer::currentWeights(
    const Portfolio& portfolio,
    const PriceMap& prices)
{
    WeightMap weights;

    double totalValue = portfolio.totalValue(prices);
    if (totalValue <= 0.0) {
        return weights;
    }

    for (const auto& position : portfolio.positions(prices)) {
        weights[position.symbol] = position.marketValue / totalValue;
    }

    return weights;
}

std::vector<TradeIntent> Rebalancer::generateDepositTrades(
    const WeightMap& targetWeights,
    double depositAmount,
    const PriceMap& prices) const
{
    std::vector<TradeIntent> trades;

    if (depositAmount <= 0.0) {
        return trades;
    }

    for (const auto& [symbol, weight] : targetWeights) {
        if (weight <= 0.0) {
            continue;
        }

        auto priceIt = prices.find(symbol);
        if (priceIt == prices.end() || priceIt->second <= 0.0) {
            continue;
        }

        trades.push_back(TradeIntent{
            symbol, TradeSide::Buy, depositAmount * weight / priceIt->second});
    }

    return trades;
}

std::vector<TradeIntent> Rebalancer::generateRebalanceTrades(
    const Portfolio& portfolio,
    const WeightMap& targetWeights,
    const PriceMap& prices) const
{
    double totalValue = portfolio.totalValue(prices);
    if (totalValue <= 0.0) {
        return {};
    }

    auto weights = currentWeights(portfolio, prices);

    WeightMap targetValues;
    WeightMap currentValues;

    for (const auto& [symbol, weight] : targetWeights) {
        targetValues[symbol] = weight * totalValue;

        auto it = weights.find(symbol);
        currentValues[symbol] = (it != weights.end() ? it->second : 0.0) * totalValue;
    }

    switch (accountKind_) {
        case AccountKind::Taxable:
            return generateTaxAwareTrades(portfolio, currentValues, targetValues, prices);

        case AccountKind::TraditionalIRA:
        case AccountKind::RothIRA:
        case AccountKind::Plan529:
            break;
    }

    return generateSimpleTrades(currentValues, targetValues, prices);
}

std::vector<TradeIntent> Rebalancer::generateTaxAwareTrades(
    const Portfolio& portfolio,
    const WeightMap& currentValues,
    const WeightMap& targetValues,
    const PriceMap& prices) const
{
    std::vector<TradeIntent> trades;

    // ════════════════════════════════════════════════════════════════════════
    // Шаг 1: Перевешенные позиции делим на убыточные и прибыльные
    // ════════════════════════════════════════════════════════════════════════

    std::vector<std::pair<std::string, double>> lossPositions;
    std::vector<std::pair<std::string, double>> gainPositions;

    for (const auto& position : portfolio.positions(prices)) {
        auto targetIt = targetValues.find(position.symbol);
        if (targetIt == targetValues.end() || !prices.contains(position.symbol)) {
            continue;
        }

        if (currentValues.at(position.symbol) > targetIt->second) {
            if (position.unrealizedGain < 0.0) {
                lossPositions.emplace_back(position.symbol, position.unrealizedGain);
            } else {
                gainPositions.emplace_back(position.symbol, position.unrealizedGain);
            }
        }
    }

    // Самый большой убыток первым
    std::stable_sort(lossPositions.begin(), lossPositions.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });

    auto sellExcess = [&](const std::string& symbol) {
        double excess = currentValues.at(symbol) - targetValues.at(symbol);
        if (excess > 0.0) {
            trades.push_back(TradeIntent{
                symbol, TradeSide::Sell, excess / prices.at(symbol)});
        }
    };

    // ════════════════════════════════════════════════════════════════════════
    // Шаг 2: Продаём убыточные позиции
    // ════════════════════════════════════════════════════════════════════════

    for (const auto& [symbol, unrealized] : lossPositions) {
        sellExcess(symbol);
    }

    // ════════════════════════════════════════════════════════════════════════
    // Шаг 3: Докупаем недовешенные
    // ════════════════════════════════════════════════════════════════════════

    for (const auto& [symbol, targetValue] : targetValues) {
        auto priceIt = prices.find(symbol);
        if (priceIt == prices.end() || priceIt->second <= 0.0) {
            continue;
        }

        double shortfall = targetValue - currentValues.at(symbol);
        if (shortfall > 0.0) {
            trades.push_back(TradeIntent{
                symbol, TradeSide::Buy, shortfall / priceIt->second});
        }
    }

    // ════════════════════════════════════════════════════════════════════════
    // Шаг 4: Продаём прибыльные, если ещё нужно
    // ════════════════════════════════════════════════════════════════════════

    for (const auto& [symbol, unrealized] : gainPositions) {
        sellExcess(symbol);
    }

    return trades;
}

std::vector<TradeIntent> Rebalancer::generateSimpleTrades(
    const WeightMap& currentValues,
    const WeightMap& targetValues,
    const PriceMap& prices) const
{
    std::vector<TradeIntent> trades;

    for (const auto& [symbol, targetValue] : targetValues) {
        auto priceIt = prices.find(symbol);
        if (priceIt == prices.end() || priceIt->second <= 0.0) {
            continue;
        }

        double diff = targetValue - currentValues.at(symbol);

        if (std::abs(diff) < kMinTradeValue) {
            continue;
        }

        if (diff > 0.0) {
            trades.push_back(TradeIntent{
                symbol, TradeSide::Buy, diff * kBuyBuffer / priceIt->second});
        } else {
            trades.push_back(TradeIntent{
                symbol, TradeSide::Sell, std::abs(diff) / priceIt->second});
        }
    }

    return trades;
}

} // namespace portsim
