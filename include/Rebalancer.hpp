#pragma once

#include "Portfolio.hpp"
#include "TradingCalendar.hpp"
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portsim {

using WeightMap = std::map<std::string, double>;

// ═══════════════════════════════════════════════════════════════════════════════
// Конфигурация ребалансировки
// ═══════════════════════════════════════════════════════════════════════════════

enum class RebalanceType {
    Calendar,
    Drift,
    Both,
    CashflowOnly
};

enum class CalendarPeriod {
    Daily,      // D
    Weekly,     // W
    Monthly,    // M
    Quarterly,  // Q
    Yearly      // A / Y
};

std::string_view toString(RebalanceType type) noexcept;
std::expected<RebalanceType, std::string> parseRebalanceType(std::string_view value);

std::string_view toString(CalendarPeriod period) noexcept;
std::expected<CalendarPeriod, std::string> parseCalendarPeriod(std::string_view value);

struct DriftThresholds {
    std::optional<double> absPct;   // |w - target| > absPct
    std::optional<double> relPct;   // |w - target| / target > relPct
};

struct RebalanceConfig {
    RebalanceType type = RebalanceType::Calendar;
    std::optional<CalendarPeriod> period;
    std::optional<DriftThresholds> drift;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Торговые намерения
// ═══════════════════════════════════════════════════════════════════════════════

enum class TradeSide {
    Buy,
    Sell
};

struct TradeIntent {
    std::string symbol;
    TradeSide side = TradeSide::Buy;
    double quantity = 0.0;
};

struct RebalanceDecision {
    bool triggered = false;
    std::string reason;   // "calendar", "drift", "deposit"
};

// ═══════════════════════════════════════════════════════════════════════════════
// Rebalancer
// ═══════════════════════════════════════════════════════════════════════════════

class Rebalancer {
public:
    Rebalancer(
        RebalanceConfig config,
        std::shared_ptr<const TradingCalendar> calendar,
        AccountKind accountKind);

    Rebalancer(const Rebalancer&) = delete;
    Rebalancer& operator=(const Rebalancer&) = delete;

    // Вызывается не более одного раза в торговый день.
    // Первый вызов только запоминает следующую календарную границу.
    RebalanceDecision shouldRebalance(
        const TimePoint& currentDate,
        const WeightMap& currentWeights,
        const WeightMap& targetWeights,
        bool isDepositDay);

    // Покупки только на сумму пополнения, существующие позиции не трогаются
    std::vector<TradeIntent> generateDepositTrades(
        const WeightMap& targetWeights,
        double depositAmount,
        const PriceMap& prices) const;

    std::vector<TradeIntent> generateRebalanceTrades(
        const Portfolio& portfolio,
        const WeightMap& targetWeights,
        const PriceMap& prices) const;

    static WeightMap currentWeights(
        const Portfolio& portfolio,
        const PriceMap& prices);

    const RebalanceConfig& getConfig() const noexcept { return config_; }

    std::optional<TimePoint> getNextCalendarRebalance() const noexcept {
        return nextCalendarRebalance_;
    }

private:
    bool checkCalendarTrigger(const TimePoint& currentDate);

    TimePoint nextCalendarDate(
        const TimePoint& currentDate,
        CalendarPeriod period) const;

    bool checkDriftTrigger(
        const WeightMap& currentWeights,
        const WeightMap& targetWeights) const;

    // Taxable: сначала продаём убыточные, затем покупаем, затем продаём прибыльные
    std::vector<TradeIntent> generateTaxAwareTrades(
        const Portfolio& portfolio,
        const WeightMap& currentValues,
        const WeightMap& targetValues,
        const PriceMap& prices) const;

    std::vector<TradeIntent> generateSimpleTrades(
        const WeightMap& currentValues,
        const WeightMap& targetValues,
        const PriceMap& prices) const;

    RebalanceConfig config_;
    std::shared_ptr<const TradingCalendar> calendar_;
    AccountKind accountKind_;
    std::optional<TimePoint> nextCalendarRebalance_;
};

} // namespace portsim
