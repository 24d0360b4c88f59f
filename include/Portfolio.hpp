#pragma once

#include "DateUtils.hpp"
#include <cstddef>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace portsim {

using PriceMap = std::map<std::string, double>;

// ═══════════════════════════════════════════════════════════════════════════════
// Константы учёта
// ═══════════════════════════════════════════════════════════════════════════════

// Лот считается исчерпанным при остатке не больше этого количества
inline constexpr double kQuantityTolerance = 0.0001;

// <= 365 дней - краткосрочное владение
inline constexpr int kShortTermHoldingDays = 365;

// Окно wash sale: 30 дней до и после продажи
inline constexpr int kWashSaleWindowDays = 30;

// ═══════════════════════════════════════════════════════════════════════════════
// Тип счёта и метод выбора лотов
// ═══════════════════════════════════════════════════════════════════════════════

enum class AccountKind {
    Taxable,
    TraditionalIRA,
    RothIRA,
    Plan529
};

enum class LotSelectionMethod {
    FIFO,   // First In, First Out
    LIFO,   // Last In, First Out
    HIFO    // Highest cost In, First Out (только для Taxable, иначе FIFO)
};

std::string_view toString(AccountKind kind) noexcept;
std::expected<AccountKind, std::string> parseAccountKind(std::string_view value);

std::string_view toString(LotSelectionMethod method) noexcept;
std::expected<LotSelectionMethod, std::string> parseLotSelectionMethod(
    std::string_view value);

enum class TradeAction {
    Buy,
    Sell,
    Drip,
    Dividend
};

std::string_view toString(TradeAction action) noexcept;

// ═══════════════════════════════════════════════════════════════════════════════
// Структуры данных
// ═══════════════════════════════════════════════════════════════════════════════

struct TaxLot {
    std::string lotId;
    std::string symbol;
    double quantity = 0.0;
    double costBasis = 0.0;          // Полная стоимость остатка лота
    TimePoint acquisitionDate;
    bool isWashSale = false;
    double washSaleDisallowed = 0.0;

    double costPerShare() const noexcept {
        return quantity > 0.0 ? costBasis / quantity : 0.0;
    }
};

// Неизменяемая запись о сделке
struct Trade {
    std::string tradeId;
    TimePoint date;
    std::string symbol;
    TradeAction action = TradeAction::Buy;
    double quantity = 0.0;
    double price = 0.0;
    double commission = 0.0;
    double slippage = 0.0;
    double totalCost = 0.0;          // > 0 покупка, < 0 продажа или дивиденд (приток денег)
    std::vector<std::string> lotIds;
    std::string notes;
};

struct Position {
    std::string symbol;
    double quantity = 0.0;
    double marketValue = 0.0;
    double costBasis = 0.0;
    double unrealizedGain = 0.0;
};

// Годовые накопители для налогового учёта
struct YearAccumulators {
    double contributions = 0.0;
    double shortTermGains = 0.0;
    double longTermGains = 0.0;
    double qualifiedDividends = 0.0;
    double ordinaryDividends = 0.0;
    double interest = 0.0;
    std::size_t washSaleCount = 0;
};

struct WashSaleRecord {
    TimePoint saleDate;
    std::string symbol;
    std::string lotId;
    double disallowedLoss = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Ошибки операций с портфелем
// ═══════════════════════════════════════════════════════════════════════════════

enum class LedgerErrorCode {
    InsufficientCash,
    InsufficientShares,
    InvalidQuantity,
    InvalidPrice
};

struct LedgerError {
    LedgerErrorCode code;
    std::string message;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Portfolio - учёт налоговых лотов, денежных средств и сделок
// ═══════════════════════════════════════════════════════════════════════════════

class Portfolio {
public:
    Portfolio(
        double initialCash,
        AccountKind accountKind,
        LotSelectionMethod lotMethod = LotSelectionMethod::HIFO,
        bool applyWashSale = true);

    Portfolio(const Portfolio&) = delete;
    Portfolio& operator=(const Portfolio&) = delete;

    // ────────────────────────────────────────────────────────────────────────
    // Операции
    // ────────────────────────────────────────────────────────────────────────

    // Покупка: создаёт новый лот с costBasis = qty * price + commission + slippage
    std::expected<Trade, LedgerError> buy(
        std::string_view symbol,
        double quantity,
        double price,
        const TimePoint& date,
        double commission = 0.0,
        double slippage = 0.0,
        TradeAction action = TradeAction::Buy);

    // Продажа по методу выбора лотов, с учётом wash sale для Taxable
    std::expected<Trade, LedgerError> sell(
        std::string_view symbol,
        double quantity,
        double price,
        const TimePoint& date,
        double commission = 0.0,
        double slippage = 0.0);

    void recordDividend(
        std::string_view symbol,
        double amount,
        const TimePoint& exDate,
        double qualifiedPct = 1.0);

    // Запись о выплате дивиденда в журнал сделок (денежные средства не меняются)
    const Trade& logDividendPayment(
        std::string_view symbol,
        double sharesHeld,
        double amountPerShare,
        const TimePoint& exDate);

    void recordInterest(double amount, const TimePoint& date);

    void addDeposit(double amount, const TimePoint& date);

    // Может увести баланс в минус, проверка остаётся за вызывающей стороной
    void deductTax(double amount);

    // Ежедневное списание комиссии фонда из стоимости лотов
    void applyExpenseDrag(std::string_view symbol, double dailyDrag);

    // ────────────────────────────────────────────────────────────────────────
    // Запросы
    // ────────────────────────────────────────────────────────────────────────

    double cash() const noexcept { return cash_; }
    AccountKind accountKind() const noexcept { return accountKind_; }
    LotSelectionMethod lotMethod() const noexcept { return lotMethod_; }
    bool applyWashSale() const noexcept { return applyWashSale_; }

    double heldQuantity(std::string_view symbol) const;
    double costBasis(std::string_view symbol) const;
    std::vector<std::string> heldSymbols() const;

    double totalValue(const PriceMap& prices) const;
    std::vector<Position> positions(const PriceMap& prices) const;

    const std::vector<TaxLot>& lots(std::string_view symbol) const;
    std::vector<TaxLot> allLots() const;

    const std::vector<Trade>& trades() const noexcept { return trades_; }
    const std::vector<WashSaleRecord>& washSales() const noexcept { return washSales_; }

    YearAccumulators yearTotals(int year) const;
    const std::map<int, YearAccumulators>& accumulators() const noexcept { return years_; }

    double realizedShortTermGains() const noexcept { return realizedShortTerm_; }
    double realizedLongTermGains() const noexcept { return realizedLongTerm_; }

private:
    struct LotSlice {
        std::string lotId;
        double quantity;
    };

    std::vector<LotSlice> selectLots(
        const std::vector<TaxLot>& lots,
        double quantity) const;

    bool hasWashSalePurchase(
        const std::vector<TaxLot>& lots,
        const TimePoint& saleDate) const;

    YearAccumulators& yearBucket(int year);

    std::string nextLotId();
    std::string nextTradeId();

    double cash_;
    AccountKind accountKind_;
    LotSelectionMethod lotMethod_;
    bool applyWashSale_;

    std::map<std::string, std::vector<TaxLot>, std::less<>> lots_;
    std::vector<Trade> trades_;
    std::map<int, YearAccumulators> years_;
    std::vector<WashSaleRecord> washSales_;

    double realizedShortTerm_ = 0.0;
    double realizedLongTerm_ = 0.0;

    std::size_t lotCounter_ = 0;
    std::size_t tradeCounter_ = 0;
};

} // namespace portsim
