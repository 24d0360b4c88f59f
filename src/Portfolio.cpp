#include "Portfolio.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace portsim {

// ═══════════════════════════════════════════════════════════════════════════════
// Преобразование перечислений
// ═══════════════════════════════════════════════════════════════════════════════

std::string_view toString(AccountKind kind) noexcept
{
    switch (kind) {
        case AccountKind::Taxable:        return "Taxable";
        case AccountKind::TraditionalIRA: return "Traditional IRA";
        case AccountKind::RothIRA:        return "Roth IRA";
        case AccountKind::Plan529:        return "529";
    }
    return "Unknown";
}

std::expected<AccountKind, std::string> parseAccountKind(std::string_view value)
{
    if (value == "Taxable" || value == "taxable") {
        return AccountKind::Taxable;
    }
    if (value == "Traditional IRA" || value == "traditional_ira" || value == "IRA") {
        return AccountKind::TraditionalIRA;
    }
    if (value == "Roth IRA" || value == "roth_ira" || value == "Roth") {
        return AccountKind::RothIRA;
    }
    if (value == "529" || value == "plan_529") {
        return AccountKind::Plan529;
    }
    return std::unexpected("Unknown account type: " + std::string(value));
}

std::string_view toString(LotSelectionMethod method) noexcept
{
    switch (method) {
        case LotSelectionMethod::FIFO: return "FIFO";
        case LotSelectionMethod::LIFO: return "LIFO";
        case LotSelectionMethod::HIFO: return "HIFO";
    }
    return "Unknown";
}

std::expected<LotSelectionMethod, std::string> parseLotSelectionMethod(
    std::string_view value)
{
    if (value == "FIFO") return LotSelectionMethod::FIFO;
    if (value == "LIFO") return LotSelectionMethod::LIFO;
    if (value == "HIFO") return LotSelectionMethod::HIFO;
    return std::unexpected("Unknown lot selection method: " + std::string(value));
}

std::string_view toString(TradeAction action) noexcept
{
    switch (action) {
        case TradeAction::Buy:      return "BUY";
        case TradeAction::Sell:     return "SELL";
        case TradeAction::Drip:     return "DRIP";
        case TradeAction::Dividend: return "DIVIDEND";
    }
    return "UNKNOWN";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Portfolio
// ═══════════════════════════════════════════════════════════════════════════════

Portfolio::Portfolio(
    double initialCash,
    AccountKind accountKind,
    LotSelectionMethod lotMethod,
    bool applyWashSale)
    : cash_(initialCash),
      accountKind_(accountKind),
      lotMethod_(lotMethod),
      applyWashSale_(applyWashSale)
{
}

std::expected<Trade, LedgerError> Portfolio::buy(
    std::string_view symbol,
    double quantity,
    double price,
    const TimePoint& date,
    double commission,
    double slippage,
    TradeAction action)
{
    if (quantity <= 0.0) {
        return std::unexpected(LedgerError{
            LedgerErrorCode::InvalidQuantity,
            "Buy quantity must be positive"});
    }

    if (price <= 0.0) {
        return std::unexpected(LedgerError{
            LedgerErrorCode::InvalidPrice,
            "Price must be positive for " + std::string(symbol)});
    }

    double totalCost = quantity * price + commission + slippage;

    if (cash_ < totalCost) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2)
            << "Insufficient cash: need $" << totalCost
            << ", have $" << cash_;
        return std::unexpected(LedgerError{
            LedgerErrorCode::InsufficientCash, oss.str()});
    }

    cash_ -= totalCost;

    TaxLot lot;
    lot.lotId = nextLotId();
    lot.symbol = std::string(symbol);
    lot.quantity = quantity;
    lot.costBasis = totalCost;
    lot.acquisitionDate = normalizeDate(date);

    Trade trade;
    trade.tradeId = nextTradeId();
    trade.date = normalizeDate(date);
    trade.symbol = std::string(symbol);
    trade.action = action;
    trade.quantity = quantity;
    trade.price = price;
    trade.commission = commission;
    trade.slippage = slippage;
    trade.totalCost = totalCost;
    trade.lotIds.push_back(lot.lotId);

    auto it = lots_.find(symbol);
    if (it == lots_.end()) {
        it = lots_.emplace(std::string(symbol), std::vector<TaxLot>{}).first;
    }
    it->second.push_back(std::move(lot));

    trades_.push_back(trade);
    return trade;
}

std::expected<Trade, LedgerError> Portfolio::sell(
    std::string_view symbol,
    double quantity,
    double price,
    const TimePoint& date,
    double commission,
    double slippage)
{
    if (quantity <= 0.0) {
        return std::unexpected(LedgerError{
            LedgerErrorCode::InvalidQuantity,
            "Sell quantity must be positive"});
    }

    double held = heldQuantity(symbol);

    if (held < quantity) {
        // Погрешность округления при расчёте доли - продаём всё что есть
        if (quantity - held <= kQuantityTolerance && held > 0.0) {
            quantity = held;
        } else {
            std::ostringstream oss;
            oss << "Insufficient shares of " << symbol
                << ": need " << quantity << ", have " << held;
            return std::unexpected(LedgerError{
                LedgerErrorCode::InsufficientShares, oss.str()});
        }
    }

    auto& symbolLots = lots_.find(symbol)->second;
    auto slices = selectLots(symbolLots, quantity);

    TimePoint saleDate = normalizeDate(date);
    double netProceeds = quantity * price - commission - slippage;
    cash_ += netProceeds;

    Trade trade;
    trade.tradeId = nextTradeId();
    trade.date = saleDate;
    trade.symbol = std::string(symbol);
    trade.action = TradeAction::Sell;
    trade.quantity = quantity;
    trade.price = price;
    trade.commission = commission;
    trade.slippage = slippage;
    trade.totalCost = -netProceeds;

    int year = yearOf(saleDate);

    for (const auto& slice : slices) {
        auto lotIt = std::find_if(symbolLots.begin(), symbolLots.end(),
            [&slice](const TaxLot& lot) { return lot.lotId == slice.lotId; });

        if (lotIt == symbolLots.end()) {
            continue;
        }

        trade.lotIds.push_back(lotIt->lotId);

        double apportionedCost = lotIt->costBasis * (slice.quantity / lotIt->quantity);
        double apportionedProceeds = (slice.quantity / quantity) * netProceeds;
        double gain = apportionedProceeds - apportionedCost;

        bool isShortTerm =
            daysBetween(lotIt->acquisitionDate, saleDate) <= kShortTermHoldingDays;

        if (accountKind_ == AccountKind::Taxable &&
            applyWashSale_ &&
            gain < 0.0 &&
            hasWashSalePurchase(symbolLots, saleDate)) {

            lotIt->isWashSale = true;
            lotIt->washSaleDisallowed = std::abs(gain);

            washSales_.push_back(WashSaleRecord{
                saleDate, std::string(symbol), lotIt->lotId, std::abs(gain)});
            yearBucket(year).washSaleCount++;

            gain = 0.0;
        }

        if (accountKind_ == AccountKind::Taxable) {
            auto& bucket = yearBucket(year);
            if (isShortTerm) {
                realizedShortTerm_ += gain;
                bucket.shortTermGains += gain;
            } else {
                realizedLongTerm_ += gain;
                bucket.longTermGains += gain;
            }
        }

        lotIt->quantity -= slice.quantity;
        lotIt->costBasis -= apportionedCost;

        if (lotIt->quantity <= kQuantityTolerance) {
            symbolLots.erase(lotIt);
        }
    }

    if (symbolLots.empty()) {
        lots_.erase(lots_.find(symbol));
    }

    trades_.push_back(trade);
    return trade;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Выбор лотов
// ═══════════════════════════════════════════════════════════════════════════════

std::vector<Portfolio::LotSlice> Portfolio::selectLots(
    const std::vector<TaxLot>& lots,
    double quantity) const
{
    std::vector<const TaxLot*> ordered;
    ordered.reserve(lots.size());
    for (const auto& lot : lots) {
        ordered.push_back(&lot);
    }

    auto byDateAscending = [](const TaxLot* a, const TaxLot* b) {
        return a->acquisitionDate < b->acquisitionDate;
    };

    switch (lotMethod_) {
        case LotSelectionMethod::FIFO:
            std::stable_sort(ordered.begin(), ordered.end(), byDateAscending);
            break;

        case LotSelectionMethod::LIFO:
            std::stable_sort(ordered.begin(), ordered.end(),
                [](const TaxLot* a, const TaxLot* b) {
                    return a->acquisitionDate > b->acquisitionDate;
                });
            break;

        case LotSelectionMethod::HIFO:
            if (accountKind_ == AccountKind::Taxable) {
                std::stable_sort(ordered.begin(), ordered.end(),
                    [](const TaxLot* a, const TaxLot* b) {
                        return a->costPerShare() > b->costPerShare();
                    });
            } else {
                // Для счетов с отсрочкой налога выигрыша нет
                std::stable_sort(ordered.begin(), ordered.end(), byDateAscending);
            }
            break;
    }

    std::vector<LotSlice> slices;
    double remaining = quantity;

    for (const auto* lot : ordered) {
        if (remaining <= 0.0) {
            break;
        }

        double fromLot = std::min(lot->quantity, remaining);
        slices.push_back(LotSlice{lot->lotId, fromLot});
        remaining -= fromLot;
    }

    return slices;
}

bool Portfolio::hasWashSalePurchase(
    const std::vector<TaxLot>& lots,
    const TimePoint& saleDate) const
{
    TimePoint windowStart = addDays(saleDate, -kWashSaleWindowDays);
    TimePoint windowEnd = addDays(saleDate, kWashSaleWindowDays);

    for (const auto& lot : lots) {
        if (lot.acquisitionDate >= windowStart &&
            lot.acquisitionDate <= windowEnd &&
            lot.acquisitionDate != saleDate) {
            return true;
        }
    }

    return false;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Денежные потоки
// ═══════════════════════════════════════════════════════════════════════════════

void Portfolio::recordDividend(
    std::string_view /* symbol */,
    double amount,
    const TimePoint& exDate,
    double qualifiedPct)
{
    cash_ += amount;

    if (accountKind_ == AccountKind::Taxable) {
        auto& bucket = yearBucket(yearOf(exDate));
        bucket.qualifiedDividends += amount * qualifiedPct;
        bucket.ordinaryDividends += amount * (1.0 - qualifiedPct);
    }
}

const Trade& Portfolio::logDividendPayment(
    std::string_view symbol,
    double sharesHeld,
    double amountPerShare,
    const TimePoint& exDate)
{
    TimePoint date = normalizeDate(exDate);

    Trade trade;
    trade.tradeId = "DIV-" + formatDate(date) + "-" + std::string(symbol);
    trade.date = date;
    trade.symbol = std::string(symbol);
    trade.action = TradeAction::Dividend;
    trade.quantity = sharesHeld;
    trade.price = amountPerShare;
    trade.totalCost = -(sharesHeld * amountPerShare);   // Поступление денег

    std::ostringstream notes;
    notes << std::fixed << std::setprecision(4) << "Dividend: $" << amountPerShare
          << "/share x " << std::setprecision(2) << sharesHeld << " shares";
    trade.notes = notes.str();

    trades_.push_back(std::move(trade));
    return trades_.back();
}

void Portfolio::recordInterest(double amount, const TimePoint& date)
{
    cash_ += amount;

    if (accountKind_ == AccountKind::Taxable) {
        yearBucket(yearOf(date)).interest += amount;
    }
}

void Portfolio::addDeposit(double amount, const TimePoint& date)
{
    cash_ += amount;
    yearBucket(yearOf(date)).contributions += amount;
}

void Portfolio::deductTax(double amount)
{
    cash_ -= amount;
}

void Portfolio::applyExpenseDrag(std::string_view symbol, double dailyDrag)
{
    auto it = lots_.find(symbol);
    if (it == lots_.end()) {
        return;
    }

    for (auto& lot : it->second) {
        lot.costBasis -= lot.costBasis * dailyDrag;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Запросы
// ═══════════════════════════════════════════════════════════════════════════════

double Portfolio::heldQuantity(std::string_view symbol) const
{
    auto it = lots_.find(symbol);
    if (it == lots_.end()) {
        return 0.0;
    }

    double total = 0.0;
    for (const auto& lot : it->second) {
        total += lot.quantity;
    }
    return total;
}

double Portfolio::costBasis(std::string_view symbol) const
{
    auto it = lots_.find(symbol);
    if (it == lots_.end()) {
        return 0.0;
    }

    double total = 0.0;
    for (const auto& lot : it->second) {
        total += lot.costBasis;
    }
    return total;
}

std::vector<std::string> Portfolio::heldSymbols() const
{
    std::vector<std::string> symbols;
    for (const auto& [symbol, symbolLots] : lots_) {
        if (!symbolLots.empty()) {
            symbols.push_back(symbol);
        }
    }
    return symbols;
}

double Portfolio::totalValue(const PriceMap& prices) const
{
    double positionsValue = 0.0;

    for (const auto& [symbol, symbolLots] : lots_) {
        auto priceIt = prices.find(symbol);
        if (priceIt == prices.end()) {
            continue;
        }
        positionsValue += heldQuantity(symbol) * priceIt->second;
    }

    return cash_ + positionsValue;
}

std::vector<Position> Portfolio::positions(const PriceMap& prices) const
{
    std::vector<Position> result;

    for (const auto& [symbol, symbolLots] : lots_) {
        if (symbolLots.empty()) {
            continue;
        }

        Position pos;
        pos.symbol = symbol;
        pos.quantity = heldQuantity(symbol);
        pos.costBasis = costBasis(symbol);

        auto priceIt = prices.find(symbol);
        double price = priceIt != prices.end() ? priceIt->second : 0.0;

        pos.marketValue = pos.quantity * price;
        pos.unrealizedGain = pos.marketValue - pos.costBasis;
        result.push_back(std::move(pos));
    }

    return result;
}

const std::vector<TaxLot>& Portfolio::lots(std::string_view symbol) const
{
    static const std::vector<TaxLot> empty;

    auto it = lots_.find(symbol);
    return it != lots_.end() ? it->second : empty;
}

std::vector<TaxLot> Portfolio::allLots() const
{
    std::vector<TaxLot> result;
    for (const auto& [symbol, symbolLots] : lots_) {
        result.insert(result.end(), symbolLots.begin(), symbolLots.end());
    }
    return result;
}

YearAccumulators Portfolio::yearTotals(int year) const
{
    auto it = years_.find(year);
    return it != years_.end() ? it->second : YearAccumulators{};
}

YearAccumulators& Portfolio::yearBucket(int year)
{
    return years_[year];
}

std::string Portfolio::nextLotId()
{
    std::ostringstream oss;
    oss << "LOT-" << std::setw(6) << std::setfill('0') << ++lotCounter_;
    return oss.str();
}

std::string Portfolio::nextTradeId()
{
    std::ostringstream oss;
    oss << "TRD-" << std::setw(6) << std::setfill('0') << ++tradeCounter_;
    return oss.str();
}

} // namespace portsim
