#include "TaxCalculator.hpp"
#include <algorithm>

namespace portsim {

TaxCalculator::TaxCalculator(const TaxConfig& config)
    : config_(config)
{
}

TaxSummary TaxCalculator::calculateAnnualTax(
    int year,
    const Portfolio& portfolio) const
{
    TaxSummary summary;
    summary.year = year;

    // Счета с отсрочкой или освобождением от налога ничего не начисляют
    if (portfolio.accountKind() != AccountKind::Taxable) {
        return summary;
    }

    auto totals = portfolio.yearTotals(year);

    summary.shortTermGains = totals.shortTermGains;
    summary.longTermGains = totals.longTermGains;
    summary.qualifiedDividends = totals.qualifiedDividends;
    summary.ordinaryDividends = totals.ordinaryDividends;
    summary.interestIncome = totals.interest;
    summary.washSaleCount = totals.washSaleCount;

    // Убытки не дают отрицательного налога
    summary.shortTermTax = std::max(0.0, totals.shortTermGains) * config_.ordinaryRate();
    summary.longTermTax = std::max(0.0, totals.longTermGains) * config_.longTermRate();

    summary.qualifiedDividendTax = totals.qualifiedDividends * config_.longTermRate();
    summary.ordinaryDividendTax = totals.ordinaryDividends * config_.ordinaryRate();
    summary.interestTax = totals.interest * config_.ordinaryRate();

    summary.totalTax = summary.shortTermTax
                     + summary.longTermTax
                     + summary.qualifiedDividendTax
                     + summary.ordinaryDividendTax
                     + summary.interestTax;

    return summary;
}

double TaxCalculator::applyYearEndTax(
    int year,
    Portfolio& portfolio,
    bool payFromExternal) const
{
    auto summary = calculateAnnualTax(year, portfolio);

    if (!payFromExternal && summary.totalTax > 0.0) {
        portfolio.deductTax(summary.totalTax);
    }

    return summary.totalTax;
}

double TaxCalculator::calculateAfterTaxValue(
    const Portfolio& portfolio,
    const PriceMap& prices) const
{
    double totalValue = portfolio.totalValue(prices);

    switch (portfolio.accountKind()) {
        case AccountKind::RothIRA:
        case AccountKind::Plan529:
            return totalValue;

        case AccountKind::TraditionalIRA:
            // Весь остаток облагается при выводе
            return totalValue * (1.0 - config_.withdrawalTaxRateForIra);

        case AccountKind::Taxable:
            break;
    }

    // Консервативно: нереализованная прибыль по долгосрочной ставке,
    // нереализованные убытки не учитываются
    double unrealizedTax = 0.0;
    for (const auto& position : portfolio.positions(prices)) {
        if (position.unrealizedGain > 0.0) {
            unrealizedTax += position.unrealizedGain * config_.longTermRate();
        }
    }

    return totalValue - unrealizedTax;
}

std::map<int, double> TaxCalculator::calculateTaxDrag(
    const Portfolio& portfolio,
    const std::vector<int>& years) const
{
    std::map<int, double> drag;
    for (int year : years) {
        drag[year] = calculateAnnualTax(year, portfolio).totalTax;
    }
    return drag;
}

} // namespace portsim
