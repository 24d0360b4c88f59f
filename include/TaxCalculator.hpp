#pragma once

#include "Portfolio.hpp"
#include <cstddef>
#include <map>
#include <vector>

namespace portsim {

// ═══════════════════════════════════════════════════════════════════════════════
// Налоговые ставки (федеральные + штат)
// ═══════════════════════════════════════════════════════════════════════════════

struct TaxConfig {
    double federalOrdinary = 0.32;
    double federalLtcg = 0.15;
    double state = 0.06;
    bool applyWashSale = true;
    bool payTaxesFromExternal = false;
    double withdrawalTaxRateForIra = 0.25;

    double ordinaryRate() const noexcept { return federalOrdinary + state; }
    double longTermRate() const noexcept { return federalLtcg + state; }
};

struct TaxSummary {
    int year = 0;

    double shortTermGains = 0.0;
    double longTermGains = 0.0;
    double qualifiedDividends = 0.0;
    double ordinaryDividends = 0.0;
    double interestIncome = 0.0;

    double shortTermTax = 0.0;
    double longTermTax = 0.0;
    double qualifiedDividendTax = 0.0;
    double ordinaryDividendTax = 0.0;
    double interestTax = 0.0;
    double totalTax = 0.0;

    std::size_t washSaleCount = 0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Налоговый калькулятор (США)
// ═══════════════════════════════════════════════════════════════════════════════

class TaxCalculator {
public:
    TaxCalculator() = default;
    explicit TaxCalculator(const TaxConfig& config);
    ~TaxCalculator() = default;

    TaxCalculator(const TaxCalculator&) = delete;
    TaxCalculator& operator=(const TaxCalculator&) = delete;

    void setConfig(const TaxConfig& config) noexcept { config_ = config; }
    const TaxConfig& getConfig() const noexcept { return config_; }

    // Налог за год по накопителям портфеля. Не изменяет портфель.
    TaxSummary calculateAnnualTax(int year, const Portfolio& portfolio) const;

    // Рассчитать и списать налог (если не платится из внешних средств).
    // Возвращает сумму налога.
    double applyYearEndTax(
        int year,
        Portfolio& portfolio,
        bool payFromExternal) const;

    double calculateAfterTaxValue(
        const Portfolio& portfolio,
        const PriceMap& prices) const;

    // year -> налог за год
    std::map<int, double> calculateTaxDrag(
        const Portfolio& portfolio,
        const std::vector<int>& years) const;

private:
    TaxConfig config_;
};

} // namespace portsim
