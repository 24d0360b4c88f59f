#pragma once

#include "Portfolio.hpp"
#include "Rebalancer.hpp"
#include "TaxCalculator.hpp"
#include <expected>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace portsim {

using json = nlohmann::json;
using Result = std::expected<void, std::string>;

// ═══════════════════════════════════════════════════════════════════════════════
// Перечисления конфигурации
// ═══════════════════════════════════════════════════════════════════════════════

enum class DepositCadence {
    None,
    Daily,
    EveryMarketDay,
    Weekly,         // По понедельникам
    Monthly,        // Первый торговый день месяца
    Quarterly,
    Yearly
};

enum class DividendMode {
    Drip,
    Cash
};

enum class SizingMethod {
    EqualWeight,
    CustomWeights
};

std::string_view toString(DepositCadence cadence) noexcept;
std::expected<DepositCadence, std::string> parseDepositCadence(std::string_view value);

std::string_view toString(DividendMode mode) noexcept;
std::expected<DividendMode, std::string> parseDividendMode(std::string_view value);

std::string_view toString(SizingMethod method) noexcept;
std::expected<SizingMethod, std::string> parseSizingMethod(std::string_view value);

// ═══════════════════════════════════════════════════════════════════════════════
// Разделы конфигурации
// ═══════════════════════════════════════════════════════════════════════════════

// Годовые лимиты взносов IRA / Roth
struct ContributionCaps {
    bool enforce = true;
    double ira = 7000.0;
    double iraCatchUp = 1000.0;
    double roth = 7000.0;
    double rothCatchUp = 1000.0;
    bool catchUpEligible = false;

    // Лимит для типа счёта, nullopt если лимита нет
    std::optional<double> capFor(AccountKind kind) const noexcept;
};

struct AccountConfig {
    AccountKind type = AccountKind::Taxable;
    TaxConfig tax;
    ContributionCaps caps;
};

struct DepositConfig {
    DepositCadence cadence = DepositCadence::None;
    double amount = 0.0;
};

struct FrictionsConfig {
    double commissionPerTrade = 0.0;
    double slippageBps = 5.0;
    bool useActualEtfEr = true;

    double slippageFor(double quantity, double price) const noexcept {
        return quantity * price * slippageBps / 10000.0;
    }
};

struct PositionSizing {
    SizingMethod method = SizingMethod::EqualWeight;
    std::map<std::string, double> customWeights;
};

// ═══════════════════════════════════════════════════════════════════════════════
// StrategyConfig - декларативное описание стратегии
// ═══════════════════════════════════════════════════════════════════════════════

struct StrategyConfig {
    std::string name = "Untitled";
    std::string notes;

    std::vector<std::string> symbols;
    TimePoint startDate;
    TimePoint endDate;
    double initialCash = 0.0;

    AccountConfig account;
    std::optional<DepositConfig> deposits;
    DividendMode dividendMode = DividendMode::Drip;
    RebalanceConfig rebalancing;
    LotSelectionMethod lotMethod = LotSelectionMethod::HIFO;
    FrictionsConfig frictions;
    PositionSizing sizing;
    std::vector<std::string> benchmark{"SPY"};

    static std::expected<StrategyConfig, std::string> fromJson(const json& j);
    static std::expected<StrategyConfig, std::string> fromFile(
        const std::filesystem::path& path);

    json toJson() const;

    // Структурные ошибки, при которых запуск невозможен
    Result validate() const;

    // EQUAL_WEIGHT: 1/N; CUSTOM_WEIGHTS: нормализованы к сумме 1
    WeightMap targetWeights() const;
};

} // namespace portsim
