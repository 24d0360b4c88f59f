#include "StrategyConfig.hpp"
#include <algorithm>
#include <fstream>
#include <set>

namespace portsim {

// ═══════════════════════════════════════════════════════════════════════════════
// Преобразование перечислений
// ═══════════════════════════════════════════════════════════════════════════════

std::string_view toString(DepositCadence cadence) noexcept
{
    switch (cadence) {
        case DepositCadence::None:           return "none";
        case DepositCadence::Daily:          return "daily";
        case DepositCadence::EveryMarketDay: return "every_market_day";
        case DepositCadence::Weekly:         return "weekly";
        case DepositCadence::Monthly:        return "monthly";
        case DepositCadence::Quarterly:      return "quarterly";
        case DepositCadence::Yearly:         return "yearly";
    }
    return "none";
}

std::expected<DepositCadence, std::string> parseDepositCadence(std::string_view value)
{
    if (value == "none" || value.empty()) return DepositCadence::None;
    if (value == "daily") return DepositCadence::Daily;
    if (value == "every_market_day") return DepositCadence::EveryMarketDay;
    if (value == "weekly") return DepositCadence::Weekly;
    if (value == "monthly") return DepositCadence::Monthly;
    if (value == "quarterly") return DepositCadence::Quarterly;
    if (value == "yearly") return DepositCadence::Yearly;
    return std::unexpected("Unknown deposit cadence: " + std::string(value));
}

std::string_view toString(DividendMode mode) noexcept
{
    switch (mode) {
        case DividendMode::Drip: return "DRIP";
        case DividendMode::Cash: return "CASH";
    }
    return "DRIP";
}

std::expected<DividendMode, std::string> parseDividendMode(std::string_view value)
{
    if (value == "DRIP") return DividendMode::Drip;
    if (value == "CASH") return DividendMode::Cash;
    return std::unexpected("Unknown dividend mode: " + std::string(value));
}

std::string_view toString(SizingMethod method) noexcept
{
    switch (method) {
        case SizingMethod::EqualWeight:   return "EQUAL_WEIGHT";
        case SizingMethod::CustomWeights: return "CUSTOM_WEIGHTS";
    }
    return "EQUAL_WEIGHT";
}

std::expected<SizingMethod, std::string> parseSizingMethod(std::string_view value)
{
    if (value == "EQUAL_WEIGHT") return SizingMethod::EqualWeight;
    if (value == "CUSTOM_WEIGHTS") return SizingMethod::CustomWeights;
    return std::unexpected("Unknown position sizing method: " + std::string(value));
}

// ═══════════════════════════════════════════════════════════════════════════════
// ContributionCaps
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<double> ContributionCaps::capFor(AccountKind kind) const noexcept
{
    if (!enforce) {
        return std::nullopt;
    }

    switch (kind) {
        case AccountKind::TraditionalIRA:
            return ira + (catchUpEligible ? iraCatchUp : 0.0);
        case AccountKind::RothIRA:
            return roth + (catchUpEligible ? rothCatchUp : 0.0);
        case AccountKind::Taxable:
        case AccountKind::Plan529:
            break;
    }

    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Чтение JSON
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<StrategyConfig, std::string> StrategyConfig::fromJson(const json& j)
{
    try {
        StrategyConfig config;

        if (j.contains("meta")) {
            const auto& meta = j.at("meta");
            config.name = meta.value("name", config.name);
            config.notes = meta.value("notes", "");
        }

        // Universe - порядок сохраняется, повторы отбрасываются
        std::set<std::string> seen;
        for (const auto& symbol :
             j.at("universe").at("symbols").get<std::vector<std::string>>()) {
            if (!symbol.empty() && seen.insert(symbol).second) {
                config.symbols.push_back(symbol);
            }
        }

        const auto& period = j.at("period");
        auto start = parseDate(period.at("start").get<std::string>());
        if (!start) {
            return std::unexpected("period.start: " + start.error());
        }
        auto end = parseDate(period.at("end").get<std::string>());
        if (!end) {
            return std::unexpected("period.end: " + end.error());
        }
        config.startDate = *start;
        config.endDate = *end;

        config.initialCash = j.at("initial_cash").get<double>();

        // ────────────────────────────────────────────────────────────────────
        // Счёт
        // ────────────────────────────────────────────────────────────────────

        const auto& account = j.at("account");
        auto kind = parseAccountKind(account.at("type").get<std::string>());
        if (!kind) {
            return std::unexpected(kind.error());
        }
        config.account.type = *kind;

        if (account.contains("tax")) {
            const auto& tax = account.at("tax");
            auto& t = config.account.tax;
            t.federalOrdinary = tax.value("federal_ordinary", t.federalOrdinary);
            t.federalLtcg = tax.value("federal_ltcg", t.federalLtcg);
            t.state = tax.value("state", t.state);
            t.applyWashSale = tax.value("apply_wash_sale", t.applyWashSale);
            t.payTaxesFromExternal = tax.value("pay_taxes_from_external", t.payTaxesFromExternal);
            t.withdrawalTaxRateForIra =
                tax.value("withdrawal_tax_rate_for_ira", t.withdrawalTaxRateForIra);
        }

        if (account.contains("contribution_caps")) {
            const auto& caps = account.at("contribution_caps");
            auto& c = config.account.caps;
            c.enforce = caps.value("enforce", c.enforce);
            c.ira = caps.value("ira", c.ira);
            c.iraCatchUp = caps.value("ira_catch_up", c.iraCatchUp);
            c.roth = caps.value("roth", c.roth);
            c.rothCatchUp = caps.value("roth_catch_up", c.rothCatchUp);
            c.catchUpEligible = caps.value("catch_up_eligible", c.catchUpEligible);
        }

        // ────────────────────────────────────────────────────────────────────
        // Денежные потоки
        // ────────────────────────────────────────────────────────────────────

        if (j.contains("deposits") && !j.at("deposits").is_null()) {
            const auto& deposits = j.at("deposits");
            auto cadence = parseDepositCadence(deposits.value("cadence", "none"));
            if (!cadence) {
                return std::unexpected(cadence.error());
            }
            config.deposits = DepositConfig{*cadence, deposits.value("amount", 0.0)};
        }

        if (j.contains("dividends")) {
            auto mode = parseDividendMode(j.at("dividends").value("mode", "DRIP"));
            if (!mode) {
                return std::unexpected(mode.error());
            }
            config.dividendMode = *mode;
        }

        // ────────────────────────────────────────────────────────────────────
        // Ребалансировка
        // ────────────────────────────────────────────────────────────────────

        const auto& rebalancing = j.at("rebalancing");
        auto type = parseRebalanceType(rebalancing.at("type").get<std::string>());
        if (!type) {
            return std::unexpected(type.error());
        }
        config.rebalancing.type = *type;

        if (rebalancing.contains("calendar") && !rebalancing.at("calendar").is_null()) {
            auto period = parseCalendarPeriod(
                rebalancing.at("calendar").at("period").get<std::string>());
            if (!period) {
                return std::unexpected(period.error());
            }
            config.rebalancing.period = *period;
        }

        if (rebalancing.contains("drift") && !rebalancing.at("drift").is_null()) {
            const auto& drift = rebalancing.at("drift");
            DriftThresholds thresholds;
            if (drift.contains("abs_pct") && !drift.at("abs_pct").is_null()) {
                thresholds.absPct = drift.at("abs_pct").get<double>();
            }
            if (drift.contains("rel_pct") && !drift.at("rel_pct").is_null()) {
                thresholds.relPct = drift.at("rel_pct").get<double>();
            }
            config.rebalancing.drift = thresholds;
        }

        // ────────────────────────────────────────────────────────────────────
        // Исполнение
        // ────────────────────────────────────────────────────────────────────

        if (j.contains("lots")) {
            auto method = parseLotSelectionMethod(j.at("lots").value("method", "HIFO"));
            if (!method) {
                return std::unexpected(method.error());
            }
            config.lotMethod = *method;
        }

        if (j.contains("frictions")) {
            const auto& frictions = j.at("frictions");
            auto& f = config.frictions;
            f.commissionPerTrade = frictions.value("commission_per_trade", f.commissionPerTrade);
            f.slippageBps = frictions.value("slippage_bps", f.slippageBps);
            f.useActualEtfEr = frictions.value("use_actual_etf_er", f.useActualEtfEr);
        }

        if (j.contains("position_sizing")) {
            const auto& sizing = j.at("position_sizing");
            auto method = parseSizingMethod(sizing.value("method", "EQUAL_WEIGHT"));
            if (!method) {
                return std::unexpected(method.error());
            }
            config.sizing.method = *method;

            if (sizing.contains("custom_weights") && !sizing.at("custom_weights").is_null()) {
                config.sizing.customWeights =
                    sizing.at("custom_weights").get<std::map<std::string, double>>();
            }
        }

        if (j.contains("benchmark")) {
            config.benchmark = j.at("benchmark").get<std::vector<std::string>>();
        }

        return config;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Invalid strategy config: ") + e.what());
    }
}

std::expected<StrategyConfig, std::string> StrategyConfig::fromFile(
    const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        return std::unexpected("Config file not found: " + path.string());
    }

    try {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected("Failed to open config file: " + path.string());
        }

        json j;
        file >> j;
        return fromJson(j);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to parse config file: ") + e.what());
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Запись JSON
// ═══════════════════════════════════════════════════════════════════════════════

json StrategyConfig::toJson() const
{
    json j;
    j["meta"] = {{"name", name}, {"notes", notes}};
    j["universe"] = {{"symbols", symbols}};
    j["period"] = {{"start", formatDate(startDate)}, {"end", formatDate(endDate)}};
    j["initial_cash"] = initialCash;

    const auto& t = account.tax;
    const auto& c = account.caps;
    j["account"] = {
        {"type", std::string(toString(account.type))},
        {"tax", {
            {"federal_ordinary", t.federalOrdinary},
            {"federal_ltcg", t.federalLtcg},
            {"state", t.state},
            {"apply_wash_sale", t.applyWashSale},
            {"pay_taxes_from_external", t.payTaxesFromExternal},
            {"withdrawal_tax_rate_for_ira", t.withdrawalTaxRateForIra}
        }},
        {"contribution_caps", {
            {"enforce", c.enforce},
            {"ira", c.ira},
            {"ira_catch_up", c.iraCatchUp},
            {"roth", c.roth},
            {"roth_catch_up", c.rothCatchUp},
            {"catch_up_eligible", c.catchUpEligible}
        }}
    };

    if (deposits) {
        j["deposits"] = {
            {"cadence", std::string(toString(deposits->cadence))},
            {"amount", deposits->amount}
        };
    } else {
        j["deposits"] = nullptr;
    }

    j["dividends"] = {{"mode", std::string(toString(dividendMode))}};

    json rebalance;
    rebalance["type"] = std::string(toString(rebalancing.type));
    if (rebalancing.period) {
        rebalance["calendar"] = {{"period", std::string(toString(*rebalancing.period))}};
    }
    if (rebalancing.drift) {
        json drift = json::object();
        if (rebalancing.drift->absPct) {
            drift["abs_pct"] = *rebalancing.drift->absPct;
        }
        if (rebalancing.drift->relPct) {
            drift["rel_pct"] = *rebalancing.drift->relPct;
        }
        rebalance["drift"] = drift;
    }
    j["rebalancing"] = rebalance;

    j["lots"] = {{"method", std::string(toString(lotMethod))}};

    j["frictions"] = {
        {"commission_per_trade", frictions.commissionPerTrade},
        {"slippage_bps", frictions.slippageBps},
        {"use_actual_etf_er", frictions.useActualEtfEr}
    };

    j["position_sizing"] = {
        {"method", std::string(toString(sizing.method))},
        {"custom_weights", sizing.customWeights}
    };

    j["benchmark"] = benchmark;

    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Проверка и веса
// ═══════════════════════════════════════════════════════════════════════════════

Result StrategyConfig::validate() const
{
    if (symbols.empty()) {
        return std::unexpected("Universe must contain at least one symbol");
    }

    if (endDate < startDate) {
        return std::unexpected(
            "End date " + formatDate(endDate) +
            " is before start date " + formatDate(startDate));
    }

    if (initialCash <= 0.0) {
        return std::unexpected("Initial cash must be positive");
    }

    if (deposits && deposits->amount < 0.0) {
        return std::unexpected("Deposit amount cannot be negative");
    }

    if (frictions.commissionPerTrade < 0.0 || frictions.slippageBps < 0.0) {
        return std::unexpected("Commission and slippage cannot be negative");
    }

    const auto& t = account.tax;
    for (double rate : {t.federalOrdinary, t.federalLtcg, t.state,
                        t.withdrawalTaxRateForIra}) {
        if (rate < 0.0 || rate > 1.0) {
            return std::unexpected("Tax rates must be within [0, 1]");
        }
    }

    switch (rebalancing.type) {
        case RebalanceType::Calendar:
            if (!rebalancing.period) {
                return std::unexpected("Calendar rebalancing requires calendar.period");
            }
            break;

        case RebalanceType::Drift:
            if (!rebalancing.drift ||
                (!rebalancing.drift->absPct && !rebalancing.drift->relPct)) {
                return std::unexpected("Drift rebalancing requires abs_pct or rel_pct");
            }
            break;

        case RebalanceType::Both:
            if (!rebalancing.period && !rebalancing.drift) {
                return std::unexpected(
                    "Rebalancing type 'both' requires a calendar period or drift thresholds");
            }
            break;

        case RebalanceType::CashflowOnly:
            break;
    }

    if (sizing.method == SizingMethod::CustomWeights) {
        for (const auto& [symbol, weight] : sizing.customWeights) {
            if (weight < 0.0) {
                return std::unexpected("Negative weight for " + symbol);
            }
        }
    }

    return {};
}

WeightMap StrategyConfig::targetWeights() const
{
    WeightMap weights;
    if (symbols.empty()) {
        return weights;
    }

    double equal = 1.0 / static_cast<double>(symbols.size());

    if (sizing.method == SizingMethod::CustomWeights && !sizing.customWeights.empty()) {
        double total = 0.0;
        for (const auto& symbol : symbols) {
            auto it = sizing.customWeights.find(symbol);
            double weight = it != sizing.customWeights.end() ? std::max(it->second, 0.0) : 0.0;
            weights[symbol] = weight;
            total += weight;
        }

        if (total > 0.0) {
            for (auto& [symbol, weight] : weights) {
                weight /= total;
            }
            return weights;
        }

        weights.clear();
    }

    for (const auto& symbol : symbols) {
        weights[symbol] = equal;
    }

    return weights;
}

} // namespace portsim
