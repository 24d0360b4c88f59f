#include "ResultExporter.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace portsim {

namespace {

json taxSummaryToJson(const TaxSummary& s)
{
    return json{
        {"year", s.year},
        {"short_term_gains", s.shortTermGains},
        {"long_term_gains", s.longTermGains},
        {"qualified_dividends", s.qualifiedDividends},
        {"ordinary_dividends", s.ordinaryDividends},
        {"interest_income", s.interestIncome},
        {"short_term_tax", s.shortTermTax},
        {"long_term_tax", s.longTermTax},
        {"qualified_dividend_tax", s.qualifiedDividendTax},
        {"ordinary_dividend_tax", s.ordinaryDividendTax},
        {"interest_tax", s.interestTax},
        {"total_tax", s.totalTax},
        {"wash_sale_count", s.washSaleCount}
    };
}

json tradeToJson(const Trade& t)
{
    return json{
        {"trade_id", t.tradeId},
        {"date", formatDate(t.date)},
        {"symbol", t.symbol},
        {"action", std::string(toString(t.action))},
        {"quantity", t.quantity},
        {"price", t.price},
        {"commission", t.commission},
        {"slippage", t.slippage},
        {"total_cost", t.totalCost},
        {"lot_ids", t.lotIds},
        {"notes", t.notes}
    };
}

json lotToJson(const TaxLot& lot)
{
    return json{
        {"lot_id", lot.lotId},
        {"symbol", lot.symbol},
        {"quantity", lot.quantity},
        {"cost_basis", lot.costBasis},
        {"acquisition_date", formatDate(lot.acquisitionDate)},
        {"is_wash_sale", lot.isWashSale},
        {"wash_sale_disallowed", lot.washSaleDisallowed}
    };
}

template<typename Writer>
Result saveToFile(const std::filesystem::path& path, Writer&& writer)
{
    try {
        std::ofstream file(path);
        if (!file) {
            return std::unexpected("Failed to open output file: " + path.string());
        }

        writer(file);

        if (!file) {
            return std::unexpected("Failed to write output file: " + path.string());
        }
        return {};
    } catch (const std::exception& e) {
        return std::unexpected("Failed to export " + path.string() + ": " + e.what());
    }
}

} // namespace

json ResultExporter::toJson(const SimulationResult& result)
{
    json j;
    j["config"] = result.config.toJson();

    j["summary"] = {
        {"final_value", result.finalValue},
        {"after_tax_value", result.afterTaxValue},
        {"total_deposits", result.totalDeposits},
        {"total_taxes", result.totalTaxes}
    };

    j["diagnostics"] = {
        {"total_trades", result.diagnostics.totalTrades},
        {"total_symbols", result.diagnostics.totalSymbols},
        {"trading_days", result.diagnostics.tradingDays},
        {"simulated_days", result.diagnostics.simulatedDays}
    };

    json equity = json::array();
    for (const auto& point : result.equityCurve) {
        equity.push_back({
            {"date", formatDate(point.date)},
            {"total_value", point.totalValue},
            {"cash", point.cash},
            {"positions_value", point.positionsValue}
        });
    }
    j["equity_curve"] = std::move(equity);

    json trades = json::array();
    for (const auto& trade : result.trades) {
        trades.push_back(tradeToJson(trade));
    }
    j["trades"] = std::move(trades);

    json lots = json::array();
    for (const auto& lot : result.lots) {
        lots.push_back(lotToJson(lot));
    }
    j["lots"] = std::move(lots);

    json taxes = json::array();
    for (const auto& summary : result.taxSummaries) {
        taxes.push_back(taxSummaryToJson(summary));
    }
    j["tax_summaries"] = std::move(taxes);

    // Последний снимок позиций, полная история есть в CSV кривой
    json positions = json::array();
    if (!result.positionsHistory.empty()) {
        for (const auto& pos : result.positionsHistory.back().positions) {
            positions.push_back({
                {"symbol", pos.symbol},
                {"quantity", pos.quantity},
                {"market_value", pos.marketValue},
                {"cost_basis", pos.costBasis},
                {"unrealized_gain", pos.unrealizedGain}
            });
        }
    }
    j["final_positions"] = std::move(positions);

    json benchmarks = json::object();
    for (const auto& [symbol, curve] : result.benchmarkEquity) {
        json points = json::array();
        for (const auto& point : curve) {
            points.push_back({{"date", formatDate(point.date)}, {"value", point.value}});
        }
        benchmarks[symbol] = std::move(points);
    }
    j["benchmarks"] = std::move(benchmarks);

    json warnings = json::array();
    for (const auto& w : result.warnings) {
        warnings.push_back({
            {"date", formatDate(w.date)},
            {"kind", std::string(toString(w.kind))},
            {"symbol", w.symbol},
            {"message", w.message}
        });
    }
    j["warnings"] = std::move(warnings);

    return j;
}

void ResultExporter::writeEquityCsv(const SimulationResult& result, std::ostream& out)
{
    out << "date,total_value,cash,positions_value";
    for (const auto& [symbol, curve] : result.benchmarkEquity) {
        out << "," << symbol;
    }
    out << "\n";

    // Индексы бенчмарков по дате
    std::map<std::string, std::map<TimePoint, double>> benchmarkByDate;
    for (const auto& [symbol, curve] : result.benchmarkEquity) {
        auto& byDate = benchmarkByDate[symbol];
        for (const auto& point : curve) {
            byDate[point.date] = point.value;
        }
    }

    out << std::fixed << std::setprecision(2);
    for (const auto& point : result.equityCurve) {
        out << formatDate(point.date) << ","
            << point.totalValue << ","
            << point.cash << ","
            << point.positionsValue;

        for (const auto& [symbol, byDate] : benchmarkByDate) {
            out << ",";
            auto it = byDate.find(point.date);
            if (it != byDate.end()) {
                out << it->second;
            }
        }
        out << "\n";
    }
}

void ResultExporter::writeTradesCsv(const SimulationResult& result, std::ostream& out)
{
    out << "trade_id,date,symbol,action,quantity,price,commission,slippage,total,lot_ids\n";

    for (const auto& trade : result.trades) {
        std::string lotIds;
        for (std::size_t i = 0; i < trade.lotIds.size(); ++i) {
            if (i > 0) lotIds += ";";
            lotIds += trade.lotIds[i];
        }

        out << trade.tradeId << ","
            << formatDate(trade.date) << ","
            << trade.symbol << ","
            << toString(trade.action) << ","
            << std::fixed << std::setprecision(6) << trade.quantity << ","
            << std::setprecision(4) << trade.price << ","
            << trade.commission << ","
            << trade.slippage << ","
            << trade.totalCost << ","
            << lotIds << "\n";
    }
}

Result ResultExporter::saveJson(const SimulationResult& result, const std::filesystem::path& path)
{
    return saveToFile(path, [&result](std::ostream& out) {
        out << toJson(result).dump(2);
    });
}

Result ResultExporter::saveEquityCsv(const SimulationResult& result, const std::filesystem::path& path)
{
    return saveToFile(path, [&result](std::ostream& out) {
        writeEquityCsv(result, out);
    });
}

Result ResultExporter::saveTradesCsv(const SimulationResult& result, const std::filesystem::path& path)
{
    return saveToFile(path, [&result](std::ostream& out) {
        writeTradesCsv(result, out);
    });
}

} // namespace portsim
