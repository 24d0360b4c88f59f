#pragma once

#include "SimulationRunner.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <ostream>

namespace portsim {

// ═══════════════════════════════════════════════════════════════════════════════
// ResultExporter - выгрузка результата симуляции в JSON и CSV
// ═══════════════════════════════════════════════════════════════════════════════

class ResultExporter {
public:
    // Полный результат: конфиг, кривая, сделки, лоты, налоги, предупреждения
    static json toJson(const SimulationResult& result);

    // date,total_value,cash,positions_value[,<benchmark>...]
    static void writeEquityCsv(const SimulationResult& result, std::ostream& out);

    // trade_id,date,symbol,action,quantity,price,commission,slippage,total,lot_ids
    static void writeTradesCsv(const SimulationResult& result, std::ostream& out);

    static Result saveJson(const SimulationResult& result, const std::filesystem::path& path);
    static Result saveEquityCsv(const SimulationResult& result, const std::filesystem::path& path);
    static Result saveTradesCsv(const SimulationResult& result, const std::filesystem::path& path);
};

} // namespace portsim
