#pragma once

#include "StrategyConfig.hpp"
#include <expected>
#include <string>
#include <vector>

namespace portsim {

// ═══════════════════════════════════════════════════════════════════════════════
// Strategy Manager Interface
// ═══════════════════════════════════════════════════════════════════════════════

struct StrategyInfo {
    StrategyConfig config;
    std::string createdDate;
    std::string modifiedDate;
};

class IStrategyManager {
public:
    virtual ~IStrategyManager() = default;

    // CRUD операции
    virtual Result createStrategy(const StrategyConfig& config) = 0;

    virtual std::expected<StrategyInfo, std::string> getStrategy(
        const std::string& name) = 0;

    virtual std::expected<std::vector<std::string>, std::string> listStrategies() = 0;

    virtual Result updateStrategy(const StrategyConfig& config) = 0;

    virtual Result deleteStrategy(const std::string& name) = 0;

    // Disable copy
    IStrategyManager(const IStrategyManager&) = delete;
    IStrategyManager& operator=(const IStrategyManager&) = delete;

protected:
    IStrategyManager() = default;
};

} // namespace portsim
