#pragma once

#include "IStrategyManager.hpp"
#include <filesystem>

namespace portsim {

// ═══════════════════════════════════════════════════════════════════════════════
// Strategy Manager: именованные стратегии в ~/.portsim/strategies/<name>.json
// ═══════════════════════════════════════════════════════════════════════════════

class StrategyManager : public IStrategyManager {
public:
    explicit StrategyManager(const std::string& strategiesDir = "");
    ~StrategyManager() override = default;

    Result createStrategy(const StrategyConfig& config) override;

    std::expected<StrategyInfo, std::string> getStrategy(
        const std::string& name) override;

    std::expected<std::vector<std::string>, std::string> listStrategies() override;

    Result updateStrategy(const StrategyConfig& config) override;

    Result deleteStrategy(const std::string& name) override;

    const std::filesystem::path& getStrategiesDir() const noexcept { return strategiesDir_; }

private:
    std::filesystem::path strategiesDir_;

    std::filesystem::path getStrategyFilePath(const std::string& name) const;
    Result writeStrategy(const StrategyInfo& info) const;
};

} // namespace portsim
