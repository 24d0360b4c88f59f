#pragma once

#include "CommandLineParser.hpp"
#include "IMarketDataStore.hpp"
#include "IStrategyManager.hpp"
#include "SimulationRunner.hpp"
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace portsim {

class CommandExecutor {
public:
    explicit CommandExecutor(const std::string& strategiesDir = "");
    ~CommandExecutor() = default;

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    Result execute(const ParsedCommand& cmd);

    // Хранилище по умолчанию, если в команде нет --sqlite-path / --data-dir
    void setStore(std::shared_ptr<IMarketDataStore> store) noexcept {
        store_ = std::move(store);
    }

private:
    std::string strategiesDir_;
    std::shared_ptr<IMarketDataStore> store_;

    // Help & Version
    Result executeHelp(const ParsedCommand& cmd);
    Result executeVersion(const ParsedCommand& cmd);

    void printHelp(std::string_view topic = "");
    void printVersion() const;

    // Load
    Result executeLoad(const ParsedCommand& cmd);

    // Symbol Management
    Result executeSymbol(const ParsedCommand& cmd);
    Result executeSymbolList(const ParsedCommand& cmd);
    Result executeSymbolShow(const ParsedCommand& cmd);
    Result executeSymbolDelete(const ParsedCommand& cmd);

    // Strategy Management
    Result executeStrategy(const ParsedCommand& cmd);
    Result executeStrategyCreate(const ParsedCommand& cmd);
    Result executeStrategyList(const ParsedCommand& cmd);
    Result executeStrategyShow(const ParsedCommand& cmd);
    Result executeStrategyDelete(const ParsedCommand& cmd);

    // Run
    Result executeRun(const ParsedCommand& cmd);

    // Utility methods
    template<typename T>
    std::expected<T, std::string> getRequiredOption(
        const ParsedCommand& cmd,
        std::string_view optionName) const;

    std::unique_ptr<IStrategyManager> makeStrategyManager(const ParsedCommand& cmd) const;

    // --sqlite-path, иначе установленное хранилище
    std::expected<std::shared_ptr<IMarketDataStore>, std::string> openStore(
        const ParsedCommand& cmd);

    // --config FILE или --strategy NAME
    std::expected<StrategyConfig, std::string> loadStrategyConfig(const ParsedCommand& cmd) const;

    void printStrategyDetails(const StrategyInfo& info) const;
};

// Template implementation
template<typename T>
std::expected<T, std::string> CommandExecutor::getRequiredOption(
    const ParsedCommand& cmd,
    std::string_view optionName) const {

    std::string optName(optionName);
    if (!cmd.options.count(optName)) {
        return std::unexpected(
            "Required option '" + optName + "' is missing");
    }

    try {
        return cmd.options.at(optName).as<T>();
    } catch (const std::exception& e) {
        return std::unexpected(
            "Invalid value for option '" + optName + "': " + e.what());
    }
}

}  // namespace portsim
