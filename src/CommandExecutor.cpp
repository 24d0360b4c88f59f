#include "CommandExecutor.hpp"
#include "CSVMarketDataLoader.hpp"
#include "InMemoryMarketDataStore.hpp"
#include "ResultExporter.hpp"
#include "SQLiteMarketDataStore.hpp"
#include "StrategyManager.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace portsim {

namespace {

std::vector<std::string> splitSymbols(std::string_view list)
{
    std::vector<std::string> symbols;
    std::string current;

    for (char c : list) {
        if (c == ',') {
            if (!current.empty()) {
                symbols.push_back(current);
            }
            current.clear();
        } else if (c != ' ' && c != '\t') {
            current += c;
        }
    }

    if (!current.empty()) {
        symbols.push_back(current);
    }

    return symbols;
}

} // namespace

CommandExecutor::CommandExecutor(const std::string& strategiesDir)
    : strategiesDir_(strategiesDir)
{
}

// ═════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═════════════════════════════════════════════════════════════════════════════

std::unique_ptr<IStrategyManager> CommandExecutor::makeStrategyManager(
    const ParsedCommand& cmd) const
{
    std::string dir = strategiesDir_;
    if (cmd.options.count("strategies-dir")) {
        dir = cmd.options.at("strategies-dir").as<std::string>();
    }
    return std::make_unique<StrategyManager>(dir);
}

std::expected<std::shared_ptr<IMarketDataStore>, std::string> CommandExecutor::openStore(
    const ParsedCommand& cmd)
{
    if (cmd.options.count("sqlite-path")) {
        auto path = cmd.options.at("sqlite-path").as<std::string>();
        try {
            store_ = std::make_shared<SQLiteMarketDataStore>(path);
        } catch (const std::exception& e) {
            return std::unexpected(std::string(e.what()));
        }
    }

    if (!store_) {
        return std::unexpected("Market data store not specified (use --sqlite-path)");
    }

    return store_;
}

std::expected<StrategyConfig, std::string> CommandExecutor::loadStrategyConfig(
    const ParsedCommand& cmd) const
{
    if (cmd.options.count("config")) {
        return StrategyConfig::fromFile(cmd.options.at("config").as<std::string>());
    }

    if (cmd.options.count("strategy")) {
        auto manager = makeStrategyManager(cmd);
        auto info = manager->getStrategy(cmd.options.at("strategy").as<std::string>());
        if (!info) {
            return std::unexpected(info.error());
        }
        return info->config;
    }

    return std::unexpected("Required option 'config' or 'strategy' is missing");
}

void CommandExecutor::printStrategyDetails(const StrategyInfo& info) const
{
    const auto& config = info.config;

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "STRATEGY: " << config.name << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    if (!config.notes.empty()) {
        std::cout << "Notes:        " << config.notes << std::endl;
    }
    std::cout << "Period:       " << formatDate(config.startDate)
              << " to " << formatDate(config.endDate) << std::endl;
    std::cout << "Initial cash: $" << std::fixed << std::setprecision(2)
              << config.initialCash << std::endl;
    std::cout << "Account:      " << toString(config.account.type) << std::endl;
    std::cout << "Lots:         " << toString(config.lotMethod) << std::endl;
    std::cout << "Dividends:    " << toString(config.dividendMode) << std::endl;
    std::cout << "Rebalancing:  " << toString(config.rebalancing.type) << std::endl;

    if (config.deposits) {
        std::cout << "Deposits:     $" << config.deposits->amount << " "
                  << toString(config.deposits->cadence) << std::endl;
    }

    std::cout << "\nUniverse (" << config.symbols.size() << "):" << std::endl;
    auto weights = config.targetWeights();
    for (const auto& symbol : config.symbols) {
        std::cout << "  - " << std::left << std::setw(10) << symbol << std::right
                  << std::setprecision(2) << weights[symbol] * 100.0 << "%" << std::endl;
    }

    if (!info.createdDate.empty()) {
        std::cout << "\nCreated:      " << info.createdDate << std::endl;
        std::cout << "Modified:     " << info.modifiedDate << std::endl;
    }

    std::cout << std::string(70, '=') << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Маршрутизация команд
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::execute(const ParsedCommand& cmd)
{
    if (cmd.command == "help") {
        return executeHelp(cmd);
    } else if (cmd.command == "version") {
        return executeVersion(cmd);
    } else if (cmd.command == "load") {
        return executeLoad(cmd);
    } else if (cmd.command == "symbol") {
        return executeSymbol(cmd);
    } else if (cmd.command == "strategy") {
        return executeStrategy(cmd);
    } else if (cmd.command == "run") {
        return executeRun(cmd);
    } else {
        return std::unexpected("Unknown command: " + cmd.command);
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Help & Version
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeHelp(const ParsedCommand& cmd)
{
    if (!cmd.positional.empty()) {
        printHelp(cmd.positional[0]);
    } else {
        printHelp();
    }
    return {};
}

Result CommandExecutor::executeVersion(const ParsedCommand& /*cmd*/)
{
    printVersion();
    return {};
}

void CommandExecutor::printHelp(std::string_view topic)
{
    CommandLineParser parser;

    if (topic.empty()) {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "Portfolio Simulator" << std::endl;
        std::cout << "Usage: portsim <command> [options]" << std::endl << std::endl;

        std::cout << "COMMANDS:" << std::endl;
        std::cout << "  load                    Import CSV market data into SQLite" << std::endl;
        std::cout << "  symbol                  Inspect stored symbols (list, show, delete)" << std::endl;
        std::cout << "  strategy                Manage saved strategies (create, list, show, delete)" << std::endl;
        std::cout << "  run                     Run a simulation" << std::endl;
        std::cout << "  help <command>          Show detailed help for a command" << std::endl;
        std::cout << "  version                 Show version information" << std::endl;
        std::cout << std::endl;

        std::cout << "Examples:" << std::endl;
        std::cout << "  portsim load -d ./data --sqlite-path market.db" << std::endl;
        std::cout << "  portsim run -c strategy.json --sqlite-path market.db -o result.json" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else if (topic == "load") {
        std::cout << "\nCOMMAND: load" << std::endl;
        std::cout << "  portsim load --data-dir DIR --sqlite-path DB [--symbols A,B]\n" << std::endl;
        std::cout << parser.createLoadOptions() << std::endl;

    } else if (topic == "symbol") {
        std::cout << "\nCOMMAND: symbol" << std::endl;
        std::cout << "  portsim symbol list --sqlite-path DB" << std::endl;
        std::cout << "  portsim symbol show --sqlite-path DB -t SYM" << std::endl;
        std::cout << "  portsim symbol delete --sqlite-path DB -t SYM --confirm\n" << std::endl;
        std::cout << parser.createSymbolOptions() << std::endl;

    } else if (topic == "strategy") {
        std::cout << "\nCOMMAND: strategy" << std::endl;
        std::cout << "  portsim strategy create --config FILE [-n NAME]" << std::endl;
        std::cout << "  portsim strategy list" << std::endl;
        std::cout << "  portsim strategy show -n NAME" << std::endl;
        std::cout << "  portsim strategy delete -n NAME --confirm\n" << std::endl;
        std::cout << parser.createStrategyOptions() << std::endl;

    } else if (topic == "run") {
        std::cout << "\nCOMMAND: run" << std::endl;
        std::cout << "  portsim run (--config FILE | --strategy NAME) "
                  << "(--data-dir DIR | --sqlite-path DB) [OPTIONS]\n" << std::endl;
        std::cout << parser.createRunOptions() << std::endl;

    } else {
        std::cout << "Unknown help topic: " << topic << std::endl;
        std::cout << "Available topics: load, symbol, strategy, run" << std::endl;
    }

    std::cout << std::endl;
}

void CommandExecutor::printVersion() const
{
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << "Portfolio Simulator" << std::endl;
    std::cout << "Version: 1.0.0" << std::endl;
    std::cout << "Build Date: " << __DATE__ << std::endl;
    std::cout << std::string(50, '=') << "\n" << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Load
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeLoad(const ParsedCommand& cmd)
{
    auto dataDir = getRequiredOption<std::string>(cmd, "data-dir");
    if (!dataDir) {
        return std::unexpected(dataDir.error());
    }

    if (!cmd.options.count("sqlite-path")) {
        return std::unexpected("Required option 'sqlite-path' is missing");
    }

    auto store = openStore(cmd);
    if (!store) {
        return std::unexpected(store.error());
    }

    std::vector<std::string> symbols;
    if (cmd.options.count("symbols")) {
        symbols = splitSymbols(cmd.options.at("symbols").as<std::string>());
    }

    char delimiter = ',';
    if (cmd.options.count("delimiter")) {
        delimiter = cmd.options.at("delimiter").as<char>();
    }

    CSVMarketDataLoader loader(*dataDir, nullptr, delimiter);
    auto report = loader.importInto(**store, symbols);
    if (!report) {
        return std::unexpected(report.error());
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "IMPORT COMPLETED" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Symbols:   " << report->symbolsLoaded << std::endl;
    std::cout << "Bars:      " << report->barsLoaded << std::endl;
    std::cout << "Dividends: " << report->dividendsLoaded << std::endl;
    std::cout << "Splits:    " << report->splitsLoaded << std::endl;
    if (report->rowsSkipped > 0) {
        std::cout << "Skipped rows: " << report->rowsSkipped << std::endl;
    }
    if (!report->failedSymbols.empty()) {
        std::cout << "Failed:    ";
        for (const auto& symbol : report->failedSymbols) {
            std::cout << symbol << " ";
        }
        std::cout << std::endl;
    }
    std::cout << std::string(70, '=') << std::endl << std::endl;

    if (report->symbolsLoaded == 0) {
        return std::unexpected("No symbols imported from " + *dataDir);
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Symbol Management
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeSymbol(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty()) {
        std::cout << "Use 'portsim symbol --help' for usage information" << std::endl;
        return {};
    }

    if (cmd.subcommand == "list") {
        return executeSymbolList(cmd);
    } else if (cmd.subcommand == "show") {
        return executeSymbolShow(cmd);
    } else if (cmd.subcommand == "delete") {
        return executeSymbolDelete(cmd);
    } else {
        return std::unexpected("Unknown symbol subcommand: " + cmd.subcommand);
    }
}

Result CommandExecutor::executeSymbolList(const ParsedCommand& cmd)
{
    auto store = openStore(cmd);
    if (!store) {
        return std::unexpected(store.error());
    }

    auto symbols = (*store)->listSymbols();
    if (!symbols) {
        return std::unexpected(symbols.error());
    }

    if (symbols->empty()) {
        std::cout << "No symbols found." << std::endl;
        return {};
    }

    std::cout << "Symbols (" << symbols->size() << "):" << std::endl;
    for (const auto& symbol : *symbols) {
        std::cout << "  - " << symbol << std::endl;
    }

    return {};
}

Result CommandExecutor::executeSymbolShow(const ParsedCommand& cmd)
{
    auto symbol = getRequiredOption<std::string>(cmd, "symbol");
    if (!symbol) {
        return std::unexpected(symbol.error());
    }

    auto store = openStore(cmd);
    if (!store) {
        return std::unexpected(store.error());
    }

    auto info = (*store)->getSymbolInfo(*symbol);
    if (!info) {
        return std::unexpected(info.error());
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "SYMBOL: " << info->symbol << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Bars:          " << info->barCount << std::endl;
    if (info->firstBar && info->lastBar) {
        std::cout << "Range:         " << formatDate(*info->firstBar)
                  << " to " << formatDate(*info->lastBar) << std::endl;
    }
    std::cout << "Dividends:     " << info->dividendCount << std::endl;
    std::cout << "Splits:        " << info->splitCount << std::endl;
    if (info->expenseRatio) {
        std::cout << "Expense ratio: " << std::fixed << std::setprecision(4)
                  << *info->expenseRatio * 100.0 << "%" << std::endl;
    }
    std::cout << std::string(70, '=') << std::endl << std::endl;

    return {};
}

Result CommandExecutor::executeSymbolDelete(const ParsedCommand& cmd)
{
    auto symbol = getRequiredOption<std::string>(cmd, "symbol");
    if (!symbol) {
        return std::unexpected(symbol.error());
    }

    bool confirmed = cmd.options.count("confirm") && cmd.options.at("confirm").as<bool>();
    if (!confirmed) {
        return std::unexpected("Deletion of '" + *symbol + "' requires --confirm");
    }

    auto store = openStore(cmd);
    if (!store) {
        return std::unexpected(store.error());
    }

    auto deleted = (*store)->deleteSymbol(*symbol);
    if (!deleted) {
        return std::unexpected(deleted.error());
    }

    std::cout << "Symbol '" << *symbol << "' deleted successfully" << std::endl;
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Strategy Management
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeStrategy(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty()) {
        std::cout << "Use 'portsim strategy --help' for usage information" << std::endl;
        return {};
    }

    if (cmd.subcommand == "create") {
        return executeStrategyCreate(cmd);
    } else if (cmd.subcommand == "list") {
        return executeStrategyList(cmd);
    } else if (cmd.subcommand == "show") {
        return executeStrategyShow(cmd);
    } else if (cmd.subcommand == "delete") {
        return executeStrategyDelete(cmd);
    } else {
        return std::unexpected("Unknown strategy subcommand: " + cmd.subcommand);
    }
}

Result CommandExecutor::executeStrategyCreate(const ParsedCommand& cmd)
{
    auto path = getRequiredOption<std::string>(cmd, "config");
    if (!path) {
        return std::unexpected(path.error());
    }

    auto config = StrategyConfig::fromFile(*path);
    if (!config) {
        return std::unexpected(config.error());
    }

    // -n переопределяет meta.name
    if (cmd.options.count("name")) {
        config->name = cmd.options.at("name").as<std::string>();
    }

    return makeStrategyManager(cmd)->createStrategy(*config);
}

Result CommandExecutor::executeStrategyList(const ParsedCommand& cmd)
{
    auto manager = makeStrategyManager(cmd);

    auto names = manager->listStrategies();
    if (!names) {
        return std::unexpected(names.error());
    }

    if (names->empty()) {
        std::cout << "No strategies found." << std::endl;
        return {};
    }

    std::cout << "Strategies (" << names->size() << "):" << std::endl;
    for (const auto& name : *names) {
        std::cout << "  - " << name << std::endl;
    }

    return {};
}

Result CommandExecutor::executeStrategyShow(const ParsedCommand& cmd)
{
    auto name = getRequiredOption<std::string>(cmd, "name");
    if (!name) {
        return std::unexpected(name.error());
    }

    auto info = makeStrategyManager(cmd)->getStrategy(*name);
    if (!info) {
        return std::unexpected(info.error());
    }

    printStrategyDetails(*info);
    return {};
}

Result CommandExecutor::executeStrategyDelete(const ParsedCommand& cmd)
{
    auto name = getRequiredOption<std::string>(cmd, "name");
    if (!name) {
        return std::unexpected(name.error());
    }

    bool confirmed = cmd.options.count("confirm") && cmd.options.at("confirm").as<bool>();
    if (!confirmed) {
        return std::unexpected("Deletion of strategy '" + *name + "' requires --confirm");
    }

    return makeStrategyManager(cmd)->deleteStrategy(*name);
}

// ═════════════════════════════════════════════════════════════════════════════
// Run
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeRun(const ParsedCommand& cmd)
{
    // ════════════════════════════════════════════════════════════════════════
    // Конфигурация стратегии
    // ════════════════════════════════════════════════════════════════════════

    auto config = loadStrategyConfig(cmd);
    if (!config) {
        return std::unexpected(config.error());
    }

    // ════════════════════════════════════════════════════════════════════════
    // Источник рыночных данных
    // ════════════════════════════════════════════════════════════════════════

    std::shared_ptr<IMarketDataStore> store;

    if (cmd.options.count("data-dir")) {
        auto memoryStore = std::make_shared<InMemoryMarketDataStore>();

        std::vector<std::string> symbols = config->symbols;
        symbols.insert(symbols.end(), config->benchmark.begin(), config->benchmark.end());

        CSVMarketDataLoader loader(cmd.options.at("data-dir").as<std::string>());

        // Бенчмарка может не быть в каталоге, импортируем только найденные
        auto available = loader.discoverSymbols();
        if (!available) {
            return std::unexpected(available.error());
        }

        std::vector<std::string> toImport;
        for (const auto& symbol : symbols) {
            if (std::find(available->begin(), available->end(), symbol) != available->end() &&
                std::find(toImport.begin(), toImport.end(), symbol) == toImport.end()) {
                toImport.push_back(symbol);
            }
        }

        if (toImport.empty()) {
            return std::unexpected("None of the strategy symbols found in " +
                                   cmd.options.at("data-dir").as<std::string>());
        }

        auto report = loader.importInto(*memoryStore, toImport);
        if (!report) {
            return std::unexpected(report.error());
        }

        store = memoryStore;
    } else {
        auto opened = openStore(cmd);
        if (!opened) {
            return std::unexpected("Market data not specified (use --data-dir or --sqlite-path)");
        }
        store = *opened;
    }

    // ════════════════════════════════════════════════════════════════════════
    // Запуск
    // ════════════════════════════════════════════════════════════════════════

    RunnerOptions options;
    options.verbose = cmd.options.count("verbose") && cmd.options.at("verbose").as<bool>();
    options.includeBenchmark =
        !(cmd.options.count("no-benchmark") && cmd.options.at("no-benchmark").as<bool>());

    SimulationRunner runner(store, options);
    auto result = runner.run(*config);
    if (!result) {
        return std::unexpected(result.error());
    }

    // ════════════════════════════════════════════════════════════════════════
    // Экспорт
    // ════════════════════════════════════════════════════════════════════════

    if (cmd.options.count("output")) {
        auto path = cmd.options.at("output").as<std::string>();
        if (auto saved = ResultExporter::saveJson(*result, path); !saved) {
            return saved;
        }
        std::cout << "Result saved to " << path << std::endl;
    }

    if (cmd.options.count("equity-csv")) {
        auto path = cmd.options.at("equity-csv").as<std::string>();
        if (auto saved = ResultExporter::saveEquityCsv(*result, path); !saved) {
            return saved;
        }
        std::cout << "Equity curve saved to " << path << std::endl;
    }

    if (cmd.options.count("trades-csv")) {
        auto path = cmd.options.at("trades-csv").as<std::string>();
        if (auto saved = ResultExporter::saveTradesCsv(*result, path); !saved) {
            return saved;
        }
        std::cout << "Trade log saved to " << path << std::endl;
    }

    return {};
}

}  // namespace portsim
