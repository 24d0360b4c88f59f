#include "CommandLineParser.hpp"
#include <sstream>

namespace portsim {

bool CommandLineParser::hasSubcommands(std::string_view command) noexcept
{
    return command == "symbol" || command == "strategy";
}

std::expected<ParsedCommand, std::string> CommandLineParser::parse(
    int argc,
    char* argv[]) {

    if (argc < 2) {
        return std::unexpected(
            "No command specified. Use 'portsim help' for usage information.");
    }

    ParsedCommand result;
    result.command = argv[1];

    try {
        // ═════════════════════════════════════════════════════════════════════
        // Проверка глобального help
        // ═════════════════════════════════════════════════════════════════════

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "help" || arg == "--help" || arg == "-h") {
                if (i == 1) {
                    result.command = "help";
                    for (int j = 2; j < argc; ++j) {
                        std::string currentArg = argv[j];
                        if (!currentArg.empty() && currentArg[0] != '-') {
                            result.positional.push_back(currentArg);
                        }
                    }
                } else {
                    // portsim run --help -> help run
                    result.positional.push_back(result.command);
                    result.command = "help";
                    if (argc > 2 && argv[2][0] != '-' && std::string(argv[2]) != "help") {
                        result.positional.push_back(argv[2]);
                    }
                }
                return result;
            }
        }

        // Определяем есть ли subcommand
        int startIdx = 2;
        if (hasSubcommands(result.command) && argc > 2 && argv[2][0] != '-') {
            result.subcommand = argv[2];
            startIdx = 3;
        }

        std::vector<std::string> args(argv + startIdx, argv + argc);

        po::options_description desc;
        if (result.command == "load") {
            desc.add(createLoadOptions());
        } else if (result.command == "symbol") {
            desc.add(createSymbolOptions());
        } else if (result.command == "strategy") {
            desc.add(createStrategyOptions());
        } else if (result.command == "run") {
            desc.add(createRunOptions());
        } else if (result.command == "version") {
            result.positional = args;
            return result;
        } else {
            std::ostringstream oss;
            oss << "Unknown command: " << result.command;
            return std::unexpected(oss.str());
        }

        po::store(po::command_line_parser(args).options(desc).run(), result.options);
        po::notify(result.options);

        return result;

    } catch (const po::error& e) {
        return std::unexpected(std::string("Command line parsing error: ") +
                               e.what());
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Load Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createLoadOptions() const {
    po::options_description desc("Load options");

    desc.add_options()
        ("data-dir,d", po::value<std::string>()->required(),
         "CSV data directory (bars/, dividends/, splits/, metadata.csv)")

        ("sqlite-path", po::value<std::string>()->required(),
         "SQLite database file")

        ("symbols", po::value<std::string>(),
         "Comma-separated symbols to import (default: all in bars/)")

        ("delimiter", po::value<char>()->default_value(','),
         "CSV delimiter")

        ("help,h", "Show help message");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Symbol Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createSymbolOptions() const {
    po::options_description desc("Symbol options");

    desc.add_options()
        ("sqlite-path", po::value<std::string>(),
         "SQLite database file")

        ("symbol,t", po::value<std::string>(),
         "Ticker symbol")

        ("confirm", po::bool_switch()->default_value(false),
         "Confirm deletion")

        ("help,h", "Show help message");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Strategy Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createStrategyOptions() const {
    po::options_description desc("Strategy options");

    desc.add_options()
        ("name,n", po::value<std::string>(),
         "Strategy name")

        ("config,c", po::value<std::string>(),
         "Strategy JSON file")

        ("strategies-dir", po::value<std::string>(),
         "Directory of saved strategies (default: ~/.portsim/strategies)")

        ("confirm", po::bool_switch()->default_value(false),
         "Confirm deletion")

        ("help,h", "Show help message");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Run Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createRunOptions() const {
    po::options_description desc("Run options");

    desc.add_options()
        ("config,c", po::value<std::string>(),
         "Strategy JSON file")

        ("strategy,s", po::value<std::string>(),
         "Saved strategy name")

        ("strategies-dir", po::value<std::string>(),
         "Directory of saved strategies (default: ~/.portsim/strategies)")

        ("data-dir,d", po::value<std::string>(),
         "CSV data directory")

        ("sqlite-path", po::value<std::string>(),
         "SQLite database file")

        ("output,o", po::value<std::string>(),
         "Write full result as JSON")

        ("equity-csv", po::value<std::string>(),
         "Write equity curve as CSV")

        ("trades-csv", po::value<std::string>(),
         "Write trade log as CSV")

        ("verbose,v", po::bool_switch()->default_value(false),
         "Print every trade")

        ("no-benchmark", po::bool_switch()->default_value(false),
         "Skip benchmark curves")

        ("help,h", "Show help message");

    return desc;
}

}  // namespace portsim
