#pragma once

#include <boost/program_options.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace po = boost::program_options;

namespace portsim {

struct ParsedCommand {
    std::string command;
    std::string subcommand;
    po::variables_map options;
    std::vector<std::string> positional;
};

class CommandLineParser {
public:
    CommandLineParser() = default;

    std::expected<ParsedCommand, std::string> parse(int argc, char* argv[]);

    // Описания опций команд (используются и в справке)
    po::options_description createLoadOptions() const;
    po::options_description createSymbolOptions() const;
    po::options_description createStrategyOptions() const;
    po::options_description createRunOptions() const;

    // Команды с подкомандами: symbol, strategy
    static bool hasSubcommands(std::string_view command) noexcept;
};

}  // namespace portsim
