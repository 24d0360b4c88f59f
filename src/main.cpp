#include "CommandExecutor.hpp"
#include "CommandLineParser.hpp"
#include <iostream>

using namespace portsim;

int main(int argc, char** argv)
{
    try {
        CommandLineParser parser;

        auto parseResult = parser.parse(argc, argv);

        if (!parseResult) {
            std::cerr << "Error: " << parseResult.error() << std::endl;
            return 1;
        }

        CommandExecutor executor;

        auto execResult = executor.execute(parseResult.value());

        if (!execResult) {
            std::cerr << "Error: " << execResult.error() << std::endl;
            return 1;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
