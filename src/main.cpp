#include "Cortex/CliParser.hpp"
#include "Cortex/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    Cortex::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 signals --help and bad arguments through exceptions.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    try {
        Cortex::Core core(parser.getCommands());
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
