#include "DirDump/CliParser.hpp"
#include "DirDump/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    DirDump::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 reports help and usage errors through ParseError
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    DirDump::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
