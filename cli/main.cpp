//
// Created by gregorian-rayne on 10/12/26.
//

#include "gk/cli/commands/command.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(const int argc, char** argv) {
    try {
        if (argc < 2) {
            gk::cli::print_overview();
            return 1;
        }

        std::string command = argv[1];
        if (command == "-h" || command == "--help") {
            command = "help";
        } else if (command == "-V" || command == "--version") {
            command = "version";
        }

        const std::vector<std::string> args(argv + 2, argv + argc);
        return gk::cli::run_command(command, args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
