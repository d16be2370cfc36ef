#include <iostream>
#include <vector>
#include <string>
#include "cli/wtm_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::SAND << theme::color::BOLD << "wtm"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        }
        if (cmd == "--help" || cmd == "help") {
            print_usage();
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        WtmCLI cli;
        return cli.run(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
