#include <iostream>
#include <string>
#include <vector>
#include "cli/slurmled_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"

int main(int argc, char* argv[]) {
    try {
        if (argc < 2) {
            print_usage();
            return EXIT_CONFIG_FAILURE;
        }

        std::string cmd = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::bold("slurmled") << theme::dim(" version " SLURMLED_VERSION) << "\n";
            return EXIT_CLEAN;
        } else if (cmd == "--help" || cmd == "-h") {
            print_usage();
            return EXIT_CLEAN;
        }

        auto role = parse_role(cmd);
        if (!role) {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return EXIT_CONFIG_FAILURE;
        }
        return run_monitor(*role, args);
    } catch (const std::exception& e) {
        log_error(e.what());
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_CONFIG_FAILURE;
    }
}
