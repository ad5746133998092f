#include <iostream>
#include <vector>
#include <string>
#include <core/constants.hpp>
#include "cli/vmig_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    vmig run "
              << theme::color::RESET << theme::color::BROWN << "<target> --host H --user U"
              << theme::color::RESET << theme::color::DIM
              << "   Upload and run a migration payload" << theme::color::RESET << "\n";
    std::cout << theme::color::DIM
              << "        [--port P] [--save-log] [--log-dir D]" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    vmig targets"
              << theme::color::RESET << theme::color::DIM
              << "                           List configured targets" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    vmig config "
              << theme::color::RESET << theme::color::BROWN << "<profile.yaml> [-o out.json]"
              << theme::color::RESET << theme::color::DIM
              << "  Build payload config" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    vmig init"
              << theme::color::RESET << theme::color::DIM
              << "                              Write the default config file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    VMIG_PASSWORD         SSH password (prompted if unset)\n"
              << "    VMIG_CONFIG           Config file (default ~/.vmig/config.yaml)\n\n"
              << "    vmig --version        Show version\n"
              << "    vmig --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        VmigCLI cli;

        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        std::vector<std::string> rest(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "vmig"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << VMIG_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage();
            return 0;
        } else if (cmd == "run") {
            return cli.run_job(rest);
        } else if (cmd == "targets") {
            return cli.run_targets();
        } else if (cmd == "config") {
            return cli.run_config(rest);
        } else if (cmd == "init") {
            return cli.run_init();
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
