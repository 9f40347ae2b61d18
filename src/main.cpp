#include <iostream>
#include <string>
#include "cli/sshlink_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>

void print_usage() {
    std::cout << theme::banner(SSHLINK_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::SLATE << "    sshlink"
              << theme::color::RESET << theme::color::DIM
              << "                   Open the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::SLATE << "    sshlink "
              << theme::color::RESET << theme::color::AMBER << "<profile>"
              << theme::color::RESET << theme::color::DIM
              << "         Connect to a host profile, then open the REPL"
              << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    Profiles live in " << get_config_path().string() << "\n\n"
              << "    sshlink --version         Show version\n"
              << "    sshlink --help            Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc > 1) {
            std::string arg = argv[1];
            if (arg == "--version") {
                std::cout << theme::color::SLATE << theme::color::BOLD << "sshlink"
                          << theme::color::RESET << theme::color::DIM
                          << " version " SSHLINK_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help") {
                print_usage();
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cout << theme::fail("Unknown option: " + arg);
                print_usage();
                return 1;
            }
        }

        if (!config_exists()) {
            auto created = create_default_config();
            if (created.is_err()) {
                std::cout << theme::fail(created.error.message);
                return 1;
            }
            std::cout << theme::info("Wrote a starter config to " + get_config_path().string());
        }

        SshlinkCLI cli;
        cli.run_repl(argc > 1 ? argv[1] : "");
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
