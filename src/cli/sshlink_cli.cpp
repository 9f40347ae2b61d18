#include "sshlink_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <core/config.hpp>
#include <readline/readline.h>
#include <readline/history.h>

SshlinkCLI::SshlinkCLI() : BaseCLI() {
    register_all_commands();
}

void SshlinkCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    auto quit = [this](BaseCLI& cli, const std::string& arg) {
        if (cli.conn) std::cout << theme::dim("    Disconnecting...") << "\n";
        quit_requested_ = true;
    };
    add_command("quit", quit, "Disconnect and exit");
    add_command("exit", quit, "Disconnect and exit");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_connection_commands(*this);
    register_shell_commands(*this);
    register_sftp_commands(*this);
}

void SshlinkCLI::run_repl(const std::string& profile) {
    std::cout << theme::banner(SSHLINK_VERSION);

    if (!config.has_value()) {
        std::cout << theme::fail(config_error);
    } else if (!profile.empty()) {
        connect_profile(profile);
    } else if (!config->hosts().empty()) {
        std::cout << theme::step("Type 'hosts' to list profiles, 'connect <profile>' to start.");
    }
    std::cout << "\n";

    std::string line;
    while (!quit_requested_) {
        report_finished_transfers();

        std::string prompt = get_prompt_string();
        set_at_prompt(true);
        char* raw = readline(prompt.c_str());
        set_at_prompt(false);
        if (!raw) {
            std::cout << "\n";
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);

        if (conn && conn->state() != ConnectionState::Connected) {
            std::cout << theme::fail("Session ended.");
            disconnect();
        }
    }

    disconnect();
}
