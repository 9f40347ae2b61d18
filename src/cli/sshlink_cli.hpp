#pragma once

#include "base_cli.hpp"
#include <string>

#define SSHLINK_VERSION "0.1.0"

void register_connection_commands(BaseCLI& cli);
void register_shell_commands(BaseCLI& cli);
void register_sftp_commands(BaseCLI& cli);

class SshlinkCLI : public BaseCLI {
public:
    SshlinkCLI();

    // Connects to `profile` when given, then reads commands until quit or EOF.
    void run_repl(const std::string& profile = "");

private:
    bool quit_requested_ = false;

    void register_all_commands();
};
