#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/log.hpp>

static void do_connect(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << "Usage: connect <profile>\n";
        return;
    }
    cli.connect_profile(arg);
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    if (!cli.conn) {
        std::cout << theme::fail("Not connected.");
        return;
    }
    cli.disconnect();
    std::cout << theme::ok("Disconnected");
}

static void do_hosts(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;

    std::cout << theme::section("Hosts");
    if (cli.config->hosts().empty()) {
        std::cout << theme::dim("    No profiles under 'hosts:' yet.") << "\n\n";
        return;
    }
    for (const auto& [name, profile] : cli.config->hosts()) {
        std::string auth = profile.key_file ? "key " + *profile.key_file : "password";
        std::cout << theme::kv(name, fmt::format("{}@{}:{}  {}", profile.user, profile.host,
                                                 profile.port, theme::dim(auth)));
    }
    std::cout << "\n";
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    if (config_exists()) {
        std::cout << theme::kv("Config", get_config_path().string());
    } else {
        std::cout << theme::fail("Config not found");
    }
    std::cout << theme::kv("Log", sshlink_log_path());

    if (!cli.conn) {
        std::cout << theme::kv("Session", "not connected") << "\n";
        return;
    }

    std::cout << theme::kv("Profile", cli.profile_name);
    std::cout << theme::kv("Key", cli.conn->key().str());
    std::cout << theme::kv("Session", connection_state_name(cli.conn->state()));
    std::cout << theme::kv("Shell", channel_state_name(cli.conn->shell_state()));
    std::cout << theme::kv("SFTP", channel_state_name(cli.conn->sftp_state()));

    for (auto direction : {TransferDirection::Upload, TransferDirection::Download}) {
        int percent = cli.transfer_progress(direction);
        if (percent < 0) continue;
        std::cout << theme::kv(direction == TransferDirection::Upload ? "Upload" : "Download",
                               fmt::format("{}%", percent));
    }
    std::cout << "\n";
}

static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    if (arg.empty()) {
        std::cout << "Usage: exec <command>\n";
        return;
    }
    auto result = cli.conn->execute(arg).get();
    if (result.is_err()) {
        std::cout << theme::fail(describe(result.error));
        return;
    }
    std::cout << result.value;
    if (!result.value.empty() && result.value.back() != '\n') std::cout << "\n";
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("connect", do_connect, "Connect using a config profile");
    cli.add_command("disconnect", do_disconnect, "Close the session");
    cli.add_command("hosts", do_hosts, "List configured profiles");
    cli.add_command("status", do_status, "Show session, channel and transfer state");
    cli.add_command("exec", do_exec, "Run a command on a fresh exec channel");
}
