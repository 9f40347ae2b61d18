#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>

static void do_shell(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;

    PtyType pty = cli.conn->options().default_pty;
    if (!arg.empty()) {
        auto parsed = parse_pty_type(arg);
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error.message);
            return;
        }
        pty = parsed.value;
    }

    auto result = cli.conn->start_shell(pty).get();
    if (result.is_err()) {
        std::cout << theme::fail(describe(result.error));
        return;
    }
    std::cout << theme::ok(std::string("Shell open (") + pty_type_name(pty) + ")");
    std::cout << theme::dim("    Use 'send <text>' to type into it, 'close' to end it.") << "\n";
    std::cout << result.value;
    if (!result.value.empty() && result.value.back() != '\n') std::cout << "\n";
}

static void do_send(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    if (cli.conn->shell_state() != ChannelState::Open) {
        std::cout << theme::fail("No shell open. Use 'shell' first.");
        return;
    }

    auto result = cli.conn->write_to_shell(arg + "\n").get();
    if (result.is_err()) {
        std::cout << theme::fail(describe(result.error));
        return;
    }
    std::cout << result.value;
}

static void do_close(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto result = cli.conn->close_shell().get();
    if (result.is_err()) {
        std::cout << theme::fail(describe(result.error));
        return;
    }
    std::cout << theme::ok("Shell closed");
}

void register_shell_commands(BaseCLI& cli) {
    cli.add_command("shell", do_shell, "Open an interactive shell [pty type]");
    cli.add_command("send", do_send, "Write a line to the shell");
    cli.add_command("close", do_close, "Close the shell");
}
