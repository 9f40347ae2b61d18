#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <chrono>
#include <cstdlib>
#include <fmt/format.h>
#include <core/log.hpp>
#include <transport/libssh2_transport.hpp>
#include <readline/readline.h>

static const char* direction_name(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
        if (!config->defaults().log_file.empty()) {
            set_log_path(expand_home(config->defaults().log_file).string());
        }
    } else {
        config_error = config_result.error.message;
    }
}

BaseCLI::~BaseCLI() {
    disconnect();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail(config_error.empty() ? "No configuration loaded." : config_error);
        std::cout << theme::step("Edit " + get_config_path().string() + " and restart.");
        return false;
    }
    return true;
}

bool BaseCLI::require_connection() {
    if (!conn || conn->state() != ConnectionState::Connected) {
        std::cout << theme::fail("Not connected.");
        std::cout << theme::step("Use 'connect <profile>' first.");
        return false;
    }
    return true;
}

ConnectionFactory& BaseCLI::factory() {
    if (!factory_) {
        ConnectionOptions options;
        if (config) options = options_from_config(config->defaults());
        transport_ = std::make_shared<Libssh2Transport>(
            static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(
                options.connect_timeout).count()));
        factory_ = std::make_unique<ConnectionFactory>(transport_, options);
    }
    return *factory_;
}

// ── Connection ─────────────────────────────────────────────────

bool BaseCLI::connect_profile(const std::string& name) {
    if (!require_config()) return false;

    auto profile = config->profile(name);
    if (profile.is_err()) {
        std::cout << theme::fail(profile.error.message);
        return false;
    }
    auto credential = load_credential(profile.value);
    if (credential.is_err()) {
        std::cout << theme::fail(credential.error.message);
        return false;
    }

    if (conn) disconnect();

    const auto& p = profile.value;
    std::cout << theme::step(fmt::format("Connecting to {}@{}:{}", p.user, p.host, p.port));
    auto result = factory().connect_with_credential(p.host, p.port, p.user,
                                                    credential.value).get();
    if (result.is_err()) {
        std::cout << theme::fail(describe(result.error));
        return false;
    }

    conn = result.value;
    profile_name = name;
    subscribe_streams();
    std::cout << theme::ok("Connected");
    return true;
}

void BaseCLI::subscribe_streams() {
    conn->on(events::SHELL, [this](const Payload& payload) {
        if (auto text = std::get_if<TextPayload>(&payload)) print_async(text->text);
    });
    conn->on(events::SHELL_CLOSED, [this](const Payload&) {
        print_async(theme::info("Remote shell closed"));
    });

    auto progress = [this](TransferDirection direction) {
        return [this, direction](const Payload& payload) {
            auto p = std::get_if<ProgressPayload>(&payload);
            if (!p) return;
            {
                std::lock_guard<std::mutex> lock(transfer_mutex_);
                if (progress_[direction] == p->percent) return;
                progress_[direction] = p->percent;
            }
            if (p->percent % 25 == 0) {
                print_async(theme::info(fmt::format("{} {}%", direction_name(direction),
                                                    p->percent)));
            }
        };
    };
    conn->on(events::UPLOAD_PROGRESS, progress(TransferDirection::Upload));
    conn->on(events::DOWNLOAD_PROGRESS, progress(TransferDirection::Download));
}

void BaseCLI::disconnect() {
    if (!conn) return;
    conn->disconnect();
    conn.reset();
    profile_name.clear();

    // Pending futures settle with ConnectionClosed on teardown.
    report_finished_transfers();
}

// ── Commands ───────────────────────────────────────────────────

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Connection", {"connect", "disconnect", "status", "hosts", "exec"}},
        {"Shell",      {"shell", "send", "close"}},
        {"SFTP",       {"sftp", "ls", "mv", "mkdir", "rm", "rmdir", "chmod", "sftp-close"}},
        {"Transfers",  {"put", "get", "cancel", "transfers"}},
        {"General",    {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::SLATE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

// ── Async output ───────────────────────────────────────────────

void BaseCLI::print_async(const std::string& text) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (!at_prompt_) {
        std::cout << text << std::flush;
        return;
    }

    // Lift the half-typed line out of the way, print, then put it back.
    int saved_point = rl_point;
    char* saved_line = rl_copy_text(0, rl_end);
    rl_save_prompt();
    rl_replace_line("", 0);
    rl_redisplay();

    std::cout << "\r" << text;
    if (!text.empty() && text.back() != '\n') std::cout << "\n";
    std::cout << std::flush;

    rl_restore_prompt();
    rl_replace_line(saved_line, 0);
    rl_point = saved_point;
    rl_redisplay();
    free(saved_line);
}

// ── Transfers ──────────────────────────────────────────────────

void BaseCLI::track_transfer(TransferDirection direction, const std::string& label,
                             std::future<Result<TransferResult>> future) {
    std::lock_guard<std::mutex> lock(transfer_mutex_);
    progress_[direction] = 0;
    transfers_[direction] = PendingTransfer{label, std::move(future)};
}

void BaseCLI::report_finished_transfers() {
    std::vector<std::pair<TransferDirection, PendingTransfer>> finished;
    {
        std::lock_guard<std::mutex> lock(transfer_mutex_);
        for (auto it = transfers_.begin(); it != transfers_.end();) {
            if (it->second.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                finished.emplace_back(it->first, std::move(it->second));
                progress_.erase(it->first);
                it = transfers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& [direction, pending] : finished) {
        auto result = pending.future.get();
        std::string what = fmt::format("{} {}", direction_name(direction), pending.label);
        if (result.is_err()) {
            std::cout << theme::fail(fmt::format("{} failed: {}", what, describe(result.error)));
        } else if (result.value.cancelled()) {
            std::cout << theme::info(what + " cancelled");
        } else if (direction == TransferDirection::Download) {
            std::cout << theme::ok(fmt::format("{} saved to {}", what, result.value.local_path));
        } else {
            std::cout << theme::ok(what + " complete");
        }
    }
}

int BaseCLI::transfer_progress(TransferDirection direction) const {
    std::lock_guard<std::mutex> lock(transfer_mutex_);
    if (!transfers_.count(direction)) return -1;
    auto it = progress_.find(direction);
    return it == progress_.end() ? 0 : it->second;
}

std::string BaseCLI::get_prompt_string() const {
    // \001 and \002 bracket non-printing sequences for readline's width math.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::SLATE) + "sshlink" + rl_esc(theme::color::RESET);
    if (conn && conn->state() == ConnectionState::Connected) {
        prompt += ":" + rl_esc(theme::color::AMBER) + profile_name + rl_esc(theme::color::RESET);
        if (conn->shell_state() == ChannelState::Open) {
            prompt += rl_esc(theme::color::GREEN) + " [shell]" + rl_esc(theme::color::RESET);
        }
    }
    return prompt + "> ";
}
