#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <filesystem>
#include <fmt/format.h>
#include <util/string_utils.hpp>

// Prints the error and returns false when the SFTP step failed.
static bool report(const Result<void>& result, const std::string& done) {
    if (result.is_err()) {
        std::cout << theme::fail(describe(result.error));
        return false;
    }
    std::cout << theme::ok(done);
    return true;
}

static bool expect_args(const std::vector<std::string>& args, size_t count,
                        const std::string& usage) {
    if (args.size() != count) {
        std::cout << "Usage: " << usage << "\n";
        return false;
    }
    return true;
}

static void do_sftp(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    report(cli.conn->connect_sftp().get(), "SFTP open");
}

static void do_ls(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    std::string path = arg.empty() ? "." : StringUtils::trim(arg);

    auto result = cli.conn->sftp_list(path).get();
    if (result.is_err()) {
        std::cout << theme::fail(describe(result.error));
        return;
    }

    for (const auto& entry : result.value) {
        std::string name = entry.is_directory ? theme::slate(entry.filename + "/")
                                              : entry.filename;
        std::cout << fmt::format("    {:>6o}  {:>5}:{:<5}  {:>12}  {}  ",
                                 entry.flags & 07777, entry.owner_user_id,
                                 entry.owner_group_id, entry.file_size,
                                 theme::dim(entry.modification_date))
                  << name << "\n";
    }
    if (result.value.empty()) std::cout << theme::dim("    (empty)") << "\n";
}

static void do_mv(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = StringUtils::split_args(arg);
    if (!expect_args(args, 2, "mv <old> <new>")) return;
    report(cli.conn->sftp_rename(args[0], args[1]).get(),
           fmt::format("Renamed {} -> {}", args[0], args[1]));
}

static void do_mkdir(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = StringUtils::split_args(arg);
    if (!expect_args(args, 1, "mkdir <path>")) return;
    report(cli.conn->sftp_mkdir(args[0]).get(), "Created " + args[0]);
}

static void do_rm(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = StringUtils::split_args(arg);
    if (!expect_args(args, 1, "rm <path>")) return;
    report(cli.conn->sftp_remove(args[0]).get(), "Removed " + args[0]);
}

static void do_rmdir(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = StringUtils::split_args(arg);
    if (!expect_args(args, 1, "rmdir <path>")) return;
    report(cli.conn->sftp_remove_directory(args[0]).get(), "Removed " + args[0]);
}

static void do_chmod(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = StringUtils::split_args(arg);
    if (!expect_args(args, 2, "chmod <octal mode> <path>")) return;

    const std::string& text = args[0];
    if (text.empty() || text.size() > 4 ||
        text.find_first_not_of("01234567") != std::string::npos) {
        std::cout << theme::fail("Mode must be octal, e.g. 644 or 0755");
        return;
    }
    int mode = std::stoi(text, nullptr, 8);
    report(cli.conn->sftp_chmod(args[1], mode).get(),
           fmt::format("Mode of {} set to {:o}", args[1], mode));
}

static void do_put(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = StringUtils::split_args(arg);
    if (args.size() == 1) args.push_back(std::filesystem::path(args[0]).filename().string());
    if (!expect_args(args, 2, "put <local> [remote]")) return;

    if (cli.conn->transfer_in_flight(TransferDirection::Upload)) {
        std::cout << theme::fail("An upload is already running. 'cancel put' stops it.");
        return;
    }
    cli.track_transfer(TransferDirection::Upload, args[0],
                       cli.conn->sftp_upload(args[0], args[1]));
    std::cout << theme::step(fmt::format("Uploading {} -> {}", args[0], args[1]));
}

static void do_get(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = StringUtils::split_args(arg);
    if (args.size() == 1) args.push_back(std::filesystem::path(args[0]).filename().string());
    if (!expect_args(args, 2, "get <remote> [local]")) return;

    if (cli.conn->transfer_in_flight(TransferDirection::Download)) {
        std::cout << theme::fail("A download is already running. 'cancel get' stops it.");
        return;
    }
    cli.track_transfer(TransferDirection::Download, args[0],
                       cli.conn->sftp_download(args[0], args[1]));
    std::cout << theme::step(fmt::format("Downloading {} -> {}", args[0], args[1]));
}

static void do_cancel(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    std::string which = StringUtils::trim(arg);
    if (which == "put") {
        cli.conn->cancel_upload();
    } else if (which == "get") {
        cli.conn->cancel_download();
    } else {
        std::cout << "Usage: cancel put|get\n";
        return;
    }
    std::cout << theme::info("Cancel requested");
}

static void do_transfers(BaseCLI& cli, const std::string& arg) {
    bool any = false;
    for (auto direction : {TransferDirection::Upload, TransferDirection::Download}) {
        int percent = cli.transfer_progress(direction);
        if (percent < 0) continue;
        any = true;
        std::cout << theme::kv(direction == TransferDirection::Upload ? "upload" : "download",
                               fmt::format("{}%", percent));
    }
    if (!any) std::cout << theme::dim("    No transfers running.") << "\n";
}

static void do_sftp_close(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    report(cli.conn->disconnect_sftp().get(), "SFTP closed");
}

void register_sftp_commands(BaseCLI& cli) {
    cli.add_command("sftp", do_sftp, "Open the SFTP subsystem (ls and friends do it too)");
    cli.add_command("ls", do_ls, "List a remote directory");
    cli.add_command("mv", do_mv, "Rename a remote file");
    cli.add_command("mkdir", do_mkdir, "Create a remote directory");
    cli.add_command("rm", do_rm, "Remove a remote file");
    cli.add_command("rmdir", do_rmdir, "Remove an empty remote directory");
    cli.add_command("chmod", do_chmod, "Change remote permissions (octal)");
    cli.add_command("put", do_put, "Upload a file in the background");
    cli.add_command("get", do_get, "Download a file in the background");
    cli.add_command("cancel", do_cancel, "Cancel the running upload (put) or download (get)");
    cli.add_command("transfers", do_transfers, "Show transfer progress");
    cli.add_command("sftp-close", do_sftp_close, "Cancel transfers and close SFTP");
}
