#pragma once

#include <string>
#include <variant>
#include <core/types.hpp>

// Typed commands accepted by a Transport. Every command is sent together with
// the ConnectionKey it belongs to; its outcome comes back later as a
// notification (see events.hpp).

struct ConnectCommand {
    std::string host;
    int port = 22;
    std::string username;
    Credential credential;
};

struct DisconnectCommand {};

struct ExecuteCommand {
    std::string command;
};

struct StartShellCommand {
    PtyType pty = PtyType::Vanilla;
};

struct WriteShellCommand {
    std::string input;
};

struct CloseShellCommand {};

struct ConnectSftpCommand {};

struct SftpListCommand {
    std::string path;
};

struct SftpRenameCommand {
    std::string old_path;
    std::string new_path;
};

struct SftpMkdirCommand {
    std::string path;
};

struct SftpRemoveCommand {
    std::string path;
};

struct SftpRemoveDirectoryCommand {
    std::string path;
};

struct SftpChmodCommand {
    std::string path;
    int mode = 0;
};

struct SftpUploadCommand {
    std::string local_path;
    std::string remote_path;
};

struct SftpDownloadCommand {
    std::string remote_path;
    std::string local_path;
};

struct SftpCancelUploadCommand {};
struct SftpCancelDownloadCommand {};
struct DisconnectSftpCommand {};

using Command = std::variant<
    ConnectCommand,
    DisconnectCommand,
    ExecuteCommand,
    StartShellCommand,
    WriteShellCommand,
    CloseShellCommand,
    ConnectSftpCommand,
    SftpListCommand,
    SftpRenameCommand,
    SftpMkdirCommand,
    SftpRemoveCommand,
    SftpRemoveDirectoryCommand,
    SftpChmodCommand,
    SftpUploadCommand,
    SftpDownloadCommand,
    SftpCancelUploadCommand,
    SftpCancelDownloadCommand,
    DisconnectSftpCommand>;

// Human-readable command name for logs ("SftpList", "WriteShell", ...).
const char* command_name(const Command& cmd);
