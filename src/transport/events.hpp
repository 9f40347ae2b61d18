#pragma once

#include <string>
#include <variant>
#include <vector>
#include <core/types.hpp>

// ── Event names ─────────────────────────────────────────────
// One-shot responses carry the outcome of exactly one command.
// Streaming events fire any number of times.
namespace events {
    constexpr const char* CONNECTED            = "Connected";
    constexpr const char* EXECUTE              = "Execute";
    constexpr const char* SHELL_STARTED        = "ShellStarted";
    constexpr const char* SHELL_WRITTEN        = "ShellWritten";
    constexpr const char* SFTP_CONNECTED       = "SftpConnected";
    constexpr const char* SFTP_LIST            = "SftpList";
    constexpr const char* SFTP_RENAME          = "SftpRename";
    constexpr const char* SFTP_MKDIR           = "SftpMkdir";
    constexpr const char* SFTP_REMOVE          = "SftpRemove";
    constexpr const char* SFTP_REMOVE_DIRECTORY = "SftpRemoveDirectory";
    constexpr const char* SFTP_CHMOD           = "SftpChmod";
    constexpr const char* UPLOAD_COMPLETE      = "UploadComplete";
    constexpr const char* DOWNLOAD_COMPLETE    = "DownloadComplete";

    // Streaming
    constexpr const char* SHELL                = "Shell";
    constexpr const char* SHELL_CLOSED         = "ShellClosed";   // remote end closed the shell
    constexpr const char* UPLOAD_PROGRESS      = "UploadProgress";
    constexpr const char* DOWNLOAD_PROGRESS    = "DownloadProgress";
}

// ── Payloads ────────────────────────────────────────────────

struct Ack {};

struct TextPayload {
    std::string text;
};

struct ListingPayload {
    std::vector<DirEntry> entries;
};

struct ProgressPayload {
    int percent = 0;
};

struct CancelledPayload {};

struct FailurePayload {
    Error error;
};

using Payload = std::variant<
    Ack,
    TextPayload,
    ListingPayload,
    ProgressPayload,
    CancelledPayload,
    FailurePayload>;

const char* payload_kind_name(const Payload& payload);

// ── Event table ─────────────────────────────────────────────

enum class EventMode {
    OneShot,
    Streaming,
};

struct EventSpec {
    const char* name;
    EventMode mode;
    unsigned allowed;   // bitmask over Payload alternatives
};

// Returns nullptr for names outside the closed set.
const EventSpec* find_event(const std::string& name);

// True if the payload alternative is one the event may carry.
bool payload_allowed(const EventSpec& spec, const Payload& payload);
