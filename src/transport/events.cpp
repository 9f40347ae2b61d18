#include "events.hpp"
#include "command.hpp"
#include <variant>

// Bit positions follow the Payload alternative order.
static constexpr unsigned ACK       = 1u << 0;
static constexpr unsigned TEXT      = 1u << 1;
static constexpr unsigned LISTING   = 1u << 2;
static constexpr unsigned PROGRESS  = 1u << 3;
static constexpr unsigned CANCELLED = 1u << 4;
static constexpr unsigned FAILURE   = 1u << 5;

static const EventSpec EVENT_TABLE[] = {
    {events::CONNECTED,             EventMode::OneShot,   ACK | FAILURE},
    {events::EXECUTE,               EventMode::OneShot,   TEXT | FAILURE | CANCELLED},
    {events::SHELL_STARTED,         EventMode::OneShot,   TEXT | FAILURE},
    {events::SHELL_WRITTEN,         EventMode::OneShot,   TEXT | ACK | FAILURE},
    {events::SFTP_CONNECTED,        EventMode::OneShot,   ACK | FAILURE},
    {events::SFTP_LIST,             EventMode::OneShot,   LISTING | FAILURE},
    {events::SFTP_RENAME,           EventMode::OneShot,   ACK | FAILURE},
    {events::SFTP_MKDIR,            EventMode::OneShot,   ACK | FAILURE},
    {events::SFTP_REMOVE,           EventMode::OneShot,   ACK | FAILURE},
    {events::SFTP_REMOVE_DIRECTORY, EventMode::OneShot,   ACK | FAILURE},
    {events::SFTP_CHMOD,            EventMode::OneShot,   ACK | FAILURE},
    {events::UPLOAD_COMPLETE,       EventMode::OneShot,   ACK | CANCELLED | FAILURE},
    {events::DOWNLOAD_COMPLETE,     EventMode::OneShot,   ACK | TEXT | CANCELLED | FAILURE},
    {events::SHELL,                 EventMode::Streaming, TEXT},
    {events::SHELL_CLOSED,          EventMode::Streaming, ACK},
    {events::UPLOAD_PROGRESS,       EventMode::Streaming, PROGRESS},
    {events::DOWNLOAD_PROGRESS,     EventMode::Streaming, PROGRESS},
};

const EventSpec* find_event(const std::string& name) {
    for (const auto& spec : EVENT_TABLE) {
        if (name == spec.name) return &spec;
    }
    return nullptr;
}

bool payload_allowed(const EventSpec& spec, const Payload& payload) {
    return (spec.allowed & (1u << payload.index())) != 0;
}

const char* payload_kind_name(const Payload& payload) {
    static const char* const NAMES[] = {
        "Ack", "Text", "Listing", "Progress", "Cancelled", "Failure",
    };
    static_assert(sizeof(NAMES) / sizeof(NAMES[0]) == std::variant_size_v<Payload>,
                  "payload name table out of sync with Payload");
    return NAMES[payload.index()];
}

const char* command_name(const Command& cmd) {
    static const char* const NAMES[] = {
        "Connect", "Disconnect", "Execute", "StartShell", "WriteShell",
        "CloseShell", "ConnectSftp", "SftpList", "SftpRename", "SftpMkdir",
        "SftpRemove", "SftpRemoveDirectory", "SftpChmod", "SftpUpload",
        "SftpDownload", "SftpCancelUpload", "SftpCancelDownload",
        "DisconnectSftp",
    };
    static_assert(sizeof(NAMES) / sizeof(NAMES[0]) == std::variant_size_v<Command>,
                  "command name table out of sync with Command");
    return NAMES[cmd.index()];
}
