#include "types.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionFailure:    return "ConnectionFailure";
        case ErrorKind::ChannelNotOpen:       return "ChannelNotOpen";
        case ErrorKind::OperationRejected:    return "OperationRejected";
        case ErrorKind::UnsupportedOperation: return "UnsupportedOperation";
        case ErrorKind::RemoteError:          return "RemoteError";
        case ErrorKind::Cancelled:            return "Cancelled";
        case ErrorKind::ConnectionClosed:     return "ConnectionClosed";
        case ErrorKind::Timeout:              return "Timeout";
        case ErrorKind::ConfigError:          return "ConfigError";
    }
    return "Unknown";
}

const char* remote_code_name(RemoteCode code) {
    switch (code) {
        case RemoteCode::None:             return "None";
        case RemoteCode::NotFound:         return "NotFound";
        case RemoteCode::PermissionDenied: return "PermissionDenied";
        case RemoteCode::ProtocolError:    return "ProtocolError";
        case RemoteCode::Failure:          return "Failure";
    }
    return "Unknown";
}

std::string describe(const Error& err) {
    if (err.code != RemoteCode::None) {
        return fmt::format("{}({}): {}", error_kind_name(err.kind),
                           remote_code_name(err.code), err.message);
    }
    return fmt::format("{}: {}", error_kind_name(err.kind), err.message);
}

// ── PtyType ─────────────────────────────────────────────────

static const std::pair<const char*, PtyType> PTY_NAMES[] = {
    {"vanilla", PtyType::Vanilla},
    {"vt100",   PtyType::Vt100},
    {"vt102",   PtyType::Vt102},
    {"vt220",   PtyType::Vt220},
    {"ansi",    PtyType::Ansi},
    {"xterm",   PtyType::Xterm},
};

Result<PtyType> parse_pty_type(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& [pty_name, type] : PTY_NAMES) {
        if (lower == pty_name) return Result<PtyType>::Ok(type);
    }
    return Result<PtyType>::Err(ErrorKind::OperationRejected,
                                fmt::format("Unknown pty type '{}'", name));
}

const char* pty_type_name(PtyType type) {
    for (const auto& [pty_name, t] : PTY_NAMES) {
        if (t == type) return pty_name;
    }
    return "vanilla";
}

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle:         return "idle";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Failed:       return "failed";
    }
    return "unknown";
}

const char* channel_state_name(ChannelState state) {
    switch (state) {
        case ChannelState::Closed:  return "closed";
        case ChannelState::Opening: return "opening";
        case ChannelState::Open:    return "open";
    }
    return "unknown";
}
