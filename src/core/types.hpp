#pragma once

#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <cstdint>

// ── Errors ──────────────────────────────────────────────────

enum class ErrorKind {
    ConnectionFailure,     // auth rejected, unreachable, handshake failure
    ChannelNotOpen,        // operation before open, and auto-open failed
    OperationRejected,     // second open/transfer while one is in flight
    UnsupportedOperation,  // platform lacks the capability (chmod)
    RemoteError,           // remote reported a protocol-level failure
    Cancelled,             // stopped on request
    ConnectionClosed,      // waiter rejected because teardown came first
    Timeout,               // waiter expired before its notification arrived
    ConfigError,           // unreadable or invalid configuration
};

// Refines ErrorKind::RemoteError.
enum class RemoteCode {
    None,
    NotFound,
    PermissionDenied,
    ProtocolError,
    Failure,
};

struct Error {
    ErrorKind kind = ErrorKind::RemoteError;
    std::string message;
    RemoteCode code = RemoteCode::None;
};

const char* error_kind_name(ErrorKind kind);
const char* remote_code_name(RemoteCode code);

// "RemoteError(NotFound): no such file" style rendering.
std::string describe(const Error& err);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    Error error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), Error{}};
    }

    static Result<T> Err(Error err) {
        return {false, T{}, std::move(err)};
    }

    static Result<T> Err(ErrorKind kind, const std::string& msg,
                         RemoteCode code = RemoteCode::None) {
        return {false, T{}, Error{kind, msg, code}};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    Error error;

    static Result<void> Ok() {
        return {true, Error{}};
    }

    static Result<void> Err(Error err) {
        return {false, std::move(err)};
    }

    static Result<void> Err(ErrorKind kind, const std::string& msg,
                            RemoteCode code = RemoteCode::None) {
        return {false, Error{kind, msg, code}};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Terminal emulation ──────────────────────────────────────

enum class PtyType {
    Vanilla,
    Vt100,
    Vt102,
    Vt220,
    Ansi,
    Xterm,
};

// Unrecognized names are rejected with OperationRejected.
Result<PtyType> parse_pty_type(const std::string& name);
const char* pty_type_name(PtyType type);

// ── Credentials ─────────────────────────────────────────────

struct PasswordCredential {
    std::string password;
};

// Key material is passed through verbatim; format checks belong to the transport.
struct KeyPair {
    std::string private_key;
    std::optional<std::string> public_key;
    std::optional<std::string> passphrase;
};

using Credential = std::variant<PasswordCredential, KeyPair>;

// ── SFTP data ───────────────────────────────────────────────

struct DirEntry {
    std::string filename;
    bool is_directory = false;
    std::string modification_date;
    std::string last_access;
    uint64_t file_size = 0;
    uint32_t owner_user_id = 0;
    uint32_t owner_group_id = 0;
    uint32_t flags = 0;
};

enum class TransferDirection {
    Upload,
    Download,
};

enum class TransferOutcome {
    Completed,
    Cancelled,
};

struct TransferResult {
    TransferOutcome outcome = TransferOutcome::Completed;
    std::string local_path;   // set for downloads

    bool cancelled() const { return outcome == TransferOutcome::Cancelled; }
};

// ── Connection lifecycle ────────────────────────────────────

enum class ConnectionState {
    Idle,
    Connecting,
    Connected,
    Disconnected,
    Failed,
};

enum class ChannelState {
    Closed,
    Opening,
    Open,
};

const char* connection_state_name(ConnectionState state);
const char* channel_state_name(ChannelState state);
