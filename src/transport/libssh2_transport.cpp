#include "libssh2_transport.hpp"
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <optional>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// One libssh2 session plus the threads working on it.
struct Libssh2Session {
    explicit Libssh2Session(ConnectionKey k) : key(std::move(k)) {}

    ConnectionKey key;

    // Command queue, drained by the worker
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<Command> queue;
    std::thread worker;
    std::atomic<bool> finished{false};

    // Set on disconnect: EAGAIN loops give up instead of waiting
    std::atomic<bool> aborted{false};

    std::mutex io_mutex;
    socket_t sock = SSHLINK_INVALID_SOCKET;
    LIBSSH2_SESSION* session = nullptr;

    LIBSSH2_CHANNEL* shell = nullptr;
    std::thread reader;
    std::atomic<bool> shell_running{false};

    LIBSSH2_SFTP* sftp = nullptr;

    struct Transfer {
        std::thread thread;
        std::atomic<bool> running{false};
        std::atomic<bool> cancel{false};
    };
    Transfer upload;
    Transfer download;
};

// ── libssh2 helpers ────────────────────────────────────────────

static void ensure_libssh2_init() {
    static std::once_flag once;
    std::call_once(once, []() {
        platform::init_networking();
        int rc = libssh2_init(0);
        if (rc != 0) sshlink_log(fmt::format("libssh2: libssh2_init failed ({})", rc));
    });
}

// Run fn under the io mutex until it stops returning EAGAIN.
template <typename Fn>
static long with_retry(Libssh2Session& s, Fn&& fn) {
    while (true) {
        long rc;
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            rc = static_cast<long>(fn());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (s.aborted) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
}

// Pointer-returning flavour: nullptr with EAGAIN means try again.
template <typename T, typename Fn>
static T* with_retry_ptr(Libssh2Session& s, Fn&& fn) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            T* p = fn();
            if (p) return p;
            if (libssh2_session_last_errno(s.session) != LIBSSH2_ERROR_EAGAIN) return nullptr;
        }
        if (s.aborted) return nullptr;
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
}

static std::string session_error(Libssh2Session& s) {
    if (!s.session) return "no session";
    std::lock_guard<std::mutex> lock(s.io_mutex);
    char* msg = nullptr;
    libssh2_session_last_error(s.session, &msg, nullptr, 0);
    return msg ? msg : "unknown error";
}

// SFTP status codes refine RemoteError; anything else is a protocol error.
static Error sftp_error(Libssh2Session& s, const std::string& what) {
    Error err{ErrorKind::RemoteError, "", RemoteCode::ProtocolError};
    unsigned long status = 0;
    {
        std::lock_guard<std::mutex> lock(s.io_mutex);
        if (s.session && s.sftp &&
            libssh2_session_last_errno(s.session) == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            status = libssh2_sftp_last_error(s.sftp);
        }
    }
    switch (status) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
            err.code = RemoteCode::NotFound;
            err.message = fmt::format("{}: no such file or directory", what);
            return err;
        case LIBSSH2_FX_PERMISSION_DENIED:
            err.code = RemoteCode::PermissionDenied;
            err.message = fmt::format("{}: permission denied", what);
            return err;
        case LIBSSH2_FX_FAILURE:
            err.code = RemoteCode::Failure;
            err.message = fmt::format("{}: operation failed", what);
            return err;
        default:
            break;
    }
    err.message = fmt::format("{}: {}", what, session_error(s));
    return err;
}

static FailurePayload failure(ErrorKind kind, const std::string& msg,
                              RemoteCode code = RemoteCode::None) {
    return FailurePayload{Error{kind, msg, code}};
}

// Event that answers a command, or nullptr for commands with no reply.
static const char* reply_event(const Command& cmd) {
    if (std::holds_alternative<ConnectCommand>(cmd)) return events::CONNECTED;
    if (std::holds_alternative<ExecuteCommand>(cmd)) return events::EXECUTE;
    if (std::holds_alternative<StartShellCommand>(cmd)) return events::SHELL_STARTED;
    if (std::holds_alternative<WriteShellCommand>(cmd)) return events::SHELL_WRITTEN;
    if (std::holds_alternative<ConnectSftpCommand>(cmd)) return events::SFTP_CONNECTED;
    if (std::holds_alternative<SftpListCommand>(cmd)) return events::SFTP_LIST;
    if (std::holds_alternative<SftpRenameCommand>(cmd)) return events::SFTP_RENAME;
    if (std::holds_alternative<SftpMkdirCommand>(cmd)) return events::SFTP_MKDIR;
    if (std::holds_alternative<SftpRemoveCommand>(cmd)) return events::SFTP_REMOVE;
    if (std::holds_alternative<SftpRemoveDirectoryCommand>(cmd)) return events::SFTP_REMOVE_DIRECTORY;
    if (std::holds_alternative<SftpChmodCommand>(cmd)) return events::SFTP_CHMOD;
    if (std::holds_alternative<SftpUploadCommand>(cmd)) return events::UPLOAD_COMPLETE;
    if (std::holds_alternative<SftpDownloadCommand>(cmd)) return events::DOWNLOAD_COMPLETE;
    return nullptr;
}

// ── Transport surface ──────────────────────────────────────────

Libssh2Transport::Libssh2Transport(int connect_timeout_secs)
    : connect_timeout_secs_(connect_timeout_secs) {}

Libssh2Transport::~Libssh2Transport() {
    std::vector<std::shared_ptr<Libssh2Session>> all;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& [key, s] : sessions_) {
            s->aborted = true;
            {
                std::lock_guard<std::mutex> qlock(s->queue_mutex);
                s->queue.push_back(DisconnectCommand{});
            }
            s->queue_cv.notify_one();
            all.push_back(s);
        }
        sessions_.clear();
        for (auto& s : retired_) all.push_back(s);
        retired_.clear();
    }
    for (auto& s : all) {
        if (s->worker.joinable()) s->worker.join();
    }
}

void Libssh2Transport::on_notification(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

bool Libssh2Transport::supports(Capability capability) const {
    switch (capability) {
        case Capability::Chmod: return true;   // SFTP setstat
    }
    return false;
}

void Libssh2Transport::emit(const ConnectionKey& key, const char* event, const Payload& payload) {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = handler_;
    }
    if (!handler) {
        sshlink_log(fmt::format("libssh2: no notification handler, dropped {} for {}", event,
                                key.str()));
        return;
    }
    handler(key, event, payload);
}

void Libssh2Transport::reject_without_session(const ConnectionKey& key, const Command& cmd) {
    const char* event = reply_event(cmd);
    sshlink_log(fmt::format("libssh2: {} for unknown session {}", command_name(cmd), key.str()));
    if (event) {
        emit(key, event, failure(ErrorKind::ConnectionClosed, "No open session for this connection"));
    }
}

void Libssh2Transport::reap_retired() {
    std::vector<std::shared_ptr<Libssh2Session>> done;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto it = retired_.begin(); it != retired_.end();) {
            if ((*it)->finished) {
                done.push_back(*it);
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& s : done) {
        if (s->worker.joinable()) s->worker.join();
    }
}

void Libssh2Transport::send_command(const ConnectionKey& key, const Command& cmd) {
    reap_retired();

    std::shared_ptr<Libssh2Session> s;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(key);
        if (it != sessions_.end()) {
            s = it->second;
        } else if (std::holds_alternative<ConnectCommand>(cmd)) {
            s = std::make_shared<Libssh2Session>(key);
            sessions_.emplace(key, s);
            s->worker = std::thread(&Libssh2Transport::run_worker, this, s);
        }

        if (s && std::holds_alternative<DisconnectCommand>(cmd)) {
            s->aborted = true;
            sessions_.erase(key);
            retired_.push_back(s);
        }
    }
    if (!s) {
        reject_without_session(key, cmd);
        return;
    }

    // Cancellation only flips the flag the transfer thread polls.
    if (std::holds_alternative<SftpCancelUploadCommand>(cmd)) {
        s->upload.cancel = true;
        return;
    }
    if (std::holds_alternative<SftpCancelDownloadCommand>(cmd)) {
        s->download.cancel = true;
        return;
    }
    // A cancel can only follow its transfer command, so clear stale flags here.
    if (std::holds_alternative<SftpUploadCommand>(cmd)) s->upload.cancel = false;
    if (std::holds_alternative<SftpDownloadCommand>(cmd)) s->download.cancel = false;

    {
        std::lock_guard<std::mutex> lock(s->queue_mutex);
        s->queue.push_back(cmd);
    }
    s->queue_cv.notify_one();
}

void Libssh2Transport::run_worker(std::shared_ptr<Libssh2Session> s) {
    while (true) {
        Command cmd;
        {
            std::unique_lock<std::mutex> lock(s->queue_mutex);
            s->queue_cv.wait(lock, [&]() { return !s->queue.empty(); });
            cmd = std::move(s->queue.front());
            s->queue.pop_front();
        }
        sshlink_log(fmt::format("libssh2: {} on {}", command_name(cmd), s->key.str()));
        std::visit([&](const auto& c) { handle(*s, c); }, cmd);
        if (std::holds_alternative<DisconnectCommand>(cmd)) break;
    }
    s->finished = true;
}

// ── Session ────────────────────────────────────────────────────

void Libssh2Transport::handle(Libssh2Session& s, const ConnectCommand& cmd) {
    if (s.session) {
        emit(s.key, events::CONNECTED,
             failure(ErrorKind::OperationRejected, "Session is already connected"));
        return;
    }

    auto fail = [&](const std::string& msg) {
        sshlink_log(fmt::format("libssh2: connect {}@{}:{} failed: {}", cmd.username, cmd.host,
                                cmd.port, msg));
        close_session(s);
        emit(s.key, events::CONNECTED, failure(ErrorKind::ConnectionFailure, msg));
    };

    ensure_libssh2_init();

    auto sock = platform::connect_tcp(cmd.host, cmd.port, connect_timeout_secs_);
    if (sock.is_err()) {
        fail(sock.error.message);
        return;
    }
    s.sock = sock.value;

    s.session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!s.session) {
        fail("Failed to create SSH session");
        return;
    }
    libssh2_session_set_blocking(s.session, 0);

    long rc = with_retry(s, [&]() { return libssh2_session_handshake(s.session, s.sock); });
    if (rc != 0) {
        fail(fmt::format("SSH handshake failed: {}", session_error(s)));
        return;
    }

    if (auto* password = std::get_if<PasswordCredential>(&cmd.credential)) {
        rc = with_retry(s, [&]() {
            return libssh2_userauth_password(s.session, cmd.username.c_str(),
                                             password->password.c_str());
        });
    } else {
        const auto& key = std::get<KeyPair>(cmd.credential);
        rc = with_retry(s, [&]() {
            return libssh2_userauth_publickey_frommemory(
                s.session, cmd.username.c_str(), cmd.username.size(),
                key.public_key ? key.public_key->c_str() : nullptr,
                key.public_key ? key.public_key->size() : 0,
                key.private_key.c_str(), key.private_key.size(),
                key.passphrase ? key.passphrase->c_str() : nullptr);
        });
    }
    if (rc != 0) {
        fail(fmt::format("Authentication failed: {}", session_error(s)));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(s.io_mutex);
        libssh2_keepalive_config(s.session, 1, KEEPALIVE_INTERVAL_SECS);
    }
    emit(s.key, events::CONNECTED, Ack{});
}

void Libssh2Transport::handle(Libssh2Session& s, const DisconnectCommand&) {
    close_sftp(s);
    close_shell(s);
    close_session(s);
}

void Libssh2Transport::close_session(Libssh2Session& s) {
    if (s.session) {
        // Best effort: aborted sessions skip the goodbye if the socket is busy.
        with_retry(s, [&]() {
            return libssh2_session_disconnect(s.session, "Normal disconnection");
        });
        std::lock_guard<std::mutex> lock(s.io_mutex);
        libssh2_session_free(s.session);
        s.session = nullptr;
    }
    if (s.sock != SSHLINK_INVALID_SOCKET) {
        platform::close_socket(s.sock);
        s.sock = SSHLINK_INVALID_SOCKET;
    }
}

// ── Exec ───────────────────────────────────────────────────────

void Libssh2Transport::handle(Libssh2Session& s, const ExecuteCommand& cmd) {
    if (!s.session) {
        emit(s.key, events::EXECUTE, failure(ErrorKind::ChannelNotOpen, "Not connected"));
        return;
    }

    LIBSSH2_CHANNEL* ch = with_retry_ptr<LIBSSH2_CHANNEL>(s, [&]() {
        return libssh2_channel_open_session(s.session);
    });
    if (!ch) {
        emit(s.key, events::EXECUTE, failure(ErrorKind::RemoteError,
             fmt::format("Failed to open exec channel: {}", session_error(s)),
             RemoteCode::ProtocolError));
        return;
    }

    long rc = with_retry(s, [&]() { return libssh2_channel_exec(ch, cmd.command.c_str()); });
    if (rc != 0) {
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            libssh2_channel_free(ch);
        }
        emit(s.key, events::EXECUTE, failure(ErrorKind::RemoteError,
             fmt::format("Failed to exec command: {}", session_error(s)),
             RemoteCode::ProtocolError));
        return;
    }

    // stdout until EOF, then whatever stderr is left
    std::string output;
    char buf[SSH_READ_BUF_SIZE];
    while (!s.aborted) {
        long n;
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            n = static_cast<long>(libssh2_channel_read(ch, buf, sizeof(buf)));
        }
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
        } else if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
            bool eof;
            {
                std::lock_guard<std::mutex> lock(s.io_mutex);
                eof = libssh2_channel_eof(ch) != 0;
            }
            if (eof) break;
            platform::sleep_ms(EAGAIN_SLEEP_MS);
        } else {
            break;
        }
    }
    while (true) {
        long n;
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            n = static_cast<long>(libssh2_channel_read_stderr(ch, buf, sizeof(buf)));
        }
        if (n <= 0) break;
        output.append(buf, static_cast<size_t>(n));
    }

    rc = with_retry(s, [&]() { return libssh2_channel_close(ch); });
    int exit_status = 0;
    {
        std::lock_guard<std::mutex> lock(s.io_mutex);
        if (rc == 0) exit_status = libssh2_channel_get_exit_status(ch);
        libssh2_channel_free(ch);
    }
    sshlink_log(fmt::format("libssh2: exec on {} exited {} ({} bytes)", s.key.str(),
                            exit_status, output.size()));

    if (s.aborted) {
        emit(s.key, events::EXECUTE, CancelledPayload{});
        return;
    }
    emit(s.key, events::EXECUTE, TextPayload{output});
}

// ── Shell ──────────────────────────────────────────────────────

void Libssh2Transport::handle(Libssh2Session& s, const StartShellCommand& cmd) {
    if (!s.session) {
        emit(s.key, events::SHELL_STARTED, failure(ErrorKind::ChannelNotOpen, "Not connected"));
        return;
    }
    if (s.shell) {
        emit(s.key, events::SHELL_STARTED,
             failure(ErrorKind::OperationRejected, "A shell is already open"));
        return;
    }

    LIBSSH2_CHANNEL* ch = with_retry_ptr<LIBSSH2_CHANNEL>(s, [&]() {
        return libssh2_channel_open_session(s.session);
    });
    if (!ch) {
        emit(s.key, events::SHELL_STARTED, failure(ErrorKind::RemoteError,
             fmt::format("Failed to open shell channel: {}", session_error(s)),
             RemoteCode::ProtocolError));
        return;
    }

    const char* term = pty_type_name(cmd.pty);
    long rc = with_retry(s, [&]() {
        return libssh2_channel_request_pty_ex(ch, term, static_cast<unsigned>(std::strlen(term)),
                                              nullptr, 0, PTY_DEFAULT_COLS, PTY_DEFAULT_ROWS,
                                              0, 0);
    });
    if (rc == 0) rc = with_retry(s, [&]() { return libssh2_channel_shell(ch); });
    if (rc != 0) {
        std::string reason = session_error(s);
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            libssh2_channel_free(ch);
        }
        emit(s.key, events::SHELL_STARTED, failure(ErrorKind::RemoteError,
             fmt::format("Failed to start shell: {}", reason), RemoteCode::ProtocolError));
        return;
    }

    // Initial output ends after a quiet period (banner, motd, prompt).
    std::string initial;
    char buf[SSH_READ_BUF_SIZE];
    auto quiet_since = std::chrono::steady_clock::now();
    while (!s.aborted &&
           std::chrono::steady_clock::now() - quiet_since <
               std::chrono::milliseconds(SHELL_INITIAL_OUTPUT_MS)) {
        long n;
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            n = static_cast<long>(libssh2_channel_read(ch, buf, sizeof(buf)));
        }
        if (n > 0) {
            initial.append(buf, static_cast<size_t>(n));
            quiet_since = std::chrono::steady_clock::now();
        } else if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(EAGAIN_SLEEP_MS);
        } else {
            break;
        }
    }

    s.shell = ch;
    s.shell_running = true;
    emit(s.key, events::SHELL_STARTED, TextPayload{initial});
    s.reader = std::thread(&Libssh2Transport::shell_reader, this, std::ref(s));
}

void Libssh2Transport::shell_reader(Libssh2Session& s) {
    char buf[SSH_READ_BUF_SIZE];
    while (s.shell_running) {
        long n;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            n = static_cast<long>(libssh2_channel_read(s.shell, buf, sizeof(buf)));
            if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) eof = libssh2_channel_eof(s.shell) != 0;
        }
        if (n > 0) {
            emit(s.key, events::SHELL, TextPayload{std::string(buf, static_cast<size_t>(n))});
        } else if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
            if (eof) {
                sshlink_log(fmt::format("libssh2: remote closed the shell on {}", s.key.str()));
                emit(s.key, events::SHELL_CLOSED, Ack{});
                break;
            }
            platform::sleep_ms(READER_IDLE_SLEEP_MS);
        } else {
            sshlink_log(fmt::format("libssh2: shell read error {} on {}", n, s.key.str()));
            emit(s.key, events::SHELL_CLOSED, Ack{});
            break;
        }
    }
}

void Libssh2Transport::handle(Libssh2Session& s, const WriteShellCommand& cmd) {
    if (!s.shell) {
        emit(s.key, events::SHELL_WRITTEN, failure(ErrorKind::ChannelNotOpen, "No shell is open"));
        return;
    }

    size_t sent = 0;
    int retries = 0;
    while (sent < cmd.input.size()) {
        long w;
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            w = static_cast<long>(libssh2_channel_write(s.shell, cmd.input.data() + sent,
                                                        cmd.input.size() - sent));
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++retries > SSH_WRITE_MAX_RETRIES || s.aborted) {
                emit(s.key, events::SHELL_WRITTEN, failure(ErrorKind::RemoteError,
                     "Shell write stalled", RemoteCode::ProtocolError));
                return;
            }
            platform::sleep_ms(EAGAIN_SLEEP_MS);
            continue;
        }
        if (w < 0) {
            emit(s.key, events::SHELL_WRITTEN, failure(ErrorKind::RemoteError,
                 fmt::format("Shell write failed: {}", session_error(s)),
                 RemoteCode::ProtocolError));
            return;
        }
        retries = 0;
        sent += static_cast<size_t>(w);
    }
    emit(s.key, events::SHELL_WRITTEN, Ack{});
}

void Libssh2Transport::handle(Libssh2Session& s, const CloseShellCommand&) {
    close_shell(s);
}

void Libssh2Transport::close_shell(Libssh2Session& s) {
    s.shell_running = false;
    if (s.reader.joinable()) s.reader.join();
    if (!s.shell) return;

    with_retry(s, [&]() { return libssh2_channel_close(s.shell); });
    {
        std::lock_guard<std::mutex> lock(s.io_mutex);
        libssh2_channel_free(s.shell);
    }
    s.shell = nullptr;
    sshlink_log(fmt::format("libssh2: shell closed on {}", s.key.str()));
}

// ── SFTP requests ──────────────────────────────────────────────

void Libssh2Transport::handle(Libssh2Session& s, const ConnectSftpCommand&) {
    if (!s.session) {
        emit(s.key, events::SFTP_CONNECTED, failure(ErrorKind::ChannelNotOpen, "Not connected"));
        return;
    }
    if (!s.sftp) {
        s.sftp = with_retry_ptr<LIBSSH2_SFTP>(s, [&]() { return libssh2_sftp_init(s.session); });
        if (!s.sftp) {
            emit(s.key, events::SFTP_CONNECTED, failure(ErrorKind::RemoteError,
                 fmt::format("SFTP init failed: {}", session_error(s)),
                 RemoteCode::ProtocolError));
            return;
        }
    }
    emit(s.key, events::SFTP_CONNECTED, Ack{});
}

void Libssh2Transport::handle(Libssh2Session& s, const SftpListCommand& cmd) {
    if (!s.sftp) {
        emit(s.key, events::SFTP_LIST, failure(ErrorKind::ChannelNotOpen, "SFTP is not connected"));
        return;
    }
    std::string path = cmd.path.empty() ? "." : cmd.path;

    LIBSSH2_SFTP_HANDLE* dir = with_retry_ptr<LIBSSH2_SFTP_HANDLE>(s, [&]() {
        return libssh2_sftp_opendir(s.sftp, path.c_str());
    });
    if (!dir) {
        emit(s.key, events::SFTP_LIST, FailurePayload{sftp_error(s, path)});
        return;
    }

    std::vector<DirEntry> entries;
    char name[SFTP_NAME_BUF_SIZE];
    char longentry[SFTP_LONGENTRY_BUF_SIZE];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    long rc;
    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        rc = with_retry(s, [&]() {
            return libssh2_sftp_readdir_ex(dir, name, sizeof(name), longentry,
                                           sizeof(longentry), &attrs);
        });
        if (rc <= 0) break;

        DirEntry e;
        e.filename.assign(name, static_cast<size_t>(rc));
        if (e.filename == "." || e.filename == "..") continue;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            e.is_directory = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
            e.flags = static_cast<uint32_t>(attrs.permissions);
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) e.file_size = attrs.filesize;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
            e.modification_date = platform::format_utc_iso(static_cast<std::time_t>(attrs.mtime));
            e.last_access = platform::format_utc_iso(static_cast<std::time_t>(attrs.atime));
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
            e.owner_user_id = static_cast<uint32_t>(attrs.uid);
            e.owner_group_id = static_cast<uint32_t>(attrs.gid);
        }
        entries.push_back(std::move(e));
    }

    Error read_error;
    if (rc < 0) read_error = sftp_error(s, path);
    with_retry(s, [&]() { return libssh2_sftp_closedir(dir); });

    if (rc < 0) {
        emit(s.key, events::SFTP_LIST, FailurePayload{read_error});
        return;
    }
    emit(s.key, events::SFTP_LIST, ListingPayload{std::move(entries)});
}

void Libssh2Transport::handle(Libssh2Session& s, const SftpRenameCommand& cmd) {
    if (!s.sftp) {
        emit(s.key, events::SFTP_RENAME, failure(ErrorKind::ChannelNotOpen, "SFTP is not connected"));
        return;
    }
    long rc = with_retry(s, [&]() {
        return libssh2_sftp_rename_ex(s.sftp, cmd.old_path.c_str(),
                                      static_cast<unsigned>(cmd.old_path.size()),
                                      cmd.new_path.c_str(),
                                      static_cast<unsigned>(cmd.new_path.size()),
                                      LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC |
                                          LIBSSH2_SFTP_RENAME_NATIVE);
    });
    if (rc != 0) {
        emit(s.key, events::SFTP_RENAME, FailurePayload{sftp_error(s, cmd.old_path)});
        return;
    }
    emit(s.key, events::SFTP_RENAME, Ack{});
}

void Libssh2Transport::handle(Libssh2Session& s, const SftpMkdirCommand& cmd) {
    if (!s.sftp) {
        emit(s.key, events::SFTP_MKDIR, failure(ErrorKind::ChannelNotOpen, "SFTP is not connected"));
        return;
    }
    long rc = with_retry(s, [&]() {
        return libssh2_sftp_mkdir(s.sftp, cmd.path.c_str(), SFTP_DEFAULT_DIR_MODE);
    });
    if (rc != 0) {
        emit(s.key, events::SFTP_MKDIR, FailurePayload{sftp_error(s, cmd.path)});
        return;
    }
    emit(s.key, events::SFTP_MKDIR, Ack{});
}

void Libssh2Transport::handle(Libssh2Session& s, const SftpRemoveCommand& cmd) {
    if (!s.sftp) {
        emit(s.key, events::SFTP_REMOVE, failure(ErrorKind::ChannelNotOpen, "SFTP is not connected"));
        return;
    }
    long rc = with_retry(s, [&]() { return libssh2_sftp_unlink(s.sftp, cmd.path.c_str()); });
    if (rc != 0) {
        emit(s.key, events::SFTP_REMOVE, FailurePayload{sftp_error(s, cmd.path)});
        return;
    }
    emit(s.key, events::SFTP_REMOVE, Ack{});
}

void Libssh2Transport::handle(Libssh2Session& s, const SftpRemoveDirectoryCommand& cmd) {
    if (!s.sftp) {
        emit(s.key, events::SFTP_REMOVE_DIRECTORY,
             failure(ErrorKind::ChannelNotOpen, "SFTP is not connected"));
        return;
    }
    long rc = with_retry(s, [&]() { return libssh2_sftp_rmdir(s.sftp, cmd.path.c_str()); });
    if (rc != 0) {
        emit(s.key, events::SFTP_REMOVE_DIRECTORY, FailurePayload{sftp_error(s, cmd.path)});
        return;
    }
    emit(s.key, events::SFTP_REMOVE_DIRECTORY, Ack{});
}

void Libssh2Transport::handle(Libssh2Session& s, const SftpChmodCommand& cmd) {
    if (!s.sftp) {
        emit(s.key, events::SFTP_CHMOD, failure(ErrorKind::ChannelNotOpen, "SFTP is not connected"));
        return;
    }
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    attrs.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    attrs.permissions = static_cast<unsigned long>(cmd.mode);
    long rc = with_retry(s, [&]() {
        return libssh2_sftp_setstat(s.sftp, cmd.path.c_str(), &attrs);
    });
    if (rc != 0) {
        emit(s.key, events::SFTP_CHMOD, FailurePayload{sftp_error(s, cmd.path)});
        return;
    }
    emit(s.key, events::SFTP_CHMOD, Ack{});
}

void Libssh2Transport::handle(Libssh2Session& s, const DisconnectSftpCommand&) {
    close_sftp(s);
}

void Libssh2Transport::close_sftp(Libssh2Session& s) {
    s.upload.cancel = true;
    s.download.cancel = true;
    if (s.upload.thread.joinable()) s.upload.thread.join();
    if (s.download.thread.joinable()) s.download.thread.join();
    if (!s.sftp) return;

    with_retry(s, [&]() { return libssh2_sftp_shutdown(s.sftp); });
    s.sftp = nullptr;
    sshlink_log(fmt::format("libssh2: SFTP closed on {}", s.key.str()));
}

// ── Transfers ──────────────────────────────────────────────────

void Libssh2Transport::handle(Libssh2Session& s, const SftpUploadCommand& cmd) {
    if (!s.sftp) {
        emit(s.key, events::UPLOAD_COMPLETE,
             failure(ErrorKind::ChannelNotOpen, "SFTP is not connected"));
        return;
    }
    if (s.upload.running) {
        emit(s.key, events::UPLOAD_COMPLETE,
             failure(ErrorKind::OperationRejected, "An upload is already running"));
        return;
    }
    if (s.upload.thread.joinable()) s.upload.thread.join();
    s.upload.running = true;
    s.upload.thread = std::thread(&Libssh2Transport::run_upload, this, std::ref(s), cmd);
}

void Libssh2Transport::handle(Libssh2Session& s, const SftpDownloadCommand& cmd) {
    if (!s.sftp) {
        emit(s.key, events::DOWNLOAD_COMPLETE,
             failure(ErrorKind::ChannelNotOpen, "SFTP is not connected"));
        return;
    }
    if (s.download.running) {
        emit(s.key, events::DOWNLOAD_COMPLETE,
             failure(ErrorKind::OperationRejected, "A download is already running"));
        return;
    }
    if (s.download.thread.joinable()) s.download.thread.join();
    s.download.running = true;
    s.download.thread = std::thread(&Libssh2Transport::run_download, this, std::ref(s), cmd);
}

// Handled in send_command(); queued copies are no-ops.
void Libssh2Transport::handle(Libssh2Session&, const SftpCancelUploadCommand&) {}
void Libssh2Transport::handle(Libssh2Session&, const SftpCancelDownloadCommand&) {}

static int percent_of(uint64_t done, uint64_t total) {
    if (total == 0) return 100;
    return static_cast<int>(done * 100 / total);
}

void Libssh2Transport::run_upload(Libssh2Session& s, SftpUploadCommand cmd) {
    auto finish = [&](const Payload& payload) {
        s.upload.running = false;
        emit(s.key, events::UPLOAD_COMPLETE, payload);
    };

    std::ifstream in(cmd.local_path, std::ios::binary);
    if (!in) {
        finish(failure(ErrorKind::RemoteError,
                       fmt::format("Cannot open local file {}", cmd.local_path),
                       RemoteCode::NotFound));
        return;
    }
    std::error_code ec;
    uint64_t total = fs::file_size(cmd.local_path, ec);
    if (ec) total = 0;

    LIBSSH2_SFTP_HANDLE* fh = with_retry_ptr<LIBSSH2_SFTP_HANDLE>(s, [&]() {
        return libssh2_sftp_open(s.sftp, cmd.remote_path.c_str(),
                                 LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                 SFTP_DEFAULT_FILE_MODE);
    });
    if (!fh) {
        finish(FailurePayload{sftp_error(s, cmd.remote_path)});
        return;
    }

    std::vector<char> buf(SFTP_TRANSFER_BUF_SIZE);
    uint64_t done = 0;
    int last_percent = -1;
    bool cancelled = false;
    std::optional<Error> error;

    while (in && !error) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        size_t n = static_cast<size_t>(in.gcount());
        if (n == 0) break;

        size_t off = 0;
        while (off < n) {
            if (s.upload.cancel || s.aborted) {
                cancelled = true;
                break;
            }
            long w = with_retry(s, [&]() {
                return libssh2_sftp_write(fh, buf.data() + off, n - off);
            });
            if (w < 0) {
                error = sftp_error(s, cmd.remote_path);
                break;
            }
            off += static_cast<size_t>(w);
            done += static_cast<uint64_t>(w);
        }
        if (cancelled) break;

        int percent = percent_of(done, total);
        if (percent != last_percent) {
            last_percent = percent;
            emit(s.key, events::UPLOAD_PROGRESS, ProgressPayload{percent});
        }
    }

    with_retry(s, [&]() { return libssh2_sftp_close(fh); });

    if (cancelled) {
        sshlink_log(fmt::format("libssh2: upload to {} cancelled after {} bytes",
                                cmd.remote_path, done));
        finish(CancelledPayload{});
    } else if (error) {
        finish(FailurePayload{*error});
    } else {
        if (last_percent != 100) emit(s.key, events::UPLOAD_PROGRESS, ProgressPayload{100});
        finish(Ack{});
    }
}

void Libssh2Transport::run_download(Libssh2Session& s, SftpDownloadCommand cmd) {
    auto finish = [&](const Payload& payload) {
        s.download.running = false;
        emit(s.key, events::DOWNLOAD_COMPLETE, payload);
    };

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    long rc = with_retry(s, [&]() {
        return libssh2_sftp_stat(s.sftp, cmd.remote_path.c_str(), &attrs);
    });
    if (rc != 0) {
        finish(FailurePayload{sftp_error(s, cmd.remote_path)});
        return;
    }
    uint64_t total = (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) ? attrs.filesize : 0;

    LIBSSH2_SFTP_HANDLE* fh = with_retry_ptr<LIBSSH2_SFTP_HANDLE>(s, [&]() {
        return libssh2_sftp_open(s.sftp, cmd.remote_path.c_str(), LIBSSH2_FXF_READ, 0);
    });
    if (!fh) {
        finish(FailurePayload{sftp_error(s, cmd.remote_path)});
        return;
    }

    std::ofstream out(cmd.local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        with_retry(s, [&]() { return libssh2_sftp_close(fh); });
        finish(failure(ErrorKind::RemoteError,
                       fmt::format("Cannot write local file {}", cmd.local_path),
                       RemoteCode::PermissionDenied));
        return;
    }

    std::vector<char> buf(SFTP_TRANSFER_BUF_SIZE);
    uint64_t done = 0;
    int last_percent = -1;
    bool cancelled = false;
    std::optional<Error> error;

    while (true) {
        if (s.download.cancel || s.aborted) {
            cancelled = true;
            break;
        }
        long n = with_retry(s, [&]() { return libssh2_sftp_read(fh, buf.data(), buf.size()); });
        if (n == 0) break;
        if (n < 0) {
            error = sftp_error(s, cmd.remote_path);
            break;
        }
        out.write(buf.data(), n);
        if (!out) {
            error = Error{ErrorKind::RemoteError,
                          fmt::format("Write to {} failed", cmd.local_path),
                          RemoteCode::Failure};
            break;
        }
        done += static_cast<uint64_t>(n);

        int percent = percent_of(done, total);
        if (percent != last_percent) {
            last_percent = percent;
            emit(s.key, events::DOWNLOAD_PROGRESS, ProgressPayload{percent});
        }
    }

    with_retry(s, [&]() { return libssh2_sftp_close(fh); });
    out.close();

    if (cancelled || error) {
        // Leave no partial file behind.
        std::error_code ec;
        fs::remove(cmd.local_path, ec);
    }

    if (cancelled) {
        sshlink_log(fmt::format("libssh2: download of {} cancelled after {} bytes",
                                cmd.remote_path, done));
        finish(CancelledPayload{});
    } else if (error) {
        finish(FailurePayload{*error});
    } else {
        if (last_percent != 100) emit(s.key, events::DOWNLOAD_PROGRESS, ProgressPayload{100});
        finish(TextPayload{cmd.local_path});
    }
}
