#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <core/constants.hpp>
#include "transport.hpp"

struct Libssh2Session;

// Libssh2Transport: the production Transport.
//
// Every ConnectionKey gets its own session worker: a thread draining a
// command queue and driving a non-blocking libssh2 session. Each libssh2 call
// holds the session's io mutex only for the call itself, so the shell reader
// and transfer threads interleave with the worker on the same session.
//
//   worker thread     connect, exec, shell open/write/close, SFTP requests
//   shell reader      streams "Shell" chunks while the shell is open
//   transfer threads  one upload and one download, each with a cancel flag
//
// Cancel commands bypass the queue and only raise the transfer's flag; the
// transfer thread notices it between chunks and reports Cancelled.
class Libssh2Transport : public Transport {
public:
    explicit Libssh2Transport(int connect_timeout_secs = CONNECT_TIMEOUT_SECS);
    ~Libssh2Transport() override;

    Libssh2Transport(const Libssh2Transport&) = delete;
    Libssh2Transport& operator=(const Libssh2Transport&) = delete;

    void send_command(const ConnectionKey& key, const Command& cmd) override;
    void on_notification(NotificationHandler handler) override;
    bool supports(Capability capability) const override;

private:
    int connect_timeout_secs_;

    std::mutex handler_mutex_;
    NotificationHandler handler_;

    std::mutex sessions_mutex_;
    std::unordered_map<ConnectionKey, std::shared_ptr<Libssh2Session>> sessions_;
    std::vector<std::shared_ptr<Libssh2Session>> retired_;   // disconnecting

    void emit(const ConnectionKey& key, const char* event, const Payload& payload);
    void reject_without_session(const ConnectionKey& key, const Command& cmd);
    void reap_retired();

    void run_worker(std::shared_ptr<Libssh2Session> s);
    void shell_reader(Libssh2Session& s);
    void run_upload(Libssh2Session& s, SftpUploadCommand cmd);
    void run_download(Libssh2Session& s, SftpDownloadCommand cmd);

    // ── Command handlers (worker thread) ───────────────────────
    void handle(Libssh2Session& s, const ConnectCommand& cmd);
    void handle(Libssh2Session& s, const DisconnectCommand& cmd);
    void handle(Libssh2Session& s, const ExecuteCommand& cmd);
    void handle(Libssh2Session& s, const StartShellCommand& cmd);
    void handle(Libssh2Session& s, const WriteShellCommand& cmd);
    void handle(Libssh2Session& s, const CloseShellCommand& cmd);
    void handle(Libssh2Session& s, const ConnectSftpCommand& cmd);
    void handle(Libssh2Session& s, const SftpListCommand& cmd);
    void handle(Libssh2Session& s, const SftpRenameCommand& cmd);
    void handle(Libssh2Session& s, const SftpMkdirCommand& cmd);
    void handle(Libssh2Session& s, const SftpRemoveCommand& cmd);
    void handle(Libssh2Session& s, const SftpRemoveDirectoryCommand& cmd);
    void handle(Libssh2Session& s, const SftpChmodCommand& cmd);
    void handle(Libssh2Session& s, const SftpUploadCommand& cmd);
    void handle(Libssh2Session& s, const SftpDownloadCommand& cmd);
    void handle(Libssh2Session& s, const SftpCancelUploadCommand& cmd);
    void handle(Libssh2Session& s, const SftpCancelDownloadCommand& cmd);
    void handle(Libssh2Session& s, const DisconnectSftpCommand& cmd);

    void close_shell(Libssh2Session& s);
    void close_sftp(Libssh2Session& s);
    void close_session(Libssh2Session& s);
};
