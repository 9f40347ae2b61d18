#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <transport/events.hpp>
#include "connection_key.hpp"
#include "event_bridge.hpp"
#include "options.hpp"

class Transport;
class SerialQueue;
class ShellChannel;
class SftpChannel;
class TransferController;

// Connection: one authenticated session, identified by a ConnectionKey that
// is minted at construction and scopes every command and notification.
//
//   Idle → Connecting → Connected → Disconnected
//                     ↘ Failed
//
// A Connection is single-use: after Disconnected or Failed, create a new one.
// The shell and SFTP channels are multiplexed over it; each is opened on
// first use. disconnect() cancels running transfers, closes both channels,
// sends the disconnect command and tears down every waiter still pending for
// the key. A failed connect also sends the disconnect command.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using HandlerId = EventBridge::HandlerId;

    static std::shared_ptr<Connection> create(std::shared_ptr<Transport> transport,
                                              std::shared_ptr<EventBridge> bridge,
                                              ConnectionOptions options = {});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const ConnectionKey& key() const { return key_; }
    ConnectionState state() const;
    const ConnectionOptions& options() const { return options_; }

    // ── Lifecycle ──────────────────────────────────────────────

    using ConnectCallback = std::function<void(Result<void>)>;

    std::future<Result<void>> connect(const std::string& host, int port,
                                      const std::string& username,
                                      const Credential& credential);

    // Callback flavour of connect(); `done` runs on the thread that settles
    // the connect reply.
    void connect_async(const std::string& host, int port, const std::string& username,
                       const Credential& credential, ConnectCallback done);

    // Safe from any state; a second call does nothing.
    void disconnect();

    // Runs on a fresh exec channel; needs no shell.
    std::future<Result<std::string>> execute(const std::string& command);

    // ── Shell ──────────────────────────────────────────────────

    std::shared_future<Result<std::string>> start_shell(PtyType pty);
    std::future<Result<std::string>> write_to_shell(const std::string& input);
    std::shared_future<Result<void>> close_shell();
    ChannelState shell_state() const;

    // ── SFTP ───────────────────────────────────────────────────

    std::future<Result<void>> connect_sftp();
    std::future<Result<std::vector<DirEntry>>> sftp_list(const std::string& path);
    std::future<Result<void>> sftp_rename(const std::string& old_path,
                                          const std::string& new_path);
    std::future<Result<void>> sftp_mkdir(const std::string& path);
    std::future<Result<void>> sftp_remove(const std::string& path);
    std::future<Result<void>> sftp_remove_directory(const std::string& path);
    std::future<Result<void>> sftp_chmod(const std::string& path, int mode);

    std::future<Result<TransferResult>> sftp_upload(const std::string& local_path,
                                                    const std::string& remote_path);
    std::future<Result<TransferResult>> sftp_download(const std::string& remote_path,
                                                      const std::string& local_path);
    void cancel_upload();
    void cancel_download();
    bool transfer_in_flight(TransferDirection direction) const;

    // Cancels running transfers, then closes the SFTP subsystem.
    std::shared_future<Result<void>> disconnect_sftp();
    ChannelState sftp_state() const;

    // ── Streaming notifications ────────────────────────────────

    // "Shell" subscribers receive output only while the shell is open; other
    // streaming events (transfer progress) go straight to the bridge.
    Result<HandlerId> on(const std::string& event, EventBridge::Handler handler);
    bool off(const std::string& event, HandlerId id);

private:
    Connection(std::shared_ptr<Transport> transport, std::shared_ptr<EventBridge> bridge,
               ConnectionOptions options);

    ConnectionKey key_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<EventBridge> bridge_;
    ConnectionOptions options_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::Idle;
    std::string endpoint_;   // user@host:port, for messages

    std::shared_ptr<SerialQueue> exec_queue_;
    std::shared_ptr<ShellChannel> shell_;
    std::shared_ptr<SftpChannel> sftp_;
    std::shared_ptr<TransferController> transfers_;

    // Ready check handed to the channels: Ok only while Connected.
    Result<void> check_connected() const;

    void on_connect_reply(const ConnectCallback& done, const Result<Payload>& reply);
    void fail_connect(const Error& err);
};
