#include "connection.hpp"
#include "replies.hpp"
#include "serial_queue.hpp"
#include "shell_channel.hpp"
#include "sftp_channel.hpp"
#include "transfer_controller.hpp"
#include <transport/transport.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

template <typename T>
static std::future<Result<T>> ready_error(const Error& err) {
    std::promise<Result<T>> promise;
    promise.set_value(Result<T>::Err(err));
    return promise.get_future();
}

Connection::Connection(std::shared_ptr<Transport> transport,
                       std::shared_ptr<EventBridge> bridge, ConnectionOptions options)
    : key_(ConnectionKey::generate()), transport_(std::move(transport)),
      bridge_(std::move(bridge)), options_(options),
      exec_queue_(std::make_shared<SerialQueue>()) {}

std::shared_ptr<Connection> Connection::create(std::shared_ptr<Transport> transport,
                                               std::shared_ptr<EventBridge> bridge,
                                               ConnectionOptions options) {
    std::shared_ptr<Connection> conn(
        new Connection(std::move(transport), std::move(bridge), options));

    std::weak_ptr<Connection> weak = conn;
    auto ready = [weak]() -> Result<void> {
        auto self = weak.lock();
        if (!self) {
            return Result<void>::Err(ErrorKind::ConnectionClosed, "Connection no longer exists");
        }
        return self->check_connected();
    };

    conn->shell_ = ShellChannel::create(conn->key_, conn->transport_, conn->bridge_,
                                        options, ready);
    conn->sftp_ = std::make_shared<SftpChannel>(conn->key_, conn->transport_, conn->bridge_,
                                                options, ready);
    conn->transfers_ = std::make_shared<TransferController>(conn->key_, conn->transport_,
                                                            conn->bridge_, conn->sftp_);

    sshlink_log(fmt::format("connection: created {}", conn->key_.str()));
    return conn;
}

Connection::~Connection() {
    disconnect();
    bridge_->release(key_);
}

ConnectionState Connection::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Result<void> Connection::check_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case ConnectionState::Connected:
            return Result<void>::Ok();
        case ConnectionState::Idle:
        case ConnectionState::Connecting:
            return Result<void>::Err(ErrorKind::ChannelNotOpen,
                fmt::format("Not connected (state: {})", connection_state_name(state_)));
        case ConnectionState::Disconnected:
        case ConnectionState::Failed:
            break;
    }
    return Result<void>::Err(ErrorKind::ConnectionClosed,
        fmt::format("Connection is {}", connection_state_name(state_)));
}

// ── Lifecycle ──────────────────────────────────────────────────

std::future<Result<void>> Connection::connect(const std::string& host, int port,
                                              const std::string& username,
                                              const Credential& credential) {
    auto promise = std::make_shared<std::promise<Result<void>>>();
    auto future = promise->get_future();
    connect_async(host, port, username, credential,
                  [promise](Result<void> result) { promise->set_value(std::move(result)); });
    return future;
}

void Connection::connect_async(const std::string& host, int port,
                               const std::string& username, const Credential& credential,
                               ConnectCallback done) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Idle) {
            Error err{ErrorKind::OperationRejected,
                      fmt::format("connect() is only valid once (state: {})",
                                  connection_state_name(state_))};
            lock.unlock();
            done(Result<void>::Err(err));
            return;
        }
        state_ = ConnectionState::Connecting;
        endpoint_ = fmt::format("{}@{}:{}", username, host, port);
    }
    sshlink_log(fmt::format("connection: {} connecting to {} ({} auth)", key_.str(), endpoint_,
                            std::holds_alternative<KeyPair>(credential) ? "key" : "password"));

    auto self = shared_from_this();
    auto reg = bridge_->register_waiter(key_, events::CONNECTED,
        [self, done](Result<Payload> reply) { self->on_connect_reply(done, reply); },
        options_.connect_timeout);
    if (reg.is_err()) {
        fail_connect(reg.error);
        done(Result<void>::Err(reg.error));
        return;
    }

    transport_->send_command(key_, ConnectCommand{host, port, username, credential});
}

void Connection::on_connect_reply(const ConnectCallback& done, const Result<Payload>& reply) {
    auto result = reply_to_void(reply);

    bool still_connecting;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        still_connecting = state_ == ConnectionState::Connecting;
        if (still_connecting && result.is_ok()) state_ = ConnectionState::Connected;
    }

    if (!still_connecting) {
        // disconnect() won the race; the waiter was torn down with the key.
        done(Result<void>::Err(ErrorKind::ConnectionClosed,
            fmt::format("Disconnected while connecting to {}", endpoint_)));
        return;
    }

    if (result.is_ok()) {
        sshlink_log(fmt::format("connection: {} connected to {}", key_.str(), endpoint_));
        done(Result<void>::Ok());
        return;
    }

    Error err = result.error;
    if (err.kind == ErrorKind::Timeout) {
        err.message = fmt::format("Timed out connecting to {}", endpoint_);
    } else {
        err.message = fmt::format("Failed to connect to {}: {}", endpoint_, err.message);
    }
    if (err.kind != ErrorKind::ConnectionClosed) err.kind = ErrorKind::ConnectionFailure;

    // The transport holds a session for the key even when the handshake fails.
    transport_->send_command(key_, DisconnectCommand{});

    fail_connect(err);
    done(Result<void>::Err(err));
}

void Connection::fail_connect(const Error& err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Failed;
    }
    sshlink_log(fmt::format("connection: {} failed: {}", key_.str(), describe(err)));
    bridge_->teardown(key_);
}

void Connection::disconnect() {
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        if (previous == ConnectionState::Disconnected || previous == ConnectionState::Failed) {
            return;
        }
        state_ = ConnectionState::Disconnected;
    }
    sshlink_log(fmt::format("connection: {} disconnecting (was {})", key_.str(),
                            connection_state_name(previous)));

    if (shell_) shell_->close();
    if (sftp_) disconnect_sftp();

    if (previous != ConnectionState::Idle) {
        transport_->send_command(key_, DisconnectCommand{});
    }

    Error closed{ErrorKind::ConnectionClosed, "Connection was disconnected"};
    exec_queue_->fail_pending(closed);

    size_t rejected = bridge_->teardown(key_);
    sshlink_log(fmt::format("connection: {} torn down, {} waiter(s) rejected", key_.str(),
                            rejected));
}

std::future<Result<std::string>> Connection::execute(const std::string& command) {
    auto ready = check_connected();
    if (ready.is_err()) return ready_error<std::string>(ready.error);

    auto promise = std::make_shared<std::promise<Result<std::string>>>();
    auto future = promise->get_future();
    auto self = shared_from_this();

    QueuedOperation op;
    op.run = [self, promise, command](std::function<void()> done) {
        auto still = self->check_connected();
        if (still.is_err()) {
            promise->set_value(Result<std::string>::Err(still.error));
            done();
            return;
        }
        auto reg = self->bridge_->register_waiter(self->key_, events::EXECUTE,
            [promise, done](Result<Payload> reply) {
                promise->set_value(reply_to_text(reply));
                done();
            },
            self->options_.request_timeout);
        if (reg.is_err()) {
            promise->set_value(Result<std::string>::Err(reg.error));
            done();
            return;
        }
        self->transport_->send_command(self->key_, ExecuteCommand{command});
    };
    op.fail = [promise](const Error& err) {
        promise->set_value(Result<std::string>::Err(err));
    };

    exec_queue_->push(std::move(op));
    return future;
}

// ── Shell ──────────────────────────────────────────────────────

std::shared_future<Result<std::string>> Connection::start_shell(PtyType pty) {
    return shell_->open(pty);
}

std::future<Result<std::string>> Connection::write_to_shell(const std::string& input) {
    return shell_->write(input);
}

std::shared_future<Result<void>> Connection::close_shell() {
    return shell_->close();
}

ChannelState Connection::shell_state() const {
    return shell_->state();
}

// ── SFTP ───────────────────────────────────────────────────────

std::future<Result<void>> Connection::connect_sftp() {
    return sftp_->open();
}

std::future<Result<std::vector<DirEntry>>> Connection::sftp_list(const std::string& path) {
    return sftp_->list(path);
}

std::future<Result<void>> Connection::sftp_rename(const std::string& old_path,
                                                  const std::string& new_path) {
    return sftp_->rename(old_path, new_path);
}

std::future<Result<void>> Connection::sftp_mkdir(const std::string& path) {
    return sftp_->mkdir(path);
}

std::future<Result<void>> Connection::sftp_remove(const std::string& path) {
    return sftp_->remove(path);
}

std::future<Result<void>> Connection::sftp_remove_directory(const std::string& path) {
    return sftp_->remove_directory(path);
}

std::future<Result<void>> Connection::sftp_chmod(const std::string& path, int mode) {
    return sftp_->chmod(path, mode);
}

std::future<Result<TransferResult>> Connection::sftp_upload(const std::string& local_path,
                                                            const std::string& remote_path) {
    return transfers_->upload(local_path, remote_path);
}

std::future<Result<TransferResult>> Connection::sftp_download(const std::string& remote_path,
                                                              const std::string& local_path) {
    return transfers_->download(remote_path, local_path);
}

void Connection::cancel_upload() {
    transfers_->cancel_upload();
}

void Connection::cancel_download() {
    transfers_->cancel_download();
}

bool Connection::transfer_in_flight(TransferDirection direction) const {
    return transfers_->in_flight(direction);
}

std::shared_future<Result<void>> Connection::disconnect_sftp() {
    transfers_->cancel_upload();
    transfers_->cancel_download();
    return sftp_->close();
}

ChannelState Connection::sftp_state() const {
    return sftp_->state();
}

// ── Streaming notifications ────────────────────────────────────

Result<Connection::HandlerId> Connection::on(const std::string& event,
                                             EventBridge::Handler handler) {
    if (event == events::SHELL) {
        return Result<HandlerId>::Ok(shell_->subscribe(
            [handler](const std::string& data) { handler(TextPayload{data}); }));
    }
    return bridge_->register_handler(key_, event, std::move(handler));
}

bool Connection::off(const std::string& event, HandlerId id) {
    if (event == events::SHELL) return shell_->unsubscribe(id);
    return bridge_->unregister_handler(key_, id);
}
