#include "sftp_channel.hpp"
#include "event_bridge.hpp"
#include "replies.hpp"
#include <transport/transport.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

SftpChannel::SftpChannel(ConnectionKey key, std::shared_ptr<Transport> transport,
                         std::shared_ptr<EventBridge> bridge, ConnectionOptions options,
                         ReadyCheck ready)
    : key_(std::move(key)), transport_(std::move(transport)), bridge_(std::move(bridge)),
      options_(options), ready_(std::move(ready)),
      machine_(std::make_shared<ChannelMachine>("sftp")) {}

ChannelState SftpChannel::state() const {
    return machine_->state();
}

// ── Lifecycle ──────────────────────────────────────────────────

ChannelMachine::OpenStarter SftpChannel::starter() {
    auto self = shared_from_this();
    return [self](ChannelMachine::OpenSettle settle) {
        if (self->ready_) {
            auto ready = self->ready_();
            if (ready.is_err()) {
                settle(ChannelMachine::OpenResult::Err(ready.error));
                return;
            }
        }

        auto reg = self->bridge_->register_waiter(self->key_, events::SFTP_CONNECTED,
            [settle](Result<Payload> reply) { settle(reply_to_text(reply)); },
            self->options_.request_timeout);
        if (reg.is_err()) {
            settle(ChannelMachine::OpenResult::Err(reg.error));
            return;
        }
        self->transport_->send_command(self->key_, ConnectSftpCommand{});
    };
}

std::future<Result<void>> SftpChannel::open() {
    auto promise = std::make_shared<std::promise<Result<void>>>();
    auto future = promise->get_future();
    machine_->when_open([promise](const ChannelMachine::OpenResult& result) {
        if (result.is_ok()) {
            promise->set_value(Result<void>::Ok());
        } else {
            promise->set_value(Result<void>::Err(result.error));
        }
    }, starter());
    return future;
}

void SftpChannel::when_open(ChannelMachine::OpenListener listener) {
    machine_->when_open(std::move(listener), starter());
}

std::shared_future<Result<void>> SftpChannel::close() {
    auto self = shared_from_this();
    return machine_->close([self]() {
        self->transport_->send_command(self->key_, DisconnectSftpCommand{});
    });
}

// ── Requests ───────────────────────────────────────────────────

template <typename T>
std::future<Result<T>> SftpChannel::request(const char* event, Command cmd,
                                            Result<T> (*convert)(const Result<Payload>&)) {
    auto promise = std::make_shared<std::promise<Result<T>>>();
    auto future = promise->get_future();
    auto self = shared_from_this();
    std::string event_name = event;

    QueuedOperation op;
    op.run = [self, promise, event_name, cmd, convert](std::function<void()> done) {
        auto reg = self->bridge_->register_waiter(self->key_, event_name,
            [promise, done, convert](Result<Payload> reply) {
                promise->set_value(convert(reply));
                done();
            },
            self->options_.request_timeout);
        if (reg.is_err()) {
            promise->set_value(Result<T>::Err(reg.error));
            done();
            return;
        }
        self->transport_->send_command(self->key_, cmd);
    };
    op.fail = [promise](const Error& err) {
        promise->set_value(Result<T>::Err(err));
    };

    machine_->enqueue(std::move(op), starter());
    return future;
}

std::future<Result<std::vector<DirEntry>>> SftpChannel::list(const std::string& path) {
    return request<std::vector<DirEntry>>(events::SFTP_LIST, SftpListCommand{path},
                                          &reply_to_listing);
}

std::future<Result<void>> SftpChannel::rename(const std::string& old_path,
                                              const std::string& new_path) {
    return request<void>(events::SFTP_RENAME, SftpRenameCommand{old_path, new_path},
                         &reply_to_void);
}

std::future<Result<void>> SftpChannel::mkdir(const std::string& path) {
    return request<void>(events::SFTP_MKDIR, SftpMkdirCommand{path}, &reply_to_void);
}

std::future<Result<void>> SftpChannel::remove(const std::string& path) {
    return request<void>(events::SFTP_REMOVE, SftpRemoveCommand{path}, &reply_to_void);
}

std::future<Result<void>> SftpChannel::remove_directory(const std::string& path) {
    return request<void>(events::SFTP_REMOVE_DIRECTORY, SftpRemoveDirectoryCommand{path},
                         &reply_to_void);
}

std::future<Result<void>> SftpChannel::chmod(const std::string& path, int mode) {
    if (!transport_->supports(Capability::Chmod)) {
        std::promise<Result<void>> unsupported;
        unsupported.set_value(Result<void>::Err(ErrorKind::UnsupportedOperation,
            "chmod is not supported by this transport"));
        return unsupported.get_future();
    }
    return request<void>(events::SFTP_CHMOD, SftpChmodCommand{path, mode}, &reply_to_void);
}
