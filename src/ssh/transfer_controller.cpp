#include "transfer_controller.hpp"
#include "event_bridge.hpp"
#include "sftp_channel.hpp"
#include <transport/transport.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

static const char* direction_name(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

static const char* completion_event(TransferDirection direction) {
    return direction == TransferDirection::Upload ? events::UPLOAD_COMPLETE
                                                  : events::DOWNLOAD_COMPLETE;
}

TransferController::TransferController(ConnectionKey key, std::shared_ptr<Transport> transport,
                                       std::shared_ptr<EventBridge> bridge,
                                       std::shared_ptr<SftpChannel> sftp)
    : key_(std::move(key)), transport_(std::move(transport)), bridge_(std::move(bridge)),
      sftp_(std::move(sftp)) {}

std::optional<TransferController::TransferHandle>&
TransferController::slot(TransferDirection direction) {
    return direction == TransferDirection::Upload ? upload_ : download_;
}

bool TransferController::in_flight(TransferDirection direction) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return direction == TransferDirection::Upload ? upload_.has_value()
                                                  : download_.has_value();
}

// ── Starting ───────────────────────────────────────────────────

std::future<Result<TransferResult>> TransferController::upload(const std::string& local_path,
                                                               const std::string& remote_path) {
    return start(TransferDirection::Upload, local_path, remote_path);
}

std::future<Result<TransferResult>> TransferController::download(const std::string& remote_path,
                                                                 const std::string& local_path) {
    return start(TransferDirection::Download, local_path, remote_path);
}

std::future<Result<TransferResult>> TransferController::start(TransferDirection direction,
                                                              const std::string& local_path,
                                                              const std::string& remote_path) {
    auto promise = std::make_shared<std::promise<Result<TransferResult>>>();
    auto future = promise->get_future();
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& current = slot(direction);
        if (current) {
            promise->set_value(Result<TransferResult>::Err(ErrorKind::OperationRejected,
                fmt::format("An {} is already in progress ({})", direction_name(direction),
                            current->remote_path)));
            return future;
        }
        id = next_id_++;
        current = TransferHandle{id, direction, local_path, remote_path, false, false, promise};
    }

    sshlink_log(fmt::format("transfer: {} #{} {} <-> {} queued on {}", direction_name(direction),
                            id, local_path, remote_path, key_.str()));

    auto self = shared_from_this();
    sftp_->when_open([self, direction, id](const Result<std::string>& opened) {
        if (opened.is_err()) {
            self->finish(direction, id, Result<TransferResult>::Err(ErrorKind::ChannelNotOpen,
                fmt::format("SFTP channel could not be opened: {}", describe(opened.error))));
            return;
        }
        self->begin(direction, id);
    });
    return future;
}

void TransferController::begin(TransferDirection direction, uint64_t id) {
    Command cmd;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& current = slot(direction);
        if (!current || current->id != id) return;
        if (!current->cancelled) {
            if (direction == TransferDirection::Upload) {
                cmd = SftpUploadCommand{current->local_path, current->remote_path};
            } else {
                cmd = SftpDownloadCommand{current->remote_path, current->local_path};
            }
        }
    }

    // Cancelled while waiting for the channel: nothing was sent, nothing to stop.
    if (!std::holds_alternative<SftpUploadCommand>(cmd) &&
        !std::holds_alternative<SftpDownloadCommand>(cmd)) {
        finish(direction, id, Result<TransferResult>::Ok(
            TransferResult{TransferOutcome::Cancelled, ""}));
        return;
    }

    auto self = shared_from_this();
    auto reg = bridge_->register_waiter(key_, completion_event(direction),
        [self, direction, id](Result<Payload> reply) { self->complete(direction, id, reply); });
    if (reg.is_err()) {
        finish(direction, id, Result<TransferResult>::Err(reg.error));
        return;
    }
    transport_->send_command(key_, cmd);

    bool cancel_now = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& current = slot(direction);
        if (current && current->id == id) {
            current->command_sent = true;
            cancel_now = current->cancelled;
        }
    }
    if (cancel_now) {
        if (direction == TransferDirection::Upload) {
            transport_->send_command(key_, SftpCancelUploadCommand{});
        } else {
            transport_->send_command(key_, SftpCancelDownloadCommand{});
        }
    }
}

// ── Completion ─────────────────────────────────────────────────

void TransferController::complete(TransferDirection direction, uint64_t id,
                                  const Result<Payload>& reply) {
    std::string local_path;
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& current = slot(direction);
        if (current && current->id == id) {
            local_path = current->local_path;
            cancelled = current->cancelled;
        }
    }

    if (reply.is_err()) {
        // A cancelled transfer cut short by teardown still ends as cancelled.
        if (cancelled && reply.error.kind == ErrorKind::ConnectionClosed) {
            finish(direction, id, Result<TransferResult>::Ok(
                TransferResult{TransferOutcome::Cancelled, ""}));
            return;
        }
        finish(direction, id, Result<TransferResult>::Err(reply.error));
        return;
    }

    const Payload& payload = reply.value;
    if (std::holds_alternative<CancelledPayload>(payload)) {
        finish(direction, id, Result<TransferResult>::Ok(
            TransferResult{TransferOutcome::Cancelled, ""}));
    } else if (auto* failure = std::get_if<FailurePayload>(&payload)) {
        finish(direction, id, Result<TransferResult>::Err(failure->error));
    } else if (auto* text = std::get_if<TextPayload>(&payload)) {
        finish(direction, id, Result<TransferResult>::Ok(
            TransferResult{TransferOutcome::Completed, text->text.empty() ? local_path : text->text}));
    } else {
        finish(direction, id, Result<TransferResult>::Ok(
            TransferResult{TransferOutcome::Completed,
                           direction == TransferDirection::Download ? local_path : ""}));
    }
}

void TransferController::finish(TransferDirection direction, uint64_t id,
                                Result<TransferResult> result) {
    std::shared_ptr<std::promise<Result<TransferResult>>> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& current = slot(direction);
        if (!current || current->id != id) return;
        promise = std::move(current->promise);
        current.reset();
    }

    if (result.is_ok()) {
        sshlink_log(fmt::format("transfer: {} #{} {}", direction_name(direction), id,
                                result.value.cancelled() ? "cancelled" : "completed"));
    } else {
        sshlink_log(fmt::format("transfer: {} #{} failed: {}", direction_name(direction), id,
                                describe(result.error)));
    }
    promise->set_value(std::move(result));
}

// ── Cancellation ───────────────────────────────────────────────

void TransferController::cancel_upload() {
    cancel(TransferDirection::Upload);
}

void TransferController::cancel_download() {
    cancel(TransferDirection::Download);
}

void TransferController::cancel(TransferDirection direction) {
    bool send = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& current = slot(direction);
        if (!current || current->cancelled) return;
        current->cancelled = true;
        send = current->command_sent;
    }

    sshlink_log(fmt::format("transfer: cancel {} requested", direction_name(direction)));
    if (!send) return;   // begin() sends the cancel once the command is out

    if (direction == TransferDirection::Upload) {
        transport_->send_command(key_, SftpCancelUploadCommand{});
    } else {
        transport_->send_command(key_, SftpCancelDownloadCommand{});
    }
}
