#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <transport/events.hpp>
#include "connection_key.hpp"

class Transport;
class EventBridge;
class SftpChannel;

// TransferController: at most one upload and one download in flight per SFTP
// channel. A second transfer in the same direction is rejected, not queued,
// so cancel always has an unambiguous target.
//
// Transfers wait for the SFTP channel to be open but do not occupy its serial
// queue, so short requests keep flowing while a long transfer runs.
//
// cancel_*() is best effort and idempotent: with nothing in flight it does
// nothing. A cancelled transfer resolves successfully with
// TransferOutcome::Cancelled once the transport confirms.
class TransferController : public std::enable_shared_from_this<TransferController> {
public:
    TransferController(ConnectionKey key, std::shared_ptr<Transport> transport,
                       std::shared_ptr<EventBridge> bridge,
                       std::shared_ptr<SftpChannel> sftp);

    std::future<Result<TransferResult>> upload(const std::string& local_path,
                                               const std::string& remote_path);
    std::future<Result<TransferResult>> download(const std::string& remote_path,
                                                 const std::string& local_path);

    void cancel_upload();
    void cancel_download();

    bool in_flight(TransferDirection direction) const;

private:
    struct TransferHandle {
        uint64_t id;
        TransferDirection direction;
        std::string local_path;
        std::string remote_path;
        bool cancelled = false;
        bool command_sent = false;
        std::shared_ptr<std::promise<Result<TransferResult>>> promise;
    };

    ConnectionKey key_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<EventBridge> bridge_;
    std::shared_ptr<SftpChannel> sftp_;

    mutable std::mutex mutex_;
    std::optional<TransferHandle> upload_;
    std::optional<TransferHandle> download_;
    uint64_t next_id_ = 1;

    std::optional<TransferHandle>& slot(TransferDirection direction);

    std::future<Result<TransferResult>> start(TransferDirection direction,
                                              const std::string& local_path,
                                              const std::string& remote_path);
    void begin(TransferDirection direction, uint64_t id);
    void complete(TransferDirection direction, uint64_t id, const Result<Payload>& reply);
    void finish(TransferDirection direction, uint64_t id, Result<TransferResult> result);
    void cancel(TransferDirection direction);
};
