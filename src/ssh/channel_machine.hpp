#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "serial_queue.hpp"

// ChannelMachine: the Closed → Opening → Open lifecycle shared by the shell
// and SFTP channels.
//
//   - open() while Opening returns the in-flight future, so concurrent callers
//     share one underlying open command and see the same outcome.
//   - enqueue() runs an operation once the channel is open, auto-opening a
//     Closed channel, and serializes operations through a SerialQueue.
//   - close() while Opening waits for the open to settle before the close
//     command is issued; close() while Closed is a no-op.
//   - close() while Open goes through the SerialQueue, so the close command
//     follows any request still in flight and a reopen follows the close.
//     Operations accepted before a close fail with ChannelNotOpen instead of
//     reaching the closed channel.
//
// The channel-specific commands are supplied by the owner as callbacks:
// an OpenStarter issues the open command and reports its result through the
// OpenSettle it is given.
class ChannelMachine : public std::enable_shared_from_this<ChannelMachine> {
public:
    using OpenResult = Result<std::string>;
    using OpenSettle = std::function<void(OpenResult)>;
    using OpenStarter = std::function<void(OpenSettle)>;
    using OpenListener = std::function<void(const OpenResult&)>;
    using CloseIssuer = std::function<void()>;

    explicit ChannelMachine(std::string label);

    ChannelState state() const;
    const std::string& label() const { return label_; }

    std::shared_future<OpenResult> open(OpenStarter starter);

    // Calls listener once the channel is open (immediately if it already is),
    // or with the failure if opening fails. Does not occupy the serial queue.
    void when_open(OpenListener listener, OpenStarter auto_open);

    void enqueue(QueuedOperation op, OpenStarter auto_open);

    std::shared_future<Result<void>> close(CloseIssuer issue_close);

private:
    std::string label_;
    std::shared_ptr<SerialQueue> serial_;

    mutable std::mutex mutex_;
    ChannelState state_ = ChannelState::Closed;
    uint64_t epoch_ = 0;   // bumped by every close
    OpenResult open_result_;
    std::shared_ptr<std::promise<OpenResult>> open_promise_;
    std::shared_future<OpenResult> open_future_;
    std::vector<OpenListener> open_listeners_;
    std::vector<QueuedOperation> waiting_;   // submitted while not yet open

    // Close requested while Opening
    bool close_requested_ = false;
    CloseIssuer pending_close_;
    std::shared_ptr<std::promise<Result<void>>> close_promise_;
    std::shared_future<Result<void>> close_future_;

    // CALLER MUST HOLD mutex_. Moves Closed → Opening; true if the caller
    // must now invoke the starter (outside the lock).
    bool begin_open_locked();

    void start_open(OpenStarter starter);
    void settle_open(OpenResult result);

    // Wraps op so it fails instead of running if the channel was closed
    // after `epoch` was observed.
    QueuedOperation guarded(QueuedOperation op, uint64_t epoch);
};
