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
#include "channel_machine.hpp"
#include "connection_key.hpp"
#include "options.hpp"

class Transport;
class EventBridge;

// ShellChannel: the single interactive pty session of a Connection.
//
// open/write/close run through a ChannelMachine, so a write issued while the
// shell is still opening queues behind the open, and a close issued while
// opening waits for the open to settle before the close command goes out.
//
// Shell output is streamed: a persistent "Shell" handler is registered with
// the bridge when the channel is created and fans each chunk out to the
// subscribers added through subscribe(). Output arriving while the channel is
// closed is dropped. A "ShellClosed" notification (the remote end hung up)
// closes an open channel so the next write starts a fresh shell.
class ShellChannel : public std::enable_shared_from_this<ShellChannel> {
public:
    using OutputCallback = std::function<void(const std::string& data)>;
    using ReadyCheck = std::function<Result<void>()>;

    static std::shared_ptr<ShellChannel> create(ConnectionKey key,
                                                std::shared_ptr<Transport> transport,
                                                std::shared_ptr<EventBridge> bridge,
                                                ConnectionOptions options,
                                                ReadyCheck ready);

    // Resolves with the initial output captured when the shell started.
    std::shared_future<Result<std::string>> open(PtyType pty);

    // Opens with the default pty if closed; awaits an in-flight open.
    std::shared_future<Result<std::string>> ensure_open();

    // Resolves with the transport's immediate reply, not the command output.
    std::future<Result<std::string>> write(const std::string& input);

    std::shared_future<Result<void>> close();

    ChannelState state() const;

    uint64_t subscribe(OutputCallback cb);
    bool unsubscribe(uint64_t id);

private:
    ShellChannel(ConnectionKey key, std::shared_ptr<Transport> transport,
                 std::shared_ptr<EventBridge> bridge, ConnectionOptions options,
                 ReadyCheck ready);

    ConnectionKey key_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<EventBridge> bridge_;
    ConnectionOptions options_;
    ReadyCheck ready_;
    std::shared_ptr<ChannelMachine> machine_;

    std::mutex subscribers_mutex_;
    std::vector<std::pair<uint64_t, OutputCallback>> subscribers_;
    uint64_t next_subscriber_ = 1;

    ChannelMachine::OpenStarter starter(PtyType pty);
    void on_output(const Payload& payload);
    void on_remote_close();
};
