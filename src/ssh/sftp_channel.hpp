#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <transport/command.hpp>
#include <transport/events.hpp>
#include "channel_machine.hpp"
#include "connection_key.hpp"
#include "options.hpp"

class Transport;
class EventBridge;

// SftpChannel: the SFTP subsystem of a Connection. Independent of the shell,
// but shares the connection's key and bridge.
//
// Every filesystem request auto-opens the channel when it is closed and then
// runs through the channel's serial queue: one request in flight at a time,
// each a command followed by exactly one correlated reply.
class SftpChannel : public std::enable_shared_from_this<SftpChannel> {
public:
    using ReadyCheck = std::function<Result<void>()>;

    SftpChannel(ConnectionKey key, std::shared_ptr<Transport> transport,
                std::shared_ptr<EventBridge> bridge, ConnectionOptions options,
                ReadyCheck ready);

    std::future<Result<void>> open();

    std::future<Result<std::vector<DirEntry>>> list(const std::string& path);
    std::future<Result<void>> rename(const std::string& old_path, const std::string& new_path);
    std::future<Result<void>> mkdir(const std::string& path);
    std::future<Result<void>> remove(const std::string& path);
    std::future<Result<void>> remove_directory(const std::string& path);

    // Fails with UnsupportedOperation when the transport cannot chmod.
    std::future<Result<void>> chmod(const std::string& path, int mode);

    // Tear down the subsystem. Idempotent; does not touch the shell.
    std::shared_future<Result<void>> close();

    ChannelState state() const;

    // For long-running transfers that must not hold the serial queue.
    void when_open(ChannelMachine::OpenListener listener);

private:
    ConnectionKey key_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<EventBridge> bridge_;
    ConnectionOptions options_;
    ReadyCheck ready_;
    std::shared_ptr<ChannelMachine> machine_;

    ChannelMachine::OpenStarter starter();

    template <typename T>
    std::future<Result<T>> request(const char* event, Command cmd,
                                   Result<T> (*convert)(const Result<Payload>&));
};
