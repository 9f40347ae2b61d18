#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include "connection.hpp"
#include "event_bridge.hpp"
#include "options.hpp"

class Transport;

// ConnectionFactory: the public entry point. Owns the EventBridge shared by
// every Connection it creates and attaches it to the transport exactly once.
//
// Each connect_*() mints a fresh Connection (and ConnectionKey) and resolves
// once authentication succeeds or fails. Connections stay valid after the
// factory is gone; they hold the bridge and transport themselves.
class ConnectionFactory {
public:
    explicit ConnectionFactory(std::shared_ptr<Transport> transport,
                               ConnectionOptions options = {});

    ConnectionFactory(const ConnectionFactory&) = delete;
    ConnectionFactory& operator=(const ConnectionFactory&) = delete;

    std::future<Result<std::shared_ptr<Connection>>> connect_with_credential(
        const std::string& host, int port, const std::string& username,
        const Credential& credential);

    std::future<Result<std::shared_ptr<Connection>>> connect_with_password(
        const std::string& host, int port, const std::string& username,
        const std::string& password);

    std::future<Result<std::shared_ptr<Connection>>> connect_with_key(
        const std::string& host, int port, const std::string& username,
        const std::string& private_key,
        const std::optional<std::string>& passphrase = std::nullopt,
        const std::optional<std::string>& public_key = std::nullopt);

    // A Connection that has not connected yet, for callers that drive
    // connect() themselves.
    std::shared_ptr<Connection> create_connection();

    const std::shared_ptr<EventBridge>& bridge() const { return bridge_; }
    const ConnectionOptions& options() const { return options_; }

private:
    std::shared_ptr<EventBridge> bridge_;
    std::shared_ptr<Transport> transport_;
    ConnectionOptions options_;
};
