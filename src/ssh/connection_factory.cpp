#include "connection_factory.hpp"
#include <transport/transport.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

ConnectionFactory::ConnectionFactory(std::shared_ptr<Transport> transport,
                                     ConnectionOptions options)
    : bridge_(std::make_shared<EventBridge>()), transport_(std::move(transport)),
      options_(options) {
    bridge_->attach(*transport_);
}

std::shared_ptr<Connection> ConnectionFactory::create_connection() {
    return Connection::create(transport_, bridge_, options_);
}

std::future<Result<std::shared_ptr<Connection>>> ConnectionFactory::connect_with_credential(
    const std::string& host, int port, const std::string& username,
    const Credential& credential) {
    auto promise = std::make_shared<std::promise<Result<std::shared_ptr<Connection>>>>();
    auto future = promise->get_future();
    auto conn = create_connection();
    conn->connect_async(host, port, username, credential,
        [promise, conn](Result<void> result) {
            if (result.is_err()) {
                promise->set_value(Result<std::shared_ptr<Connection>>::Err(result.error));
            } else {
                promise->set_value(Result<std::shared_ptr<Connection>>::Ok(conn));
            }
        });
    return future;
}

std::future<Result<std::shared_ptr<Connection>>> ConnectionFactory::connect_with_password(
    const std::string& host, int port, const std::string& username,
    const std::string& password) {
    return connect_with_credential(host, port, username, PasswordCredential{password});
}

std::future<Result<std::shared_ptr<Connection>>> ConnectionFactory::connect_with_key(
    const std::string& host, int port, const std::string& username,
    const std::string& private_key, const std::optional<std::string>& passphrase,
    const std::optional<std::string>& public_key) {
    return connect_with_credential(host, port, username,
                                   KeyPair{private_key, public_key, passphrase});
}
