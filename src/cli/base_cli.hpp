#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <future>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <ssh/connection.hpp>
#include <ssh/connection_factory.hpp>

class Transport;

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI();

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();
    bool require_connection();

    // Connects using a `hosts:` profile and subscribes to streaming output.
    bool connect_profile(const std::string& name);
    void disconnect();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Prints from any thread without trampling the readline prompt.
    void print_async(const std::string& text);
    void set_at_prompt(bool at_prompt) { at_prompt_ = at_prompt; }

    // Background transfers, reported when their futures settle.
    void track_transfer(TransferDirection direction, const std::string& label,
                        std::future<Result<TransferResult>> future);
    void report_finished_transfers();
    int transfer_progress(TransferDirection direction) const;

    // Public state
    std::optional<Config> config;
    std::string config_error;
    std::shared_ptr<Connection> conn;
    std::string profile_name;

    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;

private:
    struct PendingTransfer {
        std::string label;
        std::future<Result<TransferResult>> future;
    };

    std::shared_ptr<Transport> transport_;
    std::unique_ptr<ConnectionFactory> factory_;

    std::mutex output_mutex_;
    std::atomic<bool> at_prompt_{false};

    mutable std::mutex transfer_mutex_;
    std::map<TransferDirection, PendingTransfer> transfers_;
    std::map<TransferDirection, int> progress_;

    ConnectionFactory& factory();
    void subscribe_streams();
};
