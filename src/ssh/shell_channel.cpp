#include "shell_channel.hpp"
#include "event_bridge.hpp"
#include "replies.hpp"
#include <transport/transport.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

ShellChannel::ShellChannel(ConnectionKey key, std::shared_ptr<Transport> transport,
                           std::shared_ptr<EventBridge> bridge, ConnectionOptions options,
                           ReadyCheck ready)
    : key_(std::move(key)), transport_(std::move(transport)), bridge_(std::move(bridge)),
      options_(options), ready_(std::move(ready)),
      machine_(std::make_shared<ChannelMachine>("shell")) {}

std::shared_ptr<ShellChannel> ShellChannel::create(ConnectionKey key,
                                                   std::shared_ptr<Transport> transport,
                                                   std::shared_ptr<EventBridge> bridge,
                                                   ConnectionOptions options,
                                                   ReadyCheck ready) {
    std::shared_ptr<ShellChannel> shell(
        new ShellChannel(std::move(key), std::move(transport), std::move(bridge),
                         options, std::move(ready)));

    std::weak_ptr<ShellChannel> weak = shell;
    auto reg = shell->bridge_->register_handler(shell->key_, events::SHELL,
        [weak](const Payload& payload) {
            if (auto self = weak.lock()) self->on_output(payload);
        });
    if (reg.is_err()) {
        sshlink_log(fmt::format("shell: output handler not registered for {}: {}",
                                shell->key_.str(), describe(reg.error)));
    }
    reg = shell->bridge_->register_handler(shell->key_, events::SHELL_CLOSED,
        [weak](const Payload&) {
            if (auto self = weak.lock()) self->on_remote_close();
        });
    if (reg.is_err()) {
        sshlink_log(fmt::format("shell: close handler not registered for {}: {}",
                                shell->key_.str(), describe(reg.error)));
    }
    return shell;
}

ChannelState ShellChannel::state() const {
    return machine_->state();
}

// ── Lifecycle ──────────────────────────────────────────────────

ChannelMachine::OpenStarter ShellChannel::starter(PtyType pty) {
    auto self = shared_from_this();
    return [self, pty](ChannelMachine::OpenSettle settle) {
        if (self->ready_) {
            auto ready = self->ready_();
            if (ready.is_err()) {
                settle(ChannelMachine::OpenResult::Err(ready.error));
                return;
            }
        }

        auto reg = self->bridge_->register_waiter(self->key_, events::SHELL_STARTED,
            [settle](Result<Payload> reply) { settle(reply_to_text(reply)); },
            self->options_.request_timeout);
        if (reg.is_err()) {
            settle(ChannelMachine::OpenResult::Err(reg.error));
            return;
        }
        self->transport_->send_command(self->key_, StartShellCommand{pty});
    };
}

std::shared_future<Result<std::string>> ShellChannel::open(PtyType pty) {
    return machine_->open(starter(pty));
}

std::shared_future<Result<std::string>> ShellChannel::ensure_open() {
    return machine_->open(starter(options_.default_pty));
}

std::shared_future<Result<void>> ShellChannel::close() {
    auto self = shared_from_this();
    return machine_->close([self]() {
        self->transport_->send_command(self->key_, CloseShellCommand{});
    });
}

// ── I/O ────────────────────────────────────────────────────────

std::future<Result<std::string>> ShellChannel::write(const std::string& input) {
    auto promise = std::make_shared<std::promise<Result<std::string>>>();
    auto future = promise->get_future();
    auto self = shared_from_this();

    QueuedOperation op;
    op.run = [self, promise, input](std::function<void()> done) {
        auto reg = self->bridge_->register_waiter(self->key_, events::SHELL_WRITTEN,
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
        self->transport_->send_command(self->key_, WriteShellCommand{input});
    };
    op.fail = [promise](const Error& err) {
        promise->set_value(Result<std::string>::Err(err));
    };

    machine_->enqueue(std::move(op), starter(options_.default_pty));
    return future;
}

uint64_t ShellChannel::subscribe(OutputCallback cb) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    uint64_t id = next_subscriber_++;
    subscribers_.emplace_back(id, std::move(cb));
    return id;
}

bool ShellChannel::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
        if (it->first == id) {
            subscribers_.erase(it);
            return true;
        }
    }
    return false;
}

void ShellChannel::on_output(const Payload& payload) {
    auto* text = std::get_if<TextPayload>(&payload);
    if (!text) return;

    if (machine_->state() == ChannelState::Closed) {
        sshlink_log(fmt::format("shell: dropped {} bytes of output on closed shell {}",
                                text->text.size(), key_.str()));
        return;
    }

    std::vector<OutputCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& [id, cb] : subscribers_) callbacks.push_back(cb);
    }
    for (const auto& cb : callbacks) {
        try {
            cb(text->text);
        } catch (const std::exception& e) {
            sshlink_log(fmt::format("shell: output subscriber threw: {}", e.what()));
        }
    }
}

void ShellChannel::on_remote_close() {
    // Only the shell that is open now; an opening one is a new session.
    if (machine_->state() != ChannelState::Open) return;
    sshlink_log(fmt::format("shell: remote end closed the shell on {}", key_.str()));
    close();
}
