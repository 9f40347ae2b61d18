#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <transport/transport.hpp>

// In-memory Transport for tests. Records every command and lets the test
// deliver notifications synchronously on its own thread.
class FakeTransport : public Transport {
public:
    using SendHook = std::function<void(FakeTransport&, const ConnectionKey&, const Command&)>;

    void send_command(const ConnectionKey& key, const Command& cmd) override {
        SendHook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.emplace_back(key, cmd);
            hook = on_send;
        }
        if (hook) hook(*this, key, cmd);
    }

    void on_notification(NotificationHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
        ++attach_count;
    }

    bool supports(Capability capability) const override {
        return capability == Capability::Chmod && chmod_supported;
    }

    void emit(const ConnectionKey& key, const std::string& event, const Payload& payload) {
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = handler_;
        }
        if (handler) handler(key, event, payload);
    }

    std::vector<std::pair<ConnectionKey, Command>> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    template <typename T>
    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& entry : sent_) {
            if (std::holds_alternative<T>(entry.second)) ++n;
        }
        return n;
    }

    template <typename T>
    T last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sent_.rbegin(); it != sent_.rend(); ++it) {
            if (auto* cmd = std::get_if<T>(&it->second)) return *cmd;
        }
        return T{};
    }

    std::vector<std::string> command_names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& entry : sent_) names.push_back(command_name(entry.second));
        return names;
    }

    bool chmod_supported = true;
    int attach_count = 0;

    // Runs after a command is recorded; may call emit() to reply inline.
    SendHook on_send;

private:
    mutable std::mutex mutex_;
    NotificationHandler handler_;
    std::vector<std::pair<ConnectionKey, Command>> sent_;
};
