#pragma once

#include <functional>
#include <string>
#include <ssh/connection_key.hpp>
#include "command.hpp"
#include "events.hpp"

enum class Capability {
    Chmod,
};

// Black-box protocol engine. Commands are fire-and-forget: the outcome of a
// command arrives later through the notification handler, tagged with the
// same ConnectionKey and an event name from events.hpp.
//
// Notifications may be delivered from any thread, including from inside
// send_command().
class Transport {
public:
    using NotificationHandler =
        std::function<void(const ConnectionKey& key, const std::string& event,
                           const Payload& payload)>;

    virtual ~Transport() = default;

    virtual void send_command(const ConnectionKey& key, const Command& cmd) = 0;

    // Registered once, before any command is sent.
    virtual void on_notification(NotificationHandler handler) = 0;

    virtual bool supports(Capability capability) const = 0;
};
