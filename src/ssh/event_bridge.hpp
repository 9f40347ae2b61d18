#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <core/types.hpp>
#include <transport/events.hpp>
#include "connection_key.hpp"

class Transport;

// EventBridge: routes transport notifications to the caller waiting for them.
//
// Two kinds of registration, both keyed by (ConnectionKey, event name):
//   - one-shot waiter: settles exactly once, then is discarded. At most one
//     per key/event; a duplicate registration is rejected.
//   - persistent handler: fires for every matching notification until it is
//     unregistered or the key is torn down.
//
// dispatch() offers a notification to the waiter first and only falls through
// to handlers when no waiter is pending, so a request/response pair is never
// delivered twice. Callbacks always run without the registry lock held, so
// they may register, dispatch or send commands themselves.
//
// A background thread expires waiters registered with a timeout.
class EventBridge : public std::enable_shared_from_this<EventBridge> {
public:
    using Clock = std::chrono::steady_clock;
    using Settle = std::function<void(Result<Payload>)>;
    using Handler = std::function<void(const Payload&)>;
    using HandlerId = uint64_t;

    EventBridge();
    ~EventBridge();

    EventBridge(const EventBridge&) = delete;
    EventBridge& operator=(const EventBridge&) = delete;

    // Route every notification of the transport into dispatch(). The bridge
    // must be owned by a shared_ptr; notifications after it is gone are dropped.
    void attach(Transport& transport);

    // ── One-shot waiters ───────────────────────────────────────

    // Register before sending the command that produces the event.
    // settle is invoked exactly once: with the payload, with ConnectionClosed
    // on teardown, or with Timeout once `timeout` (if non-zero) elapses.
    // On an error return nothing was registered and settle is never called.
    Result<void> register_waiter(const ConnectionKey& key, const std::string& event,
                                 Settle settle,
                                 std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    // Future flavour of register_waiter(). A failed registration yields a
    // future that is already ready with the error.
    std::future<Result<Payload>> wait_for(const ConnectionKey& key, const std::string& event,
                                          std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    // ── Persistent handlers ────────────────────────────────────

    Result<HandlerId> register_handler(const ConnectionKey& key, const std::string& event,
                                       Handler handler);
    bool unregister_handler(const ConnectionKey& key, HandlerId id);

    // ── Delivery ───────────────────────────────────────────────

    void dispatch(const ConnectionKey& key, const std::string& event, const Payload& payload);

    // Reject every pending waiter of the key with ConnectionClosed and drop
    // its handlers. Returns the number of waiters rejected. Later calls for
    // the same key are no-ops, and later registrations are refused.
    size_t teardown(const ConnectionKey& key);

    // Forget a torn-down key entirely. Called by the key's owner once nothing
    // can register for it any more; a key that is still live is left alone.
    void release(const ConnectionKey& key);

    // ── Introspection ──────────────────────────────────────────

    size_t pending_waiters(const ConnectionKey& key) const;
    size_t handler_count(const ConnectionKey& key) const;
    bool is_torn_down(const ConnectionKey& key) const;
    size_t tracked_keys() const;

private:
    struct Waiter {
        uint64_t id;
        Settle settle;
        bool has_deadline;
        Clock::time_point expires_at;
    };

    struct HandlerEntry {
        HandlerId id;
        std::string event;
        Handler handler;
    };

    struct KeyRegistry {
        std::map<std::string, Waiter> waiters;   // event name → waiter
        std::vector<HandlerEntry> handlers;
        bool closed = false;                     // torn down, refuses registrations
    };

    mutable std::mutex mutex_;
    std::unordered_map<ConnectionKey, KeyRegistry> registry_;
    uint64_t next_id_ = 1;

    // Expiry thread
    std::condition_variable expiry_cv_;
    std::thread expiry_thread_;
    bool stopping_ = false;

    void expiry_loop();

    // CALLER MUST HOLD mutex_. Moves overdue waiters' callbacks into `out`.
    void collect_overdue(Clock::time_point now, std::vector<Settle>& out);

    // CALLER MUST HOLD mutex_.
    bool next_deadline(Clock::time_point& out) const;
};
