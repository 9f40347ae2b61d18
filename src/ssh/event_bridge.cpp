#include "event_bridge.hpp"
#include <transport/transport.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

// ── Lifecycle ──────────────────────────────────────────────────

EventBridge::EventBridge() {
    expiry_thread_ = std::thread(&EventBridge::expiry_loop, this);
}

EventBridge::~EventBridge() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    expiry_cv_.notify_all();
    if (expiry_thread_.joinable())
        expiry_thread_.join();
}

void EventBridge::attach(Transport& transport) {
    std::weak_ptr<EventBridge> weak = weak_from_this();
    transport.on_notification(
        [weak](const ConnectionKey& key, const std::string& event, const Payload& payload) {
            if (auto self = weak.lock()) self->dispatch(key, event, payload);
        });
}

// ── One-shot waiters ───────────────────────────────────────────

Result<void> EventBridge::register_waiter(const ConnectionKey& key, const std::string& event,
                                          Settle settle, std::chrono::milliseconds timeout) {
    if (!find_event(event)) {
        return Result<void>::Err(ErrorKind::OperationRejected,
                                 fmt::format("Unknown event '{}'", event));
    }

    bool wake_expiry = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& reg = registry_[key];
        if (reg.closed) {
            return Result<void>::Err(ErrorKind::ConnectionClosed,
                                     fmt::format("Connection {} is closed", key.str()));
        }
        if (reg.waiters.count(event)) {
            return Result<void>::Err(ErrorKind::OperationRejected,
                fmt::format("A request awaiting '{}' is already pending", event));
        }

        Waiter waiter{next_id_++, std::move(settle), false, Clock::time_point{}};
        if (timeout.count() > 0) {
            waiter.has_deadline = true;
            waiter.expires_at = Clock::now() + timeout;
            wake_expiry = true;
        }
        reg.waiters.emplace(event, std::move(waiter));
    }

    if (wake_expiry) expiry_cv_.notify_all();
    return Result<void>::Ok();
}

std::future<Result<Payload>> EventBridge::wait_for(const ConnectionKey& key,
                                                   const std::string& event,
                                                   std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<Result<Payload>>>();
    auto future = promise->get_future();

    auto reg = register_waiter(key, event,
        [promise](Result<Payload> result) { promise->set_value(std::move(result)); },
        timeout);
    if (reg.is_err()) {
        promise->set_value(Result<Payload>::Err(reg.error));
    }
    return future;
}

// ── Persistent handlers ────────────────────────────────────────

Result<EventBridge::HandlerId> EventBridge::register_handler(const ConnectionKey& key,
                                                             const std::string& event,
                                                             Handler handler) {
    if (!find_event(event)) {
        return Result<HandlerId>::Err(ErrorKind::OperationRejected,
                                      fmt::format("Unknown event '{}'", event));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& reg = registry_[key];
    if (reg.closed) {
        return Result<HandlerId>::Err(ErrorKind::ConnectionClosed,
                                      fmt::format("Connection {} is closed", key.str()));
    }

    HandlerId id = next_id_++;
    reg.handlers.push_back({id, event, std::move(handler)});
    return Result<HandlerId>::Ok(id);
}

bool EventBridge::unregister_handler(const ConnectionKey& key, HandlerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(key);
    if (it == registry_.end()) return false;

    auto& handlers = it->second.handlers;
    for (auto h = handlers.begin(); h != handlers.end(); ++h) {
        if (h->id == id) {
            handlers.erase(h);
            return true;
        }
    }
    return false;
}

// ── Delivery ───────────────────────────────────────────────────

void EventBridge::dispatch(const ConnectionKey& key, const std::string& event,
                           const Payload& payload) {
    const EventSpec* spec = find_event(event);
    if (!spec) {
        sshlink_log(fmt::format("bridge: dropped unknown event '{}' for {}", event, key.str()));
        return;
    }
    bool valid = payload_allowed(*spec, payload);

    Settle settle;
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = registry_.find(key);
        if (it == registry_.end()) {
            sshlink_log(fmt::format("bridge: no consumer for {} on {}", event, key.str()));
            return;
        }

        auto& reg = it->second;
        auto w = reg.waiters.find(event);
        if (w != reg.waiters.end()) {
            settle = std::move(w->second.settle);
            reg.waiters.erase(w);
        } else {
            for (const auto& h : reg.handlers) {
                if (h.event == event) handlers.push_back(h.handler);
            }
        }
    }

    if (settle) {
        if (!valid) {
            sshlink_log(fmt::format("bridge: {} payload is not valid for {} on {}",
                                    payload_kind_name(payload), event, key.str()));
            settle(Result<Payload>::Err(ErrorKind::RemoteError,
                fmt::format("Unexpected {} payload for '{}'", payload_kind_name(payload), event),
                RemoteCode::ProtocolError));
            return;
        }
        settle(Result<Payload>::Ok(payload));
        return;
    }

    if (handlers.empty()) {
        sshlink_log(fmt::format("bridge: no consumer for {} on {}", event, key.str()));
        return;
    }
    if (!valid) {
        sshlink_log(fmt::format("bridge: dropped {} payload for streaming '{}' on {}",
                                payload_kind_name(payload), event, key.str()));
        return;
    }

    for (const auto& handler : handlers) {
        try {
            handler(payload);
        } catch (const std::exception& e) {
            sshlink_log(fmt::format("bridge: handler for {} on {} threw: {}",
                                    event, key.str(), e.what()));
        }
    }
}

size_t EventBridge::teardown(const ConnectionKey& key) {
    std::vector<Settle> rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& reg = registry_[key];
        if (reg.closed) return 0;
        reg.closed = true;

        for (auto& [event, waiter] : reg.waiters)
            rejected.push_back(std::move(waiter.settle));
        reg.waiters.clear();
        reg.handlers.clear();
    }

    sshlink_log(fmt::format("bridge: teardown {} rejected {} waiter(s)",
                            key.str(), rejected.size()));

    for (auto& settle : rejected) {
        settle(Result<Payload>::Err(ErrorKind::ConnectionClosed,
                                    "Connection closed before a response arrived"));
    }
    return rejected.size();
}

void EventBridge::release(const ConnectionKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(key);
    if (it != registry_.end() && it->second.closed) registry_.erase(it);
}

// ── Introspection ──────────────────────────────────────────────

size_t EventBridge::pending_waiters(const ConnectionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(key);
    return it == registry_.end() ? 0 : it->second.waiters.size();
}

size_t EventBridge::handler_count(const ConnectionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(key);
    return it == registry_.end() ? 0 : it->second.handlers.size();
}

bool EventBridge::is_torn_down(const ConnectionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(key);
    return it != registry_.end() && it->second.closed;
}

size_t EventBridge::tracked_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.size();
}

// ── Expiry thread ──────────────────────────────────────────────

bool EventBridge::next_deadline(Clock::time_point& out) const {
    bool found = false;
    for (const auto& [key, reg] : registry_) {
        for (const auto& [event, waiter] : reg.waiters) {
            if (!waiter.has_deadline) continue;
            if (!found || waiter.expires_at < out) {
                out = waiter.expires_at;
                found = true;
            }
        }
    }
    return found;
}

void EventBridge::collect_overdue(Clock::time_point now, std::vector<Settle>& out) {
    for (auto& [key, reg] : registry_) {
        for (auto w = reg.waiters.begin(); w != reg.waiters.end();) {
            if (w->second.has_deadline && w->second.expires_at <= now) {
                sshlink_log(fmt::format("bridge: waiter for {} on {} expired",
                                        w->first, key.str()));
                out.push_back(std::move(w->second.settle));
                w = reg.waiters.erase(w);
            } else {
                ++w;
            }
        }
    }
}

void EventBridge::expiry_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        Clock::time_point deadline;
        if (next_deadline(deadline)) {
            expiry_cv_.wait_until(lock, deadline);
        } else {
            expiry_cv_.wait(lock);
        }
        if (stopping_) break;

        std::vector<Settle> expired;
        collect_overdue(Clock::now(), expired);
        if (expired.empty()) continue;

        lock.unlock();
        for (auto& settle : expired) {
            settle(Result<Payload>::Err(ErrorKind::Timeout,
                                        "Timed out waiting for a response"));
        }
        lock.lock();
    }
}
