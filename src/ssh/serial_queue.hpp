#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <core/types.hpp>

// One queued request. run() must eventually call done() exactly once; fail()
// is called instead of run() when the request is dropped before it starts.
struct QueuedOperation {
    std::function<void(std::function<void()> done)> run;
    std::function<void(const Error&)> fail;
};

// SerialQueue: runs queued operations one at a time, in submission order.
// The next operation starts only after the previous one reports done, so two
// requests that wait on the same event never overlap.
class SerialQueue : public std::enable_shared_from_this<SerialQueue> {
public:
    void push(QueuedOperation op);

    // Fail every operation that has not started yet. Returns how many.
    size_t fail_pending(const Error& err);

    bool busy() const;
    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::deque<QueuedOperation> queue_;
    bool busy_ = false;

    void pump();
    void finished();
};
