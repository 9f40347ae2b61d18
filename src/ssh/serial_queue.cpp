#include "serial_queue.hpp"
#include <atomic>

void SerialQueue::push(QueuedOperation op) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(op));
    }
    pump();
}

size_t SerialQueue::fail_pending(const Error& err) {
    std::deque<QueuedOperation> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(queue_);
    }
    for (auto& op : dropped) {
        if (op.fail) op.fail(err);
    }
    return dropped.size();
}

bool SerialQueue::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

size_t SerialQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void SerialQueue::pump() {
    QueuedOperation op;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (busy_ || queue_.empty()) return;
        busy_ = true;
        op = std::move(queue_.front());
        queue_.pop_front();
    }

    auto self = shared_from_this();
    auto called = std::make_shared<std::atomic<bool>>(false);
    op.run([self, called]() {
        if (called->exchange(true)) return;
        self->finished();
    });
}

void SerialQueue::finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_ = false;
    }
    pump();
}
