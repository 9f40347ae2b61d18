#include "channel_machine.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

template <typename T>
static std::shared_future<T> ready_future(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future().share();
}

ChannelMachine::ChannelMachine(std::string label)
    : label_(std::move(label)), serial_(std::make_shared<SerialQueue>()),
      open_result_(OpenResult::Ok("")) {}

ChannelState ChannelMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

// ── Opening ────────────────────────────────────────────────────

bool ChannelMachine::begin_open_locked() {
    if (state_ != ChannelState::Closed) return false;
    state_ = ChannelState::Opening;
    open_promise_ = std::make_shared<std::promise<OpenResult>>();
    open_future_ = open_promise_->get_future().share();
    return true;
}

void ChannelMachine::start_open(OpenStarter starter) {
    auto self = shared_from_this();

    // Queued so a reopen never overtakes the close command of the last session.
    QueuedOperation op;
    op.run = [self, starter](std::function<void()> done) {
        sshlink_log(fmt::format("{}: opening", self->label_));
        starter([self, done](OpenResult result) {
            self->settle_open(std::move(result));
            done();
        });
    };
    op.fail = [self](const Error& err) {
        self->settle_open(OpenResult::Err(err));
    };
    serial_->push(std::move(op));
}

std::shared_future<ChannelMachine::OpenResult> ChannelMachine::open(OpenStarter starter) {
    std::shared_future<OpenResult> future;
    bool start = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::Open) return ready_future(open_result_);
        start = begin_open_locked();
        future = open_future_;
    }
    if (start) start_open(std::move(starter));
    return future;
}

void ChannelMachine::when_open(OpenListener listener, OpenStarter auto_open) {
    bool open_now = false;
    bool start = false;
    OpenResult cached = OpenResult::Ok("");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::Open) {
            open_now = true;
            cached = open_result_;
        } else {
            open_listeners_.push_back(std::move(listener));
            start = begin_open_locked();
        }
    }
    if (open_now) {
        listener(cached);
        return;
    }
    if (start) start_open(std::move(auto_open));
}

QueuedOperation ChannelMachine::guarded(QueuedOperation op, uint64_t epoch) {
    auto self = shared_from_this();
    auto inner = std::make_shared<QueuedOperation>(std::move(op));

    QueuedOperation wrapped;
    wrapped.run = [self, inner, epoch](std::function<void()> done) {
        bool current;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            current = self->state_ == ChannelState::Open && self->epoch_ == epoch;
        }
        if (!current) {
            if (inner->fail) {
                inner->fail(Error{ErrorKind::ChannelNotOpen,
                                  fmt::format("{} was closed", self->label_)});
            }
            done();
            return;
        }
        inner->run(std::move(done));
    };
    wrapped.fail = [inner](const Error& err) {
        if (inner->fail) inner->fail(err);
    };
    return wrapped;
}

void ChannelMachine::enqueue(QueuedOperation op, OpenStarter auto_open) {
    bool open_now = false;
    bool start = false;
    uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::Open) {
            open_now = true;
            epoch = epoch_;
        } else {
            waiting_.push_back(std::move(op));
            start = begin_open_locked();
        }
    }
    if (open_now) {
        serial_->push(guarded(std::move(op), epoch));
        return;
    }
    if (start) start_open(std::move(auto_open));
}

void ChannelMachine::settle_open(OpenResult result) {
    std::shared_ptr<std::promise<OpenResult>> promise;
    std::vector<OpenListener> listeners;
    std::vector<QueuedOperation> waiting;
    CloseIssuer issue_close;
    std::shared_ptr<std::promise<Result<void>>> close_promise;
    bool closing = false;
    uint64_t epoch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        promise = std::move(open_promise_);
        listeners.swap(open_listeners_);
        waiting.swap(waiting_);

        if (close_requested_) {
            closing = true;
            close_requested_ = false;
            state_ = ChannelState::Closed;
            ++epoch_;
            if (result.is_ok()) issue_close = std::move(pending_close_);
            pending_close_ = nullptr;
            close_promise = std::move(close_promise_);
        } else if (result.is_ok()) {
            state_ = ChannelState::Open;
            open_result_ = result;
        } else {
            state_ = ChannelState::Closed;
        }
        epoch = epoch_;
    }

    sshlink_log(fmt::format("{}: open {}{}", label_,
                            result.is_ok() ? "succeeded" : "failed: " + describe(result.error),
                            closing ? " (close pending)" : ""));

    if (promise) promise->set_value(result);
    if (issue_close) issue_close();
    if (close_promise) close_promise->set_value(Result<void>::Ok());

    OpenResult effective = result;
    if (closing && result.is_ok()) {
        effective = OpenResult::Err(ErrorKind::ChannelNotOpen,
                                    fmt::format("{} was closed while opening", label_));
    }

    for (auto& listener : listeners) listener(effective);

    if (effective.is_ok()) {
        for (auto& op : waiting) serial_->push(guarded(std::move(op), epoch));
        return;
    }

    Error err{ErrorKind::ChannelNotOpen,
              fmt::format("{} could not be opened: {}", label_, describe(effective.error))};
    for (auto& op : waiting) {
        if (op.fail) op.fail(err);
    }
}

// ── Closing ────────────────────────────────────────────────────

std::shared_future<Result<void>> ChannelMachine::close(CloseIssuer issue_close) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::Closed) {
            return ready_future(Result<void>::Ok());
        }
        if (state_ == ChannelState::Opening) {
            if (!close_requested_) {
                close_requested_ = true;
                pending_close_ = std::move(issue_close);
                close_promise_ = std::make_shared<std::promise<Result<void>>>();
                close_future_ = close_promise_->get_future().share();
            }
            return close_future_;
        }
        state_ = ChannelState::Closed;
        ++epoch_;
        open_result_ = OpenResult::Ok("");
    }

    sshlink_log(fmt::format("{}: closing", label_));
    size_t dropped = serial_->fail_pending(Error{ErrorKind::ChannelNotOpen,
                                                 fmt::format("{} was closed", label_)});
    if (dropped > 0) {
        sshlink_log(fmt::format("{}: {} queued request(s) failed by close", label_, dropped));
    }

    // Issued after the request in flight, if any, has settled.
    auto promise = std::make_shared<std::promise<Result<void>>>();
    auto future = promise->get_future().share();
    QueuedOperation op;
    op.run = [issue_close, promise](std::function<void()> done) {
        if (issue_close) issue_close();
        promise->set_value(Result<void>::Ok());
        done();
    };
    op.fail = [issue_close, promise](const Error&) {
        if (issue_close) issue_close();
        promise->set_value(Result<void>::Ok());
    };
    serial_->push(std::move(op));
    return future;
}
