#pragma once

#include <fanout/runtime/scheduler.hpp>

#include <coroutine>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>
#include <vector>

namespace fanout::sync {

/// What close() does with items that are still buffered
enum class close_mode {
    drain,    ///< Receivers still get buffered items, then end-of-stream
    discard   ///< Buffered items are dropped; receivers see end-of-stream at once
};

/// Multi-producer multi-consumer bounded channel
///
/// The broker uses one as its command mailbox and one per subscription as
/// the outbound event queue. try_send() never suspends, which is what the
/// fan-out path relies on; send() suspends while the channel is full.
///
/// Values are handed straight to a parked receiver, and a parked sender's
/// value is moved in by the receiver that makes room, so a woken task never
/// races another one for the item it was woken for.
///
/// Woken tasks resume on the owner scheduler, by default the one running
/// when the channel was created, never on the thread that woke them. The
/// owner must outlive the channel.
template<typename T>
class channel {
public:
    /// @param capacity Maximum number of buffered items (0 = unbounded)
    /// @param owner Scheduler woken tasks resume on (nullptr = the waker's)
    explicit channel(size_t capacity = 0,
                     runtime::scheduler* owner = runtime::scheduler::current())
        : capacity_(capacity)
        , owner_(owner) {}

    ~channel() {
        close();
    }

    // Non-copyable, non-movable
    channel(const channel&) = delete;
    channel& operator=(const channel&) = delete;

    /// Send awaitable
    class send_awaitable {
    public:
        send_awaitable(channel& ch, T value)
            : channel_(ch), value_(std::move(value)) {}

        bool await_ready() const noexcept { return false; }

        bool await_suspend(std::coroutine_handle<> awaiter) {
            std::coroutine_handle<> to_wake;
            {
                std::lock_guard<std::mutex> guard(channel_.mutex_);
                if (channel_.closed_) {
                    return false;
                }
                if (!channel_.deliver(value_, to_wake)) {
                    channel_.send_waiters_.push({awaiter, &value_, &sent_});
                    return true;
                }
                sent_ = true;
            }
            if (to_wake) {
                runtime::schedule_handle(to_wake, channel_.owner_);
            }
            return false;
        }

        /// @return false if the channel was closed before the value got in
        bool await_resume() const noexcept {
            return sent_;
        }

    private:
        channel& channel_;
        T value_;
        bool sent_ = false;
    };

    /// Receive awaitable; yields std::nullopt once the channel is closed and empty
    class recv_awaitable {
    public:
        explicit recv_awaitable(channel& ch) : channel_(ch) {}

        bool await_ready() const noexcept { return false; }

        bool await_suspend(std::coroutine_handle<> awaiter) {
            std::coroutine_handle<> to_wake;
            {
                std::lock_guard<std::mutex> guard(channel_.mutex_);
                if (channel_.queue_.empty() && !channel_.closed_) {
                    channel_.recv_waiters_.push({awaiter, &slot_});
                    return true;
                }
                slot_ = channel_.pop_front(to_wake);
            }
            if (to_wake) {
                runtime::schedule_handle(to_wake, channel_.owner_);
            }
            return false;
        }

        std::optional<T> await_resume() {
            return std::move(slot_);
        }

    private:
        channel& channel_;
        std::optional<T> slot_;
    };

    /// Send a value, suspending while the channel is full
    auto send(T value) {
        return send_awaitable(*this, std::move(value));
    }

    /// Send without waiting; false if the channel is full or closed
    bool try_send(T value) {
        std::coroutine_handle<> to_wake;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_ || !deliver(value, to_wake)) {
                return false;
            }
        }
        if (to_wake) {
            runtime::schedule_handle(to_wake, owner_);
        }
        return true;
    }

    /// Receive a value, suspending while the channel is empty
    auto recv() {
        return recv_awaitable(*this);
    }

    /// Receive without waiting
    std::optional<T> try_recv() {
        std::coroutine_handle<> to_wake;
        std::optional<T> result;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            result = pop_front(to_wake);
        }
        if (to_wake) {
            runtime::schedule_handle(to_wake, owner_);
        }
        return result;
    }

    /// Close the channel. Idempotent; wakes every waiting sender and receiver.
    void close(close_mode mode = close_mode::drain) {
        std::vector<std::coroutine_handle<>> to_resume;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (mode == close_mode::discard) {
                std::queue<T>().swap(queue_);
            }
            if (closed_) {
                return;
            }
            closed_ = true;

            // Parked receivers only exist while the queue is empty, so they
            // all see end-of-stream; parked senders see a failed send.
            while (!recv_waiters_.empty()) {
                to_resume.push_back(recv_waiters_.front().handle);
                recv_waiters_.pop();
            }
            while (!send_waiters_.empty()) {
                to_resume.push_back(send_waiters_.front().handle);
                send_waiters_.pop();
            }
        }
        for (auto& h : to_resume) {
            runtime::schedule_handle(h, owner_);
        }
    }

    bool is_closed() const noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        return closed_;
    }

    size_t size() const noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        return queue_.size();
    }

    bool empty() const noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        return queue_.empty();
    }

    size_t capacity() const noexcept { return capacity_; }

    runtime::scheduler* owner() const noexcept { return owner_; }

private:
    struct recv_waiter {
        std::coroutine_handle<> handle;
        std::optional<T>* slot;
    };

    struct send_waiter {
        std::coroutine_handle<> handle;
        T* value;
        bool* sent;
    };

    // Callers hold mutex_
    bool has_room() const noexcept {
        return capacity_ == 0 || queue_.size() < capacity_;
    }

    // Callers hold mutex_ and have checked closed_. Hands value to a parked
    // receiver or buffers it; false if there is no room.
    bool deliver(T& value, std::coroutine_handle<>& to_wake) {
        if (!recv_waiters_.empty()) {
            auto waiter = recv_waiters_.front();
            recv_waiters_.pop();
            waiter.slot->emplace(std::move(value));
            to_wake = waiter.handle;
            return true;
        }
        if (!has_room()) {
            return false;
        }
        queue_.push(std::move(value));
        return true;
    }

    // Callers hold mutex_. Takes the oldest item and, now that a slot is
    // free, moves the oldest parked sender's value in.
    std::optional<T> pop_front(std::coroutine_handle<>& to_wake) {
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> result(std::move(queue_.front()));
        queue_.pop();

        if (!closed_ && !send_waiters_.empty()) {
            auto waiter = send_waiters_.front();
            send_waiters_.pop();
            queue_.push(std::move(*waiter.value));
            *waiter.sent = true;
            to_wake = waiter.handle;
        }
        return result;
    }

    mutable std::mutex mutex_;
    std::queue<T> queue_;
    std::queue<recv_waiter> recv_waiters_;
    std::queue<send_waiter> send_waiters_;
    size_t capacity_;
    runtime::scheduler* owner_;
    bool closed_ = false;
};

} // namespace fanout::sync
