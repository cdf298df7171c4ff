#pragma once

#include <fanout/runtime/scheduler.hpp>

#include <atomic>
#include <coroutine>
#include <mutex>
#include <queue>
#include <vector>

namespace fanout::sync {

/// One-shot coroutine event.
///
/// Used for the broker's handshakes: a subscriber waits on it until the
/// coordinator has registered the subscription, and shutdown callers wait
/// on it until every queue has been closed.
///
/// Waiters resume on the scheduler that was current when the event was
/// created, whichever thread calls set().
class event {
public:
    event(runtime::scheduler* owner = runtime::scheduler::current())
        : owner_(owner) {}
    ~event() = default;

    // Non-copyable, non-movable
    event(const event&) = delete;
    event& operator=(const event&) = delete;

    class wait_awaitable {
    public:
        explicit wait_awaitable(event& e) : event_(e) {}

        bool await_ready() const noexcept {
            return event_.signaled_.load(std::memory_order_acquire);
        }

        bool await_suspend(std::coroutine_handle<> awaiter) noexcept {
            std::lock_guard<std::mutex> guard(event_.mutex_);
            if (event_.signaled_.load(std::memory_order_relaxed)) {
                return false;
            }
            event_.waiters_.push(awaiter);
            return true;
        }

        void await_resume() const noexcept {}

    private:
        event& event_;
    };

    /// Wait for the event to be signaled
    auto wait() {
        return wait_awaitable(*this);
    }

    /// Signal the event and wake all waiters; later calls are no-ops
    void set() {
        std::vector<std::coroutine_handle<>> to_resume;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (signaled_.exchange(true, std::memory_order_acq_rel)) {
                return;
            }
            while (!waiters_.empty()) {
                to_resume.push_back(waiters_.front());
                waiters_.pop();
            }
        }
        for (auto& h : to_resume) {
            runtime::schedule_handle(h, owner_);
        }
    }

    bool is_set() const noexcept {
        return signaled_.load(std::memory_order_acquire);
    }

private:
    runtime::scheduler* owner_;
    std::mutex mutex_;
    std::atomic<bool> signaled_{false};
    std::queue<std::coroutine_handle<>> waiters_;
};

} // namespace fanout::sync
