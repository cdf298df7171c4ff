#pragma once

#include <fanout/coro/task.hpp>
#include <fanout/log/logger.hpp>
#include <vector>
#include <deque>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <coroutine>
#include <thread>

namespace fanout::runtime {

/// Thread pool that resumes coroutine handles.
///
/// All workers share one FIFO run queue. Connection handlers, replay tasks
/// and the broker coordinator are all ordinary coroutines resumed here; the
/// coordinator stays single-owner because a coroutine frame is only ever
/// resumed by one worker at a time.
class scheduler {
public:
    explicit scheduler(size_t num_threads = std::thread::hardware_concurrency())
        : num_threads_(num_threads == 0 ? 1 : num_threads) {}

    ~scheduler() {
        shutdown();
    }

    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;
    scheduler(scheduler&&) = delete;
    scheduler& operator=(scheduler&&) = delete;

    void start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return;
        }

        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(&scheduler::worker_loop, this);
        }
        current_scheduler_ = this;
        FANOUT_LOG_DEBUG("scheduler started with {} workers", num_threads_);
    }

    /// Stop all workers. Also detaches the calling thread from this
    /// scheduler, even if another thread already stopped it.
    ///
    /// Handles still queued, and any spawned from now on, are resumed on the
    /// calling thread instead, so a coroutine that was woken is never lost.
    void shutdown() {
        if (current_scheduler_ == this) {
            current_scheduler_ = nullptr;
        }

        {
            // Pairs with the predicate check in worker_loop so no wake-up is lost
            std::lock_guard<std::mutex> lock(mutex_);
            bool expected = true;
            if (!running_.compare_exchange_strong(expected, false)) {
                return;
            }
        }
        ready_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
        workers_.clear();

        std::deque<std::coroutine_handle<>> leftover;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            leftover.swap(queue_);
        }
        FANOUT_LOG_DEBUG("scheduler stopped, {} handles left to run inline", leftover.size());
        for (auto handle : leftover) {
            if (handle && !handle.done()) handle.resume();
        }
    }

    /// Queue handle for a worker; resumes it inline once the pool has stopped
    void spawn(std::coroutine_handle<> handle) {
        if (!handle) [[unlikely]] return;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (running_.load(std::memory_order_relaxed)) [[likely]] {
                queue_.push_back(handle);
                handle = nullptr;
            }
        }
        if (handle) {
            if (!handle.done()) handle.resume();
            return;
        }
        ready_.notify_one();
    }

    [[nodiscard]] size_t num_threads() const noexcept { return num_threads_; }

    [[nodiscard]] size_t pending_tasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] size_t total_tasks_executed() const noexcept {
        return tasks_executed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] static scheduler* current() noexcept {
        return current_scheduler_;
    }

private:
    void worker_loop() {
        current_scheduler_ = this;

        while (true) {
            std::coroutine_handle<> handle;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                ready_.wait(lock, [this] {
                    return !queue_.empty() || !running_.load(std::memory_order_acquire);
                });
                if (!running_.load(std::memory_order_acquire)) {
                    break;
                }
                handle = queue_.front();
                queue_.pop_front();
            }

            if (handle && !handle.done()) {
                handle.resume();
                tasks_executed_.fetch_add(1, std::memory_order_relaxed);
            }
        }

        current_scheduler_ = nullptr;
    }

    size_t num_threads_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> tasks_executed_{0};
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::coroutine_handle<>> queue_;

    static inline thread_local scheduler* current_scheduler_ = nullptr;
};

/// Resume a woken coroutine: on the current scheduler if this thread runs
/// one, inline otherwise
inline void schedule_handle(std::coroutine_handle<> handle) noexcept {
    if (!handle) return;

    auto* sched = scheduler::current();
    if (sched && sched->is_running()) {
        sched->spawn(handle);
    } else {
        // No scheduler - run synchronously. Task self-destructs via final_suspend.
        if (!handle.done()) handle.resume();
    }
}

/// Resume a woken coroutine on owner, whatever thread wakes it.
///
/// Objects shared between threads (channels, events) remember the scheduler
/// they were created under and wake their waiters there, so a plain thread
/// that sends into a channel never ends up running the receiver. Without an
/// owner this falls back to schedule_handle().
inline void schedule_handle(std::coroutine_handle<> handle, scheduler* owner) noexcept {
    if (!handle) return;

    if (owner) {
        owner->spawn(handle);
    } else {
        schedule_handle(handle);
    }
}

} // namespace fanout::runtime
