#pragma once

/// @file transport.hpp
/// @brief What a streaming connection must offer the SSE handlers
///
/// The embedding HTTP server implements transport for each accepted
/// connection. Streaming needs two capabilities beyond plain writes: an
/// explicit flush, so every event leaves the process as soon as it is
/// encoded, and a notification when the peer goes away, so an idle
/// subscriber is torn down without waiting for the next write to fail.

#include <fanout/coro/task.hpp>
#include <fanout/http/message.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace fanout::http {

namespace detail {

/// Shared disconnect state
struct close_state {
    std::atomic<bool> closed{false};
    std::mutex mutex;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
    uint64_t next_id = 1;

    /// @return registration id, or 0 if the callback already ran
    uint64_t add_callback(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!closed.load(std::memory_order_relaxed)) {
                uint64_t id = next_id++;
                callbacks.emplace_back(id, std::move(cb));
                return id;
            }
        }
        // Already closed: invoke immediately, outside the lock
        cb();
        return 0;
    }

    void remove_callback(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        callbacks.erase(
            std::remove_if(callbacks.begin(), callbacks.end(),
                [id](const auto& p) { return p.first == id; }),
            callbacks.end()
        );
    }

    void trigger() {
        std::vector<std::function<void()>> to_invoke;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed.exchange(true, std::memory_order_release)) {
                return;
            }
            for (auto& [id, cb] : callbacks) {
                to_invoke.push_back(std::move(cb));
            }
            callbacks.clear();
        }
        for (auto& cb : to_invoke) {
            cb();
        }
    }
};

} // namespace detail

/// Registration handle for disconnect callbacks; unregisters on destruction
class close_registration {
public:
    close_registration() = default;
    close_registration(close_registration&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {
        other.id_ = 0;
    }
    close_registration& operator=(close_registration&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }
    ~close_registration() { unregister(); }

    close_registration(const close_registration&) = delete;
    close_registration& operator=(const close_registration&) = delete;

    void unregister() {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
            id_ = 0;
        }
    }

private:
    friend class close_notifier;

    close_registration(std::shared_ptr<detail::close_state> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::close_state> state_;
    uint64_t id_ = 0;
};

/// Peer-disconnect signal owned by a transport.
///
/// The server side calls notify() when it sees the connection drop (read
/// of 0 bytes, RST, idle timeout). Callbacks run on the notifying thread.
class close_notifier {
public:
    close_notifier()
        : state_(std::make_shared<detail::close_state>()) {}

    /// Mark the peer as gone and run every registered callback once
    void notify() {
        state_->trigger();
    }

    bool is_closed() const noexcept {
        return state_->closed.load(std::memory_order_acquire);
    }

    /// Run callback on disconnect; immediately if the peer is already gone
    template<typename F>
    [[nodiscard]] close_registration on_close(F&& callback) const {
        return close_registration{state_, state_->add_callback(std::forward<F>(callback))};
    }

private:
    std::shared_ptr<detail::close_state> state_;
};

/// A single HTTP response stream
class transport {
public:
    virtual ~transport() = default;

    /// Send the status line and headers. Called once, before any write().
    virtual bool write_head(const response& head) = 0;

    /// Queue body bytes; false once the connection is unusable
    virtual bool write(const char* data, size_t size) = 0;

    /// Push everything written so far to the peer
    virtual coro::task<bool> flush() = 0;

    /// Disconnect notification for this connection
    virtual close_notifier& disconnects() noexcept = 0;
};

} // namespace fanout::http
