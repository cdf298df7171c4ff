#pragma once

#include <fanout/sse/event.hpp>
#include <fanout/sync/channel.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fanout::broker {

/// Default per-subscription queue capacity
inline constexpr size_t DEFAULT_BUFFER_SIZE = 128;

/// One connected client on one channel.
///
/// The channel and cursor never change after construction. The queue is the
/// only piece of broker state shared between tasks: the coordinator and a
/// replay task offer() into it, the connection handler drains it with next().
class subscription {
public:
    subscription(std::string_view channel, std::string_view last_event_id,
                 size_t buffer_size = DEFAULT_BUFFER_SIZE)
        : channel_(channel)
        , last_event_id_(last_event_id)
        , queue_(buffer_size == 0 ? 1 : buffer_size) {}

    subscription(const subscription&) = delete;
    subscription& operator=(const subscription&) = delete;

    const std::string& channel() const noexcept { return channel_; }
    const std::string& last_event_id() const noexcept { return last_event_id_; }

    /// Non-blocking enqueue; false when the queue is full or closed
    bool offer(sse::event evt) {
        return queue_.try_send(std::move(evt));
    }

    /// Await the next event; std::nullopt once the subscription is closed
    auto next() {
        return queue_.recv();
    }

    /// Take the next event if one is already buffered
    std::optional<sse::event> try_next() {
        return queue_.try_recv();
    }

    /// Close the queue and drop whatever is still buffered. Idempotent.
    void close() {
        queue_.close(sync::close_mode::discard);
    }

    bool is_closed() const noexcept { return queue_.is_closed(); }

    /// Number of events waiting to be written
    size_t pending() const noexcept { return queue_.size(); }

    size_t capacity() const noexcept { return queue_.capacity(); }

private:
    std::string channel_;
    std::string last_event_id_;
    sync::channel<sse::event> queue_;
};

using subscription_ptr = std::shared_ptr<subscription>;

/// Convenience factory
inline subscription_ptr make_subscription(std::string_view channel,
                                          std::string_view last_event_id,
                                          size_t buffer_size = DEFAULT_BUFFER_SIZE) {
    return std::make_shared<subscription>(channel, last_event_id, buffer_size);
}

} // namespace fanout::broker
