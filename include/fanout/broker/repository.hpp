#pragma once

/// @file repository.hpp
/// @brief History source used to replay missed events to reconnecting clients

#include <fanout/sse/event.hpp>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace fanout::broker {

/// One-shot, forward-only sequence of historical events
class event_cursor {
public:
    virtual ~event_cursor() = default;

    /// Next event in order, or std::nullopt when the sequence is exhausted.
    /// May throw; the replay task treats an exception as end of sequence.
    virtual std::optional<sse::event> next() = 0;
};

/// Pluggable history store
class repository {
public:
    virtual ~repository() = default;

    /// Events on channel that follow last_event_id. An empty id asks for
    /// everything available. A null cursor is treated as an empty replay.
    virtual std::unique_ptr<event_cursor> replay(std::string_view channel,
                                                 std::string_view last_event_id) = 0;
};

using repository_ptr = std::shared_ptr<repository>;

/// Cursor over a snapshot of events taken when the replay started
class vector_cursor final : public event_cursor {
public:
    explicit vector_cursor(std::vector<sse::event> events)
        : events_(std::move(events)) {}

    std::optional<sse::event> next() override {
        if (pos_ >= events_.size()) {
            return std::nullopt;
        }
        return std::move(events_[pos_++]);
    }

private:
    std::vector<sse::event> events_;
    size_t pos_ = 0;
};

} // namespace fanout::broker
