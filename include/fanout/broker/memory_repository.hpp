#pragma once

#include <fanout/broker/repository.hpp>

#include <algorithm>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fanout::broker {

/// In-process history kept per channel.
///
/// Thread-safe: publishers append while replay tasks take snapshots.
/// With a retention limit the oldest events are dropped first.
class memory_repository final : public repository {
public:
    /// @param retention Maximum events kept per channel (0 = unlimited)
    explicit memory_repository(size_t retention = 0)
        : retention_(retention) {}

    /// Record an event on a channel. Comments are not history and are ignored.
    void append(std::string_view channel, sse::event evt) {
        if (evt.is_comment()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto& history = channels_[std::string(channel)];
        history.push_back(std::move(evt));
        if (retention_ > 0 && history.size() > retention_) {
            history.pop_front();
        }
    }

    /// Events after the one whose id matches last_event_id. When the id is
    /// empty, or has already fallen out of retention, the whole retained
    /// history is replayed.
    std::unique_ptr<event_cursor> replay(std::string_view channel,
                                         std::string_view last_event_id) override {
        std::vector<sse::event> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = channels_.find(std::string(channel));
            if (it != channels_.end()) {
                const auto& history = it->second;
                auto first = history.begin();
                if (!last_event_id.empty()) {
                    auto match = std::find_if(history.rbegin(), history.rend(),
                        [&](const sse::event& e) { return e.id == last_event_id; });
                    if (match != history.rend()) {
                        first = match.base();
                    }
                }
                snapshot.assign(first, history.end());
            }
        }
        return std::make_unique<vector_cursor>(std::move(snapshot));
    }

    /// Number of events retained for a channel
    size_t size(std::string_view channel) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(std::string(channel));
        return it == channels_.end() ? 0 : it->second.size();
    }

private:
    size_t retention_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<sse::event>> channels_;
};

} // namespace fanout::broker
