#pragma once

/// @file broker.hpp
/// @brief Channel coordinator: subscriptions, fan-out, replay and shutdown
///
/// All broker state lives inside one coroutine (the coordinator). Every
/// other task talks to it through a bounded mailbox, so the subscriber and
/// repository maps need no locks. Fan-out never blocks: a subscriber whose
/// queue is full is evicted rather than slowing everybody else down.

#include <fanout/broker/repository.hpp>
#include <fanout/broker/subscription.hpp>
#include <fanout/coro/task.hpp>
#include <fanout/log/logger.hpp>
#include <fanout/runtime/scheduler.hpp>
#include <fanout/sse/event.hpp>
#include <fanout/sync/channel.hpp>
#include <fanout/sync/event.hpp>

#include <exception>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace fanout::broker {

/// Coordinator settings
struct broker_config {
    bool replay_all = false;      ///< Replay history even without a Last-Event-ID
    size_t mailbox_size = 64;     ///< Commands buffered before senders suspend
    bool enable_logging = true;   ///< Report replay and shutdown problems
};

namespace detail {

struct register_cmd {
    std::string channel;
    repository_ptr repo;
};

struct default_repository_cmd {
    repository_ptr repo;
};

/// Answer to a request/reply command, read by the waiting caller
template<typename T>
struct reply {
    T value{};
    sync::event ready;
};

/// The coordinator's end of a reply.
///
/// Releases the caller when answered or, if the command is dropped or its
/// handling throws first, when destroyed; the caller then sees the default
/// value.
template<typename T>
class reply_handle {
public:
    explicit reply_handle(std::shared_ptr<reply<T>> r) : reply_(std::move(r)) {}

    reply_handle(reply_handle&&) noexcept = default;
    reply_handle& operator=(reply_handle&& other) noexcept {
        if (this != &other) {
            release();
            reply_ = std::move(other.reply_);
        }
        return *this;
    }

    ~reply_handle() { release(); }

    void answer(T value) {
        if (reply_) {
            reply_->value = std::move(value);
            release();
        }
    }

private:
    void release() {
        if (reply_) {
            auto r = std::move(reply_);
            r->ready.set();
        }
    }

    std::shared_ptr<reply<T>> reply_;
};

struct subscribe_cmd {
    subscription_ptr sub;
    reply_handle<bool> accepted;
};

struct unsubscribe_cmd {
    subscription_ptr sub;
};

struct publish_cmd {
    std::vector<std::string> channels;
    sse::event evt;
};

struct count_cmd {
    std::string channel;
    reply_handle<size_t> count;
};

using command = std::variant<register_cmd, default_repository_cmd, subscribe_cmd,
                             unsubscribe_cmd, publish_cmd, count_cmd>;

using mailbox = sync::channel<command>;

} // namespace detail

/// Broker coordinator.
///
/// The coordinator starts in the constructor, on the current scheduler if
/// there is one, inline otherwise. The broker stays bound to that scheduler:
/// the coordinator and every task it wakes resume there, even when the
/// message comes from a plain thread. Shut the broker down before the
/// scheduler stops.
///
/// Every operation is a message; none of them fail at the call site. After
/// shutdown() messages are dropped.
class broker {
public:
    explicit broker(broker_config config = {})
        : config_(config)
        , mailbox_(std::make_shared<detail::mailbox>(config.mailbox_size == 0 ? 1 : config.mailbox_size))
        , stopped_(std::make_shared<sync::event>()) {
        run(mailbox_, config_, stopped_).go();
    }

    ~broker() {
        shutdown();
    }

    broker(const broker&) = delete;
    broker& operator=(const broker&) = delete;

    const broker_config& config() const noexcept { return config_; }

    /// Bind a repository to a channel; last write wins, null is ignored
    coro::task<void> register_repository(std::string channel, repository_ptr repo) {
        auto mailbox = mailbox_;
        auto send = mailbox->send(detail::register_cmd{std::move(channel), std::move(repo)});
        co_await send;
    }

    /// Set the repository used by channels without their own binding
    coro::task<void> register_default_repository(repository_ptr repo) {
        auto mailbox = mailbox_;
        auto send = mailbox->send(detail::default_repository_cmd{std::move(repo)});
        co_await send;
    }

    /// Hand a subscription to the coordinator.
    ///
    /// Resumes only once the subscription is registered, so the caller may
    /// start draining it right away. Returns false, with the subscription
    /// closed, if the broker has already shut down or could not register it.
    coro::task<bool> subscribe(subscription_ptr sub) {
        auto mailbox = mailbox_;
        auto accepted = std::make_shared<detail::reply<bool>>();

        auto send = mailbox->send(detail::subscribe_cmd{sub, detail::reply_handle<bool>(accepted)});
        if (co_await send) {
            co_await accepted->ready.wait();
        }
        if (!accepted->value) {
            sub->close();
        }
        co_return accepted->value;
    }

    /// Remove a subscription from its channel. Idempotent.
    coro::task<void> unsubscribe(subscription_ptr sub) {
        auto mailbox = mailbox_;
        auto send = mailbox->send(detail::unsubscribe_cmd{std::move(sub)});
        co_await send;
    }

    /// Deliver an event to every subscriber of the named channels
    coro::task<void> publish(std::vector<std::string> channels, sse::event evt) {
        auto mailbox = mailbox_;
        auto send = mailbox->send(detail::publish_cmd{std::move(channels), std::move(evt)});
        if (!co_await send) {
            FANOUT_LOG_DEBUG("publish after shutdown dropped");
        }
    }

    /// Publish without suspending, for callers outside any coroutine. The
    /// fan-out itself runs on the broker's scheduler, not on this thread.
    /// @return false if the mailbox is full or the broker has shut down
    bool try_publish(std::vector<std::string> channels, sse::event evt) {
        return mailbox_->try_send(detail::publish_cmd{std::move(channels), std::move(evt)});
    }

    /// Current number of subscribers on a channel (0 after shutdown)
    coro::task<size_t> subscriber_count(std::string channel) {
        auto mailbox = mailbox_;
        auto count = std::make_shared<detail::reply<size_t>>();

        auto send = mailbox->send(detail::count_cmd{std::move(channel), detail::reply_handle<size_t>(count)});
        if (co_await send) {
            co_await count->ready.wait();
        }
        co_return count->value;
    }

    /// Stop accepting commands. Commands already queued are still handled,
    /// then every subscription on every channel is closed exactly once.
    /// Safe to call repeatedly and from any thread.
    void shutdown() {
        mailbox_->close();
    }

    /// Await the end of shutdown (all subscriptions closed)
    auto wait_stopped() {
        return stopped_->wait();
    }

    bool is_stopped() const noexcept {
        return stopped_->is_set();
    }

private:
    using subscriber_set = std::unordered_set<subscription_ptr>;

    /// Coordinator loop. The maps are locals of this frame: nothing else
    /// can reach them.
    static coro::task<void> run(std::shared_ptr<detail::mailbox> mailbox,
                                broker_config config,
                                std::shared_ptr<sync::event> stopped) {
        std::unordered_map<std::string, subscriber_set> subscribers;
        std::unordered_map<std::string, repository_ptr> repositories;
        repository_ptr default_repository;

        // Evictions raised while publishing. They cannot go through our own
        // mailbox (we would be waiting on ourselves), so they are applied at
        // the top of the next iteration instead.
        std::vector<subscription_ptr> evicted;

        auto remove = [&subscribers](const subscription_ptr& sub) {
            auto it = subscribers.find(sub->channel());
            if (it == subscribers.end()) {
                return;
            }
            it->second.erase(sub);
            if (it->second.empty()) {
                subscribers.erase(it);
            }
        };

        while (true) {
            for (auto& sub : evicted) {
                remove(sub);
            }
            evicted.clear();

            auto cmd = co_await mailbox->recv();
            if (!cmd) {
                break;  // Mailbox closed: shutdown
            }

            try {
                if (auto* reg = std::get_if<detail::register_cmd>(&*cmd)) {
                    if (reg->repo) {
                        repositories[reg->channel] = std::move(reg->repo);
                    }
                } else if (auto* def = std::get_if<detail::default_repository_cmd>(&*cmd)) {
                    default_repository = std::move(def->repo);
                } else if (auto* sub_cmd = std::get_if<detail::subscribe_cmd>(&*cmd)) {
                    auto& sub = sub_cmd->sub;
                    bool registered = false;
                    if (!sub->is_closed()) {
                        subscribers[sub->channel()].insert(sub);

                        if (config.replay_all || !sub->last_event_id().empty()) {
                            repository_ptr repo = default_repository;
                            auto it = repositories.find(sub->channel());
                            if (it != repositories.end()) {
                                repo = it->second;
                            }
                            // Replay and live events share the queue and may
                            // interleave; replay only starts no later than now.
                            if (repo) {
                                replay(std::move(repo), sub, mailbox, config.enable_logging).go();
                            }
                        }
                        registered = true;
                    }
                    sub_cmd->accepted.answer(registered);
                } else if (auto* unsub = std::get_if<detail::unsubscribe_cmd>(&*cmd)) {
                    remove(unsub->sub);
                } else if (auto* pub = std::get_if<detail::publish_cmd>(&*cmd)) {
                    for (const auto& channel : pub->channels) {
                        auto it = subscribers.find(channel);
                        if (it == subscribers.end()) {
                            continue;
                        }
                        for (const auto& sub : it->second) {
                            if (!sub->offer(pub->evt)) {
                                // Slow consumer: disconnect rather than block or drop silently
                                sub->close();
                                evicted.push_back(sub);
                                FANOUT_LOG_DEBUG("evicted subscriber on '{}' (queue full)", channel);
                            }
                        }
                    }
                } else if (auto* count = std::get_if<detail::count_cmd>(&*cmd)) {
                    auto it = subscribers.find(count->channel);
                    count->count.answer(it == subscribers.end() ? 0 : it->second.size());
                }
            } catch (const std::exception& e) {
                // A pending reply is released when cmd goes out of scope
                if (config.enable_logging) {
                    FANOUT_LOG_ERROR("broker command failed: {}", e.what());
                }
            }
        }

        size_t closed = 0;
        for (auto& [channel, subs] : subscribers) {
            for (const auto& sub : subs) {
                sub->close();
                ++closed;
            }
        }
        subscribers.clear();
        repositories.clear();

        if (config.enable_logging) {
            FANOUT_LOG_INFO("broker stopped, closed {} subscriptions", closed);
        }
        stopped->set();
    }

    /// Drain a repository cursor into a subscription's queue. Runs as its
    /// own task and is never joined; a full queue evicts the subscriber just
    /// like a live publish would, a closed one ends the replay.
    static coro::task<void> replay(repository_ptr repo, subscription_ptr sub,
                                   std::shared_ptr<detail::mailbox> mailbox,
                                   bool enable_logging) {
        std::unique_ptr<event_cursor> cursor;
        try {
            cursor = repo->replay(sub->channel(), sub->last_event_id());
        } catch (const std::exception& e) {
            if (enable_logging) {
                FANOUT_LOG_WARNING("replay of '{}' failed: {}", sub->channel(), e.what());
            }
            co_return;
        }
        if (!cursor) {
            co_return;
        }

        size_t replayed = 0;
        while (true) {
            std::optional<sse::event> evt;
            try {
                evt = cursor->next();
            } catch (const std::exception& e) {
                if (enable_logging) {
                    FANOUT_LOG_WARNING("replay of '{}' stopped after {} events: {}",
                                       sub->channel(), replayed, e.what());
                }
                break;
            }
            if (!evt) {
                break;
            }

            if (!sub->offer(std::move(*evt))) {
                if (!sub->is_closed()) {
                    sub->close();
                    auto send = mailbox->send(detail::unsubscribe_cmd{sub});
                    co_await send;
                }
                break;
            }
            ++replayed;
        }
        FANOUT_LOG_DEBUG("replayed {} events on '{}'", replayed, sub->channel());
    }

    broker_config config_;
    std::shared_ptr<detail::mailbox> mailbox_;
    std::shared_ptr<sync::event> stopped_;
};

} // namespace fanout::broker
