#pragma once

/// @file server.hpp
/// @brief Process-facing entry point: configuration, broker and handlers

#include <fanout/broker/broker.hpp>
#include <fanout/broker/repository.hpp>
#include <fanout/broker/subscription.hpp>
#include <fanout/coro/task.hpp>
#include <fanout/http/hold_adapter.hpp>
#include <fanout/http/stream_handler.hpp>
#include <fanout/log/logger.hpp>
#include <fanout/sse/event.hpp>

#include <memory>
#include <string>
#include <vector>

namespace fanout {

/// Server configuration
struct server_config {
    bool allow_cors = false;                               ///< Send Access-Control-Allow-Origin: *
    bool replay_all = false;                               ///< Replay history without a Last-Event-ID
    size_t buffer_size = broker::DEFAULT_BUFFER_SIZE;      ///< Per-subscriber queue capacity
    bool gzip = false;                                     ///< Compress streams for clients that accept it
    size_t mailbox_size = 64;                              ///< Coordinator mailbox capacity
    bool enable_logging = true;                            ///< Log per-connection failures
};

/// SSE fan-out server.
///
/// Owns the broker. Handlers returned by handler(), handler_with_initial_event()
/// and proxying_handler() refer to it and must not outlive the server.
///
/// Example:
/// @code
/// fanout::server srv;
/// auto events = srv.handler("ticks");
/// // for each accepted request:
/// co_await events(req, conn);
/// // elsewhere:
/// co_await srv.publish({"ticks"}, sse::event::message("42"));
/// @endcode
class server {
public:
    explicit server(server_config config = {})
        : config_(config)
        , broker_(broker::broker_config{
              .replay_all = config.replay_all,
              .mailbox_size = config.mailbox_size,
              .enable_logging = config.enable_logging,
          }) {
        if (config_.buffer_size == 0) {
            config_.buffer_size = 1;
        }
    }

    ~server() {
        shutdown();
    }

    server(const server&) = delete;
    server& operator=(const server&) = delete;

    const server_config& config() const noexcept { return config_; }

    broker::broker& get_broker() noexcept { return broker_; }

    /// Deliver an event to every subscriber of the named channels
    coro::task<void> publish(std::vector<std::string> channels, sse::event evt) {
        return broker_.publish(std::move(channels), std::move(evt));
    }

    /// Non-suspending publish; false if the mailbox is full or stopped
    bool try_publish(std::vector<std::string> channels, sse::event evt) {
        return broker_.try_publish(std::move(channels), std::move(evt));
    }

    /// Bind a history source to a channel
    coro::task<void> register_repository(std::string channel, broker::repository_ptr repo) {
        return broker_.register_repository(std::move(channel), std::move(repo));
    }

    /// History source for channels without their own binding
    coro::task<void> register_default_repository(broker::repository_ptr repo) {
        return broker_.register_default_repository(std::move(repo));
    }

    /// Streaming handler for a channel
    http::stream_handler handler(std::string channel) {
        return handler_with_initial_event(std::move(channel), {});
    }

    /// Streaming handler that greets each new client with initial()
    http::stream_handler handler_with_initial_event(std::string channel,
                                                    http::initial_event_func initial) {
        return http::stream_handler(broker_, std::move(channel), stream_options(),
                                    std::move(initial));
    }

    /// Proxying handler that holds connections named by Grip-Channel
    http::hold_adapter proxying_handler(http::upstream_ptr up) {
        return http::hold_adapter(broker_, std::move(up), stream_options());
    }

    /// Close every subscription and stop the broker. Idempotent.
    void shutdown() {
        broker_.shutdown();
    }

    /// Await the end of shutdown
    auto wait_stopped() {
        return broker_.wait_stopped();
    }

private:
    http::stream_options stream_options() const {
        return http::stream_options{
            .allow_cors = config_.allow_cors,
            .gzip = config_.gzip,
            .buffer_size = config_.buffer_size,
            .enable_logging = config_.enable_logging,
        };
    }

    server_config config_;
    broker::broker broker_;
};

} // namespace fanout
