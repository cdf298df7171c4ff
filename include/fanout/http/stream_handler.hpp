#pragma once

/// @file stream_handler.hpp
/// @brief Per-connection SSE loop: subscription queue -> encoder -> transport

#include <fanout/broker/broker.hpp>
#include <fanout/broker/subscription.hpp>
#include <fanout/coro/task.hpp>
#include <fanout/http/message.hpp>
#include <fanout/http/transport.hpp>
#include <fanout/log/logger.hpp>
#include <fanout/sse/encoder.hpp>
#include <fanout/sse/event.hpp>

#include <exception>
#include <functional>
#include <string>
#include <string_view>

namespace fanout::http {

/// Connection-level settings, derived from the server configuration
struct stream_options {
    bool allow_cors = false;
    bool gzip = false;
    size_t buffer_size = broker::DEFAULT_BUFFER_SIZE;
    bool enable_logging = true;
};

/// Optional one-shot event sent to each new client before live traffic.
/// It may throw; the failure is logged and streaming goes on.
using initial_event_func = std::function<sse::event()>;

/// Whether this response will be gzip-coded
inline bool negotiate_gzip(const stream_options& opts, const request& req) {
    return opts.gzip && req.accepts_gzip();
}

/// Overwrite h with the SSE streaming headers
inline void apply_stream_headers(headers& h, const stream_options& opts, bool use_gzip) {
    h.set("Content-Type", sse::SSE_CONTENT_TYPE);
    h.set("Cache-Control", "no-cache, no-store, must-revalidate");
    h.set("Connection", "keep-alive");
    if (opts.allow_cors) {
        h.set("Access-Control-Allow-Origin", "*");
    }
    if (use_gzip) {
        h.set("Content-Encoding", "gzip");
    }
}

/// Build SSE response headers for a request
inline response build_stream_response(const stream_options& opts, const request& req) {
    response resp(status::ok);
    apply_stream_headers(resp.get_headers(), opts, negotiate_gzip(opts, req));
    return resp;
}

/// Streaming endpoint for one channel.
///
/// Invoked once per accepted request. The handler writes the headers,
/// registers a subscription with the broker and then forwards every queued
/// event to the transport until the subscription ends: by peer disconnect,
/// by a failed write, by eviction or by broker shutdown.
///
/// The broker must outlive every running invocation.
class stream_handler {
public:
    stream_handler(broker::broker& b, std::string channel, stream_options opts,
                   initial_event_func initial = {})
        : broker_(&b)
        , channel_(std::move(channel))
        , opts_(opts)
        , initial_(std::move(initial)) {}

    const std::string& channel() const noexcept { return channel_; }

    /// Serve one request. req and t must stay alive until the task completes.
    coro::task<void> operator()(const request& req, transport& t) const {
        bool use_gzip = negotiate_gzip(opts_, req);

        response head(status::ok);
        apply_stream_headers(head.get_headers(), opts_, use_gzip);
        if (!t.write_head(head) || !co_await t.flush()) {
            if (opts_.enable_logging) {
                FANOUT_LOG_WARNING("could not start stream on '{}'", channel_);
            }
            co_return;
        }

        co_await stream(*broker_, channel_, std::string(req.last_event_id()), use_gzip,
                        opts_, initial_, {}, t);
    }

    /// Body of a stream whose headers are already on the wire.
    ///
    /// preamble, if any, is written first through the same (possibly
    /// compressed) path; the hold adapter uses it for the upstream body.
    static coro::task<void> stream(broker::broker& b, std::string channel,
                                   std::string last_event_id, bool use_gzip,
                                   stream_options opts, initial_event_func initial,
                                   std::string preamble, transport& t) {
        auto sub = broker::make_subscription(channel, last_event_id, opts.buffer_size);

        // Disconnect closes the queue, which wakes the loop below
        auto registration = t.disconnects().on_close([sub] { sub->close(); });

        if (!co_await b.subscribe(sub)) {
            co_return;  // Broker already stopped
        }

        sse::encoder<transport> enc(t, use_gzip);

        if (!preamble.empty()) {
            if (!enc.write_raw(preamble) || !co_await t.flush()) {
                if (opts.enable_logging) {
                    FANOUT_LOG_WARNING("write failed on '{}', dropping subscriber", channel);
                }
                sub->close();
            }
        }

        if (initial && !sub->is_closed()) {
            try {
                sse::event evt = initial();
                bool ok = enc.encode(evt);
                if (ok) {
                    ok = co_await t.flush();
                }
                if (!ok && opts.enable_logging) {
                    FANOUT_LOG_WARNING("initial event on '{}' could not be written", channel);
                }
            } catch (const std::exception& e) {
                if (opts.enable_logging) {
                    FANOUT_LOG_WARNING("initial event on '{}' failed: {}", channel, e.what());
                }
            }
        }

        [[maybe_unused]] size_t sent = 0;
        while (true) {
            auto evt = co_await sub->next();
            if (!evt) {
                break;
            }

            bool ok = enc.encode(*evt);
            if (ok) {
                ok = co_await t.flush();
            }
            if (!ok) {
                if (opts.enable_logging) {
                    FANOUT_LOG_WARNING("write failed on '{}', dropping subscriber", channel);
                }
                sub->close();
                break;
            }
            ++sent;
        }

        registration.unregister();

        // Covers disconnect and write failure; a no-op after eviction or shutdown
        co_await b.unsubscribe(sub);

        if (!t.disconnects().is_closed()) {
            bool ok = enc.finish();
            if (ok) {
                ok = co_await t.flush();
            }
            if (!ok) {
                FANOUT_LOG_DEBUG("could not terminate stream on '{}'", channel);
            }
        }
        FANOUT_LOG_DEBUG("stream on '{}' ended after {} events", channel, sent);
    }

private:
    broker::broker* broker_;
    std::string channel_;
    stream_options opts_;
    initial_event_func initial_;
};

} // namespace fanout::http
