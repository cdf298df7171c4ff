#pragma once

/// @file hold_adapter.hpp
/// @brief Reverse-proxy front that turns "hold" responses into SSE streams
///
/// The backend answers an ordinary request. When its response carries a
/// Grip-Channel header the edge keeps the client connection open and
/// streams that channel to it; otherwise the response is relayed as is.

#include <fanout/broker/broker.hpp>
#include <fanout/coro/task.hpp>
#include <fanout/http/message.hpp>
#include <fanout/http/stream_handler.hpp>
#include <fanout/http/transport.hpp>
#include <fanout/log/logger.hpp>

#include <exception>
#include <memory>
#include <string>
#include <string_view>

namespace fanout::http {

/// Response header naming the channel to hold the connection on
inline constexpr std::string_view GRIP_CHANNEL_HEADER = "Grip-Channel";

/// Upstream exchange performed on behalf of the client
class upstream {
public:
    virtual ~upstream() = default;

    /// Forward req and return the backend's complete response. Throws on
    /// transport failure.
    virtual coro::task<response> round_trip(const request& req) = 0;
};

using upstream_ptr = std::shared_ptr<upstream>;

/// Proxying handler
class hold_adapter {
public:
    hold_adapter(broker::broker& b, upstream_ptr up, stream_options opts)
        : broker_(&b)
        , upstream_(std::move(up))
        , opts_(opts) {}

    /// Serve one request. req and t must stay alive until the task completes.
    coro::task<void> operator()(const request& req, transport& t) const {
        response resp;
        bool failed = false;
        try {
            resp = co_await upstream_->round_trip(req);
        } catch (const std::exception& e) {
            if (opts_.enable_logging) {
                FANOUT_LOG_ERROR("upstream request for {} failed: {}", req.path(), e.what());
            }
            failed = true;
        }

        if (failed) {
            co_await relay(response(status::bad_gateway, "Bad Gateway\n"), t);
            co_return;
        }

        std::string channel(resp.header(GRIP_CHANNEL_HEADER));
        if (channel.empty()) {
            co_await relay(resp, t);
            co_return;
        }

        bool use_gzip = negotiate_gzip(opts_, req);
        auto& h = resp.get_headers();
        apply_stream_headers(h, opts_, use_gzip);
        h.remove("Content-Length");
        h.remove(GRIP_CHANNEL_HEADER);

        if (!t.write_head(resp) || !co_await t.flush()) {
            if (opts_.enable_logging) {
                FANOUT_LOG_WARNING("could not start held stream on '{}'", channel);
            }
            co_return;
        }

        FANOUT_LOG_DEBUG("holding {} on channel '{}'", req.path(), channel);
        co_await stream_handler::stream(*broker_, channel, std::string(req.last_event_id()),
                                        use_gzip, opts_, {}, std::string(resp.body()), t);
    }

private:
    /// Write a complete, non-streaming response
    coro::task<void> relay(const response& resp, transport& t) const {
        bool ok = t.write_head(resp);
        auto body = resp.body();
        if (ok && !body.empty()) {
            ok = t.write(body.data(), body.size());
        }
        if (ok) {
            ok = co_await t.flush();
        }
        if (!ok && opts_.enable_logging) {
            FANOUT_LOG_WARNING("could not relay upstream response ({})", resp.status_code());
        }
    }

    broker::broker* broker_;
    upstream_ptr upstream_;
    stream_options opts_;
};

} // namespace fanout::http
