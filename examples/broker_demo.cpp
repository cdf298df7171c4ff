/// @file broker_demo.cpp
/// @brief Fan-out broker example
///
/// Attaches a few simulated SSE clients to a channel, publishes a stream of
/// ticks, then reconnects one client with a Last-Event-ID so it replays the
/// history it missed. Each client's bytes go to stdout, prefixed with its name.
///
/// Usage: ./broker_demo [--events N] [--clients N] [--threads N] [--cors] [--gzip]
/// Default: 10 events, 3 clients, hardware concurrency threads
///
/// Features demonstrated:
/// - server facade and channel handlers
/// - per-channel history with memory_repository
/// - reconnect replay
/// - fanout::run owning the server and its shutdown

#include <fanout/fanout.hpp>

#include <atomic>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using namespace fanout;

/// Transport that prints everything written to it
class stdout_transport : public http::transport {
public:
    explicit stdout_transport(std::string name) : name_(std::move(name)) {}

    bool write_head(const http::response& resp) override {
        fmt::print("[{}] {}", name_, resp.serialize_head());
        return true;
    }

    bool write(const char* data, size_t size) override {
        fmt::print("[{}] {}", name_, std::string_view(data, size));
        return true;
    }

    coro::task<bool> flush() override {
        std::fflush(stdout);
        co_return true;
    }

    http::close_notifier& disconnects() noexcept override {
        return notifier_;
    }

private:
    std::string name_;
    http::close_notifier notifier_;
};

struct demo_options {
    int events = 10;
    int clients = 3;
    bool cors = false;
    bool gzip = false;
};

/// Counts connected and still-running clients
struct client_tracker {
    int expected = 0;
    std::atomic<int> connected{0};
    std::atomic<int> running{0};
    sync::event all_connected;
    sync::event all_done;
};

coro::task<void> serve_client(const http::stream_handler& handler, const http::request& req,
                              stdout_transport& conn, client_tracker& tracker) {
    co_await handler(req, conn);
    if (tracker.running.fetch_sub(1) == 1) {
        tracker.all_done.set();
    }
}

coro::task<int> async_main(fanout::server& srv, demo_options opts) {
    auto history = std::make_shared<broker::memory_repository>(100);
    co_await srv.register_repository("ticks", history);

    client_tracker tracker;
    tracker.expected = opts.clients;

    // Runs once the client's subscription is registered
    auto events = srv.handler_with_initial_event("ticks", [&tracker] {
        if (tracker.connected.fetch_add(1) + 1 >= tracker.expected) {
            tracker.all_connected.set();
        }
        return sse::event::typed("hello", "connected");
    });

    std::vector<std::unique_ptr<stdout_transport>> conns;
    std::vector<http::request> requests;
    requests.reserve(opts.clients + 1);

    for (int i = 0; i < opts.clients; ++i) {
        conns.push_back(std::make_unique<stdout_transport>("client-" + std::to_string(i)));
        requests.emplace_back("/events");
        tracker.running.fetch_add(1);
        serve_client(events, requests.back(), *conns.back(), tracker).go();
    }
    if (opts.clients > 0) {
        co_await tracker.all_connected.wait();
    }

    for (int i = 1; i <= opts.events; ++i) {
        auto evt = sse::event::with_id(std::to_string(i), "tick " + std::to_string(i));
        history->append("ticks", evt);
        { std::vector<std::string> ch{"ticks"}; co_await srv.publish(std::move(ch), std::move(evt)); }
    }
    size_t subscribers = co_await srv.get_broker().subscriber_count("ticks");
    FANOUT_LOG_INFO("published {} ticks to {} clients", opts.events, subscribers);

    // A late client that saw the first half replays the rest
    conns.push_back(std::make_unique<stdout_transport>("late"));
    requests.emplace_back("/events");
    requests.back().set_header("Last-Event-ID", std::to_string(opts.events / 2));
    tracker.running.fetch_add(1);
    serve_client(events, requests.back(), *conns.back(), tracker).go();

    { std::vector<std::string> ch{"ticks"}; co_await srv.publish(std::move(ch), sse::event::comment("bye")); }

    // The handlers refer to locals of this frame; let them finish first
    srv.shutdown();
    co_await tracker.all_done.wait();
    FANOUT_LOG_INFO("all clients finished");
    co_return 0;
}

int main(int argc, char* argv[]) {
    demo_options opts;
    size_t threads = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--events" && i + 1 < argc) {
            opts.events = std::stoi(argv[++i]);
        } else if (arg == "--clients" && i + 1 < argc) {
            opts.clients = std::stoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            threads = std::stoul(argv[++i]);
        } else if (arg == "--cors") {
            opts.cors = true;
        } else if (arg == "--gzip") {
            opts.gzip = true;
        } else {
            fmt::print(stderr, "Usage: {} [--events N] [--clients N] [--threads N] [--cors] [--gzip]\n",
                       argv[0]);
            return 1;
        }
    }

    server_config config{
        .allow_cors = opts.cors,
        .gzip = opts.gzip,
    };
    return fanout::run(config, [&opts](fanout::server& srv) {
        return async_main(srv, opts);
    }, threads);
}
