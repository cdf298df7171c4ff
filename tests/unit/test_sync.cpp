#include <catch2/catch.hpp>
#include <fanout/coro/task.hpp>
#include <fanout/runtime/scheduler.hpp>
#include <fanout/sync/channel.hpp>
#include <fanout/sync/event.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "../test_main.cpp"

using namespace fanout::sync;
using namespace fanout::coro;
using fanout::runtime::scheduler;
using fanout::test::finished;
using fanout::test::scaled_ms;
using fanout::test::start;

TEST_CASE("channel basic operations", "[sync][channel]") {
    channel<int> ch(3);

    SECTION("try_send and try_recv") {
        REQUIRE(ch.try_send(1));
        REQUIRE(ch.try_send(2));
        REQUIRE(ch.try_send(3));
        REQUIRE_FALSE(ch.try_send(4));  // Full

        REQUIRE(ch.size() == 3);

        auto v1 = ch.try_recv();
        REQUIRE(v1.has_value());
        REQUIRE(*v1 == 1);

        REQUIRE(ch.try_send(4));
        REQUIRE(ch.size() == 3);
    }

    SECTION("unbounded channel") {
        channel<int> unbounded(0);
        for (int i = 0; i < 500; ++i) {
            REQUIRE(unbounded.try_send(i));
        }
        REQUIRE(unbounded.size() == 500);
    }

    SECTION("try_recv on empty channel") {
        REQUIRE_FALSE(ch.try_recv().has_value());
    }
}

TEST_CASE("channel close modes", "[sync][channel]") {
    channel<int> ch(10);
    ch.try_send(1);
    ch.try_send(2);

    SECTION("drain keeps buffered items") {
        ch.close(close_mode::drain);
        REQUIRE(ch.is_closed());
        REQUIRE_FALSE(ch.try_send(3));

        REQUIRE(*ch.try_recv() == 1);
        REQUIRE(*ch.try_recv() == 2);
        REQUIRE_FALSE(ch.try_recv().has_value());
    }

    SECTION("discard drops buffered items") {
        ch.close(close_mode::discard);
        REQUIRE(ch.is_closed());
        REQUIRE(ch.empty());
        REQUIRE_FALSE(ch.try_recv().has_value());
    }

    SECTION("close is idempotent") {
        ch.close();
        ch.close();
        ch.close(close_mode::discard);
        REQUIRE(ch.is_closed());
        REQUIRE(ch.empty());
    }
}

TEST_CASE("channel hands values to a waiting receiver", "[sync][channel][coro]") {
    channel<int> ch(1);
    std::vector<int> received;
    bool ended = false;

    auto consumer = [&]() -> task<void> {
        while (auto v = co_await ch.recv()) {
            received.push_back(*v);
        }
        ended = true;
    };

    auto c = consumer();
    start(c);
    REQUIRE_FALSE(finished(c));

    // No scheduler: the receiver runs inside try_send
    REQUIRE(ch.try_send(1));
    REQUIRE(ch.try_send(2));
    REQUIRE(received == std::vector<int>{1, 2});
    REQUIRE(ch.empty());

    ch.close();
    REQUIRE(ended);
    REQUIRE(finished(c));
}

TEST_CASE("channel send suspends while full", "[sync][channel][coro]") {
    channel<int> ch(1);
    REQUIRE(ch.try_send(1));

    bool result = false;
    bool resumed = false;
    auto producer = [&]() -> task<void> {
        result = co_await ch.send(2);
        resumed = true;
    };

    auto p = producer();
    start(p);
    REQUIRE_FALSE(resumed);

    SECTION("receiving makes room") {
        REQUIRE(*ch.try_recv() == 1);
        REQUIRE(resumed);
        REQUIRE(result);
        REQUIRE(*ch.try_recv() == 2);
    }

    SECTION("closing fails the parked send") {
        ch.close();
        REQUIRE(resumed);
        REQUIRE_FALSE(result);
    }
}

TEST_CASE("channel recv sees end-of-stream after discard", "[sync][channel][coro]") {
    channel<int> ch(4);
    bool got_value = false;
    bool ended = false;

    auto consumer = [&]() -> task<void> {
        auto v = co_await ch.recv();
        got_value = v.has_value();
        ended = true;
    };

    ch.try_send(1);
    ch.close(close_mode::discard);

    auto c = consumer();
    start(c);
    REQUIRE(ended);
    REQUIRE_FALSE(got_value);
}

TEST_CASE("event basic operations", "[sync][event]") {
    event evt;
    int woken = 0;

    auto waiter = [&]() -> task<void> {
        co_await evt.wait();
        ++woken;
    };

    auto w1 = waiter();
    auto w2 = waiter();
    start(w1);
    start(w2);
    REQUIRE(woken == 0);
    REQUIRE_FALSE(evt.is_set());

    evt.set();
    REQUIRE(evt.is_set());
    REQUIRE(woken == 2);

    // Already set: does not suspend, set() again is a no-op
    evt.set();
    auto w3 = waiter();
    start(w3);
    REQUIRE(woken == 3);
}

TEST_CASE("channel with coroutines", "[sync][channel][coro]") {
    channel<int> ch(2);
    std::atomic<int> sum{0};
    std::atomic<bool> producer_done{false};
    std::atomic<bool> consumer_done{false};

    auto producer = [&]() -> task<void> {
        for (int i = 1; i <= 100; ++i) {
            bool sent = co_await ch.send(i);
            if (!sent) break;
        }
        ch.close();
        producer_done = true;
    };

    auto consumer = [&]() -> task<void> {
        while (true) {
            auto val = co_await ch.recv();
            if (!val) break;
            sum += *val;
        }
        consumer_done = true;
    };

    scheduler sched(2);
    sched.start();

    {
        auto p = producer();
        auto c = consumer();
        sched.spawn(p.release());
        sched.spawn(c.release());
    }

    auto deadline = std::chrono::steady_clock::now() + scaled_ms(2000);
    while (!(producer_done && consumer_done) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    REQUIRE(producer_done);
    REQUIRE(consumer_done);
    REQUIRE(sum == 5050);

    sched.shutdown();
}

TEST_CASE("channel wakes receivers on its owner scheduler", "[sync][channel][scheduler]") {
    scheduler sched(1);
    sched.start();

    channel<int> ch(1);
    REQUIRE(ch.owner() == &sched);

    std::atomic<bool> waiting{false};
    std::atomic<int> value{0};
    std::atomic<std::thread::id> receiver_thread{};

    auto receiver = [&]() -> task<void> {
        waiting = true;
        auto v = co_await ch.recv();
        receiver_thread = std::this_thread::get_id();
        value = v.value_or(-1);
    };
    {
        auto t = receiver();
        sched.spawn(t.release());
    }

    auto deadline = std::chrono::steady_clock::now() + scaled_ms(1000);
    while (!waiting.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    bool sent = false;
    std::thread sender([&] { sent = ch.try_send(7); });
    auto sender_id = sender.get_id();
    sender.join();
    REQUIRE(sent);

    deadline = std::chrono::steady_clock::now() + scaled_ms(1000);
    while (value.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    REQUIRE(value.load() == 7);
    REQUIRE(receiver_thread.load() != sender_id);

    sched.shutdown();
}
