#include <catch2/catch.hpp>
#include <fanout/broker/subscription.hpp>
#include <fanout/coro/task.hpp>
#include <fanout/run.hpp>
#include <fanout/runtime/scheduler.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include "../test_main.cpp"  // For scaled timeouts

using namespace fanout::runtime;
using namespace fanout::coro;
using namespace fanout::test;

namespace {

task<int> answer() {
    co_return 42;
}

task<int> doubled() {
    int v = co_await answer();
    co_return v * 2;
}

task<int> failing() {
    throw std::runtime_error("boom");
    co_return 0;
}

} // namespace

TEST_CASE("task co_return value", "[task]") {
    REQUIRE(sync_wait(answer()) == 42);
    REQUIRE(sync_wait(doubled()) == 84);
}

TEST_CASE("task is lazy", "[task]") {
    bool ran = false;
    auto body = [&]() -> task<void> {
        ran = true;
        co_return;
    };

    auto t = body();
    REQUIRE_FALSE(ran);
    sync_wait(std::move(t));
    REQUIRE(ran);
}

TEST_CASE("task exception propagation via co_await", "[task]") {
    auto outer = []() -> task<std::string> {
        try {
            co_await failing();
        } catch (const std::runtime_error& e) {
            co_return std::string(e.what());
        }
        co_return std::string("not thrown");
    };

    REQUIRE(sync_wait(outer()) == "boom");
    REQUIRE_THROWS_AS(sync_wait(failing()), std::runtime_error);
}

TEST_CASE("task::go() without a scheduler runs inline", "[task][spawn]") {
    int value = 0;
    auto body = [&]() -> task<void> {
        value = co_await answer();
    };

    body().go();
    REQUIRE(value == 42);
}

TEST_CASE("Scheduler start/shutdown", "[scheduler]") {
    scheduler sched(2);
    REQUIRE(sched.num_threads() == 2);
    REQUIRE_FALSE(sched.is_running());

    sched.start();
    REQUIRE(sched.is_running());
    REQUIRE(scheduler::current() == &sched);

    sched.shutdown();
    REQUIRE_FALSE(sched.is_running());
    REQUIRE(scheduler::current() == nullptr);

    // Second shutdown is a no-op
    sched.shutdown();
}

TEST_CASE("Scheduler spawn multiple coroutines", "[scheduler]") {
    scheduler sched(4);
    sched.start();

    std::atomic<int> counter{0};
    constexpr int num_tasks = 100;

    auto body = [&]() -> task<void> {
        counter.fetch_add(1);
        co_return;
    };

    for (int i = 0; i < num_tasks; ++i) {
        auto t = body();
        sched.spawn(t.release());
    }

    auto deadline = std::chrono::steady_clock::now() + scaled_ms(1000);
    while ((counter.load() < num_tasks || sched.total_tasks_executed() < static_cast<size_t>(num_tasks))
           && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    REQUIRE(counter.load() == num_tasks);
    REQUIRE(sched.total_tasks_executed() >= static_cast<size_t>(num_tasks));
    REQUIRE(sched.pending_tasks() == 0);

    sched.shutdown();
}

TEST_CASE("Scheduler runs queued work when it stops", "[scheduler][shutdown]") {
    scheduler sched(1);
    sched.start();

    std::atomic<bool> blocking{false};
    std::atomic<bool> release{false};
    std::atomic<bool> queued_ran{false};

    // Occupy the only worker so the next spawn stays queued
    auto blocker = [&]() -> task<void> {
        blocking = true;
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        co_return;
    };
    auto queued = [&]() -> task<void> {
        queued_ran = true;
        co_return;
    };

    {
        auto b = blocker();
        sched.spawn(b.release());
    }
    auto deadline = std::chrono::steady_clock::now() + scaled_ms(1000);
    while (!blocking.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    REQUIRE(blocking.load());

    {
        auto q = queued();
        sched.spawn(q.release());
    }

    std::thread stopper([&] { sched.shutdown(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    release = true;
    stopper.join();

    REQUIRE(queued_ran.load());
    REQUIRE_FALSE(sched.is_running());
}

TEST_CASE("Scheduler resumes inline after shutdown", "[scheduler][shutdown]") {
    scheduler sched(1);
    sched.start();
    sched.shutdown();

    bool ran = false;
    auto body = [&]() -> task<void> {
        ran = true;
        co_return;
    };
    auto t = body();
    sched.spawn(t.release());

    REQUIRE(ran);
    REQUIRE(sched.pending_tasks() == 0);
}

TEST_CASE("run returns the task result", "[runtime][run]") {
    REQUIRE(fanout::run(doubled(), 2) == 84);
    REQUIRE_THROWS_AS(fanout::run(failing(), 1), std::runtime_error);
}

TEST_CASE("run with a server closes what the entry point left open", "[runtime][run]") {
    auto sub = fanout::broker::make_subscription("news", "");

    SECTION("entry returns") {
        int result = fanout::run(fanout::server_config{}, [&](fanout::server& srv) -> task<int> {
            bool registered = co_await srv.get_broker().subscribe(sub);
            co_return registered ? 1 : 0;
        }, 2);

        REQUIRE(result == 1);
        REQUIRE(sub->is_closed());
    }

    SECTION("entry throws") {
        auto entry = [&](fanout::server& srv) -> task<void> {
            co_await srv.get_broker().subscribe(sub);
            throw std::runtime_error("entry failed");
        };

        REQUIRE_THROWS_AS(fanout::run(fanout::server_config{}, entry, 2), std::runtime_error);
        REQUIRE(sub->is_closed());
    }
}
