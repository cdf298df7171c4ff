#include <catch2/catch.hpp>
#include <fanout/broker/memory_repository.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace fanout;
using broker::event_cursor;
using broker::memory_repository;

namespace {

std::vector<std::string> collect_ids(event_cursor& cursor) {
    std::vector<std::string> ids;
    while (auto evt = cursor.next()) {
        ids.push_back(evt->id);
    }
    return ids;
}

} // namespace

TEST_CASE("memory repository replay", "[repository]") {
    memory_repository repo;
    for (int i = 1; i <= 4; ++i) {
        repo.append("news", sse::event::with_id(std::to_string(i), "n"));
    }
    repo.append("sports", sse::event::with_id("s1", "goal"));

    SECTION("empty cursor replays everything") {
        auto cursor = repo.replay("news", "");
        REQUIRE(collect_ids(*cursor) == std::vector<std::string>{"1", "2", "3", "4"});
    }

    SECTION("known cursor replays what follows it") {
        auto cursor = repo.replay("news", "2");
        REQUIRE(collect_ids(*cursor) == std::vector<std::string>{"3", "4"});
    }

    SECTION("unknown cursor falls back to the full history") {
        auto cursor = repo.replay("news", "99");
        REQUIRE(collect_ids(*cursor).size() == 4);
    }

    SECTION("channels are independent") {
        auto cursor = repo.replay("sports", "");
        REQUIRE(collect_ids(*cursor) == std::vector<std::string>{"s1"});
        REQUIRE(repo.size("news") == 4);
        REQUIRE(repo.size("sports") == 1);
    }

    SECTION("unknown channel is empty") {
        auto cursor = repo.replay("weather", "");
        REQUIRE_FALSE(cursor->next().has_value());
        REQUIRE(repo.size("weather") == 0);
    }

    SECTION("cursor is a snapshot") {
        auto cursor = repo.replay("news", "3");
        repo.append("news", sse::event::with_id("5", "late"));
        REQUIRE(collect_ids(*cursor) == std::vector<std::string>{"4"});
    }

    SECTION("cursor stays exhausted") {
        auto cursor = repo.replay("news", "4");
        REQUIRE_FALSE(cursor->next().has_value());
        REQUIRE_FALSE(cursor->next().has_value());
    }
}

TEST_CASE("memory repository retention", "[repository]") {
    memory_repository repo(3);
    for (int i = 1; i <= 5; ++i) {
        repo.append("news", sse::event::with_id(std::to_string(i), "n"));
    }

    REQUIRE(repo.size("news") == 3);
    auto cursor = repo.replay("news", "");
    REQUIRE(collect_ids(*cursor) == std::vector<std::string>{"3", "4", "5"});

    // An id that fell out of retention replays what is left
    auto stale = repo.replay("news", "1");
    REQUIRE(collect_ids(*stale) == std::vector<std::string>{"3", "4", "5"});
}

TEST_CASE("memory repository skips comments", "[repository]") {
    memory_repository repo;
    repo.append("news", sse::event::comment("heartbeat"));
    repo.append("news", sse::event::message("real"));

    REQUIRE(repo.size("news") == 1);
}

TEST_CASE("memory repository concurrent appends", "[repository]") {
    memory_repository repo;
    std::vector<std::thread> threads;
    const int num_threads = 4;
    const int per_thread = 250;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&repo, t, per_thread]() {
            for (int i = 0; i < per_thread; ++i) {
                repo.append("news", sse::event::with_id(std::to_string(t * per_thread + i), "x"));
                if (i % 50 == 0) {
                    auto cursor = repo.replay("news", "");
                    while (cursor->next()) {}
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(repo.size("news") == static_cast<size_t>(num_threads * per_thread));
}
