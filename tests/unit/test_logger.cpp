#include <catch2/catch.hpp>
#include <fanout/log/logger.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "../test_main.cpp"

using namespace fanout::log;
using fanout::test::log_capture;

TEST_CASE("Logger singleton", "[logger]") {
    auto& logger1 = logger::instance();
    auto& logger2 = logger::instance();

    REQUIRE(&logger1 == &logger2);
}

TEST_CASE("Log level filtering", "[logger]") {
    log_capture logs;
    auto& log = logger::instance();

    log.set_level(level::warning);
    REQUIRE(log.get_level() == level::warning);

    FANOUT_LOG_INFO("filtered {}", 1);
    FANOUT_LOG_WARNING("kept {}", 2);
    FANOUT_LOG_ERROR("kept {}", 3);
    FANOUT_LOG(level::debug, "filtered {}", 4);
    FANOUT_LOG(level::error, "explicit {}", 5);

    REQUIRE(logs.count(level::info) == 0);
    REQUIRE(logs.count(level::debug) == 0);
    REQUIRE(logs.contains(level::warning, "kept 2"));
    REQUIRE(logs.contains(level::error, "kept 3"));
    REQUIRE(logs.contains(level::error, "explicit 5"));

    log.set_level(level::info);
    REQUIRE(log.get_level() == level::info);
}

TEST_CASE("Log level conversion", "[logger]") {
    REQUIRE(std::string(level_to_string(level::debug)) == "DEBUG");
    REQUIRE(std::string(level_to_string(level::info)) == "INFO");
    REQUIRE(std::string(level_to_string(level::warning)) == "WARN");
    REQUIRE(std::string(level_to_string(level::error)) == "ERROR");
}

TEST_CASE("Log sink receives location and message", "[logger]") {
    std::string file;
    int line = 0;
    std::string message;

    logger::instance().set_sink([&](level, std::string_view f, int l, std::string_view m) {
        file = std::string(f);
        line = l;
        message = std::string(m);
    });
    FANOUT_LOG_INFO("subscribers on '{}': {}", "news", 3);
    logger::instance().set_sink({});

    REQUIRE(file.find("test_logger.cpp") != std::string::npos);
    REQUIRE(line > 0);
    REQUIRE(message == "subscribers on 'news': 3");
}

TEST_CASE("Concurrent logging", "[logger]") {
    std::atomic<int> received{0};
    logger::instance().set_sink([&](level, std::string_view, int, std::string_view) {
        ++received;
    });

    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                FANOUT_LOG_INFO("Thread {} log {}", i, j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }
    logger::instance().set_sink({});

    REQUIRE(received == num_threads * logs_per_thread);
}
