#pragma once

/// @file logger.hpp
/// @brief Process-wide leveled logger and the FANOUT_LOG_* macros
///
/// Records go to stderr as "[time] [LEVEL] [file:line] message" unless an
/// embedding application installs a sink, in which case the sink gets the
/// bare message and the stderr output is skipped.

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <mutex>
#include <chrono>
#include <functional>
#include <string_view>

namespace fanout::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

/// Convert log level to string
constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

/// Receives every formatted record that passes the level filter.
/// The message is the user text only, without timestamp or location.
using sink_func = std::function<void(level, std::string_view file, int line, std::string_view message)>;

/// Singleton logger shared by the broker, handlers and replay tasks
class logger {
public:
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    /// Records below min_level are dropped before formatting
    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    /// Route records to a custom sink instead of stderr.
    /// Pass an empty function to restore the stderr output.
    void set_sink(sink_func sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (lvl < min_level_.load(std::memory_order_relaxed)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            sink_(lvl, file, line, msg);
        } else {
            write_stderr(lvl, file, line, msg);
        }
    }

private:
    logger() noexcept : min_level_(level::info) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    // Caller holds mutex_
    static void write_stderr(level lvl, const char* file, int line, std::string_view msg) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        // Cyan, green, yellow, red
        static constexpr const char* colors[] = {"\033[36m", "\033[32m", "\033[33m", "\033[31m"};

        fmt::print(stderr,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{}:{}] {}\033[0m\n",
            colors[static_cast<int>(lvl)],
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            file,
            line,
            msg
        );
    }

    std::atomic<level> min_level_;
    std::mutex mutex_;  // Serializes the sink and stderr writes
    sink_func sink_;
};

} // namespace fanout::log

/// Log at an explicit level, with the caller's file and line
#define FANOUT_LOG(lvl, fmt, ...) \
    ::fanout::log::logger::instance().log(lvl, __FILE__, __LINE__, fmt __VA_OPT__(,) __VA_ARGS__)

// Debug records cost nothing unless FANOUT_DEBUG is defined
#ifdef FANOUT_DEBUG
    #define FANOUT_LOG_DEBUG(fmt, ...) FANOUT_LOG(::fanout::log::level::debug, fmt __VA_OPT__(,) __VA_ARGS__)
#else
    #define FANOUT_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define FANOUT_LOG_INFO(fmt, ...) FANOUT_LOG(::fanout::log::level::info, fmt __VA_OPT__(,) __VA_ARGS__)
#define FANOUT_LOG_WARNING(fmt, ...) FANOUT_LOG(::fanout::log::level::warning, fmt __VA_OPT__(,) __VA_ARGS__)
#define FANOUT_LOG_ERROR(fmt, ...) FANOUT_LOG(::fanout::log::level::error, fmt __VA_OPT__(,) __VA_ARGS__)
