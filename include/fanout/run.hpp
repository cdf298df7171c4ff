#pragma once

/// @file run.hpp
/// @brief Blocking entry points: run a task, or a whole server, on a fresh scheduler
///
/// @code
/// int main() {
///     return fanout::run(fanout::server_config{}, [](fanout::server& srv) -> coro::task<int> {
///         auto events = srv.handler("ticks");
///         ...
///         co_return 0;
///     });
/// }
/// @endcode

#include <fanout/coro/task.hpp>
#include <fanout/runtime/scheduler.hpp>
#include <fanout/server.hpp>

#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

namespace fanout {

namespace detail {

template<typename Task>
struct task_result;

template<typename T>
struct task_result<coro::task<T>> {
    using type = T;
};

/// Result of a task that a plain thread is blocked on
template<typename T>
class outcome {
public:
    using value_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    void set_value(value_type value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_.emplace(std::move(value));
        done_ = true;
        cv_.notify_all();
    }

    void set_error(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = std::move(error);
        done_ = true;
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
    }

    /// The task's value, or what it threw. Call after wait().
    T get() {
        if (error_) {
            std::rethrow_exception(error_);
        }
        if constexpr (std::is_void_v<T>) {
            return;
        } else {
            return std::move(*value_);
        }
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    std::optional<value_type> value_;
    std::exception_ptr error_;
};

template<typename T>
coro::task<void> complete(coro::task<T> inner, outcome<T>& out) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(inner);
            out.set_value({});
        } else {
            out.set_value(co_await std::move(inner));
        }
    } catch (...) {
        // Rethrown by outcome::get() on the blocked thread
        out.set_error(std::current_exception());
    }
}

/// Start t on sched and block until it finishes
template<typename T>
void wait_on(runtime::scheduler& sched, coro::task<T> t, outcome<T>& out) {
    auto wrapper = complete(std::move(t), out);
    sched.spawn(wrapper.release());
    out.wait();
}

inline coro::task<void> stopped(server& srv) {
    co_await srv.wait_stopped();
}

inline size_t worker_count(size_t requested) {
    if (requested == 0) {
        requested = std::thread::hardware_concurrency();
    }
    return requested == 0 ? 1 : requested;
}

} // namespace detail

/// Run a task to completion on a fresh scheduler and return its result.
/// @param num_threads Worker threads (0 = hardware concurrency)
template<typename T>
T run(coro::task<T> task, size_t num_threads = 0) {
    runtime::scheduler sched(detail::worker_count(num_threads));
    sched.start();

    detail::outcome<T> out;
    detail::wait_on(sched, std::move(task), out);
    sched.shutdown();
    return out.get();
}

/// Run entry(srv) with a server bound to a fresh scheduler.
///
/// However entry ends, returning or throwing, the server is shut down and its
/// stop awaited while the workers are still up, so every subscription is
/// closed and every parked handler has been woken before run() returns.
/// Returns entry's result or rethrows its exception.
template<typename F>
auto run(server_config config, F&& entry, size_t num_threads = 0)
    -> typename detail::task_result<std::invoke_result_t<F&, server&>>::type {
    using T = typename detail::task_result<std::invoke_result_t<F&, server&>>::type;

    runtime::scheduler sched(detail::worker_count(num_threads));
    sched.start();
    server srv(config);

    detail::outcome<T> out;
    detail::wait_on(sched, std::invoke(entry, srv), out);

    srv.shutdown();
    detail::outcome<void> stop;
    detail::wait_on(sched, detail::stopped(srv), stop);
    sched.shutdown();

    return out.get();
}

} // namespace fanout
