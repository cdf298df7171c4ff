#pragma once

#include <coroutine>
#include <optional>
#include <exception>
#include <utility>

namespace fanout::runtime {
void schedule_handle(std::coroutine_handle<> handle) noexcept;
}

namespace fanout::coro {

template<typename T = void>
class task;

namespace detail {

/// State shared by every promise type: the captured exception and
/// whether the owning task object has let go of the frame.
struct promise_base {
    std::coroutine_handle<> continuation_;
    std::exception_ptr exception_;
    bool detached_ = false;

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    void rethrow_if_failed() const {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
    }
};

struct final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
        auto continuation = h.promise().continuation_;
        if (continuation) {
            return continuation;
        }
        if (h.promise().detached_) {
            // Detached task with no continuation - self-destruct
            h.destroy();
        }
        // Owned task with no continuation stays suspended for its owner
        return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
};

} // namespace detail

/// Lazily started coroutine returning T.
///
/// A task does nothing until it is awaited, handed to the scheduler with
/// go(), or resumed through its handle. Exceptions escaping the body are
/// captured and rethrown at the co_await site.
template<typename T>
class task {
public:
    struct promise_type : detail::promise_base {
        std::optional<T> value_;

        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
        [[nodiscard]] detail::final_awaiter final_suspend() noexcept { return {}; }

        template<typename U>
        void return_value(U&& value) {
            value_.emplace(std::forward<U>(value));
        }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { if (handle_) handle_.destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    /// Fire-and-forget on the current scheduler; the frame frees itself
    void go() {
        runtime::schedule_handle(release());
    }

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    T await_resume() {
        auto& promise = handle_.promise();
        promise.rethrow_if_failed();
        return std::move(*promise.value_);
    }

private:
    handle_type handle_;
};

/// Specialization for task<void>
template<>
class task<void> {
public:
    struct promise_type : detail::promise_base {
        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
        [[nodiscard]] detail::final_awaiter final_suspend() noexcept { return {}; }

        void return_void() noexcept {}
    };

    using handle_type = std::coroutine_handle<promise_type>;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { if (handle_) handle_.destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    /// Fire-and-forget on the current scheduler; the frame frees itself
    void go() {
        runtime::schedule_handle(release());
    }

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    void await_resume() {
        handle_.promise().rethrow_if_failed();
    }

private:
    handle_type handle_;
};

} // namespace fanout::coro
