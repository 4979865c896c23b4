#pragma once

/// @file run_sync.h
/// @brief Blocking driver for lazy Task<T> coroutines.
///
/// run_task_sync() starts a task on the calling thread and blocks until it
/// finishes. The task may suspend on work completed by another thread (an
/// engine client callback, for instance); the caller waits on a condition
/// variable that the driver coroutine signals from its final suspend point.

#include <mcpagent/async_/task.h>

#include <condition_variable>
#include <coroutine>
#include <exception>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace mcpagent::async_ {

namespace detail {

struct CompletionSignal {
    std::mutex mtx;
    std::condition_variable cv;
    bool done{false};

    void notify() {
        std::lock_guard lock(mtx);
        done = true;
        cv.notify_one();
    }

    void wait() {
        std::unique_lock lock(mtx);
        cv.wait(lock, [this] { return done; });
    }
};

template <typename T>
struct DriverResult {
    std::optional<T> value;
    void return_value(T v) { value.emplace(std::move(v)); }
    T take() { return std::move(*value); }
};

template <>
struct DriverResult<void> {
    void return_void() noexcept {}
    void take() noexcept {}
};

/// Coroutine that awaits the inner task and signals completion. It is its
/// own root, so its final suspend does not resume anyone.
template <typename T>
class Driver {
public:
    struct promise_type : DriverResult<T> {
        CompletionSignal signal;
        std::exception_ptr exception;

        Driver get_return_object() {
            return Driver{
                std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        struct FinalAwaiter {
            bool await_ready() const noexcept { return false; }
            void await_suspend(
                std::coroutine_handle<promise_type> h) noexcept {
                h.promise().signal.notify();
            }
            void await_resume() noexcept {}
        };

        FinalAwaiter final_suspend() noexcept { return {}; }

        void unhandled_exception() { exception = std::current_exception(); }
    };

    explicit Driver(std::coroutine_handle<promise_type> h) : handle_(h) {}

    ~Driver() {
        if (handle_) handle_.destroy();
    }

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    T run() {
        auto& promise = handle_.promise();
        handle_.resume();
        promise.signal.wait();
        if (promise.exception) {
            std::rethrow_exception(promise.exception);
        }
        return promise.take();
    }

private:
    std::coroutine_handle<promise_type> handle_;
};

template <typename T>
Driver<T> drive(Task<T> task) {
    if constexpr (std::is_void_v<T>) {
        co_await std::move(task);
    } else {
        co_return co_await std::move(task);
    }
}

}  // namespace detail

/// Run a lazy Task<T> to completion, blocking the current thread.
/// Rethrows whatever the task threw.
template <typename T>
T run_task_sync(Task<T> task) {
    auto driver = detail::drive<T>(std::move(task));
    return driver.run();
}

}  // namespace mcpagent::async_
