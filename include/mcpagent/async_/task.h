#pragma once

/// @file Lazy coroutine Task<T> used for every remote engine call.

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace mcpagent::async_ {

template <typename T>
class Task;

namespace detail {

// Promise state common to Task<T> and Task<void>: the awaiting coroutine
// and a captured exception. Tasks start suspended and hand control back to
// their awaiter on completion (symmetric transfer).
class PromiseBase {
public:
    std::suspend_always initial_suspend() noexcept { return {}; }

    struct FinalAwaiter {
        bool await_ready() const noexcept { return false; }

        template <typename Promise>
        std::coroutine_handle<> await_suspend(
            std::coroutine_handle<Promise> h) noexcept {
            auto continuation =
                static_cast<PromiseBase&>(h.promise()).continuation_;
            if (continuation) {
                return continuation;
            }
            return std::noop_coroutine();
        }

        void await_resume() noexcept {}
    };

    FinalAwaiter final_suspend() noexcept { return {}; }

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    void set_continuation(std::coroutine_handle<> h) noexcept {
        continuation_ = h;
    }

    void rethrow_if_failed() const {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
    }

private:
    std::coroutine_handle<> continuation_;
    std::exception_ptr exception_;
};

template <typename T>
class ValuePromise : public PromiseBase {
public:
    void return_value(T value) noexcept(
        std::is_nothrow_move_constructible_v<T>) {
        value_.emplace(std::move(value));
    }

    T take() {
        rethrow_if_failed();
        return std::move(*value_);
    }

private:
    std::optional<T> value_;
};

class VoidPromise : public PromiseBase {
public:
    void return_void() noexcept {}

    void take() { rethrow_if_failed(); }
};

template <typename T>
using promise_base_for =
    std::conditional_t<std::is_void_v<T>, VoidPromise, ValuePromise<T>>;

}  // namespace detail

/// Lazy coroutine task. Nothing runs until the task is awaited.
/// Move-only; awaiting it yields the result or rethrows the failure.
template <typename T>
class Task {
public:
    struct promise_type : detail::promise_base_for<T> {
        Task get_return_object() noexcept {
            return Task{
                std::coroutine_handle<promise_type>::from_promise(*this)};
        }
    };

    Task() noexcept = default;

    explicit Task(std::coroutine_handle<promise_type> h) noexcept
        : handle_(h) {}

    ~Task() { reset(); }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    Task(Task&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            reset();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    bool await_ready() const noexcept { return false; }

    std::coroutine_handle<> await_suspend(
        std::coroutine_handle<> awaiting) noexcept {
        handle_.promise().set_continuation(awaiting);
        return handle_;
    }

    T await_resume() { return handle_.promise().take(); }

    /// Whether the task owns a coroutine.
    explicit operator bool() const noexcept { return handle_ != nullptr; }

    /// Whether the coroutine has run to completion.
    bool done() const noexcept { return handle_ && handle_.done(); }

private:
    void reset() noexcept {
        if (handle_) {
            handle_.destroy();
            handle_ = nullptr;
        }
    }

    std::coroutine_handle<promise_type> handle_{nullptr};
};

/// Trait detecting Task<R> return types.
template <typename T>
struct is_task : std::false_type {};

template <typename R>
struct is_task<Task<R>> : std::true_type {
    using value_type = R;
};

template <typename T>
inline constexpr bool is_task_v = is_task<std::remove_cvref_t<T>>::value;

/// Result type of awaiting F(Args...): R for Task<R>, otherwise the plain
/// return type.
template <typename F, typename... Args>
struct awaited_result {
    using type = std::invoke_result_t<F, Args...>;
};

template <typename F, typename... Args>
    requires is_task_v<std::invoke_result_t<F, Args...>>
struct awaited_result<F, Args...> {
    using type = typename is_task<
        std::remove_cvref_t<std::invoke_result_t<F, Args...>>>::value_type;
};

template <typename F, typename... Args>
using awaited_result_t = typename awaited_result<F, Args...>::type;

}  // namespace mcpagent::async_
