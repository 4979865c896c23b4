#pragma once

/// @file Activity definition: a function tagged so the engine can invoke it
/// remotely by name.

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <mcpagent/async_/task.h>

namespace mcpagent::activities {

/// A named, remotely invocable unit of work.
///
/// Wrapping examples:
///   // Plain function
///   auto def = ActivityDefinition::create("add", &add);
///   // Coroutine lambda
///   auto def = ActivityDefinition::create(
///       "double", [](int x) -> Task<int> { co_return x * 2; });
///
/// Arguments and results cross the engine boundary as JSON, so every
/// parameter type must be constructible from nlohmann::json and the result
/// type convertible to it. Generic lambdas are not supported because their
/// parameter types cannot be deduced.
class ActivityDefinition {
public:
    using Executor =
        std::function<async_::Task<nlohmann::json>(std::vector<nlohmann::json>)>;

    ActivityDefinition(std::string name, std::size_t parameter_count,
                       bool is_async, Executor executor)
        : name_(std::move(name)),
          parameter_count_(parameter_count),
          is_async_(is_async),
          executor_(std::move(executor)) {}

    /// Create from any non-generic callable (function pointer, lambda,
    /// functor). The callable may return a value, void, or Task<R>.
    template <typename Callable>
    static std::shared_ptr<ActivityDefinition> create(std::string name,
                                                      Callable&& callable) {
        std::function fn{std::forward<Callable>(callable)};
        return from_function(std::move(name), std::move(fn));
    }

    /// The activity name.
    const std::string& name() const noexcept { return name_; }

    /// Number of parameters the wrapped function takes.
    std::size_t parameter_count() const noexcept { return parameter_count_; }

    /// Whether the wrapped function is a coroutine returning Task<R>.
    bool is_async() const noexcept { return is_async_; }

    /// Execute the wrapped function locally.
    /// @throws std::invalid_argument if the argument count does not match.
    async_::Task<nlohmann::json> execute(
        std::vector<nlohmann::json> args) const {
        return executor_(std::move(args));
    }

private:
    template <typename R, typename... Args>
    static std::shared_ptr<ActivityDefinition> from_function(
        std::string name, std::function<R(Args...)> fn) {
        Executor executor = [fn = std::move(fn)](
                                std::vector<nlohmann::json> args) {
            return invoke(fn, std::move(args),
                          std::index_sequence_for<Args...>{});
        };
        return std::make_shared<ActivityDefinition>(
            std::move(name), sizeof...(Args), async_::is_task_v<R>,
            std::move(executor));
    }

    // Parameters are taken by value so they live in the coroutine frame.
    template <typename R, typename... Args, std::size_t... I>
    static async_::Task<nlohmann::json> invoke(
        std::function<R(Args...)> fn, std::vector<nlohmann::json> args,
        std::index_sequence<I...>) {
        if (args.size() != sizeof...(Args)) {
            throw std::invalid_argument(
                "Activity expects " + std::to_string(sizeof...(Args)) +
                " argument(s), got " + std::to_string(args.size()));
        }
        std::tuple<std::decay_t<Args>...> typed{
            args[I].template get<std::decay_t<Args>>()...};
        if constexpr (async_::is_task_v<R>) {
            using Value = typename async_::is_task<R>::value_type;
            if constexpr (std::is_void_v<Value>) {
                co_await std::apply(fn, std::move(typed));
                co_return nlohmann::json{};
            } else {
                co_return nlohmann::json(
                    co_await std::apply(fn, std::move(typed)));
            }
        } else if constexpr (std::is_void_v<R>) {
            std::apply(fn, std::move(typed));
            co_return nlohmann::json{};
        } else {
            co_return nlohmann::json(std::apply(fn, std::move(typed)));
        }
    }

    std::string name_;
    std::size_t parameter_count_;
    bool is_async_;
    Executor executor_;
};

}  // namespace mcpagent::activities
