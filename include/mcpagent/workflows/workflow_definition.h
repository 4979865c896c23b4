#pragma once

/// @file Workflow definition builder and registration type.

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <mcpagent/async_/task.h>

namespace mcpagent::workflows {

/// Definition of a workflow type: its registered name and run function.
///
/// Created via the builder API:
///   auto def = WorkflowDefinition::create<MyWorkflow>("MyWorkflow")
///       .run(&MyWorkflow::run)
///       .build();
///
/// The engine carries a workflow's input as a single payload. A run function
/// with one parameter receives that payload; with several parameters the
/// payload is a JSON array holding them in order.
class WorkflowDefinition {
public:
    using RunFunc = std::function<async_::Task<nlohmann::json>(
        void*, std::vector<nlohmann::json>)>;

    template <typename T>
    class Builder;

    /// Start building a definition for workflow type T with the given name.
    template <typename T>
    static Builder<T> create(const std::string& name);

    /// The workflow type name.
    const std::string& name() const noexcept { return name_; }

    /// Optional human-readable description.
    const std::string& description() const noexcept { return description_; }

    /// Number of parameters the run function takes.
    std::size_t parameter_count() const noexcept { return parameter_count_; }

    /// Factory to create a new workflow instance.
    std::shared_ptr<void> create_instance() const {
        return factory_ ? factory_() : nullptr;
    }

    /// Split a single engine input payload into run arguments.
    /// @throws std::invalid_argument if the payload does not fit the run
    /// function's parameter count.
    std::vector<nlohmann::json> unpack_input(
        const std::optional<nlohmann::json>& input) const;

    /// Create an instance and run it with the given engine input.
    /// @throws std::logic_error if the factory returns no instance.
    async_::Task<nlohmann::json> execute(
        std::optional<nlohmann::json> input) const;

private:
    WorkflowDefinition() = default;

    static async_::Task<nlohmann::json> run_instance(
        RunFunc run, std::shared_ptr<void> instance,
        std::vector<nlohmann::json> args);

    std::string name_;
    std::string description_;
    std::size_t parameter_count_{0};
    std::function<std::shared_ptr<void>()> factory_;
    RunFunc run_func_;
};

/// Builder for constructing a WorkflowDefinition from a user's workflow class.
template <typename T>
class WorkflowDefinition::Builder {
public:
    explicit Builder(const std::string& name) {
        def_.name_ = name;
        // Types without a default constructor must supply factory().
        if constexpr (std::is_default_constructible_v<T>) {
            def_.factory_ = []() -> std::shared_ptr<void> {
                return std::shared_ptr<void>(
                    new T(), [](void* p) { delete static_cast<T*>(p); });
            };
        }
    }

    /// Set the run method (member function returning Task<R>). Parameters
    /// must be constructible from nlohmann::json.
    template <typename R, typename... Args>
    Builder& run(async_::Task<R> (T::*method)(Args...)) {
        def_.parameter_count_ = sizeof...(Args);
        def_.run_func_ = [method](void* instance,
                                  std::vector<nlohmann::json> args) {
            return call(method, static_cast<T*>(instance), std::move(args),
                        std::index_sequence_for<Args...>{});
        };
        return *this;
    }

    /// Set the description.
    Builder& description(std::string text) {
        def_.description_ = std::move(text);
        return *this;
    }

    /// Set a custom factory function.
    Builder& factory(std::function<std::shared_ptr<void>()> f) {
        def_.factory_ = std::move(f);
        return *this;
    }

    /// Build and return the final WorkflowDefinition.
    /// @throws std::logic_error if build() has already been called, no run
    /// function was set, or T is not default constructible and no factory
    /// was set.
    std::shared_ptr<WorkflowDefinition> build() {
        if (built_) {
            throw std::logic_error(
                "WorkflowDefinition::Builder::build() called more than once");
        }
        if (!def_.run_func_) {
            throw std::logic_error(
                "WorkflowDefinition::Builder::build() called without setting "
                "a run function");
        }
        if (!def_.factory_) {
            throw std::logic_error(
                "WorkflowDefinition::Builder::build() called without a "
                "factory for '" + def_.name_ +
                "', which has no default constructor");
        }
        built_ = true;
        // WorkflowDefinition's constructor is private; make_shared cannot
        // reach it.
        return std::shared_ptr<WorkflowDefinition>(
            new WorkflowDefinition(std::move(def_)));
    }

private:
    template <typename R, typename... Args, std::size_t... I>
    static async_::Task<nlohmann::json> call(
        async_::Task<R> (T::*method)(Args...), T* self,
        std::vector<nlohmann::json> args, std::index_sequence<I...>) {
        std::tuple<std::decay_t<Args>...> typed{
            args.at(I).template get<std::decay_t<Args>>()...};
        if constexpr (std::is_void_v<R>) {
            co_await std::apply(
                [&](auto&&... a) {
                    return (self->*method)(std::forward<decltype(a)>(a)...);
                },
                std::move(typed));
            co_return nlohmann::json{};
        } else {
            co_return nlohmann::json(co_await std::apply(
                [&](auto&&... a) {
                    return (self->*method)(std::forward<decltype(a)>(a)...);
                },
                std::move(typed)));
        }
    }

    WorkflowDefinition def_;
    bool built_{false};
};

template <typename T>
WorkflowDefinition::Builder<T> WorkflowDefinition::create(
    const std::string& name) {
    return Builder<T>(name);
}

}  // namespace mcpagent::workflows
