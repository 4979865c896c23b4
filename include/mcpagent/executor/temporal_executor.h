#pragma once

/// @file temporal_executor.h
/// @brief TemporalExecutor - forwards workflow and activity execution to the
/// workflow engine client.

#include <mcpagent/activities/activity.h>
#include <mcpagent/app/context.h>
#include <mcpagent/async_/task.h>
#include <mcpagent/common/logging.h>
#include <mcpagent/config/settings.h>
#include <mcpagent/engine/workflow_client.h>
#include <mcpagent/workflows/activity_options.h>

#include <chrono>
#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpagent::executor {

/// Options for creating a TemporalExecutor.
struct TemporalExecutorOptions {
    /// Engine configuration. Falls back to the context's "temporal" settings,
    /// then to defaults.
    std::optional<config::TemporalExecutorConfig> config{};

    /// Already-connected client. If null, ensure_client() uses `connector`.
    std::shared_ptr<engine::WorkflowClient> client{};

    /// Creates a client on first use when `client` is null.
    engine::ClientConnector connector{};

    /// Logging options. Falls back to the context's logger settings.
    std::optional<common::LoggingOptions> logging{};
};

/// Per-call options for start_workflow / execute_workflow.
struct WorkflowStartOptions {
    /// Workflow ID. Generated as "<type>-<uuid4>" when not set.
    std::optional<std::string> workflow_id{};

    /// Task queue. The configured task queue is used when not set.
    std::optional<std::string> task_queue{};

    /// Limit on the whole execution, retries and continue-as-new included.
    /// Unlimited when not set.
    std::optional<std::chrono::milliseconds> execution_timeout{};

    /// Idempotency key; the engine deduplicates starts sharing it.
    std::optional<std::string> request_id{};

    /// Wait for the workflow to complete before returning.
    bool wait_for_result{false};
};

/// What start_workflow returns: the handle, plus the result when the call
/// waited for it.
struct StartedWorkflow {
    std::shared_ptr<engine::WorkflowHandle> handle{};
    std::optional<nlohmann::json> result{};
};

/// Outcome of one task run by execute_many.
struct TaskOutcome {
    std::optional<nlohmann::json> value{};
    std::exception_ptr error{};

    bool ok() const noexcept { return error == nullptr; }
};

/// Pack positional workflow arguments into the engine's single input:
/// nothing for zero arguments, the value itself for one, and a JSON array in
/// order for more.
std::optional<nlohmann::json> pack_workflow_args(
    std::vector<nlohmann::json> args);

/// Adapter from local, function-call-shaped execution to the workflow
/// engine. Holds no state besides the shared client and context; engine
/// errors propagate unchanged.
///
/// Thread-safe to share once ensure_client() has completed.
class TemporalExecutor {
public:
    /// @throws std::invalid_argument if context is null.
    explicit TemporalExecutor(std::shared_ptr<app::Context> context,
                              TemporalExecutorOptions options = {});

    // Non-copyable
    TemporalExecutor(const TemporalExecutor&) = delete;
    TemporalExecutor& operator=(const TemporalExecutor&) = delete;

    /// The engine configuration in effect.
    const config::TemporalExecutorConfig& config() const noexcept {
        return config_;
    }

    /// The client, or nullptr before ensure_client() connected one.
    const std::shared_ptr<engine::WorkflowClient>& client() const noexcept {
        return client_;
    }

    const std::shared_ptr<app::Context>& context() const noexcept {
        return context_;
    }

    /// Return the client, connecting through the connector on first use.
    /// @throws exceptions::NotConnectedException without client or connector.
    async_::Task<std::shared_ptr<engine::WorkflowClient>> ensure_client();

    /// Tag `func` as an activity named `name`. Nothing is executed.
    template <typename F>
    std::shared_ptr<activities::ActivityDefinition> wrap_as_activity(
        std::string name, F&& func) const {
        return activities::ActivityDefinition::create(std::move(name),
                                                      std::forward<F>(func));
    }

    /// Invoke `func(args...)`: coroutine functions (returning Task<R>) are
    /// awaited, other functions are called inline.
    template <typename F, typename... Args>
        requires std::invocable<F, Args...>
    async_::Task<async_::awaited_result_t<F, Args...>> execute_task_as_async(
        F func, Args... args) {
        using Invoked = std::invoke_result_t<F, Args...>;
        using Result = async_::awaited_result_t<F, Args...>;
        if constexpr (async_::is_task_v<Invoked> && std::is_void_v<Result>) {
            co_await std::invoke(std::move(func), std::move(args)...);
            co_return;
        } else if constexpr (async_::is_task_v<Invoked>) {
            co_return co_await std::invoke(std::move(func),
                                           std::move(args)...);
        } else if constexpr (std::is_void_v<Invoked>) {
            std::invoke(std::move(func), std::move(args)...);
            co_return;
        } else {
            co_return std::invoke(std::move(func), std::move(args)...);
        }
    }

    /// Execute a plain callable. It has no activity name, so it runs locally
    /// whether or not a workflow is executing.
    template <typename F, typename... Args>
        requires std::invocable<F, Args...>
    async_::Task<async_::awaited_result_t<F, Args...>> execute_task(
        F func, Args... args) {
        return execute_task_as_async(std::move(func), std::move(args)...);
    }

    /// Execute a registered activity by name. Outside a workflow the
    /// activity runs locally; inside one it is scheduled through the engine
    /// with the configured task queue, timeout and retry policy.
    /// @throws exceptions::ActivityNotFoundException for unknown names.
    async_::Task<nlohmann::json> execute_task(
        std::string activity_name, std::vector<nlohmann::json> args = {});

    /// Run each task in order, collecting every result or exception.
    async_::Task<std::vector<TaskOutcome>> execute_many(
        std::vector<std::function<async_::Task<nlohmann::json>()>> tasks);

    /// Activity options derived from configuration.
    workflows::ActivityOptions activity_options() const;

    /// Start a registered workflow.
    /// @throws exceptions::WorkflowNotFoundException for unknown names.
    async_::Task<StartedWorkflow> start_workflow(
        std::string workflow_type,
        std::vector<nlohmann::json> args = {},
        WorkflowStartOptions options = {});

    /// Start a registered workflow and wait for its result.
    async_::Task<nlohmann::json> execute_workflow(
        std::string workflow_type,
        std::vector<nlohmann::json> args = {},
        WorkflowStartOptions options = {});

    /// Terminate a workflow run.
    async_::Task<void> terminate_workflow(
        std::string workflow_id,
        std::optional<std::string> run_id = std::nullopt,
        std::string reason = "Workflow terminated");

    /// Request cancellation of a workflow run.
    async_::Task<void> cancel_workflow(
        std::string workflow_id,
        std::optional<std::string> run_id = std::nullopt);

    /// Send a signal to a workflow run. A request_id lets the engine drop
    /// duplicate deliveries of the same signal.
    async_::Task<void> signal_workflow(
        std::string workflow_id,
        std::string signal_name,
        nlohmann::json payload = {},
        std::optional<std::string> run_id = std::nullopt,
        std::optional<std::string> request_id = std::nullopt);

private:
    std::shared_ptr<app::Context> context_;
    config::TemporalExecutorConfig config_;
    std::shared_ptr<engine::WorkflowClient> client_;
    engine::ClientConnector connector_;
    common::Logger logger_;
};

}  // namespace mcpagent::executor
