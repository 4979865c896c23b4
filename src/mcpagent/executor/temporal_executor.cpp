#include <mcpagent/executor/temporal_executor.h>
#include <mcpagent/executor/workflow_id.h>

#include <mcpagent/exceptions/executor_exception.h>
#include <mcpagent/workflows/workflow.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace mcpagent::executor {

namespace {

config::TemporalExecutorConfig resolve_config(
    const app::Context& context,
    const std::optional<config::TemporalExecutorConfig>& explicit_config) {
    if (explicit_config) {
        return *explicit_config;
    }
    if (context.config.temporal) {
        return *context.config.temporal;
    }
    return {};
}

std::shared_ptr<app::Context> require_context(
    std::shared_ptr<app::Context> context) {
    if (!context) {
        throw std::invalid_argument("TemporalExecutor requires a context");
    }
    return context;
}

}  // namespace

std::optional<nlohmann::json> pack_workflow_args(
    std::vector<nlohmann::json> args) {
    if (args.empty()) {
        return std::nullopt;
    }
    if (args.size() == 1) {
        return std::move(args.front());
    }
    auto packed = nlohmann::json::array();
    for (auto& arg : args) {
        packed.push_back(std::move(arg));
    }
    return packed;
}

// ── TemporalExecutor ────────────────────────────────────────────────────────

TemporalExecutor::TemporalExecutor(std::shared_ptr<app::Context> context,
                                   TemporalExecutorOptions options)
    : context_(require_context(std::move(context))),
      config_(resolve_config(*context_, options.config)),
      client_(std::move(options.client)),
      connector_(std::move(options.connector)),
      logger_("mcpagent.executor.temporal",
              options.logging ? std::move(*options.logging)
                              : context_->config.logging_options()) {}

async_::Task<std::shared_ptr<engine::WorkflowClient>>
TemporalExecutor::ensure_client() {
    if (client_) {
        co_return client_;
    }
    if (!connector_) {
        throw exceptions::NotConnectedException(
            "No workflow client set and no connector configured");
    }
    logger_.info("Connecting to " + config_.host + " (namespace " +
                 config_.ns + ")");
    auto client = co_await connector_(config_);
    if (!client) {
        throw exceptions::NotConnectedException(
            "Connector for " + config_.host + " returned no client");
    }
    client_ = std::move(client);
    logger_.debug("Connected to namespace " + client_->ns());
    co_return client_;
}

async_::Task<nlohmann::json> TemporalExecutor::execute_task(
    std::string activity_name, std::vector<nlohmann::json> args) {
    auto activity = context_->task_registry.get_activity(activity_name);
    if (!workflows::Workflow::in_workflow()) {
        co_return co_await activity->execute(std::move(args));
    }
    logger_.debug("Scheduling activity " + activity_name);
    co_return co_await workflows::Workflow::execute_activity(
        activity->name(), std::move(args), activity_options());
}

async_::Task<std::vector<TaskOutcome>> TemporalExecutor::execute_many(
    std::vector<std::function<async_::Task<nlohmann::json>()>> tasks) {
    std::vector<TaskOutcome> outcomes;
    outcomes.reserve(tasks.size());
    for (auto& task : tasks) {
        TaskOutcome outcome;
        try {
            outcome.value = co_await task();
        } catch (...) {
            outcome.error = std::current_exception();
        }
        outcomes.push_back(std::move(outcome));
    }
    co_return outcomes;
}

workflows::ActivityOptions TemporalExecutor::activity_options() const {
    workflows::ActivityOptions options;
    options.task_queue = config_.task_queue;
    if (config_.timeout) {
        options.schedule_to_close_timeout =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                *config_.timeout);
    }
    options.retry_policy = config_.retry_policy;
    return options;
}

async_::Task<StartedWorkflow> TemporalExecutor::start_workflow(
    std::string workflow_type,
    std::vector<nlohmann::json> args,
    WorkflowStartOptions options) {
    auto workflow = context_->workflows.get(workflow_type);
    if (!workflow) {
        throw exceptions::WorkflowNotFoundException(workflow_type);
    }
    auto client = co_await ensure_client();

    std::optional<nlohmann::json> input;
    if (workflow->parameter_count() == 0) {
        if (!args.empty()) {
            logger_.warn("Workflow " + workflow_type +
                         " takes no arguments; dropping " +
                         std::to_string(args.size()) + " supplied");
        }
    } else {
        input = pack_workflow_args(std::move(args));
    }

    engine::StartWorkflowOptions start_options;
    start_options.id = options.workflow_id
                           ? std::move(*options.workflow_id)
                           : make_workflow_id(workflow_type);
    start_options.task_queue = options.task_queue
                                   ? std::move(*options.task_queue)
                                   : config_.task_queue;
    start_options.id_reuse_policy = config_.id_reuse_policy;
    start_options.rpc_metadata = config_.rpc_metadata;
    start_options.execution_timeout = options.execution_timeout;
    start_options.request_id = std::move(options.request_id);

    logger_.info("Starting workflow " + workflow->name() + " id=" +
                 start_options.id + " task_queue=" + start_options.task_queue);

    StartedWorkflow started;
    started.handle = co_await client->start_workflow(
        workflow->name(), std::move(input), start_options);
    if (options.wait_for_result) {
        started.result = co_await started.handle->result();
    }
    co_return started;
}

async_::Task<nlohmann::json> TemporalExecutor::execute_workflow(
    std::string workflow_type,
    std::vector<nlohmann::json> args,
    WorkflowStartOptions options) {
    options.wait_for_result = true;
    auto started = co_await start_workflow(
        std::move(workflow_type), std::move(args), std::move(options));
    co_return std::move(*started.result);
}

async_::Task<void> TemporalExecutor::terminate_workflow(
    std::string workflow_id,
    std::optional<std::string> run_id,
    std::string reason) {
    auto client = co_await ensure_client();
    auto handle = client->get_workflow_handle(workflow_id, std::move(run_id));
    logger_.info("Terminating workflow " + workflow_id + ": " + reason);
    co_await handle->terminate(
        engine::TerminateWorkflowOptions{.reason = std::move(reason)});
}

async_::Task<void> TemporalExecutor::cancel_workflow(
    std::string workflow_id,
    std::optional<std::string> run_id) {
    auto client = co_await ensure_client();
    auto handle = client->get_workflow_handle(workflow_id, std::move(run_id));
    logger_.info("Cancelling workflow " + workflow_id);
    co_await handle->cancel();
}

async_::Task<void> TemporalExecutor::signal_workflow(
    std::string workflow_id,
    std::string signal_name,
    nlohmann::json payload,
    std::optional<std::string> run_id,
    std::optional<std::string> request_id) {
    auto client = co_await ensure_client();
    auto handle = client->get_workflow_handle(workflow_id, std::move(run_id));
    logger_.debug("Signaling workflow " + workflow_id + " with " +
                  signal_name);
    co_await handle->signal(
        signal_name, payload,
        engine::SignalWorkflowOptions{.request_id = std::move(request_id)});
}

}  // namespace mcpagent::executor
