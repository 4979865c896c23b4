#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "fixtures/fake_workflow_client.h"
#include "mcpagent/app/context.h"
#include "mcpagent/async_/run_sync.h"
#include "mcpagent/async_/task.h"
#include "mcpagent/exceptions/executor_exception.h"
#include "mcpagent/executor/temporal_executor.h"
#include "mcpagent/workflows/workflow_definition.h"

using namespace mcpagent;
using namespace mcpagent::executor;
using mcpagent::async_::run_task_sync;
using mcpagent::async_::Task;
using mcpagent::testing::FakeWorkflowClient;
using mcpagent::testing::FakeWorkflowHandle;
using nlohmann::json;

// ===========================================================================
// Sample workflows
// ===========================================================================
namespace {

class NoArgWorkflow {
public:
    Task<std::string> run() { co_return "ok"; }
};

class OneArgWorkflow {
public:
    Task<std::string> run(std::string arg1) { co_return arg1; }
};

class TwoArgWorkflow {
public:
    Task<std::string> run(std::string param1, std::string param2) {
        co_return param1 + "-" + param2;
    }
};

config::TemporalExecutorConfig test_config() {
    config::TemporalExecutorConfig cfg;
    cfg.host = "localhost:7233";
    cfg.ns = "test-namespace";
    cfg.task_queue = "test-queue";
    cfg.timeout = std::chrono::seconds(10);
    return cfg;
}

class TemporalExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        context_ = std::make_shared<app::Context>();
        context_->config.temporal = test_config();
        context_->config.logger.level = common::LogLevel::kError;
        client_ = std::make_shared<FakeWorkflowClient>();
        executor_ = std::make_unique<TemporalExecutor>(
            context_, TemporalExecutorOptions{
                          .config = test_config(),
                          .client = client_,
                      });
    }

    template <typename W>
    void register_workflow(const std::string& name) {
        context_->workflows.add(
            workflows::WorkflowDefinition::create<W>(name)
                .run(&W::run)
                .build());
    }

    std::shared_ptr<app::Context> context_;
    std::shared_ptr<FakeWorkflowClient> client_;
    std::unique_ptr<TemporalExecutor> executor_;
};

}  // namespace

// ===========================================================================
// Construction
// ===========================================================================

TEST(TemporalExecutorConstructionTest, NullContextThrows) {
    EXPECT_THROW(TemporalExecutor executor(nullptr), std::invalid_argument);
}

TEST(TemporalExecutorConstructionTest, ConfigFallsBackToContextSettings) {
    auto context = std::make_shared<app::Context>();
    auto cfg = test_config();
    cfg.task_queue = "from-context";
    context->config.temporal = cfg;

    TemporalExecutor executor(context);
    EXPECT_EQ(executor.config().task_queue, "from-context");
    EXPECT_EQ(executor.config().ns, "test-namespace");
    EXPECT_EQ(executor.client(), nullptr);
    EXPECT_EQ(executor.context(), context);
}

TEST(TemporalExecutorConstructionTest, ConfigDefaultsWithoutSettings) {
    TemporalExecutor executor(std::make_shared<app::Context>());
    EXPECT_EQ(executor.config().host, "localhost:7233");
    EXPECT_EQ(executor.config().ns, "default");
    EXPECT_EQ(executor.config().task_queue, "mcp-agent");
}

TEST(TemporalExecutorConstructionTest, ExplicitConfigWinsOverContext) {
    auto context = std::make_shared<app::Context>();
    context->config.temporal = config::TemporalExecutorConfig{
        .task_queue = "from-context"};
    auto cfg = test_config();

    TemporalExecutor executor(context, {.config = cfg});
    EXPECT_EQ(executor.config().task_queue, "test-queue");
}

// ===========================================================================
// ensure_client
// ===========================================================================

TEST_F(TemporalExecutorTest, EnsureClientReturnsExistingClient) {
    auto client = run_task_sync(executor_->ensure_client());
    EXPECT_EQ(client, executor_->client());
    EXPECT_EQ(client.get(), client_.get());
}

TEST(TemporalExecutorConnectTest, EnsureClientConnectsOnceThroughConnector) {
    auto fake = std::make_shared<FakeWorkflowClient>();
    int connects = 0;
    std::string connected_host;
    auto connector = [&](const config::TemporalExecutorConfig& cfg)
        -> Task<std::shared_ptr<engine::WorkflowClient>> {
        ++connects;
        connected_host = cfg.host;
        co_return fake;
    };

    TemporalExecutor executor(std::make_shared<app::Context>(),
                              {.config = test_config(),
                               .connector = connector,
                               .logging = common::LoggingOptions{
                                   .level = common::LogLevel::kError}});

    auto first = run_task_sync(executor.ensure_client());
    auto second = run_task_sync(executor.ensure_client());

    EXPECT_EQ(connects, 1);
    EXPECT_EQ(connected_host, "localhost:7233");
    EXPECT_EQ(first.get(), fake.get());
    EXPECT_EQ(second.get(), fake.get());
    EXPECT_EQ(executor.client().get(), fake.get());
}

TEST(TemporalExecutorConnectTest, EnsureClientLogsConnectedNamespace) {
    auto fake = std::make_shared<FakeWorkflowClient>("tenant-a");
    auto connector = [&](const config::TemporalExecutorConfig&)
        -> Task<std::shared_ptr<engine::WorkflowClient>> { co_return fake; };
    std::vector<std::string> messages;
    common::LoggingOptions logging;
    logging.level = common::LogLevel::kDebug;
    logging.callback = [&messages](common::LogLevel, std::string_view,
                                   std::string_view message, uint64_t) {
        messages.emplace_back(message);
    };

    TemporalExecutor executor(std::make_shared<app::Context>(),
                              {.config = test_config(),
                               .connector = connector,
                               .logging = logging});
    run_task_sync(executor.ensure_client());

    EXPECT_NE(std::find(messages.begin(), messages.end(),
                        "Connected to namespace tenant-a"),
              messages.end());
}

TEST(TemporalExecutorConnectTest, EnsureClientWithoutClientOrConnectorThrows) {
    TemporalExecutor executor(std::make_shared<app::Context>());
    EXPECT_THROW(run_task_sync(executor.ensure_client()),
                 exceptions::NotConnectedException);
}

TEST(TemporalExecutorConnectTest, ConnectorReturningNullThrows) {
    auto connector = [](const config::TemporalExecutorConfig&)
        -> Task<std::shared_ptr<engine::WorkflowClient>> {
        co_return nullptr;
    };
    TemporalExecutor executor(
        std::make_shared<app::Context>(),
        {.connector = connector,
         .logging = common::LoggingOptions{.level = common::LogLevel::kError}});
    EXPECT_THROW(run_task_sync(executor.ensure_client()),
                 exceptions::NotConnectedException);
    EXPECT_EQ(executor.client(), nullptr);
}

TEST(TemporalExecutorConnectTest, ConnectorErrorPropagatesUnchanged) {
    auto connector = [](const config::TemporalExecutorConfig&)
        -> Task<std::shared_ptr<engine::WorkflowClient>> {
        throw std::runtime_error("connection refused");
        co_return nullptr;
    };
    TemporalExecutor executor(
        std::make_shared<app::Context>(),
        {.connector = connector,
         .logging = common::LoggingOptions{.level = common::LogLevel::kError}});
    try {
        run_task_sync(executor.ensure_client());
        FAIL() << "expected connection error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "connection refused");
    }
}

// ===========================================================================
// start_workflow
// ===========================================================================

TEST_F(TemporalExecutorTest, StartWorkflowCallsClientOnce) {
    register_workflow<OneArgWorkflow>("test_workflow");

    auto started = run_task_sync(
        executor_->start_workflow("test_workflow", {"arg1"}));

    ASSERT_EQ(client_->start_calls.size(), 1u);
    const auto& call = client_->start_calls[0];
    EXPECT_EQ(call.workflow_type, "test_workflow");
    ASSERT_TRUE(call.input.has_value());
    EXPECT_EQ(*call.input, json("arg1"));
    ASSERT_NE(started.handle, nullptr);
    EXPECT_FALSE(started.result.has_value());
}

TEST_F(TemporalExecutorTest, StartWorkflowWithCustomWorkflowId) {
    register_workflow<NoArgWorkflow>("test_workflow");

    run_task_sync(executor_->start_workflow(
        "test_workflow", {},
        {.workflow_id = "my-custom-workflow-id"}));

    ASSERT_EQ(client_->start_calls.size(), 1u);
    EXPECT_EQ(client_->start_calls[0].options.id, "my-custom-workflow-id");
}

TEST_F(TemporalExecutorTest, StartWorkflowGeneratesIdFromType) {
    register_workflow<NoArgWorkflow>("test_workflow");

    run_task_sync(executor_->start_workflow("test_workflow"));
    run_task_sync(executor_->start_workflow("test_workflow"));

    ASSERT_EQ(client_->start_calls.size(), 2u);
    const auto& first = client_->start_calls[0].options.id;
    const auto& second = client_->start_calls[1].options.id;
    EXPECT_EQ(first.rfind("test_workflow-", 0), 0u);
    EXPECT_EQ(first.size(), std::string("test_workflow-").size() + 36);
    EXPECT_NE(first, second);
}

TEST_F(TemporalExecutorTest, StartWorkflowWithCustomTaskQueue) {
    register_workflow<NoArgWorkflow>("test_workflow");

    run_task_sync(executor_->start_workflow(
        "test_workflow", {}, {.task_queue = "my-custom-task-queue"}));

    ASSERT_EQ(client_->start_calls.size(), 1u);
    EXPECT_EQ(client_->start_calls[0].options.task_queue,
              "my-custom-task-queue");
}

TEST_F(TemporalExecutorTest, StartWorkflowDefaultsToConfiguredTaskQueue) {
    register_workflow<NoArgWorkflow>("test_workflow");

    run_task_sync(executor_->start_workflow("test_workflow"));

    ASSERT_EQ(client_->start_calls.size(), 1u);
    EXPECT_EQ(client_->start_calls[0].options.task_queue, "test-queue");
}

TEST_F(TemporalExecutorTest, StartWorkflowWithBothCustomParams) {
    register_workflow<TwoArgWorkflow>("test_workflow");

    run_task_sync(executor_->start_workflow(
        "test_workflow", {"value1", "value2"},
        {.workflow_id = "my-custom-workflow-id",
         .task_queue = "my-custom-task-queue"}));

    ASSERT_EQ(client_->start_calls.size(), 1u);
    const auto& call = client_->start_calls[0];
    EXPECT_EQ(call.options.id, "my-custom-workflow-id");
    EXPECT_EQ(call.options.task_queue, "my-custom-task-queue");
    // Several arguments travel as one ordered array.
    ASSERT_TRUE(call.input.has_value());
    EXPECT_EQ(*call.input, json::array({"value1", "value2"}));
}

TEST_F(TemporalExecutorTest, StartWorkflowForwardsTimeoutAndRequestId) {
    register_workflow<NoArgWorkflow>("test_workflow");

    run_task_sync(executor_->start_workflow(
        "test_workflow", {},
        {.execution_timeout = std::chrono::minutes(5),
         .request_id = "req-123"}));

    ASSERT_EQ(client_->start_calls.size(), 1u);
    const auto& options = client_->start_calls[0].options;
    EXPECT_EQ(options.execution_timeout,
              std::optional<std::chrono::milliseconds>(
                  std::chrono::minutes(5)));
    EXPECT_EQ(options.request_id, std::optional<std::string>("req-123"));
}

TEST_F(TemporalExecutorTest, StartWorkflowLeavesTimeoutAndRequestIdUnset) {
    register_workflow<NoArgWorkflow>("test_workflow");

    run_task_sync(executor_->start_workflow("test_workflow"));

    ASSERT_EQ(client_->start_calls.size(), 1u);
    EXPECT_FALSE(client_->start_calls[0].options.execution_timeout.has_value());
    EXPECT_FALSE(client_->start_calls[0].options.request_id.has_value());
}

TEST_F(TemporalExecutorTest, StartWorkflowWithoutArgsSendsNoInput) {
    register_workflow<OneArgWorkflow>("test_workflow");

    run_task_sync(executor_->start_workflow("test_workflow"));

    ASSERT_EQ(client_->start_calls.size(), 1u);
    EXPECT_FALSE(client_->start_calls[0].input.has_value());
}

TEST_F(TemporalExecutorTest, StartNoArgWorkflowDropsSuppliedArgs) {
    register_workflow<NoArgWorkflow>("test_workflow");

    run_task_sync(executor_->start_workflow("test_workflow", {"ignored"}));

    ASSERT_EQ(client_->start_calls.size(), 1u);
    EXPECT_FALSE(client_->start_calls[0].input.has_value());
}

TEST_F(TemporalExecutorTest, StartWorkflowAppliesConfiguredPolicyAndMetadata) {
    auto cfg = test_config();
    cfg.id_reuse_policy = common::WorkflowIdReusePolicy::kRejectDuplicate;
    cfg.rpc_metadata = {{"x-tenant", "acme"}};
    TemporalExecutor executor(
        context_, {.config = cfg, .client = client_});
    register_workflow<NoArgWorkflow>("test_workflow");

    run_task_sync(executor.start_workflow("test_workflow"));

    ASSERT_EQ(client_->start_calls.size(), 1u);
    const auto& options = client_->start_calls[0].options;
    EXPECT_EQ(options.id_reuse_policy,
              common::WorkflowIdReusePolicy::kRejectDuplicate);
    EXPECT_EQ(options.rpc_metadata.at("x-tenant"), "acme");
}

TEST_F(TemporalExecutorTest, StartWorkflowWaitForResultReturnsResult) {
    register_workflow<NoArgWorkflow>("test_workflow");
    auto handle = std::make_shared<FakeWorkflowHandle>("wf-1", "run-1");
    handle->result_value = "done";
    client_->next_handle = handle;

    auto started = run_task_sync(executor_->start_workflow(
        "test_workflow", {}, {.wait_for_result = true}));

    EXPECT_EQ(handle->result_calls, 1);
    ASSERT_TRUE(started.result.has_value());
    EXPECT_EQ(*started.result, json("done"));
    EXPECT_EQ(started.handle->id(), "wf-1");
}

TEST_F(TemporalExecutorTest, StartWorkflowWithoutWaitDoesNotAwaitResult) {
    register_workflow<NoArgWorkflow>("test_workflow");
    auto handle = std::make_shared<FakeWorkflowHandle>("wf-1");
    client_->next_handle = handle;

    run_task_sync(executor_->start_workflow("test_workflow"));

    EXPECT_EQ(handle->result_calls, 0);
}

TEST_F(TemporalExecutorTest, StartUnknownWorkflowThrowsWithoutRemoteCall) {
    try {
        run_task_sync(executor_->start_workflow("missing"));
        FAIL() << "expected WorkflowNotFoundException";
    } catch (const exceptions::WorkflowNotFoundException& e) {
        EXPECT_EQ(e.workflow_type(), "missing");
    }
    EXPECT_TRUE(client_->start_calls.empty());
}

TEST_F(TemporalExecutorTest, StartWorkflowClientErrorPropagatesUnchanged) {
    register_workflow<NoArgWorkflow>("test_workflow");
    client_->start_error =
        std::make_exception_ptr(std::runtime_error("already started"));

    EXPECT_THROW(run_task_sync(executor_->start_workflow("test_workflow")),
                 std::runtime_error);
    EXPECT_EQ(client_->start_calls.size(), 1u);
}

// ===========================================================================
// execute_workflow
// ===========================================================================

TEST_F(TemporalExecutorTest, ExecuteWorkflowWithCustomParams) {
    register_workflow<NoArgWorkflow>("test_workflow");
    auto handle = std::make_shared<FakeWorkflowHandle>("my-custom-workflow-id");
    handle->result_value = "workflow_result";
    client_->next_handle = handle;

    auto result = run_task_sync(executor_->execute_workflow(
        "test_workflow", {},
        {.workflow_id = "my-custom-workflow-id",
         .task_queue = "my-custom-task-queue"}));

    ASSERT_EQ(client_->start_calls.size(), 1u);
    EXPECT_EQ(client_->start_calls[0].options.id, "my-custom-workflow-id");
    EXPECT_EQ(client_->start_calls[0].options.task_queue,
              "my-custom-task-queue");
    EXPECT_EQ(handle->result_calls, 1);
    EXPECT_EQ(result, json("workflow_result"));
}

TEST_F(TemporalExecutorTest, ExecuteWorkflowAlwaysWaits) {
    register_workflow<TwoArgWorkflow>("test_workflow");
    auto handle = std::make_shared<FakeWorkflowHandle>("wf");
    handle->result_value = json{{"status", "complete"}};
    client_->next_handle = handle;

    auto result = run_task_sync(executor_->execute_workflow(
        "test_workflow", {"a", "b"}, {.wait_for_result = false}));

    EXPECT_EQ(handle->result_calls, 1);
    EXPECT_EQ(result.at("status"), "complete");
}

TEST_F(TemporalExecutorTest, ExecuteWorkflowResultErrorPropagates) {
    register_workflow<NoArgWorkflow>("test_workflow");
    auto handle = std::make_shared<FakeWorkflowHandle>("wf");
    handle->result_error =
        std::make_exception_ptr(std::runtime_error("workflow failed"));
    client_->next_handle = handle;

    EXPECT_THROW(run_task_sync(executor_->execute_workflow("test_workflow")),
                 std::runtime_error);
}

// ===========================================================================
// terminate / cancel / signal
// ===========================================================================

TEST_F(TemporalExecutorTest, TerminateWorkflow) {
    auto handle = std::make_shared<FakeWorkflowHandle>("workflow-id", "run-id");
    client_->next_handle = handle;

    run_task_sync(executor_->terminate_workflow("workflow-id", "run-id",
                                                "Termination reason"));

    ASSERT_EQ(client_->get_handle_calls.size(), 1u);
    EXPECT_EQ(client_->get_handle_calls[0].workflow_id, "workflow-id");
    EXPECT_EQ(client_->get_handle_calls[0].run_id.value_or(""), "run-id");
    ASSERT_EQ(handle->terminate_calls.size(), 1u);
    EXPECT_EQ(handle->terminate_calls[0].reason.value_or(""),
              "Termination reason");
}

TEST_F(TemporalExecutorTest, TerminateWorkflowDefaultReasonAndLatestRun) {
    auto handle = std::make_shared<FakeWorkflowHandle>("workflow-id");
    client_->next_handle = handle;

    run_task_sync(executor_->terminate_workflow("workflow-id"));

    ASSERT_EQ(client_->get_handle_calls.size(), 1u);
    EXPECT_FALSE(client_->get_handle_calls[0].run_id.has_value());
    ASSERT_EQ(handle->terminate_calls.size(), 1u);
    EXPECT_EQ(handle->terminate_calls[0].reason.value_or(""),
              "Workflow terminated");
}

TEST_F(TemporalExecutorTest, TerminateWorkflowErrorPropagates) {
    auto handle = std::make_shared<FakeWorkflowHandle>("workflow-id");
    handle->terminate_error =
        std::make_exception_ptr(std::runtime_error("not permitted"));
    client_->next_handle = handle;

    EXPECT_THROW(
        run_task_sync(executor_->terminate_workflow("workflow-id", "run-id",
                                                    "stop")),
        std::runtime_error);
}

TEST_F(TemporalExecutorTest, CancelWorkflow) {
    auto handle = std::make_shared<FakeWorkflowHandle>("workflow-id", "run-id");
    client_->next_handle = handle;

    run_task_sync(executor_->cancel_workflow("workflow-id", "run-id"));

    ASSERT_EQ(client_->get_handle_calls.size(), 1u);
    EXPECT_EQ(client_->get_handle_calls[0].workflow_id, "workflow-id");
    EXPECT_EQ(handle->cancel_calls, 1);
}

TEST_F(TemporalExecutorTest, SignalWorkflow) {
    auto handle = std::make_shared<FakeWorkflowHandle>("workflow-id");
    client_->next_handle = handle;

    run_task_sync(executor_->signal_workflow(
        "workflow-id", "human_input", json{{"answer", 42}}));

    ASSERT_EQ(handle->signals.size(), 1u);
    EXPECT_EQ(handle->signals[0].first, "human_input");
    EXPECT_EQ(handle->signals[0].second.at("answer"), 42);
    EXPECT_FALSE(client_->get_handle_calls[0].run_id.has_value());
    ASSERT_EQ(handle->signal_options.size(), 1u);
    EXPECT_FALSE(handle->signal_options[0].request_id.has_value());
}

TEST_F(TemporalExecutorTest, SignalWorkflowForwardsRequestId) {
    auto handle = std::make_shared<FakeWorkflowHandle>("workflow-id");
    client_->next_handle = handle;

    run_task_sync(executor_->signal_workflow("workflow-id", "human_input",
                                             json{{"answer", 42}}, "run-7",
                                             "signal-req-1"));

    ASSERT_EQ(handle->signal_options.size(), 1u);
    EXPECT_EQ(handle->signal_options[0].request_id,
              std::optional<std::string>("signal-req-1"));
    EXPECT_EQ(client_->get_handle_calls[0].run_id,
              std::optional<std::string>("run-7"));
}

TEST(TemporalExecutorConnectTest, TerminateConnectsFirstWhenNeeded) {
    auto fake = std::make_shared<FakeWorkflowClient>();
    int connects = 0;
    auto connector = [&](const config::TemporalExecutorConfig&)
        -> Task<std::shared_ptr<engine::WorkflowClient>> {
        ++connects;
        co_return fake;
    };
    TemporalExecutor executor(
        std::make_shared<app::Context>(),
        {.connector = connector,
         .logging = common::LoggingOptions{.level = common::LogLevel::kError}});

    run_task_sync(executor.terminate_workflow("wf", "run", "bye"));

    EXPECT_EQ(connects, 1);
    ASSERT_EQ(fake->get_handle_calls.size(), 1u);
    EXPECT_EQ(fake->get_handle_calls[0].workflow_id, "wf");
}

// ===========================================================================
// pack_workflow_args
// ===========================================================================

TEST(PackWorkflowArgsTest, NoArgsPacksToNothing) {
    EXPECT_FALSE(pack_workflow_args({}).has_value());
}

TEST(PackWorkflowArgsTest, SingleArgIsPassedThrough) {
    auto packed = pack_workflow_args({json{{"k", "v"}}});
    ASSERT_TRUE(packed.has_value());
    EXPECT_EQ(packed->at("k"), "v");
}

TEST(PackWorkflowArgsTest, SingleArrayArgIsNotWrapped) {
    auto packed = pack_workflow_args({json::array({1, 2})});
    ASSERT_TRUE(packed.has_value());
    EXPECT_EQ(*packed, json::array({1, 2}));
}

TEST(PackWorkflowArgsTest, SeveralArgsKeepOrder) {
    auto packed = pack_workflow_args({3, "two", json::array({1})});
    ASSERT_TRUE(packed.has_value());
    ASSERT_TRUE(packed->is_array());
    ASSERT_EQ(packed->size(), 3u);
    EXPECT_EQ((*packed)[0], 3);
    EXPECT_EQ((*packed)[1], "two");
    EXPECT_EQ((*packed)[2], json::array({1}));
}
