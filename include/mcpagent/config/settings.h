#pragma once

/// @file settings.h
/// @brief Application settings and the engine connection configuration.

#include <mcpagent/common/enums.h>
#include <mcpagent/common/logging.h>
#include <mcpagent/common/retry_policy.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace mcpagent::config {

/// Connection parameters for the workflow engine. Read-only once the
/// executor is constructed.
struct TemporalExecutorConfig {
    /// Engine frontend host:port.
    std::string host{"localhost:7233"};

    /// Namespace to use. Default: "default".
    std::string ns{"default"};

    /// Task queue used when a call does not name one.
    std::string task_queue{"mcp-agent"};

    /// Schedule-to-close timeout for activities scheduled by the executor.
    std::optional<std::chrono::seconds> timeout{};

    /// API key sent as a bearer token on every call.
    std::optional<std::string> api_key{};

    /// Whether to connect with TLS.
    bool tls{false};

    /// Metadata (headers) attached to every RPC.
    std::unordered_map<std::string, std::string> rpc_metadata{};

    /// Reuse policy applied to every workflow start.
    common::WorkflowIdReusePolicy id_reuse_policy{
        common::WorkflowIdReusePolicy::kAllowDuplicate};

    /// Retry policy for activities scheduled from workflows. Nullopt leaves
    /// the engine default in place.
    std::optional<common::RetryPolicy> retry_policy{};
};

/// Logger settings.
struct LoggerSettings {
    /// Minimum level. Default: kInfo.
    common::LogLevel level{common::LogLevel::kInfo};

    /// Configured transports ("console", "file", ...). Informational.
    std::vector<std::string> transports{"console"};
};

/// Top-level application settings.
struct Settings {
    /// Execution engine name, "asyncio" or "temporal".
    std::string execution_engine{"asyncio"};

    /// Logger settings.
    LoggerSettings logger{};

    /// Engine connection settings; present when a "temporal" section exists.
    std::optional<TemporalExecutorConfig> temporal{};

    /// Build settings from a parsed JSON document. Missing keys keep their
    /// defaults; unknown keys are ignored.
    /// @throws exceptions::ConfigException on type errors or bad enum values.
    static Settings from_json(const nlohmann::json& j);

    /// Logging options matching these settings.
    common::LoggingOptions logging_options() const;
};

/// Parse settings from JSON text.
/// @throws exceptions::ConfigException if the text is not valid JSON.
Settings parse_settings(std::string_view text);

/// Parse settings from YAML text, e.g. an mcp_agent.config.yaml document.
/// Keys and defaults are the same as for JSON; other top-level sections
/// (mcp servers, model providers) are ignored.
/// @throws exceptions::ConfigException if the text is not valid YAML or a
/// value is out of range.
Settings parse_settings_yaml(std::string_view text);

/// Read and parse a settings file. Files ending in ".yaml" or ".yml" are
/// read as YAML, anything else as JSON.
/// @throws exceptions::ConfigException if the file cannot be read or parsed.
Settings load_settings(const std::filesystem::path& path);

}  // namespace mcpagent::config
