#include <mcpagent/config/settings.h>
#include <mcpagent/exceptions/executor_exception.h>

#include "mcpagent/config/settings_fields.h"

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace mcpagent::config {

namespace {

// Present and not `~`/`null`.
bool has_value(const YAML::Node& node, const char* key) {
    return node[key] && !node[key].IsNull();
}

const YAML::Node& require_map(const YAML::Node& node, const char* section) {
    if (!node.IsMap()) {
        throw exceptions::ConfigException(std::string("Settings section '") +
                                          section + "' must be a mapping");
    }
    return node;
}

common::RetryPolicy retry_policy_from_yaml(const YAML::Node& node) {
    require_map(node, "temporal.retry_policy");
    common::RetryPolicy policy;
    if (has_value(node, "initial_interval_seconds")) {
        policy.initial_interval = detail::duration_from_seconds(
            node["initial_interval_seconds"].as<double>(),
            "initial_interval_seconds");
    }
    if (has_value(node, "backoff_coefficient")) {
        policy.backoff_coefficient = node["backoff_coefficient"].as<double>();
    }
    if (has_value(node, "maximum_interval_seconds")) {
        policy.maximum_interval = detail::duration_from_seconds(
            node["maximum_interval_seconds"].as<double>(),
            "maximum_interval_seconds");
    }
    if (has_value(node, "maximum_attempts")) {
        policy.maximum_attempts = node["maximum_attempts"].as<int>();
    }
    if (has_value(node, "non_retryable_error_types")) {
        policy.non_retryable_error_types =
            node["non_retryable_error_types"].as<std::vector<std::string>>();
    }
    detail::validate_retry_policy(policy);
    return policy;
}

TemporalExecutorConfig temporal_from_yaml(const YAML::Node& node) {
    require_map(node, "temporal");
    TemporalExecutorConfig cfg;
    if (has_value(node, "host")) {
        cfg.host = node["host"].as<std::string>();
    }
    if (has_value(node, "namespace")) {
        cfg.ns = node["namespace"].as<std::string>();
    }
    if (has_value(node, "task_queue")) {
        cfg.task_queue = node["task_queue"].as<std::string>();
    }
    if (has_value(node, "timeout_seconds")) {
        cfg.timeout = detail::whole_seconds(
            node["timeout_seconds"].as<int64_t>(), "timeout_seconds");
    }
    if (has_value(node, "api_key")) {
        cfg.api_key = node["api_key"].as<std::string>();
    }
    if (has_value(node, "tls")) {
        cfg.tls = node["tls"].as<bool>();
    }
    if (has_value(node, "rpc_metadata")) {
        const YAML::Node metadata = node["rpc_metadata"];
        for (const auto& entry :
             require_map(metadata, "temporal.rpc_metadata")) {
            cfg.rpc_metadata[entry.first.as<std::string>()] =
                entry.second.as<std::string>();
        }
    }
    if (has_value(node, "id_reuse_policy")) {
        cfg.id_reuse_policy = detail::reuse_policy_from_name(
            node["id_reuse_policy"].as<std::string>());
    }
    if (has_value(node, "retry_policy")) {
        cfg.retry_policy = retry_policy_from_yaml(node["retry_policy"]);
    }
    return cfg;
}

LoggerSettings logger_from_yaml(const YAML::Node& node) {
    require_map(node, "logger");
    LoggerSettings logger;
    if (has_value(node, "level")) {
        logger.level =
            detail::log_level_from_name(node["level"].as<std::string>());
    }
    if (has_value(node, "transports")) {
        logger.transports =
            node["transports"].as<std::vector<std::string>>();
    }
    return logger;
}

}  // namespace

Settings parse_settings_yaml(std::string_view text) {
    try {
        const YAML::Node root = YAML::Load(std::string(text));
        if (root.IsNull()) {
            return Settings{};
        }
        require_map(root, "<root>");

        Settings settings;
        if (has_value(root, "execution_engine")) {
            settings.execution_engine =
                root["execution_engine"].as<std::string>();
        }
        if (has_value(root, "logger")) {
            settings.logger = logger_from_yaml(root["logger"]);
        }
        if (has_value(root, "temporal")) {
            settings.temporal = temporal_from_yaml(root["temporal"]);
        }
        return settings;
    } catch (const YAML::Exception& e) {
        throw exceptions::ConfigException(
            std::string("Invalid settings: ") + e.what(),
            std::current_exception());
    }
}

}  // namespace mcpagent::config
