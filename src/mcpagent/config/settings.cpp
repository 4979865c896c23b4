#include <mcpagent/config/settings.h>
#include <mcpagent/exceptions/executor_exception.h>

#include "mcpagent/config/settings_fields.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace mcpagent::config {

namespace {

bool has_value(const nlohmann::json& j, const char* key) {
    return j.contains(key) && !j.at(key).is_null();
}

common::RetryPolicy retry_policy_from_json(const nlohmann::json& j) {
    common::RetryPolicy policy;
    if (has_value(j, "initial_interval_seconds")) {
        policy.initial_interval = detail::duration_from_seconds(
            j.at("initial_interval_seconds").get<double>(),
            "initial_interval_seconds");
    }
    policy.backoff_coefficient =
        j.value("backoff_coefficient", policy.backoff_coefficient);
    if (has_value(j, "maximum_interval_seconds")) {
        policy.maximum_interval = detail::duration_from_seconds(
            j.at("maximum_interval_seconds").get<double>(),
            "maximum_interval_seconds");
    }
    policy.maximum_attempts =
        j.value("maximum_attempts", policy.maximum_attempts);
    if (j.contains("non_retryable_error_types")) {
        policy.non_retryable_error_types =
            j.at("non_retryable_error_types").get<std::vector<std::string>>();
    }
    detail::validate_retry_policy(policy);
    return policy;
}

TemporalExecutorConfig temporal_from_json(const nlohmann::json& j) {
    TemporalExecutorConfig cfg;
    cfg.host = j.value("host", cfg.host);
    cfg.ns = j.value("namespace", cfg.ns);
    cfg.task_queue = j.value("task_queue", cfg.task_queue);
    if (has_value(j, "timeout_seconds")) {
        cfg.timeout = detail::whole_seconds(
            j.at("timeout_seconds").get<int64_t>(), "timeout_seconds");
    }
    if (has_value(j, "api_key")) {
        cfg.api_key = j.at("api_key").get<std::string>();
    }
    cfg.tls = j.value("tls", cfg.tls);
    if (j.contains("rpc_metadata")) {
        cfg.rpc_metadata = j.at("rpc_metadata")
                               .get<std::unordered_map<std::string,
                                                       std::string>>();
    }
    if (j.contains("id_reuse_policy")) {
        cfg.id_reuse_policy = detail::reuse_policy_from_name(
            j.at("id_reuse_policy").get<std::string>());
    }
    if (has_value(j, "retry_policy")) {
        cfg.retry_policy = retry_policy_from_json(j.at("retry_policy"));
    }
    return cfg;
}

LoggerSettings logger_from_json(const nlohmann::json& j) {
    LoggerSettings logger;
    if (j.contains("level")) {
        logger.level =
            detail::log_level_from_name(j.at("level").get<std::string>());
    }
    if (j.contains("transports")) {
        logger.transports =
            j.at("transports").get<std::vector<std::string>>();
    }
    return logger;
}

bool is_yaml_path(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext == ".yaml" || ext == ".yml";
}

}  // namespace

Settings Settings::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw exceptions::ConfigException("Settings must be a JSON object");
    }
    try {
        Settings settings;
        settings.execution_engine =
            j.value("execution_engine", settings.execution_engine);
        if (j.contains("logger")) {
            settings.logger = logger_from_json(j.at("logger"));
        }
        if (has_value(j, "temporal")) {
            settings.temporal = temporal_from_json(j.at("temporal"));
        }
        return settings;
    } catch (const nlohmann::json::exception& e) {
        throw exceptions::ConfigException(
            std::string("Invalid settings: ") + e.what(),
            std::current_exception());
    }
}

common::LoggingOptions Settings::logging_options() const {
    common::LoggingOptions options;
    options.level = logger.level;
    return options;
}

Settings parse_settings(std::string_view text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw exceptions::ConfigException("Settings are not valid JSON");
    }
    return Settings::from_json(parsed);
}

Settings load_settings(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw exceptions::ConfigException(
            "Cannot open settings file " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (is_yaml_path(path)) {
        return parse_settings_yaml(buffer.str());
    }
    return parse_settings(buffer.str());
}

}  // namespace mcpagent::config
