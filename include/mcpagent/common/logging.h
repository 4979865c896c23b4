#pragma once

/// @file logging.h
/// @brief Leveled logger with a pluggable sink.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mcpagent::common {

/// Log level, lowest to highest severity.
enum class LogLevel : int {
    kTrace = 0,
    kDebug = 1,
    kInfo = 2,
    kWarn = 3,
    kError = 4,
};

/// Callback receiving every message at or above the configured level.
/// @param level The log level of the message.
/// @param target The logger target (e.g., "mcpagent.executor.temporal").
/// @param message The log message text.
/// @param timestamp_millis Unix timestamp in milliseconds.
using LogCallback = std::function<void(LogLevel level,
                                       std::string_view target,
                                       std::string_view message,
                                       uint64_t timestamp_millis)>;

/// Logging options.
struct LoggingOptions {
    /// Minimum level that is emitted. Default: kInfo.
    LogLevel level{LogLevel::kInfo};

    /// Sink for log messages. If not set, messages are written to stderr.
    LogCallback callback;
};

/// Parse a level name ("trace", "debug", "info", "warn"/"warning",
/// "error"), case-insensitive. Returns nullopt for anything else.
std::optional<LogLevel> parse_log_level(std::string_view name);

/// Upper-case name of a level, e.g. "WARN".
const char* log_level_name(LogLevel level) noexcept;

/// Logger bound to a target name. Cheap to copy.
class Logger {
public:
    explicit Logger(std::string target, LoggingOptions options = {});

    const std::string& target() const noexcept { return target_; }
    LogLevel level() const noexcept { return options_.level; }

    /// Whether a message at `level` would be emitted.
    bool enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(options_.level);
    }

    void log(LogLevel level, std::string_view message) const;

    void trace(std::string_view message) const { log(LogLevel::kTrace, message); }
    void debug(std::string_view message) const { log(LogLevel::kDebug, message); }
    void info(std::string_view message) const { log(LogLevel::kInfo, message); }
    void warn(std::string_view message) const { log(LogLevel::kWarn, message); }
    void error(std::string_view message) const { log(LogLevel::kError, message); }

private:
    std::string target_;
    LoggingOptions options_;
};

}  // namespace mcpagent::common
