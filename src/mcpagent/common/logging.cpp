#include <mcpagent/common/logging.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <string>
#include <utility>

namespace mcpagent::common {

namespace {

uint64_t now_millis() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

/// Default sink: writes "[LEVEL] target: message" to stderr.
void write_to_stderr(LogLevel level, std::string_view target,
                     std::string_view message, uint64_t /*timestamp_millis*/) {
    std::fprintf(stderr, "[%s] %.*s: %.*s\n", log_level_name(level),
                 static_cast<int>(target.size()), target.data(),
                 static_cast<int>(message.size()), message.data());
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    if (lower == "trace") return LogLevel::kTrace;
    if (lower == "debug") return LogLevel::kDebug;
    if (lower == "info") return LogLevel::kInfo;
    if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
    if (lower == "error") return LogLevel::kError;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kTrace: return "TRACE";
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo:  return "INFO";
        case LogLevel::kWarn:  return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

Logger::Logger(std::string target, LoggingOptions options)
    : target_(std::move(target)), options_(std::move(options)) {}

void Logger::log(LogLevel level, std::string_view message) const {
    if (!enabled(level)) {
        return;
    }
    if (options_.callback) {
        options_.callback(level, target_, message, now_millis());
    } else {
        write_to_stderr(level, target_, message, now_millis());
    }
}

}  // namespace mcpagent::common
