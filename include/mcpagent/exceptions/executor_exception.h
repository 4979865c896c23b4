#pragma once

/// @file Exception hierarchy for errors raised by the executor itself.
///
/// Errors raised by the engine client are never wrapped in these types;
/// they propagate to the caller unchanged.

#include <exception>
#include <stdexcept>
#include <string>

namespace mcpagent::exceptions {

/// Base exception for all custom exceptions thrown by the executor library.
class ExecutorException : public std::runtime_error {
public:
    /// Returns the inner (cause) exception, if any.
    std::exception_ptr inner() const noexcept { return inner_; }

protected:
    explicit ExecutorException(const std::string& message);
    ExecutorException(const std::string& message, std::exception_ptr inner);
    ~ExecutorException() override = default;

private:
    std::exception_ptr inner_;
};

/// No workflow with the requested type name is registered in the context.
class WorkflowNotFoundException : public ExecutorException {
public:
    explicit WorkflowNotFoundException(std::string workflow_type);

    const std::string& workflow_type() const noexcept {
        return workflow_type_;
    }

private:
    std::string workflow_type_;
};

/// No activity with the requested name is registered in the task registry.
class ActivityNotFoundException : public ExecutorException {
public:
    explicit ActivityNotFoundException(std::string activity_name);

    const std::string& activity_name() const noexcept {
        return activity_name_;
    }

private:
    std::string activity_name_;
};

/// A remote operation was attempted with no client and no way to create one.
class NotConnectedException : public ExecutorException {
public:
    explicit NotConnectedException(const std::string& message);
};

/// Settings could not be read or contained invalid values.
class ConfigException : public ExecutorException {
public:
    explicit ConfigException(const std::string& message,
                             std::exception_ptr inner = nullptr);
};

}  // namespace mcpagent::exceptions
