#include "mcpagent/exceptions/executor_exception.h"

#include <utility>

namespace mcpagent::exceptions {

// ExecutorException

ExecutorException::ExecutorException(const std::string& message)
    : std::runtime_error(message) {}

ExecutorException::ExecutorException(const std::string& message,
                                     std::exception_ptr inner)
    : std::runtime_error(message), inner_(std::move(inner)) {}

// WorkflowNotFoundException

WorkflowNotFoundException::WorkflowNotFoundException(std::string workflow_type)
    : ExecutorException("Workflow type '" + workflow_type + "' not found"),
      workflow_type_(std::move(workflow_type)) {}

// ActivityNotFoundException

ActivityNotFoundException::ActivityNotFoundException(std::string activity_name)
    : ExecutorException("Activity '" + activity_name + "' not registered"),
      activity_name_(std::move(activity_name)) {}

// NotConnectedException

NotConnectedException::NotConnectedException(const std::string& message)
    : ExecutorException(message) {}

// ConfigException

ConfigException::ConfigException(const std::string& message,
                                 std::exception_ptr inner)
    : ExecutorException(message, std::move(inner)) {}

}  // namespace mcpagent::exceptions
