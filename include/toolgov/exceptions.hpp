#pragma once

#include "toolgov/error_record.hpp"

#include <stdexcept>
#include <string>

namespace toolgov {

class ToolGovException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The single uniform failure type raised by ExecutionGovernor::invoke.
// Callers distinguish failures by record().code, never by subtype.
class ToolExecutionError : public ToolGovException {
public:
    ToolExecutionError(std::string tool_name, ErrorRecord record)
        : ToolGovException(record.message)
        , tool_name_(std::move(tool_name))
        , record_(std::move(record)) {}

    const std::string& tool_name() const noexcept { return tool_name_; }
    const ErrorRecord& record() const noexcept { return record_; }
    const std::string& code() const noexcept { return record_.code; }

private:
    std::string tool_name_;
    ErrorRecord record_;
};

// Raised when invoking a scoped-resource tool after release()
class ToolReleasedError : public ToolExecutionError {
public:
    ToolReleasedError(std::string tool_name, ErrorRecord record)
        : ToolExecutionError(std::move(tool_name), std::move(record)) {}
};

// Distinct cancellation category. Never wrapped into an ErrorRecord.
class OperationCancelledException : public ToolGovException {
public:
    OperationCancelledException()
        : ToolGovException("Operation was cancelled") {}

    explicit OperationCancelledException(const std::string& what)
        : ToolGovException(what) {}
};

// Thrown from a tool body to report a domain-specific error code
class ToolError : public ToolGovException {
public:
    ToolError(std::string code, const std::string& message)
        : ToolGovException(message)
        , code_(std::move(code)) {}

    const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

class ValidationException : public ToolGovException {
public:
    explicit ValidationException(const std::string& message,
                                 std::string code = error_codes::ValidationError)
        : ToolGovException(message)
        , code_(std::move(code)) {}

    const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

class ToolNotFoundException : public ToolGovException {
public:
    explicit ToolNotFoundException(const std::string& name)
        : ToolGovException("Tool '" + name + "' not found")
        , tool_name_(name) {}

    const std::string& tool_name() const noexcept { return tool_name_; }

private:
    std::string tool_name_;
};

class ToolAlreadyRegisteredException : public ToolGovException {
public:
    explicit ToolAlreadyRegisteredException(const std::string& name)
        : ToolGovException("Tool already registered: " + name)
        , tool_name_(name) {}

    const std::string& tool_name() const noexcept { return tool_name_; }

private:
    std::string tool_name_;
};

} // namespace toolgov
