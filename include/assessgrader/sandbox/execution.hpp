#pragma once

#include <assessgrader/common/formatters/macros.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace assessgrader {

enum class ExecutionStatus { Success, Error, Timeout };

/// Why an execution did not succeed. Absent on success and on a plain timeout
enum class ExecutionFailure { CompileError, RuntimeError, Unavailable, UnsupportedLanguage, Cancelled, InternalError };

struct ExecutionRequest
{
    std::string code;
    std::string language;
    std::string stdin_text;
    std::chrono::milliseconds timeout{std::chrono::seconds{10}};
};

struct ExecutionResult
{
    std::string stdout_text;
    std::string stderr_text;
    ExecutionStatus status = ExecutionStatus::Error;
    std::optional<ExecutionFailure> failure;
    long long execution_time_ms = 0;

    /// Name of the backend that produced this result; empty if none could be reached
    std::string backend;

    bool ok() const { return status == ExecutionStatus::Success; }

    static ExecutionResult failed(ExecutionFailure reason, std::string message, std::string backend_name = "") {
        return ExecutionResult{.stdout_text = "",
                               .stderr_text = std::move(message),
                               .status = ExecutionStatus::Error,
                               .failure = reason,
                               .execution_time_ms = 0,
                               .backend = std::move(backend_name)};
    }
};

} // namespace assessgrader

FMT_SERIALIZE_ENUM(::assessgrader::ExecutionStatus, Success, Error, Timeout);
FMT_SERIALIZE_ENUM(::assessgrader::ExecutionFailure, CompileError, RuntimeError, Unavailable, UnsupportedLanguage,
                   Cancelled, InternalError);
FMT_SERIALIZE_CLASS(::assessgrader::ExecutionResult, status, failure, execution_time_ms, backend);
