#pragma once

#include <assessgrader/common/error_types.hpp>
#include <assessgrader/sandbox/execution.hpp>

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace assessgrader {

/// A place candidate code can be run
///
/// ``execute`` reports an error only when the backend could not be reached, or answered with
/// something unintelligible. Everything the backend actually decided (compile errors, crashes,
/// timeouts, unsupported languages) comes back as an ``ExecutionResult``.
class SandboxBackend
{
public:
    virtual ~SandboxBackend() = default;

    virtual std::string_view name() const = 0;

    virtual std::vector<std::string> languages() const = 0;

    virtual bool supports(std::string_view language) const;

    /// Should return promptly with ``ExecutionFailure::Cancelled`` once ``stop`` is requested
    virtual Result<ExecutionResult> execute(const ExecutionRequest& request, std::stop_token stop) = 0;
};

} // namespace assessgrader
