#pragma once

#include <assessgrader/common/class_traits.hpp>
#include <assessgrader/sandbox/execution.hpp>
#include <assessgrader/sandbox/sandbox_backend.hpp>
#include <assessgrader/sandbox/worker_pool.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace assessgrader {

struct SandboxConfig
{
    std::size_t workers = 4;
    std::size_t max_queue = 64;
    /// Added to the backends' combined timeouts to form the hard deadline a caller waits for
    std::chrono::milliseconds grace{std::chrono::seconds{5}};
};

/// Runs code on a primary backend, falling back to a secondary one once.
///
/// Calls are executed on a bounded worker pool. ``execute`` never throws and never waits past
/// one request timeout per backend able to run the language, plus the configured grace period.
/// A backend that hangs is abandoned (and told to stop) while the caller gets a ``Timeout``.
class SandboxExecutor : NonMovable
{
public:
    SandboxExecutor(std::shared_ptr<SandboxBackend> primary, std::shared_ptr<SandboxBackend> fallback,
                    SandboxConfig config = {});

    ExecutionResult execute(const ExecutionRequest& request, std::stop_token stop = {});

    ExecutionResult execute(std::string code, std::string language, std::string stdin_text,
                            std::chrono::milliseconds timeout, std::stop_token stop = {});

    /// Union of every configured backend's languages, sorted
    std::vector<std::string> supported_languages() const;

    bool is_supported(std::string_view language) const;

private:
    /// How many of the configured backends can run ``language``
    int backends_for(std::string_view language) const;

    ExecutionResult run_with_fallback(const ExecutionRequest& request, const std::stop_token& stop);

    /// Error means the backend is missing, cannot run the language, or could not be reached
    Result<ExecutionResult> try_backend(SandboxBackend* backend, const ExecutionRequest& request,
                                        const std::stop_token& stop);

    std::shared_ptr<SandboxBackend> primary_;
    std::shared_ptr<SandboxBackend> fallback_;
    SandboxConfig config_;

    // Declared last so in-flight tasks finish before the backends they use are released
    WorkerPool pool_;
};

} // namespace assessgrader
