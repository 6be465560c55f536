#include "sandbox/sandbox_executor.hpp"

#include "common/error_types.hpp"
#include "logging.hpp"

#include <fmt/format.h>
#include <range/v3/action/sort.hpp>
#include <range/v3/action/unique.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace assessgrader {

namespace {

constexpr std::chrono::milliseconds WAIT_SLICE{50};

ExecutionResult cancelled_result() {
    return ExecutionResult::failed(ExecutionFailure::Cancelled, "execution cancelled");
}

} // namespace

SandboxExecutor::SandboxExecutor(std::shared_ptr<SandboxBackend> primary, std::shared_ptr<SandboxBackend> fallback,
                                 SandboxConfig config)
    : primary_{std::move(primary)}
    , fallback_{std::move(fallback)}
    , config_{config}
    , pool_{config.workers, config.max_queue} {
    LOG_INFO("Sandbox primary: {}, fallback: {}", primary_ ? primary_->name() : "<none>",
             fallback_ ? fallback_->name() : "<none>");
}

std::vector<std::string> SandboxExecutor::supported_languages() const {
    std::vector<std::string> langs;

    for (const auto* backend : {primary_.get(), fallback_.get()}) {
        if (backend != nullptr) {
            auto backend_langs = backend->languages();
            langs.insert(langs.end(), backend_langs.begin(), backend_langs.end());
        }
    }

    return std::move(langs) | ranges::actions::sort | ranges::actions::unique;
}

bool SandboxExecutor::is_supported(std::string_view language) const {
    return (primary_ && primary_->supports(language)) || (fallback_ && fallback_->supports(language));
}

int SandboxExecutor::backends_for(std::string_view language) const {
    int count = 0;

    for (const auto* backend : {primary_.get(), fallback_.get()}) {
        if (backend != nullptr && backend->supports(language)) {
            ++count;
        }
    }

    return count;
}

ExecutionResult SandboxExecutor::execute(std::string code, std::string language, std::string stdin_text,
                                         std::chrono::milliseconds timeout, std::stop_token stop) {
    return execute(ExecutionRequest{.code = std::move(code),
                                    .language = std::move(language),
                                    .stdin_text = std::move(stdin_text),
                                    .timeout = timeout},
                   std::move(stop));
}

ExecutionResult SandboxExecutor::execute(const ExecutionRequest& request, std::stop_token stop) {
    using std::chrono::steady_clock;

    if (stop.stop_requested()) {
        return cancelled_result();
    }

    if (!is_supported(request.language)) {
        return ExecutionResult::failed(ExecutionFailure::UnsupportedLanguage,
                                       fmt::format("language '{}' is not supported", request.language));
    }

    // The task gets its own stop source so it can be abandoned without the caller cancelling anything else
    std::stop_source task_stop;
    std::stop_callback forward_stop{stop, [task_stop]() mutable { task_stop.request_stop(); }};

    auto future = pool_.submit(
        [this, request, token = task_stop.get_token()] { return run_with_fallback(request, token); });

    if (!future) {
        LOG_ERROR("Sandbox worker queue is full ({} queued); rejecting {} execution", pool_.queued(),
                  request.language);
        return ExecutionResult::failed(ExecutionFailure::Unavailable, "sandbox is at capacity");
    }

    // Each backend that may be tried gets the request's full timeout
    const auto budget = request.timeout * backends_for(request.language) + config_.grace;
    const auto deadline = steady_clock::now() + budget;

    while (true) {
        const auto now = steady_clock::now();

        if (now >= deadline) {
            task_stop.request_stop();
            LOG_WARN("Sandbox call for {} passed its {}ms deadline; abandoning it", request.language, budget.count());

            ExecutionResult timed_out;
            timed_out.status = ExecutionStatus::Timeout;
            timed_out.stderr_text = "execution did not finish in time";
            return timed_out;
        }

        const auto slice = std::min<steady_clock::duration>(WAIT_SLICE, deadline - now);

        if (future->wait_for(slice) == std::future_status::ready) {
            return future->get();
        }

        if (stop.stop_requested()) {
            task_stop.request_stop();
            return cancelled_result();
        }
    }
}

Result<ExecutionResult> SandboxExecutor::try_backend(SandboxBackend* backend, const ExecutionRequest& request,
                                                     const std::stop_token& stop) {
    if (backend == nullptr || !backend->supports(request.language)) {
        return ErrorKind::UnsupportedLanguage;
    }

    try {
        auto res = backend->execute(request, stop);

        if (!res) {
            LOG_WARN("Sandbox backend {} unreachable: {}", backend->name(), res.error());
        }

        return res;
    } catch (const std::exception& ex) {
        LOG_ERROR("Sandbox backend {} threw: {}", backend->name(), ex.what());
        return ErrorKind::SandboxUnavailable;
    }
}

ExecutionResult SandboxExecutor::run_with_fallback(const ExecutionRequest& request, const std::stop_token& stop) {
    if (stop.stop_requested()) {
        return cancelled_result();
    }

    auto primary_res = try_backend(primary_.get(), request, stop);

    if (primary_res && primary_res->ok()) {
        return *primary_res;
    }

    if (stop.stop_requested()) {
        return cancelled_result();
    }

    auto fallback_res = try_backend(fallback_.get(), request, stop);

    if (fallback_res) {
        if (primary_res) {
            LOG_DEBUG("Primary result {} replaced by fallback result {}", *primary_res, *fallback_res);
        }
        return *fallback_res;
    }

    if (primary_res) {
        return *primary_res;
    }

    LOG_ERROR("No sandbox backend could run {} code (primary: {}, fallback: {})", request.language,
              primary_res.error(), fallback_res.error());

    return ExecutionResult::failed(ExecutionFailure::Unavailable, "no execution backend is available");
}

} // namespace assessgrader
