#include "sandbox/local_process_backend.hpp"

#include "common/error_types.hpp"
#include "common/linux.hpp"
#include "logging.hpp"
#include "subprocess/subprocess.hpp"

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/map.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <chrono>
#include <cmath>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace assessgrader {

namespace {

void replace_all(std::string& str, std::string_view from, const std::string& to) {
    for (auto pos = str.find(from); pos != std::string::npos; pos = str.find(from, pos + to.size())) {
        str.replace(pos, from.size(), to);
    }
}

std::vector<std::string> expand(const std::vector<std::string>& command, const std::filesystem::path& src,
                                const std::filesystem::path& bin) {
    std::vector<std::string> res = command;

    for (auto& arg : res) {
        replace_all(arg, "{src}", src.string());
        replace_all(arg, "{bin}", bin.string());
    }

    return res;
}

ExecutionResult from_run_result(RunResult run) {
    ExecutionResult result;
    result.backend = "local";
    result.stdout_text = std::move(run.stdout_text);
    result.stderr_text = std::move(run.stderr_text);
    result.execution_time_ms = run.elapsed.count();

    switch (run.kind) {
    case RunResult::Kind::Exited:
        if (run.code == 0) {
            result.status = ExecutionStatus::Success;
        } else {
            result.status = ExecutionStatus::Error;
            result.failure = ExecutionFailure::RuntimeError;
        }
        break;
    case RunResult::Kind::Signalled:
        // RLIMIT_CPU is delivered as SIGXCPU (and SIGKILL once the hard limit is hit)
        if (run.code == SIGXCPU) {
            result.status = ExecutionStatus::Timeout;
        } else {
            result.status = ExecutionStatus::Error;
            result.failure = ExecutionFailure::RuntimeError;
        }
        break;
    case RunResult::Kind::TimedOut:
        result.status = ExecutionStatus::Timeout;
        break;
    case RunResult::Kind::Cancelled:
        result.status = ExecutionStatus::Error;
        result.failure = ExecutionFailure::Cancelled;
        break;
    }

    return result;
}

} // namespace

LocalLanguage LocalLanguage::from_run_command(std::string_view command, std::string source_file) {
    auto words = command | ranges::views::split(' ') |
                 ranges::views::transform([](auto&& word) { return word | ranges::to<std::string>(); }) |
                 ranges::views::filter([](const std::string& word) { return !word.empty(); }) |
                 ranges::to<std::vector<std::string>>();

    return LocalLanguage{.source_file = std::move(source_file), .compile_command = {}, .run_command = std::move(words)};
}

std::map<std::string, LocalLanguage, std::less<>> LocalProcessConfig::default_languages() {
    return {
        {"python", {.source_file = "main.py", .compile_command = {}, .run_command = {"python3", "{src}"}}},
        {"javascript", {.source_file = "main.js", .compile_command = {}, .run_command = {"node", "{src}"}}},
        {"ruby", {.source_file = "main.rb", .compile_command = {}, .run_command = {"ruby", "{src}"}}},
        {"bash", {.source_file = "main.sh", .compile_command = {}, .run_command = {"bash", "{src}"}}},
        {"c",
         {.source_file = "main.c",
          .compile_command = {"cc", "-O2", "-o", "{bin}", "{src}", "-lm"},
          .run_command = {"{bin}"}}},
        {"cpp",
         {.source_file = "main.cpp",
          .compile_command = {"c++", "-O2", "-std=c++20", "-o", "{bin}", "{src}"},
          .run_command = {"{bin}"}}},
    };
}

LocalProcessBackend::LocalProcessBackend(LocalProcessConfig config)
    : config_{std::move(config)} {}

std::vector<std::string> LocalProcessBackend::languages() const {
    return config_.languages | ranges::views::keys | ranges::to<std::vector<std::string>>();
}

Result<ExecutionResult> LocalProcessBackend::execute(const ExecutionRequest& request, std::stop_token stop) {
    auto lang_iter = config_.languages.find(request.language);

    if (lang_iter == config_.languages.end() || lang_iter->second.run_command.empty()) {
        return ExecutionResult::failed(ExecutionFailure::UnsupportedLanguage,
                                       fmt::format("no local runner for language '{}'", request.language),
                                       std::string{name()});
    }

    if (stop.stop_requested()) {
        return ExecutionResult::failed(ExecutionFailure::Cancelled, "execution cancelled", std::string{name()});
    }

    const LocalLanguage& lang = lang_iter->second;

    const std::filesystem::path work_dir =
        TRYE(linux::mkdtemp((config_.scratch_dir / "assessgrader-XXXXXX").string()), SandboxUnavailable);

    auto cleanup = gsl::finally([&work_dir] {
        std::error_code err;
        std::filesystem::remove_all(work_dir, err);
        if (err) {
            LOG_WARN("Failed to remove scratch dir {}: {}", work_dir.string(), err.message());
        }
    });

    const auto src_path = work_dir / lang.source_file;
    const auto bin_path = work_dir / "main.bin";

    {
        std::ofstream src_file{src_path};
        src_file << request.code;

        if (!src_file) {
            LOG_ERROR("Could not write candidate source to {}", src_path.string());
            return ErrorKind::SandboxUnavailable;
        }
    }

    if (!lang.compile_command.empty()) {
        auto cmd = expand(lang.compile_command, src_path, bin_path);
        Subprocess compiler{cmd.front(), {cmd.begin() + 1, cmd.end()}};

        auto compiled = TRYE(compiler.run("", config_.compile_timeout, stop), SandboxUnavailable);

        if (compiled.kind == RunResult::Kind::Cancelled) {
            return ExecutionResult::failed(ExecutionFailure::Cancelled, "execution cancelled", std::string{name()});
        }

        if (compiled.kind != RunResult::Kind::Exited || compiled.code != 0) {
            auto message = compiled.kind == RunResult::Kind::TimedOut ? std::string{"compilation timed out"}
                                                                      : std::move(compiled.stderr_text);
            return ExecutionResult::failed(ExecutionFailure::CompileError, std::move(message), std::string{name()});
        }
    }

    const auto timeout_secs = std::chrono::duration<double>(request.timeout).count();

    SubprocessLimits limits{
        .address_space_bytes = std::nullopt,
        // CPU limit is a backstop; the wall-clock timeout below normally fires first
        .cpu_seconds = static_cast<rlim_t>(std::ceil(timeout_secs)) + 1,
        .max_open_files = 64,
        .isolate_network = config_.isolate_network,
    };

    if (config_.memory_limit_mb > 0) {
        limits.address_space_bytes = static_cast<rlim_t>(config_.memory_limit_mb) * 1024 * 1024;
    }

    auto cmd = expand(lang.run_command, src_path, bin_path);
    Subprocess program{cmd.front(), {cmd.begin() + 1, cmd.end()}, limits};

    auto run = TRYE(program.run(request.stdin_text, request.timeout, stop), SandboxUnavailable);

    return from_run_result(std::move(run));
}

} // namespace assessgrader
