#pragma once

#include <assessgrader/sandbox/sandbox_backend.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace assessgrader {

/// How to run one language locally.
/// Commands may contain ``{src}`` (path of the source file) and ``{bin}`` (path for a compiled binary)
struct LocalLanguage
{
    std::string source_file;
    std::vector<std::string> compile_command;
    std::vector<std::string> run_command;

    /// Parses "CMD ARGS..." as a run command, e.g. "python3 {src}"
    static LocalLanguage from_run_command(std::string_view command, std::string source_file = "main");
};

struct LocalProcessConfig
{
    std::map<std::string, LocalLanguage, std::less<>> languages = default_languages();

    std::filesystem::path scratch_dir = std::filesystem::temp_directory_path();
    std::size_t memory_limit_mb = 512;
    std::chrono::seconds compile_timeout{30};
    bool isolate_network = true;

    static std::map<std::string, LocalLanguage, std::less<>> default_languages();
};

/// Runs candidate code as a child process on this machine. Meant for development and tests;
/// isolation is limited to rlimits and an empty network namespace.
class LocalProcessBackend : public SandboxBackend
{
public:
    explicit LocalProcessBackend(LocalProcessConfig config = {});

    std::string_view name() const override { return "local"; }

    std::vector<std::string> languages() const override;

    Result<ExecutionResult> execute(const ExecutionRequest& request, std::stop_token stop) override;

private:
    LocalProcessConfig config_;
};

} // namespace assessgrader
