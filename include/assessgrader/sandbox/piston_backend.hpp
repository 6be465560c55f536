#pragma once

#include <assessgrader/sandbox/sandbox_backend.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace assessgrader {

struct PistonConfig
{
    std::string base_url = "https://emkc.org/api/v2/piston";
    std::chrono::seconds connect_timeout{5};
};

/// Runs code through a Piston instance's ``/execute`` endpoint in a single round trip
class PistonBackend : public SandboxBackend
{
public:
    explicit PistonBackend(PistonConfig config);

    std::string_view name() const override { return "piston"; }

    std::vector<std::string> languages() const override;

    Result<ExecutionResult> execute(const ExecutionRequest& request, std::stop_token stop) override;

    /// Piston's name for a language, if the language is known
    static std::optional<std::string> piston_language(std::string_view language);

    static Result<ExecutionResult> interpret_response(const nlohmann::json& body);

private:
    PistonConfig config_;
};

} // namespace assessgrader
