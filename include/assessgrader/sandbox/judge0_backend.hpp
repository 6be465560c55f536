#pragma once

#include <assessgrader/sandbox/sandbox_backend.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace assessgrader {

struct Judge0Config
{
    std::string base_url = "https://judge0-ce.p.rapidapi.com";
    /// RapidAPI key. Sent along with ``api_host`` when present
    std::optional<std::string> api_key;
    std::string api_host = "judge0-ce.p.rapidapi.com";

    std::chrono::milliseconds poll_interval{1000};
    int max_polls = 30;
    std::chrono::seconds connect_timeout{5};
};

/// Submits to a Judge0 instance and polls until the submission leaves the queue
class Judge0Backend : public SandboxBackend
{
public:
    explicit Judge0Backend(Judge0Config config);

    std::string_view name() const override { return "judge0"; }

    std::vector<std::string> languages() const override;

    Result<ExecutionResult> execute(const ExecutionRequest& request, std::stop_token stop) override;

    /// Judge0 language id, if the language is known
    static std::optional<int> language_id(std::string_view language);

    /// Turns a finished submission (``GET /submissions/{token}``) into a result.
    /// Returns nullopt while the submission is still queued or processing.
    static Result<std::optional<ExecutionResult>> interpret_submission(const nlohmann::json& submission);

private:
    Judge0Config config_;
};

} // namespace assessgrader
