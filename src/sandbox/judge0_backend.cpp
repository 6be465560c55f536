#include "sandbox/judge0_backend.hpp"

#include "common/error_types.hpp"
#include "logging.hpp"
#include "sandbox/http_util.hpp"

#include <fmt/format.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/map.hpp>

#include <chrono>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace assessgrader {

namespace {

const std::map<std::string, int, std::less<>>& language_ids() {
    static const std::map<std::string, int, std::less<>> ids{
        {"python", 71}, {"javascript", 63}, {"typescript", 74}, {"java", 62}, {"cpp", 54},   {"c", 50},
        {"go", 60},     {"rust", 73},       {"csharp", 51},     {"ruby", 72}, {"php", 68},
    };
    return ids;
}

// Submission status ids, see https://ce.judge0.com/#statuses-and-languages-status-get
enum Judge0Status {
    InQueue = 1,
    Processing = 2,
    Accepted = 3,
    WrongAnswer = 4,
    TimeLimitExceeded = 5,
    CompilationError = 6,
    RuntimeErrorFirst = 7,  // SIGSEGV
    RuntimeErrorLast = 12,  // Other
    InternalError = 13,
    ExecFormatError = 14,
};

std::string string_field(const nlohmann::json& obj, const char* key) {
    auto iter = obj.find(key);
    if (iter == obj.end() || !iter->is_string()) {
        return "";
    }
    return iter->get<std::string>();
}

} // namespace

Judge0Backend::Judge0Backend(Judge0Config config)
    : config_{std::move(config)} {}

std::vector<std::string> Judge0Backend::languages() const {
    return language_ids() | ranges::views::keys | ranges::to<std::vector<std::string>>();
}

std::optional<int> Judge0Backend::language_id(std::string_view language) {
    auto iter = language_ids().find(language);
    if (iter == language_ids().end()) {
        return std::nullopt;
    }
    return iter->second;
}

Result<std::optional<ExecutionResult>> Judge0Backend::interpret_submission(const nlohmann::json& submission) {
    if (!submission.is_object()) {
        return ErrorKind::BadResponse;
    }

    auto status = submission.find("status");
    if (status == submission.end() || !status->is_object() || !status->contains("id") ||
        !(*status)["id"].is_number_integer()) {
        LOG_WARN("Judge0 submission has no status id: {}", submission.dump());
        return ErrorKind::BadResponse;
    }

    const int status_id = (*status)["id"].get<int>();

    if (status_id == InQueue || status_id == Processing) {
        return std::optional<ExecutionResult>{};
    }

    ExecutionResult result;
    result.backend = "judge0";
    result.stdout_text = string_field(submission, "stdout");
    result.stderr_text = string_field(submission, "stderr");

    // "time" is reported in seconds, as a string
    if (auto time_str = string_field(submission, "time"); !time_str.empty()) {
        try {
            result.execution_time_ms = std::llround(std::stod(time_str) * 1000.0);
        } catch (const std::exception& ex) {
            LOG_DEBUG("Ignoring unparsable Judge0 time '{}': {}", time_str, ex.what());
        }
    }

    if (status_id == Accepted || status_id == WrongAnswer) {
        // No expected output is ever sent, so WrongAnswer only means "ran to completion"
        result.status = ExecutionStatus::Success;
    } else if (status_id == TimeLimitExceeded) {
        result.status = ExecutionStatus::Timeout;
    } else if (status_id == CompilationError) {
        result.status = ExecutionStatus::Error;
        result.failure = ExecutionFailure::CompileError;
        result.stderr_text = string_field(submission, "compile_output");
    } else if (status_id >= RuntimeErrorFirst && status_id <= RuntimeErrorLast) {
        result.status = ExecutionStatus::Error;
        result.failure = ExecutionFailure::RuntimeError;
        if (result.stderr_text.empty()) {
            result.stderr_text = string_field(*status, "description");
        }
    } else {
        result.status = ExecutionStatus::Error;
        result.failure = ExecutionFailure::InternalError;
        result.stderr_text = string_field(*status, "description");
    }

    return std::optional<ExecutionResult>{std::move(result)};
}

Result<ExecutionResult> Judge0Backend::execute(const ExecutionRequest& request, std::stop_token stop) {
    auto lang_id = language_id(request.language);
    if (!lang_id) {
        return ExecutionResult::failed(ExecutionFailure::UnsupportedLanguage,
                                       fmt::format("judge0 does not know language '{}'", request.language),
                                       std::string{name()});
    }

    auto url = TRY(detail::split_url(config_.base_url));

    httplib::Client client{url.origin};
    client.set_connection_timeout(config_.connect_timeout);
    client.set_read_timeout(config_.connect_timeout + std::chrono::duration_cast<std::chrono::seconds>(request.timeout));

    httplib::Headers headers;
    if (config_.api_key) {
        headers.emplace("X-RapidAPI-Key", *config_.api_key);
        headers.emplace("X-RapidAPI-Host", config_.api_host);
    }

    const double timeout_secs = std::chrono::duration<double>(request.timeout).count();

    nlohmann::json payload{
        {"source_code", request.code},     {"language_id", *lang_id},      {"stdin", request.stdin_text},
        {"cpu_time_limit", timeout_secs}, {"wall_time_limit", timeout_secs},
    };

    auto created = TRY(detail::parse_json_body(
        client.Post(url.path_prefix + "/submissions?base64_encoded=false&wait=false", headers, payload.dump(),
                    "application/json"),
        "judge0 submit"));

    const std::string token = string_field(created.json, "token");
    if (token.empty()) {
        LOG_WARN("Judge0 did not return a submission token: {}", created.json.dump());
        return ErrorKind::BadResponse;
    }

    LOG_DEBUG("Judge0 submission {} created for {}", token, request.language);

    const std::string poll_path = fmt::format(
        "{}/submissions/{}?base64_encoded=false&fields=stdout,stderr,compile_output,status,time", url.path_prefix, token);

    for (int poll = 0; poll < config_.max_polls; ++poll) {
        if (!detail::interruptible_sleep(config_.poll_interval, stop)) {
            return ExecutionResult::failed(ExecutionFailure::Cancelled, "execution cancelled", std::string{name()});
        }

        auto submission = TRY(detail::parse_json_body(client.Get(poll_path, headers), "judge0 poll"));
        auto result = TRY(interpret_submission(submission.json));

        if (result) {
            return *result;
        }
    }

    LOG_WARN("Judge0 submission {} still pending after {} polls", token, config_.max_polls);

    ExecutionResult timed_out;
    timed_out.status = ExecutionStatus::Timeout;
    timed_out.stderr_text = "execution did not finish in time";
    timed_out.backend = std::string{name()};

    return timed_out;
}

} // namespace assessgrader
