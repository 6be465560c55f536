#include "sandbox/piston_backend.hpp"

#include "common/error_types.hpp"
#include "logging.hpp"
#include "sandbox/http_util.hpp"

#include <fmt/format.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/map.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace assessgrader {

namespace {

const std::map<std::string, std::string, std::less<>>& piston_names() {
    static const std::map<std::string, std::string, std::less<>> names{
        {"python", "python"},     {"javascript", "javascript"}, {"typescript", "typescript"},
        {"java", "java"},         {"cpp", "c++"},               {"c", "c"},
        {"go", "go"},             {"rust", "rust"},             {"csharp", "csharp"},
        {"ruby", "ruby"},         {"php", "php"},
    };
    return names;
}

/// A stage ("compile" or "run") of a Piston response
struct Stage
{
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> code;
    std::optional<std::string> signal;
};

std::optional<Stage> read_stage(const nlohmann::json& body, const char* key) {
    auto iter = body.find(key);
    if (iter == body.end() || !iter->is_object()) {
        return std::nullopt;
    }

    Stage stage;
    stage.stdout_text = iter->value("stdout", "");
    stage.stderr_text = iter->value("stderr", "");

    if (auto code = iter->find("code"); code != iter->end() && code->is_number_integer()) {
        stage.code = code->get<int>();
    }
    if (auto signal = iter->find("signal"); signal != iter->end() && signal->is_string()) {
        stage.signal = signal->get<std::string>();
    }

    return stage;
}

} // namespace

PistonBackend::PistonBackend(PistonConfig config)
    : config_{std::move(config)} {}

std::vector<std::string> PistonBackend::languages() const {
    return piston_names() | ranges::views::keys | ranges::to<std::vector<std::string>>();
}

std::optional<std::string> PistonBackend::piston_language(std::string_view language) {
    auto iter = piston_names().find(language);
    if (iter == piston_names().end()) {
        return std::nullopt;
    }
    return iter->second;
}

Result<ExecutionResult> PistonBackend::interpret_response(const nlohmann::json& body) {
    if (!body.is_object()) {
        return ErrorKind::BadResponse;
    }

    ExecutionResult result;
    result.backend = "piston";

    if (auto compile = read_stage(body, "compile"); compile && (compile->code.value_or(0) != 0 || compile->signal)) {
        result.status = ExecutionStatus::Error;
        result.failure = ExecutionFailure::CompileError;
        result.stdout_text = compile->stdout_text;
        result.stderr_text = compile->stderr_text;
        return result;
    }

    auto run = read_stage(body, "run");
    if (!run) {
        // Piston reports request problems as {"message": "..."}
        LOG_WARN("Piston response has no run stage: {}", body.dump());
        return ErrorKind::BadResponse;
    }

    result.stdout_text = run->stdout_text;
    result.stderr_text = run->stderr_text;

    if (run->signal == "SIGKILL") {
        // Piston kills the process once it runs out of time
        result.status = ExecutionStatus::Timeout;
    } else if (run->signal || run->code.value_or(0) != 0) {
        result.status = ExecutionStatus::Error;
        result.failure = ExecutionFailure::RuntimeError;
    } else {
        result.status = ExecutionStatus::Success;
    }

    return result;
}

Result<ExecutionResult> PistonBackend::execute(const ExecutionRequest& request, std::stop_token stop) {
    auto language = piston_language(request.language);
    if (!language) {
        return ExecutionResult::failed(ExecutionFailure::UnsupportedLanguage,
                                       fmt::format("piston does not know language '{}'", request.language),
                                       std::string{name()});
    }

    if (stop.stop_requested()) {
        return ExecutionResult::failed(ExecutionFailure::Cancelled, "execution cancelled", std::string{name()});
    }

    auto url = TRY(detail::split_url(config_.base_url));

    httplib::Client client{url.origin};
    client.set_connection_timeout(config_.connect_timeout);
    client.set_read_timeout(config_.connect_timeout + std::chrono::duration_cast<std::chrono::seconds>(request.timeout) +
                            std::chrono::seconds{1});

    const auto timeout_ms = request.timeout.count();

    nlohmann::json payload{
        {"language", *language},
        {"version", "*"},
        {"files", nlohmann::json::array({{{"content", request.code}}})},
        {"stdin", request.stdin_text},
        {"run_timeout", timeout_ms},
        {"compile_timeout", timeout_ms},
    };

    const auto start = std::chrono::steady_clock::now();

    auto body = TRY(detail::parse_json_body(
        client.Post(url.path_prefix + "/execute", payload.dump(), "application/json"), "piston execute"));

    auto result = TRY(interpret_response(body.json));

    // Piston does not report timings, so the round trip stands in for it
    result.execution_time_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

    return result;
}

} // namespace assessgrader
