#include "serialization/json_codec.hpp"

#include "common/overloaded.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace assessgrader {

using nlohmann::json;

namespace {

constexpr std::string_view HIDDEN_MARKER = "[Hidden]";

template <typename T>
json optional_to_json(const std::optional<T>& opt) {
    if (!opt) {
        return nullptr;
    }
    return json(*opt);
}

json optional_time_to_json(const std::optional<TimePoint>& opt) {
    if (!opt) {
        return nullptr;
    }
    return time_to_json(*opt);
}

QuestionKind parse_question_type(const std::string& name) {
    for (auto kind : {QuestionKind::McqSingle, QuestionKind::McqMultiple, QuestionKind::Coding,
                      QuestionKind::TextResponse, QuestionKind::FileUpload}) {
        if (question_type_name(kind) == name) {
            return kind;
        }
    }

    throw InvalidDefinitionError(fmt::format("unknown question type '{}'", name));
}

std::vector<std::string> string_list(const json& obj, const char* key) {
    if (!obj.contains(key)) {
        return {};
    }
    return obj.at(key).get<std::vector<std::string>>();
}

std::string_view wire_name(ExecutionStatus status) {
    switch (status) {
    case ExecutionStatus::Success:
        return "success";
    case ExecutionStatus::Error:
        return "error";
    case ExecutionStatus::Timeout:
        return "timeout";
    }
    return "error";
}

std::string_view wire_name(ExecutionFailure failure) {
    switch (failure) {
    case ExecutionFailure::CompileError:
        return "compile_error";
    case ExecutionFailure::RuntimeError:
        return "runtime_error";
    case ExecutionFailure::Unavailable:
        return "sandbox_unavailable";
    case ExecutionFailure::UnsupportedLanguage:
        return "unsupported_language";
    case ExecutionFailure::Cancelled:
        return "cancelled";
    case ExecutionFailure::InternalError:
        return "internal_error";
    }
    return "internal_error";
}

std::string_view wire_name(AttemptState state) {
    switch (state) {
    case AttemptState::NotStarted:
        return "not_started";
    case AttemptState::InProgress:
        return "in_progress";
    case AttemptState::Submitted:
        return "submitted";
    }
    return "not_started";
}

std::string_view wire_name(FinalizeReason reason) {
    switch (reason) {
    case FinalizeReason::CandidateSubmitted:
        return "submitted";
    case FinalizeReason::TimeExpired:
        return "time_expired";
    case FinalizeReason::Disqualified:
        return "disqualified";
    }
    return "submitted";
}

template <typename Enum>
json optional_wire_name(const std::optional<Enum>& opt) {
    if (!opt) {
        return nullptr;
    }
    return std::string{wire_name(*opt)};
}

} // namespace

std::string_view question_type_name(QuestionKind kind) {
    switch (kind) {
    case QuestionKind::McqSingle:
        return "mcq_single";
    case QuestionKind::McqMultiple:
        return "mcq_multiple";
    case QuestionKind::Coding:
        return "coding";
    case QuestionKind::TextResponse:
        return "text";
    case QuestionKind::FileUpload:
        return "file_upload";
    }

    return "unknown";
}

json time_to_json(TimePoint time_point) {
    auto str = to_utc_string(time_point);

    if (!str) {
        return nullptr;
    }

    return str.value();
}

void to_json(json& json, const McqOption& option) {
    json = {{"id", option.id}, {"text", option.text}};
}

void from_json(const json& json, McqOption& option) {
    // A bare string is both the id and the text
    if (json.is_string()) {
        option.id = json.get<std::string>();
        option.text = option.id;
        return;
    }

    json.at("id").get_to(option.id);
    option.text = json.value("text", option.id);
}

void to_json(json& json, const TestCase& test_case) {
    json = {{"input", test_case.input},
            {"expected_output", test_case.expected_output},
            {"points", test_case.points},
            {"hidden", test_case.hidden}};
}

void from_json(const json& json, TestCase& test_case) {
    test_case.input = json.value("input", "");
    json.at("expected_output").get_to(test_case.expected_output);
    json.at("points").get_to(test_case.points);
    test_case.hidden = json.value("hidden", false);
}

void to_json(json& json, const Question& question) {
    json = {{"id", question.id},
            {"type", std::string{question_type_name(question.kind())}},
            {"text", question.text},
            {"points", question.points},
            {"display_order", question.display_order}};

    std::visit(Overloaded{
                   [&json](const McqSingle& mcq) {
                       json["options"] = mcq.options;
                       json["correct_answer"] = mcq.correct_answer;
                       json["randomize_options"] = mcq.randomize_options;
                   },
                   [&json](const McqMultiple& mcq) {
                       json["options"] = mcq.options;
                       json["correct_answers"] = mcq.correct_answers;
                       json["randomize_options"] = mcq.randomize_options;
                   },
                   [&json](const Coding& coding) {
                       json["language"] = coding.language;
                       json["starter_code"] = coding.starter_code;
                       json["test_cases"] = coding.test_cases;
                       json["execution_timeout_ms"] = coding.execution_timeout.count();
                   },
                   [&json](const TextResponse& text) { json["max_length"] = optional_to_json(text.max_length); },
                   [&json](const FileUpload& upload) {
                       json["allowed_file_types"] = upload.allowed_file_types;
                       json["max_file_size_mb"] = upload.max_file_size_mb;
                   },
               },
               question.payload);
}

void from_json(const json& json, Question& question) {
    json.at("id").get_to(question.id);
    json.at("text").get_to(question.text);
    json.at("points").get_to(question.points);
    question.display_order = json.value("display_order", 0);

    switch (parse_question_type(json.at("type").get<std::string>())) {
    case QuestionKind::McqSingle:
        question.payload = McqSingle{.options = json.at("options").get<std::vector<McqOption>>(),
                                     .correct_answer = json.at("correct_answer").get<std::string>(),
                                     .randomize_options = json.value("randomize_options", false)};
        break;
    case QuestionKind::McqMultiple: {
        auto answers = json.at("correct_answers").get<std::vector<std::string>>();
        question.payload = McqMultiple{.options = json.at("options").get<std::vector<McqOption>>(),
                                       .correct_answers = {answers.begin(), answers.end()},
                                       .randomize_options = json.value("randomize_options", false)};
        break;
    }
    case QuestionKind::Coding: {
        Coding coding{.language = json.at("language").get<std::string>(),
                      .starter_code = json.value("starter_code", ""),
                      .test_cases = json.value("test_cases", std::vector<TestCase>{}),
                      .execution_timeout = std::chrono::seconds{10}};

        if (json.contains("execution_timeout_ms")) {
            coding.execution_timeout = std::chrono::milliseconds{json.at("execution_timeout_ms").get<long long>()};
        } else if (json.contains("execution_timeout_seconds")) {
            coding.execution_timeout = std::chrono::seconds{json.at("execution_timeout_seconds").get<long long>()};
        }

        question.payload = std::move(coding);
        break;
    }
    case QuestionKind::TextResponse: {
        TextResponse text;
        if (json.contains("max_length") && !json.at("max_length").is_null()) {
            text.max_length = json.at("max_length").get<std::size_t>();
        }
        question.payload = text;
        break;
    }
    case QuestionKind::FileUpload:
        question.payload = FileUpload{.allowed_file_types = string_list(json, "allowed_file_types"),
                                      .max_file_size_mb = json.value("max_file_size_mb", 10)};
        break;
    }
}

void to_json(json& json, const AntiCheatConfig& config) {
    json = {{"track_tab_switches", config.track_tab_switches},
            {"max_tab_switches", config.max_tab_switches},
            {"track_ip_changes", config.track_ip_changes}};
}

void from_json(const json& json, AntiCheatConfig& config) {
    const AntiCheatConfig defaults;
    config.track_tab_switches = json.value("track_tab_switches", defaults.track_tab_switches);
    config.max_tab_switches = json.value("max_tab_switches", defaults.max_tab_switches);
    config.track_ip_changes = json.value("track_ip_changes", defaults.track_ip_changes);
}

void to_json(json& json, const AssessmentDefinition& definition) {
    json = {{"id", definition.id},
            {"title", definition.title},
            {"description", definition.description},
            {"questions", definition.questions},
            {"time_limit_minutes", definition.time_limit ? nlohmann::json(definition.time_limit->count()) : nullptr},
            {"passing_score_percentage", definition.passing_score_percentage},
            {"randomize_questions", definition.randomize_questions},
            {"max_attempts", definition.max_attempts},
            {"allow_retakes", definition.allow_retakes},
            {"show_correct_answers", definition.show_correct_answers},
            {"access_token_ttl_seconds", definition.access_token_ttl.count()},
            {"anti_cheat", definition.anti_cheat}};
}

void from_json(const json& json, AssessmentDefinition& definition) {
    const AssessmentDefinition defaults;

    json.at("id").get_to(definition.id);
    definition.title = json.value("title", "");
    definition.description = json.value("description", "");
    json.at("questions").get_to(definition.questions);

    definition.time_limit.reset();
    if (json.contains("time_limit_minutes") && !json.at("time_limit_minutes").is_null()) {
        definition.time_limit = std::chrono::minutes{json.at("time_limit_minutes").get<long long>()};
    }

    definition.passing_score_percentage = json.value("passing_score_percentage", defaults.passing_score_percentage);
    definition.randomize_questions = json.value("randomize_questions", defaults.randomize_questions);
    definition.max_attempts = json.value("max_attempts", defaults.max_attempts);
    definition.allow_retakes = json.value("allow_retakes", defaults.allow_retakes);
    definition.show_correct_answers = json.value("show_correct_answers", defaults.show_correct_answers);
    definition.access_token_ttl =
        std::chrono::seconds{json.value("access_token_ttl_seconds", defaults.access_token_ttl.count())};
    definition.anti_cheat = json.value("anti_cheat", defaults.anti_cheat);
}

void to_json(json& json, const ExecutionResult& result) {
    json = {{"stdout", result.stdout_text},
            {"stderr", result.stderr_text},
            {"status", std::string{wire_name(result.status)}},
            {"failure", optional_wire_name(result.failure)},
            {"execution_time_ms", result.execution_time_ms},
            {"backend", result.backend}};
}

void to_json(json& json, const ScoreSummary& summary) {
    json = {{"points_earned", summary.points_earned},
            {"total_points", summary.total_points},
            {"percentage", summary.percentage},
            {"passed", summary.passed},
            {"questions_correct", summary.questions_correct}};
}

void to_json(json& json, const SuspiciousActivity& activity) {
    json = {{"timestamp", time_to_json(activity.timestamp)}, {"type", std::string{activity_name(activity.kind)}}};

    std::visit(Overloaded{
                   [&json](const activity::TabSwitch& tab) { json["count"] = tab.count; },
                   [&json](const activity::IpChange& change) {
                       json["previous_ip"] = change.previous_ip;
                       json["new_ip"] = change.new_ip;
                   },
                   [&json](const activity::CopyPaste& paste) { json["details"] = paste.details; },
                   [](const activity::FullScreenExit&) {},
                   [&json](const activity::Disqualified& disq) { json["reason"] = disq.reason; },
               },
               activity.kind);
}

void to_json(json& json, const Attempt& attempt) {
    json = {{"id", attempt.id},
            {"assessment_id", attempt.assessment_id},
            {"candidate_ref", attempt.candidate_ref},
            {"attempt_number", attempt.attempt_number},
            {"status", std::string{wire_name(attempt.state)}},
            {"access_token_expires_at", time_to_json(attempt.access_token_expires_at)},
            {"created_at", time_to_json(attempt.created_at)},
            {"started_at", optional_time_to_json(attempt.started_at)},
            {"submitted_at", optional_time_to_json(attempt.submitted_at)},
            {"is_submitted", attempt.is_submitted()},
            {"tab_switch_count", attempt.tab_switch_count},
            {"ip_address", attempt.ip_address},
            {"user_agent", attempt.user_agent},
            {"suspicious_activities", attempt.suspicious_activities},
            {"flagged_for_review", attempt.flagged_for_review},
            {"finalize_reason", optional_wire_name(attempt.finalize_reason)},
            {"time_elapsed_seconds", optional_to_json(attempt.time_elapsed_seconds)},
            {"score", optional_to_json(attempt.score)}};
}

json answer_to_json(const AnswerPayload& answer) {
    return std::visit(Overloaded{
                          [](const McqSelection& selection) -> json {
                              return {{"selected_options", selection.selected}};
                          },
                          [](const TextAnswer& text) -> json { return {{"text_response", text.text}}; },
                          [](const FileAnswer& file) -> json {
                              return {{"file_url", file.url}, {"file_name", file.name}, {"file_size", file.size_bytes}};
                          },
                          [](const CodeAnswer& code) -> json {
                              return {{"code", code.code}, {"language", code.language}};
                          },
                      },
                      answer);
}

AssessmentDefinition parse_definition(const json& json) {
    AssessmentDefinition definition;

    try {
        json.get_to(definition);
    } catch (const nlohmann::json::exception& ex) {
        throw InvalidDefinitionError(fmt::format("malformed assessment definition: {}", ex.what()));
    }

    definition.normalize();

    if (auto res = definition.validate(); !res) {
        throw InvalidDefinitionError(res.error());
    }

    return definition;
}

AnswerPayload parse_answer(const Question& question, const json& json) {
    if (!json.is_object()) {
        throw InvalidPayloadError("answer must be a JSON object");
    }

    try {
        switch (question.kind()) {
        case QuestionKind::McqSingle:
        case QuestionKind::McqMultiple: {
            if (json.contains("selected_options")) {
                return McqSelection{json.at("selected_options").get<std::vector<std::string>>()};
            }
            if (json.contains("selected_option")) {
                return McqSelection{{json.at("selected_option").get<std::string>()}};
            }
            break;
        }
        case QuestionKind::Coding:
            if (json.contains("code")) {
                return CodeAnswer{.code = json.at("code").get<std::string>(),
                                  .language = json.value("language", "")};
            }
            break;
        case QuestionKind::TextResponse:
            if (json.contains("text_response")) {
                return TextAnswer{json.at("text_response").get<std::string>()};
            }
            break;
        case QuestionKind::FileUpload:
            if (json.contains("file_url")) {
                return FileAnswer{.url = json.at("file_url").get<std::string>(),
                                  .name = json.value("file_name", ""),
                                  .size_bytes = json.value("file_size", std::size_t{0})};
            }
            break;
        }
    } catch (const nlohmann::json::exception& ex) {
        throw InvalidPayloadError(fmt::format("malformed answer to '{}': {}", question.id, ex.what()));
    }

    throw InvalidPayloadError(
        fmt::format("answer does not fit question '{}' ({})", question.id, question_type_name(question.kind())));
}

json candidate_question_view(const Question& question) {
    json view = {{"id", question.id},
                 {"type", std::string{question_type_name(question.kind())}},
                 {"text", question.text},
                 {"points", question.points},
                 {"display_order", question.display_order}};

    std::visit(Overloaded{
                   [&view](const McqSingle& mcq) { view["options"] = mcq.options; },
                   [&view](const McqMultiple& mcq) { view["options"] = mcq.options; },
                   [&view](const Coding& coding) {
                       view["language"] = coding.language;
                       view["starter_code"] = coding.starter_code;
                       view["execution_timeout_ms"] = coding.execution_timeout.count();

                       auto cases = json::array();
                       for (const auto& test_case : coding.test_cases) {
                           if (test_case.hidden) {
                               cases.push_back(json{{"hidden", true}, {"points", test_case.points}});
                           } else {
                               cases.push_back(json{{"hidden", false},
                                                {"points", test_case.points},
                                                {"input", test_case.input},
                                                {"expected_output", test_case.expected_output}});
                           }
                       }
                       view["test_cases"] = std::move(cases);
                   },
                   [&view](const TextResponse& text) { view["max_length"] = optional_to_json(text.max_length); },
                   [&view](const FileUpload& upload) {
                       view["allowed_file_types"] = upload.allowed_file_types;
                       view["max_file_size_mb"] = upload.max_file_size_mb;
                   },
               },
               question.payload);

    return view;
}

json response_view(const Response& response, bool reveal_hidden) {
    auto outcomes = json::array();

    for (const auto& outcome : response.test_outcomes) {
        const bool mask = outcome.hidden && !reveal_hidden;

        outcomes.push_back(json{{"index", outcome.index},
                            {"passed", outcome.passed},
                            {"points_earned", outcome.points_earned},
                            {"points", outcome.points},
                            {"hidden", outcome.hidden},
                            {"status", std::string{wire_name(outcome.status)}},
                            {"failure", optional_wire_name(outcome.failure)},
                            {"actual_output", mask ? std::string{HIDDEN_MARKER} : outcome.actual_output},
                            {"error_output", mask ? std::string{HIDDEN_MARKER} : outcome.error_output},
                            {"execution_time_ms", outcome.execution_time_ms}});
    }

    return {{"question_id", response.question_id},
            {"answer", answer_to_json(response.answer)},
            {"points_earned", response.points_earned},
            {"auto_graded", response.auto_graded},
            {"grading_note", optional_to_json(response.grading_note)},
            {"graded_by", optional_to_json(response.graded_by)},
            {"grader_comments", optional_to_json(response.grader_comments)},
            {"graded_at", optional_time_to_json(response.graded_at)},
            {"submitted_at", time_to_json(response.submitted_at)},
            {"updated_at", time_to_json(response.updated_at)},
            {"time_spent_seconds", optional_to_json(response.time_spent_seconds)},
            {"test_results", std::move(outcomes)}};
}

json answer_key(const Question& question) {
    return std::visit(Overloaded{
                          [](const McqSingle& mcq) -> json { return json::array({mcq.correct_answer}); },
                          [](const McqMultiple& mcq) -> json { return mcq.correct_answers; },
                          [](const auto&) -> json { return nullptr; },
                      },
                      question.payload);
}

} // namespace assessgrader
