#pragma once

#include <assessgrader/common/time.hpp>
#include <assessgrader/model/assessment.hpp>
#include <assessgrader/model/attempt.hpp>
#include <assessgrader/model/response.hpp>
#include <assessgrader/sandbox/execution.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace assessgrader {

// ADL hooks for nlohmann::json. Reading a definition goes through ``parse_definition``,
// which turns the library's exceptions into InvalidDefinitionError.

void to_json(nlohmann::json& json, const McqOption& option);
void from_json(const nlohmann::json& json, McqOption& option);

void to_json(nlohmann::json& json, const TestCase& test_case);
void from_json(const nlohmann::json& json, TestCase& test_case);

void to_json(nlohmann::json& json, const Question& question);
void from_json(const nlohmann::json& json, Question& question);

void to_json(nlohmann::json& json, const AntiCheatConfig& config);
void from_json(const nlohmann::json& json, AntiCheatConfig& config);

void to_json(nlohmann::json& json, const AssessmentDefinition& definition);
void from_json(const nlohmann::json& json, AssessmentDefinition& definition);

void to_json(nlohmann::json& json, const ExecutionResult& result);
void to_json(nlohmann::json& json, const ScoreSummary& summary);
void to_json(nlohmann::json& json, const SuspiciousActivity& activity);
void to_json(nlohmann::json& json, const Attempt& attempt);
nlohmann::json answer_to_json(const AnswerPayload& answer);

/// Wire names: "mcq_single", "mcq_multiple", "coding", "text", "file_upload"
std::string_view question_type_name(QuestionKind kind);

/// ISO-8601 UTC, e.g. "2024-05-01T12:00:00Z"
nlohmann::json time_to_json(TimePoint time_point);

/// Throws InvalidDefinitionError on anything malformed, including a definition that fails validation
AssessmentDefinition parse_definition(const nlohmann::json& json);

/// Decode the answer to ``question``. Throws InvalidPayloadError if the body does not fit the question's kind
AnswerPayload parse_answer(const Question& question, const nlohmann::json& json);

/// A question as the candidate sees it: no answer keys, hidden test cases reduced to their points
nlohmann::json candidate_question_view(const Question& question);

/// ``reveal_hidden`` shows outputs of hidden test cases; otherwise they read "[Hidden]"
nlohmann::json response_view(const Response& response, bool reveal_hidden);

/// Correct answers of an MCQ question, or null for anything else
nlohmann::json answer_key(const Question& question);

} // namespace assessgrader
