#pragma once

#include <assessgrader/common/formatters/macros.hpp>
#include <assessgrader/common/time.hpp>
#include <assessgrader/sandbox/execution.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace assessgrader {

/// Selected option ids. A single-answer question expects exactly one
struct McqSelection
{
    std::vector<std::string> selected;
};

struct TextAnswer
{
    std::string text;
};

struct FileAnswer
{
    std::string url;
    std::string name;
    std::size_t size_bytes = 0;
};

struct CodeAnswer
{
    std::string code;
    std::string language;
};

using AnswerPayload = std::variant<McqSelection, TextAnswer, FileAnswer, CodeAnswer>;

struct TestCaseOutcome
{
    std::size_t index = 0;
    bool passed = false;
    int points_earned = 0;
    int points = 0;
    bool hidden = false;
    ExecutionStatus status = ExecutionStatus::Error;
    std::optional<ExecutionFailure> failure;
    std::string actual_output;
    std::string error_output;
    long long execution_time_ms = 0;
};

/// Outcome of grading a single answer. Persisting it is the caller's job
struct GradeResult
{
    int points_earned = 0;
    bool auto_graded = false;
    std::optional<std::string> note;
    std::vector<TestCaseOutcome> test_outcomes;
};

struct Response
{
    std::string attempt_id;
    std::string question_id;
    AnswerPayload answer;

    int points_earned = 0;
    bool auto_graded = false;
    std::optional<std::string> grading_note;
    std::vector<TestCaseOutcome> test_outcomes;

    std::optional<std::string> graded_by;
    std::optional<std::string> grader_comments;
    std::optional<TimePoint> graded_at;

    TimePoint submitted_at;
    TimePoint updated_at;
    std::optional<int> time_spent_seconds;

    /// Automatically graded, or graded by a human reviewer
    bool is_graded() const { return auto_graded || graded_at.has_value(); }
};

} // namespace assessgrader

FMT_SERIALIZE_CLASS(::assessgrader::TestCaseOutcome, index, passed, points_earned, points, status, failure);
FMT_SERIALIZE_CLASS(::assessgrader::GradeResult, points_earned, auto_graded, note);
FMT_SERIALIZE_CLASS(::assessgrader::Response, attempt_id, question_id, points_earned, auto_graded, grading_note,
                    graded_by);
