#pragma once

#include <assessgrader/model/assessment.hpp>
#include <assessgrader/model/response.hpp>
#include <assessgrader/sandbox/sandbox_executor.hpp>

#include <memory>
#include <stop_token>
#include <string_view>

namespace assessgrader {

/// Equal once trailing line terminators ("\n", "\r\n") are removed from both sides
bool outputs_match(std::string_view actual, std::string_view expected);

GradeResult grade_mcq_single(const Question& question, const McqSingle& mcq, const McqSelection& selection);

/// Full points for an exact match, otherwise partial credit:
///   floor(points * max(0, |S∩C|/|C| - 0.5 * |S-C|/|C|))
GradeResult grade_mcq_multiple(const Question& question, const McqMultiple& mcq, const McqSelection& selection);

/// Runs every test case in order. An error on the first case (typically a compile error) fails the rest
/// without running them. Without test cases, the answer is left for manual review.
GradeResult grade_coding(const Question& question, const Coding& coding, const CodeAnswer& answer,
                         SandboxExecutor& sandbox, std::stop_token stop = {});

/// Throws InvalidPayloadError when ``answer`` is the wrong kind for ``question`` or breaks its constraints
void validate_answer(const Question& question, const AnswerPayload& answer);

class QuestionGrader
{
public:
    /// ``sandbox`` may be null, in which case coding answers cannot be auto-graded
    explicit QuestionGrader(std::shared_ptr<SandboxExecutor> sandbox);

    /// Grades a validated answer. Never throws: a failure while grading yields 0 points and a note
    GradeResult grade(const Question& question, const AnswerPayload& answer, std::stop_token stop = {}) const;

private:
    std::shared_ptr<SandboxExecutor> sandbox_;
};

} // namespace assessgrader
