#include "grading/question_grader.hpp"

#include "common/overloaded.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/count_if.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <exception>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace assessgrader {

namespace {

std::string_view strip_trailing_newlines(std::string_view str) {
    while (true) {
        if (str.ends_with("\r\n")) {
            str.remove_suffix(2);
        } else if (str.ends_with('\n')) {
            str.remove_suffix(1);
        } else {
            return str;
        }
    }
}

bool is_option(const std::vector<McqOption>& options, const std::string& option_id) {
    return ranges::any_of(options, [&option_id](const McqOption& opt) { return opt.id == option_id; });
}

void validate_selection(const Question& question, const std::vector<McqOption>& options,
                        const McqSelection& selection) {
    for (const auto& selected : selection.selected) {
        if (!is_option(options, selected)) {
            throw InvalidPayloadError(fmt::format("'{}' is not an option of question '{}'", selected, question.id));
        }
    }
}

/// Number of UTF-8 code points
std::size_t utf8_length(std::string_view str) {
    return static_cast<std::size_t>(
        ranges::count_if(str, [](char chr) { return (static_cast<unsigned char>(chr) & 0xC0U) != 0x80U; }));
}

std::string lowercase_extension(std::string_view file_name) {
    const auto dot = file_name.rfind('.');
    if (dot == std::string_view::npos) {
        return "";
    }

    std::string ext{file_name.substr(dot + 1)};
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char chr) { return std::tolower(chr); });
    return ext;
}

[[noreturn]] void throw_mismatch(const Question& question, std::string_view answer_kind) {
    throw InvalidPayloadError(
        fmt::format("a {} answer does not fit question '{}' ({})", answer_kind, question.id, question.kind()));
}

} // namespace

bool outputs_match(std::string_view actual, std::string_view expected) {
    return strip_trailing_newlines(actual) == strip_trailing_newlines(expected);
}

GradeResult grade_mcq_single(const Question& question, const McqSingle& mcq, const McqSelection& selection) {
    const bool correct = selection.selected.size() == 1 && selection.selected.front() == mcq.correct_answer;

    return GradeResult{
        .points_earned = correct ? question.points : 0, .auto_graded = true, .note = std::nullopt, .test_outcomes = {}};
}

GradeResult grade_mcq_multiple(const Question& question, const McqMultiple& mcq, const McqSelection& selection) {
    const std::set<std::string> selected{selection.selected.begin(), selection.selected.end()};
    const auto& correct = mcq.correct_answers;

    GradeResult result{.points_earned = 0, .auto_graded = true, .note = std::nullopt, .test_outcomes = {}};

    if (selected == correct) {
        result.points_earned = question.points;
        return result;
    }

    const auto num_correct = static_cast<double>(correct.size());
    const auto hits = static_cast<double>(ranges::count_if(selected, [&](const auto& id) { return correct.contains(id); }));
    const auto misses = static_cast<double>(selected.size()) - hits;

    const double score = std::max(0.0, (hits / num_correct) - (misses / num_correct * 0.5));

    result.points_earned = static_cast<int>(std::floor(question.points * score));

    return result;
}

GradeResult grade_coding(const Question& question, const Coding& coding, const CodeAnswer& answer,
                         SandboxExecutor& sandbox, std::stop_token stop) {
    GradeResult result{.points_earned = 0, .auto_graded = true, .note = std::nullopt, .test_outcomes = {}};

    if (coding.test_cases.empty()) {
        result.auto_graded = false;
        result.note = "no test cases; awaiting manual review";
        return result;
    }

    const std::string& language = answer.language.empty() ? coding.language : answer.language;

    // Set once the first case fails to even run; later cases are failed with the same reason
    std::optional<ExecutionResult> short_circuit;

    for (std::size_t i = 0; i < coding.test_cases.size(); ++i) {
        const TestCase& test_case = coding.test_cases[i];

        ExecutionResult exec = short_circuit ? *short_circuit
                                             : sandbox.execute(answer.code, language, test_case.input,
                                                               coding.execution_timeout, stop);

        const bool passed = !short_circuit && exec.ok() && outputs_match(exec.stdout_text, test_case.expected_output);

        result.test_outcomes.push_back(TestCaseOutcome{
            .index = i,
            .passed = passed,
            .points_earned = passed ? test_case.points : 0,
            .points = test_case.points,
            .hidden = test_case.hidden,
            .status = exec.status,
            .failure = exec.failure,
            .actual_output = exec.stdout_text,
            .error_output = exec.stderr_text,
            .execution_time_ms = exec.execution_time_ms,
        });

        if (passed) {
            result.points_earned += test_case.points;
        }

        if (i == 0 && exec.status == ExecutionStatus::Error) {
            short_circuit = exec;
        }

        if (exec.failure == ExecutionFailure::Unavailable && !result.note) {
            result.note = "execution sandbox unavailable";
        } else if (exec.failure == ExecutionFailure::Cancelled && !result.note) {
            result.note = "grading cancelled when the attempt was finalized";
        }
    }

    LOG_DEBUG("Coding question {}: {}/{} points over {} test cases", question.id, result.points_earned,
              question.points, coding.test_cases.size());

    return result;
}

void validate_answer(const Question& question, const AnswerPayload& answer) {
    std::visit(Overloaded{
                   [&](const McqSelection& selection) {
                       if (const auto* mcq = std::get_if<McqSingle>(&question.payload)) {
                           if (selection.selected.size() != 1) {
                               throw InvalidPayloadError(fmt::format(
                                   "question '{}' takes exactly one selected option, got {}", question.id,
                                   selection.selected.size()));
                           }
                           validate_selection(question, mcq->options, selection);
                       } else if (const auto* mcq_multi = std::get_if<McqMultiple>(&question.payload)) {
                           validate_selection(question, mcq_multi->options, selection);
                       } else {
                           throw_mismatch(question, "multiple choice");
                       }
                   },
                   [&](const TextAnswer& text) {
                       const auto* constraints = std::get_if<TextResponse>(&question.payload);
                       if (constraints == nullptr) {
                           throw_mismatch(question, "text");
                       }
                       if (constraints->max_length && utf8_length(text.text) > *constraints->max_length) {
                           throw InvalidPayloadError(fmt::format("answer to '{}' exceeds {} characters", question.id,
                                                                 *constraints->max_length));
                       }
                   },
                   [&](const FileAnswer& file) {
                       const auto* constraints = std::get_if<FileUpload>(&question.payload);
                       if (constraints == nullptr) {
                           throw_mismatch(question, "file");
                       }
                       if (file.url.empty()) {
                           throw InvalidPayloadError(fmt::format("file answer to '{}' has no url", question.id));
                       }
                       const auto max_bytes = static_cast<std::size_t>(constraints->max_file_size_mb) * 1024 * 1024;
                       if (file.size_bytes > max_bytes) {
                           throw InvalidPayloadError(fmt::format("file for '{}' is larger than {} MB", question.id,
                                                                 constraints->max_file_size_mb));
                       }
                       if (!constraints->allowed_file_types.empty()) {
                           const auto ext = lowercase_extension(file.name.empty() ? file.url : file.name);
                           if (!ranges::any_of(constraints->allowed_file_types,
                                               [&ext](const std::string& allowed) { return allowed == ext; })) {
                               throw InvalidPayloadError(fmt::format("file type '{}' is not allowed for '{}' ({})",
                                                                     ext, question.id,
                                                                     constraints->allowed_file_types));
                           }
                       }
                   },
                   [&](const CodeAnswer& code) {
                       const auto* coding = std::get_if<Coding>(&question.payload);
                       if (coding == nullptr) {
                           throw_mismatch(question, "code");
                       }
                       if (!code.language.empty() && code.language != coding->language) {
                           throw InvalidPayloadError(fmt::format("question '{}' must be answered in {}, not {}",
                                                                 question.id, coding->language, code.language));
                       }
                   },
               },
               answer);
}

QuestionGrader::QuestionGrader(std::shared_ptr<SandboxExecutor> sandbox)
    : sandbox_{std::move(sandbox)} {}

GradeResult QuestionGrader::grade(const Question& question, const AnswerPayload& answer, std::stop_token stop) const {
    auto manual = [] {
        return GradeResult{.points_earned = 0, .auto_graded = false, .note = std::nullopt, .test_outcomes = {}};
    };

    try {
        return std::visit(
            Overloaded{
                [&](const McqSingle& mcq) { return grade_mcq_single(question, mcq, std::get<McqSelection>(answer)); },
                [&](const McqMultiple& mcq) {
                    return grade_mcq_multiple(question, mcq, std::get<McqSelection>(answer));
                },
                [&](const Coding& coding) {
                    if (!sandbox_) {
                        return GradeResult{.points_earned = 0,
                                           .auto_graded = false,
                                           .note = "no execution sandbox configured",
                                           .test_outcomes = {}};
                    }
                    return grade_coding(question, coding, std::get<CodeAnswer>(answer), *sandbox_, stop);
                },
                [&](const TextResponse&) { return manual(); },
                [&](const FileUpload&) { return manual(); },
            },
            question.payload);
    } catch (const std::exception& ex) {
        LOG_ERROR("Grading question {} failed: {}", question.id, ex.what());

        // Left ungraded so a reviewer can still award points
        return GradeResult{.points_earned = 0,
                           .auto_graded = false,
                           .note = fmt::format("grading failed: {}", ex.what()),
                           .test_outcomes = {}};
    }
}

} // namespace assessgrader
