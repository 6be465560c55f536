#include "model/assessment.hpp"

#include "common/overloaded.hpp"

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/stable_sort.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/transform.hpp>

#include <set>
#include <string>
#include <string_view>
#include <variant>

namespace assessgrader {

const std::vector<McqOption>* Question::options() const {
    return std::visit(Overloaded{[](const McqSingle& mcq) -> const std::vector<McqOption>* { return &mcq.options; },
                                 [](const McqMultiple& mcq) -> const std::vector<McqOption>* { return &mcq.options; },
                                 [](const auto& /*other*/) -> const std::vector<McqOption>* { return nullptr; }},
                      payload);
}

int AssessmentDefinition::total_points() const {
    return ranges::accumulate(questions | ranges::views::transform(&Question::points), 0);
}

const Question* AssessmentDefinition::find_question(std::string_view question_id) const {
    auto iter = ranges::find_if(questions, [question_id](const Question& q) { return q.id == question_id; });

    if (iter == questions.end()) {
        return nullptr;
    }

    return &*iter;
}

void AssessmentDefinition::normalize() {
    ranges::stable_sort(questions, {}, &Question::display_order);
}

namespace {

bool has_option(const std::vector<McqOption>& options, const std::string& option_id) {
    return ranges::any_of(options, [&option_id](const McqOption& opt) { return opt.id == option_id; });
}

Expected<void, std::string> validate_options(const Question& question, const std::vector<McqOption>& options) {
    if (options.size() < 2) {
        return fmt::format("question '{}' needs at least two options", question.id);
    }

    std::set<std::string> seen;
    for (const auto& opt : options) {
        if (opt.id.empty() || !seen.insert(opt.id).second) {
            return fmt::format("question '{}' has an empty or duplicate option id '{}'", question.id, opt.id);
        }
    }

    return {};
}

Expected<void, std::string> validate_payload(const Question& question) {
    return std::visit(
        Overloaded{
            [&](const McqSingle& mcq) -> Expected<void, std::string> {
                if (auto res = validate_options(question, mcq.options); !res) {
                    return res;
                }
                if (!has_option(mcq.options, mcq.correct_answer)) {
                    return fmt::format("question '{}': correct answer '{}' is not an option", question.id,
                                       mcq.correct_answer);
                }
                return {};
            },
            [&](const McqMultiple& mcq) -> Expected<void, std::string> {
                if (auto res = validate_options(question, mcq.options); !res) {
                    return res;
                }
                if (mcq.correct_answers.empty()) {
                    return fmt::format("question '{}' has no correct answers", question.id);
                }
                for (const auto& answer : mcq.correct_answers) {
                    if (!has_option(mcq.options, answer)) {
                        return fmt::format("question '{}': correct answer '{}' is not an option", question.id, answer);
                    }
                }
                return {};
            },
            [&](const Coding& coding) -> Expected<void, std::string> {
                if (coding.language.empty()) {
                    return fmt::format("coding question '{}' has no language", question.id);
                }
                if (coding.execution_timeout <= std::chrono::milliseconds::zero()) {
                    return fmt::format("coding question '{}' has a non-positive execution timeout", question.id);
                }
                // No test cases leaves the question to a human grader
                if (coding.test_cases.empty()) {
                    return {};
                }

                int case_points = 0;
                for (const auto& test_case : coding.test_cases) {
                    if (test_case.points < 0) {
                        return fmt::format("coding question '{}' has a test case with negative points", question.id);
                    }
                    case_points += test_case.points;
                }
                if (case_points != question.points) {
                    return fmt::format("coding question '{}': test case points sum to {}, question is worth {}",
                                       question.id, case_points, question.points);
                }
                return {};
            },
            [&](const TextResponse& /*text*/) -> Expected<void, std::string> { return {}; },
            [&](const FileUpload& upload) -> Expected<void, std::string> {
                if (upload.max_file_size_mb <= 0) {
                    return fmt::format("file upload question '{}' has a non-positive size limit", question.id);
                }
                return {};
            },
        },
        question.payload);
}

} // namespace

Expected<void, std::string> AssessmentDefinition::validate() const {
    if (id.empty()) {
        return "assessment id is empty";
    }

    if (questions.empty()) {
        return fmt::format("assessment '{}' has no questions", id);
    }

    std::set<std::string> question_ids;

    for (const auto& question : questions) {
        if (question.id.empty()) {
            return fmt::format("assessment '{}' has a question with an empty id", id);
        }
        if (!question_ids.insert(question.id).second) {
            return fmt::format("assessment '{}' has duplicate question id '{}'", id, question.id);
        }
        if (question.points < 0 || question.points > MAX_QUESTION_POINTS) {
            return fmt::format("question '{}' has {} points, expected [0, {}]", question.id, question.points,
                               MAX_QUESTION_POINTS);
        }
        if (auto res = validate_payload(question); !res) {
            return res;
        }
    }

    if (total_points() <= 0) {
        return fmt::format("assessment '{}' is worth no points", id);
    }

    if (passing_score_percentage < 0.0 || passing_score_percentage > 100.0) {
        return fmt::format("passing score {} is outside [0, 100]", passing_score_percentage);
    }

    if (time_limit && time_limit->count() <= 0) {
        return fmt::format("time limit of {} minutes is not positive", time_limit->count());
    }

    if (max_attempts < 1) {
        return fmt::format("max_attempts must be at least 1, got {}", max_attempts);
    }

    if (anti_cheat.max_tab_switches < 1) {
        return fmt::format("max_tab_switches must be at least 1, got {}", anti_cheat.max_tab_switches);
    }

    if (access_token_ttl <= std::chrono::seconds::zero()) {
        return "access token lifetime must be positive";
    }

    return {};
}

} // namespace assessgrader
