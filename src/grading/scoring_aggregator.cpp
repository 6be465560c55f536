#include "grading/scoring_aggregator.hpp"

#include "logging.hpp"

#include <vector>

namespace assessgrader {

ScoreSummary aggregate(const Attempt& attempt, const std::vector<Response>& responses,
                       const AssessmentDefinition& definition) {
    ScoreSummary summary;
    summary.total_points = definition.total_points();

    for (const auto& response : responses) {
        const Question* question = definition.find_question(response.question_id);

        if (question == nullptr) {
            LOG_WARN("Attempt {} has a response to unknown question {}", attempt.id, response.question_id);
            continue;
        }

        if (!response.is_graded()) {
            continue;
        }

        summary.points_earned += response.points_earned;

        if (question->points > 0 && response.points_earned >= question->points) {
            ++summary.questions_correct;
        }
    }

    if (summary.total_points > 0) {
        // Multiply first so whole-number percentages come out exact
        summary.percentage = summary.points_earned * 100.0 / summary.total_points;
    }

    summary.passed = summary.percentage >= definition.passing_score_percentage;

    return summary;
}

} // namespace assessgrader
