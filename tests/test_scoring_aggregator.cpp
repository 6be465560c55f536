#include "catch2_custom.hpp"

#include "grading/scoring_aggregator.hpp"
#include "model/assessment.hpp"
#include "model/attempt.hpp"
#include "model/response.hpp"
#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace assessgrader;

namespace {

Response graded(std::string question_id, int points, bool auto_graded = true) {
    Response res;
    res.attempt_id = "a";
    res.question_id = std::move(question_id);
    res.points_earned = points;
    res.auto_graded = auto_graded;
    return res;
}

} // namespace

TEST_CASE("No responses scores zero") {
    const auto def = testing::sample_definition();
    const Attempt attempt{.id = "a"};

    auto summary = aggregate(attempt, {}, def);

    REQUIRE(summary.total_points == 40);
    REQUIRE(summary.points_earned == 0);
    REQUIRE(summary.percentage == 0.0);
    REQUIRE_FALSE(summary.passed);
    REQUIRE(summary.questions_correct == 0);
}

TEST_CASE("Points, percentage and pass mark") {
    const auto def = testing::sample_definition();
    const Attempt attempt{.id = "a"};

    SECTION("exactly on the pass mark passes") {
        auto summary = aggregate(attempt, {graded("q1", 10), graded("q2", 10)}, def);

        REQUIRE(summary.points_earned == 20);
        REQUIRE(summary.percentage == 50.0);
        REQUIRE(summary.passed);
        REQUIRE(summary.questions_correct == 2);
    }

    SECTION("partial credit does not make a question correct") {
        auto summary = aggregate(attempt, {graded("q1", 10), graded("q2", 5)}, def);

        REQUIRE(summary.points_earned == 15);
        REQUIRE(summary.percentage == 37.5);
        REQUIRE_FALSE(summary.passed);
        REQUIRE(summary.questions_correct == 1);
    }
}

TEST_CASE("A 70% pass mark") {
    AssessmentDefinition def;
    def.id = "pass-mark";
    def.questions = {testing::text_question("essay", 100)};
    def.passing_score_percentage = 70.0;
    const Attempt attempt{.id = "a"};

    auto above = aggregate(attempt, {graded("essay", 72)}, def);
    REQUIRE(above.percentage == 72.0);
    REQUIRE(above.passed);

    auto below = aggregate(attempt, {graded("essay", 69)}, def);
    REQUIRE(below.percentage == 69.0);
    REQUIRE_FALSE(below.passed);
}

TEST_CASE("Ungraded responses count as zero") {
    const auto def = testing::sample_definition();
    const Attempt attempt{.id = "a"};

    auto pending = graded("q4", 10, /*auto_graded=*/false);

    auto summary = aggregate(attempt, {graded("q1", 10), pending}, def);
    REQUIRE(summary.points_earned == 10);

    pending.graded_at = TimePoint{};
    summary = aggregate(attempt, {graded("q1", 10), pending}, def);
    REQUIRE(summary.points_earned == 20);
    REQUIRE(summary.questions_correct == 2);
}

TEST_CASE("Responses to unknown questions are ignored") {
    const auto def = testing::sample_definition();
    const Attempt attempt{.id = "a"};

    auto summary = aggregate(attempt, {graded("q1", 10), graded("bogus", 1000)}, def);

    REQUIRE(summary.points_earned == 10);
    REQUIRE(summary.percentage == 25.0);
}
