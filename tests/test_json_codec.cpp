#include "catch2_custom.hpp"

#include "exceptions.hpp"
#include "model/assessment.hpp"
#include "model/attempt.hpp"
#include "model/response.hpp"
#include "serialization/json_codec.hpp"
#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <variant>
#include <vector>

using namespace assessgrader;
using nlohmann::json;

namespace {

json definition_json() {
    return json::parse(R"({
        "id": "backend-screen",
        "title": "Backend screening",
        "time_limit_minutes": 45,
        "passing_score_percentage": 60,
        "randomize_questions": true,
        "anti_cheat": {"max_tab_switches": 5},
        "questions": [
            {"id": "sum", "type": "coding", "text": "Sum two numbers", "points": 10, "display_order": 3,
             "language": "python", "execution_timeout_seconds": 3,
             "test_cases": [
                 {"input": "1 2", "expected_output": "3", "points": 4},
                 {"input": "5 5", "expected_output": "10", "points": 6, "hidden": true}
             ]},
            {"id": "http", "type": "mcq_single", "text": "Idempotent method?", "points": 5, "display_order": 1,
             "options": ["GET", "POST"], "correct_answer": "GET"},
            {"id": "acid", "type": "mcq_multiple", "text": "ACID letters", "points": 4, "display_order": 2,
             "options": [{"id": "a", "text": "Atomicity"}, {"id": "c", "text": "Consistency"}, {"id": "x", "text": "Xenon"}],
             "correct_answers": ["a", "c"]},
            {"id": "essay", "type": "text", "text": "Describe CAP", "points": 6, "display_order": 4, "max_length": 500},
            {"id": "cv", "type": "file_upload", "text": "Upload CV", "points": 0, "display_order": 5,
             "allowed_file_types": ["pdf"]}
        ]
    })");
}

} // namespace

TEST_CASE("Definitions are parsed, normalized and validated") {
    auto def = parse_definition(definition_json());

    REQUIRE(def.id == "backend-screen");
    REQUIRE(def.time_limit == std::chrono::minutes{45});
    REQUIRE(def.passing_score_percentage == 60.0);
    REQUIRE(def.randomize_questions);
    REQUIRE(def.max_attempts == 1);
    REQUIRE_FALSE(def.allow_retakes);
    REQUIRE(def.anti_cheat.max_tab_switches == 5);
    REQUIRE(def.anti_cheat.track_tab_switches);
    REQUIRE(def.total_points() == 25);

    REQUIRE(def.questions.size() == 5);
    REQUIRE(def.questions[0].id == "http");
    REQUIRE(def.questions[1].id == "acid");
    REQUIRE(def.questions[2].id == "sum");

    const auto& http = std::get<McqSingle>(def.questions[0].payload);
    REQUIRE(http.options[0].id == "GET");
    REQUIRE(http.options[0].text == "GET");

    const auto& sum = std::get<Coding>(def.questions[2].payload);
    REQUIRE(sum.execution_timeout == std::chrono::seconds{3});
    REQUIRE(sum.test_cases[1].hidden);
    REQUIRE_FALSE(sum.test_cases[0].hidden);

    REQUIRE(std::get<TextResponse>(def.questions[3].payload).max_length == 500U);
    REQUIRE(std::get<FileUpload>(def.questions[4].payload).max_file_size_mb == 10);
}

TEST_CASE("Definitions survive a trip through JSON") {
    auto def = parse_definition(definition_json());

    REQUIRE(parse_definition(json(def)) == def);
}

TEST_CASE("Broken definitions are rejected") {
    auto base = definition_json();

    SECTION("missing questions") {
        base.erase("questions");
        REQUIRE_THROWS_AS(parse_definition(base), InvalidDefinitionError);
    }

    SECTION("unknown question type") {
        base["questions"][0]["type"] = "essay";
        REQUIRE_THROWS_AS(parse_definition(base), InvalidDefinitionError);
    }

    SECTION("test case points do not add up") {
        base["questions"][0]["test_cases"][0]["points"] = 1;
        REQUIRE_THROWS_AS(parse_definition(base), InvalidDefinitionError);
    }

    SECTION("correct answer is not an option") {
        base["questions"][1]["correct_answer"] = "PUT";
        REQUIRE_THROWS_AS(parse_definition(base), InvalidDefinitionError);
    }

    SECTION("duplicate question ids") {
        base["questions"][1]["id"] = "sum";
        REQUIRE_THROWS_AS(parse_definition(base), InvalidDefinitionError);
    }

    SECTION("wrong field type") {
        base["questions"][1]["points"] = "five";
        REQUIRE_THROWS_AS(parse_definition(base), InvalidDefinitionError);
    }

    SECTION("passing score out of range") {
        base["passing_score_percentage"] = 120;
        REQUIRE_THROWS_AS(parse_definition(base), InvalidDefinitionError);
    }
}

TEST_CASE("Answers are decoded by question kind") {
    const auto single = testing::mcq_single("q1", 1);
    const auto multi = testing::mcq_multiple("q2", 1);
    const auto code = testing::coding("q3");
    const auto text = testing::text_question("q4", 1);

    REQUIRE(std::get<McqSelection>(parse_answer(single, json{{"selected_option", "b"}})).selected ==
            std::vector<std::string>{"b"});
    REQUIRE(std::get<McqSelection>(parse_answer(multi, json{{"selected_options", {"a", "b"}}})).selected ==
            std::vector<std::string>{"a", "b"});

    auto code_answer = std::get<CodeAnswer>(parse_answer(code, json{{"code", "print(1)"}}));
    REQUIRE(code_answer.code == "print(1)");
    REQUIRE(code_answer.language.empty());

    REQUIRE(std::get<TextAnswer>(parse_answer(text, json{{"text_response", "hello"}})).text == "hello");

    REQUIRE_THROWS_AS(parse_answer(text, json{{"code", "print(1)"}}), InvalidPayloadError);
    REQUIRE_THROWS_AS(parse_answer(single, json{{"selected_option", 3}}), InvalidPayloadError);
    REQUIRE_THROWS_AS(parse_answer(single, json::array()), InvalidPayloadError);
}

TEST_CASE("Candidates never see answer keys or hidden cases") {
    const auto def = parse_definition(definition_json());

    auto http = candidate_question_view(def.questions[0]);
    REQUIRE(http["type"] == "mcq_single");
    REQUIRE_FALSE(http.contains("correct_answer"));
    REQUIRE(http["options"].size() == 2);

    auto sum = candidate_question_view(def.questions[2]);
    REQUIRE(sum["test_cases"][0]["input"] == "1 2");
    REQUIRE(sum["test_cases"][1] == json{{"hidden", true}, {"points", 6}});
}

TEST_CASE("Hidden test outputs are masked unless revealed") {
    Response response;
    response.question_id = "sum";
    response.answer = CodeAnswer{.code = "print(3)", .language = "python"};
    response.test_outcomes = {
        TestCaseOutcome{.index = 0, .passed = true, .points_earned = 4, .points = 4, .hidden = false,
                        .status = ExecutionStatus::Success, .failure = std::nullopt, .actual_output = "3\n",
                        .error_output = "", .execution_time_ms = 12},
        TestCaseOutcome{.index = 1, .passed = false, .points_earned = 0, .points = 6, .hidden = true,
                        .status = ExecutionStatus::Error, .failure = ExecutionFailure::RuntimeError,
                        .actual_output = "secret\n", .error_output = "Traceback", .execution_time_ms = 9},
    };

    auto masked = response_view(response, false);
    REQUIRE(masked["test_results"][0]["actual_output"] == "3\n");
    REQUIRE(masked["test_results"][1]["actual_output"] == "[Hidden]");
    REQUIRE(masked["test_results"][1]["error_output"] == "[Hidden]");
    REQUIRE(masked["test_results"][1]["status"] == "error");
    REQUIRE(masked["test_results"][1]["failure"] == "runtime_error");
    REQUIRE(masked["answer"]["code"] == "print(3)");

    auto revealed = response_view(response, true);
    REQUIRE(revealed["test_results"][1]["actual_output"] == "secret\n");
}

TEST_CASE("Execution results use wire names") {
    ExecutionResult timed_out;
    timed_out.status = ExecutionStatus::Timeout;

    REQUIRE(json(timed_out)["status"] == "timeout");
    REQUIRE(json(timed_out)["failure"].is_null());

    auto failed = ExecutionResult::failed(ExecutionFailure::Unavailable, "down");
    REQUIRE(json(failed)["status"] == "error");
    REQUIRE(json(failed)["failure"] == "sandbox_unavailable");
    REQUIRE(json(failed)["stderr"] == "down");
}

TEST_CASE("Attempts serialize with their activity log") {
    Attempt attempt{.id = "a1", .assessment_id = "quiz", .candidate_ref = "cand"};
    attempt.state = AttemptState::Submitted;
    attempt.finalize_reason = FinalizeReason::Disqualified;
    attempt.submitted_at = TimePoint{std::chrono::sys_days{std::chrono::year{2024} / 5 / 1}} + std::chrono::hours{12};
    attempt.suspicious_activities = {
        SuspiciousActivity{.timestamp = *attempt.submitted_at, .kind = activity::TabSwitch{.count = 3}},
        SuspiciousActivity{.timestamp = *attempt.submitted_at, .kind = activity::Disqualified{.reason = "tabs"}},
    };
    attempt.score = ScoreSummary{.points_earned = 5, .total_points = 10, .percentage = 50.0, .passed = false,
                                 .questions_correct = 1};

    json out = attempt;

    REQUIRE(out["status"] == "submitted");
    REQUIRE(out["finalize_reason"] == "disqualified");
    REQUIRE(out["submitted_at"] == "2024-05-01T12:00:00Z");
    REQUIRE(out["started_at"].is_null());
    REQUIRE(out["suspicious_activities"][0]["type"] == "tab_switch");
    REQUIRE(out["suspicious_activities"][0]["count"] == 3);
    REQUIRE(out["suspicious_activities"][1]["reason"] == "tabs");
    REQUIRE(out["score"]["percentage"] == 50.0);
    REQUIRE_FALSE(out.contains("access_token"));
}

TEST_CASE("Answer keys") {
    REQUIRE(answer_key(testing::mcq_single("q", 1)) == json::array({"b"}));
    REQUIRE(answer_key(testing::mcq_multiple("q", 1)) == json::array({"a", "b"}));
    REQUIRE(answer_key(testing::coding("q")).is_null());
}
