#include "catch2_custom.hpp"

#include "exceptions.hpp"
#include "grading/question_grader.hpp"
#include "model/assessment.hpp"
#include "model/response.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stop_token>
#include <string>
#include <variant>

using namespace assessgrader;

namespace {

McqSelection picked(std::initializer_list<std::string> ids) {
    return McqSelection{.selected = ids};
}

std::shared_ptr<SandboxExecutor> echo_sandbox() {
    return std::make_shared<SandboxExecutor>(testing::echo_backend(), nullptr,
                                             SandboxConfig{.workers = 2, .max_queue = 8, .grace = std::chrono::seconds{2}});
}

} // namespace

TEST_CASE("Output comparison ignores trailing line terminators only") {
    REQUIRE(outputs_match("42\n", "42"));
    REQUIRE(outputs_match("42\r\n", "42\n"));
    REQUIRE(outputs_match("a\nb\n\n", "a\nb"));
    REQUIRE_FALSE(outputs_match(" 42", "42"));
    REQUIRE_FALSE(outputs_match("42 ", "42"));
    REQUIRE_FALSE(outputs_match("4\n2", "42"));
}

TEST_CASE("Single answer MCQ is all or nothing") {
    const auto question = testing::mcq_single("q", 10);
    const auto& mcq = std::get<McqSingle>(question.payload);

    auto right = grade_mcq_single(question, mcq, picked({"b"}));
    REQUIRE(right.points_earned == 10);
    REQUIRE(right.auto_graded);

    auto wrong = grade_mcq_single(question, mcq, picked({"a"}));
    REQUIRE(wrong.points_earned == 0);
    REQUIRE(wrong.auto_graded);
}

TEST_CASE("Multiple answer MCQ awards partial credit") {
    const auto question = testing::mcq_multiple("q", 10);
    const auto& mcq = std::get<McqMultiple>(question.payload);

    SECTION("exact match") {
        REQUIRE(grade_mcq_multiple(question, mcq, picked({"b", "a"})).points_earned == 10);
    }

    SECTION("half of the correct options") {
        REQUIRE(grade_mcq_multiple(question, mcq, picked({"a"})).points_earned == 5);
    }

    SECTION("one right, one wrong") {
        // 1/2 - 0.5 * 1/2 = 0.25
        REQUIRE(grade_mcq_multiple(question, mcq, picked({"a", "c"})).points_earned == 2);
    }

    SECTION("everything selected") {
        // 2/2 - 0.5 * 2/2 = 0.5
        REQUIRE(grade_mcq_multiple(question, mcq, picked({"a", "b", "c", "d"})).points_earned == 5);
    }

    SECTION("only wrong options never go negative") {
        REQUIRE(grade_mcq_multiple(question, mcq, picked({"c", "d"})).points_earned == 0);
    }

    SECTION("nothing selected") {
        REQUIRE(grade_mcq_multiple(question, mcq, picked({})).points_earned == 0);
    }
}

TEST_CASE("Answers are validated against their question") {
    const auto single = testing::mcq_single("q1", 10);
    const auto multi = testing::mcq_multiple("q2", 10);
    const auto code = testing::coding("q3");
    const auto text = testing::text_question("q4", 5);

    REQUIRE_NOTHROW(validate_answer(single, picked({"a"})));
    REQUIRE_THROWS_AS(validate_answer(single, picked({"a", "b"})), InvalidPayloadError);
    REQUIRE_THROWS_AS(validate_answer(single, picked({"z"})), InvalidPayloadError);
    REQUIRE_THROWS_AS(validate_answer(single, TextAnswer{"b"}), InvalidPayloadError);

    REQUIRE_NOTHROW(validate_answer(multi, picked({})));
    REQUIRE_THROWS_AS(validate_answer(multi, picked({"a", "x"})), InvalidPayloadError);

    REQUIRE_NOTHROW(validate_answer(code, CodeAnswer{.code = "print(1)", .language = ""}));
    REQUIRE_NOTHROW(validate_answer(code, CodeAnswer{.code = "print(1)", .language = "python"}));
    REQUIRE_THROWS_AS(validate_answer(code, CodeAnswer{.code = "int main(){}", .language = "cpp"}),
                      InvalidPayloadError);

    // max_length counts code points, not bytes
    REQUIRE_NOTHROW(validate_answer(text, TextAnswer{std::string(20, 'a')}));
    REQUIRE_NOTHROW(validate_answer(text, TextAnswer{"\xc3\xa9\xc3\xa9\xc3\xa9"}));
    REQUIRE_THROWS_AS(validate_answer(text, TextAnswer{std::string(21, 'a')}), InvalidPayloadError);
}

TEST_CASE("File answers respect type and size limits") {
    const Question upload{.id = "f",
                          .text = "Upload your report",
                          .points = 5,
                          .display_order = 1,
                          .payload = FileUpload{.allowed_file_types = {"pdf", "docx"}, .max_file_size_mb = 1}};

    REQUIRE_NOTHROW(validate_answer(upload, FileAnswer{.url = "https://files/x", .name = "Report.PDF", .size_bytes = 10}));
    REQUIRE_THROWS_AS(validate_answer(upload, FileAnswer{.url = "https://files/x", .name = "report.exe", .size_bytes = 10}),
                      InvalidPayloadError);
    REQUIRE_THROWS_AS(
        validate_answer(upload, FileAnswer{.url = "https://files/x", .name = "report.pdf", .size_bytes = 2 * 1024 * 1024}),
        InvalidPayloadError);
    REQUIRE_THROWS_AS(validate_answer(upload, FileAnswer{.url = "", .name = "report.pdf", .size_bytes = 1}),
                      InvalidPayloadError);
}

TEST_CASE("Coding answers are run against every test case") {
    auto sandbox = echo_sandbox();
    const auto question = testing::coding("q3");
    const auto& spec = std::get<Coding>(question.payload);

    SECTION("all cases pass") {
        auto res = grade_coding(question, spec, CodeAnswer{.code = "x", .language = ""}, *sandbox);

        REQUIRE(res.auto_graded);
        REQUIRE(res.points_earned == 10);
        REQUIRE(res.test_outcomes.size() == 2);
        REQUIRE(res.test_outcomes[0].passed);
        REQUIRE(res.test_outcomes[1].passed);
        REQUIRE(res.test_outcomes[1].hidden);
        REQUIRE(res.test_outcomes[0].actual_output == "x1\n");
    }

    SECTION("wrong output earns nothing") {
        auto res = grade_coding(question, spec, CodeAnswer{.code = "y", .language = ""}, *sandbox);

        REQUIRE(res.auto_graded);
        REQUIRE(res.points_earned == 0);
        REQUIRE(res.test_outcomes.size() == 2);
        REQUIRE(res.test_outcomes[0].status == ExecutionStatus::Success);
        REQUIRE_FALSE(res.test_outcomes[0].passed);
    }

    SECTION("a compile error fails every case") {
        auto res = grade_coding(question, spec, CodeAnswer{.code = "syntax error", .language = ""}, *sandbox);

        REQUIRE(res.points_earned == 0);
        REQUIRE(res.test_outcomes.size() == 2);
        for (const auto& outcome : res.test_outcomes) {
            REQUIRE_FALSE(outcome.passed);
            REQUIRE(outcome.failure == ExecutionFailure::CompileError);
        }
    }
}

TEST_CASE("Coding points are the sum of the passing cases") {
    auto sandbox = echo_sandbox();
    auto question = testing::coding("weighted");
    question.points = 45;
    auto& spec = std::get<Coding>(question.payload);
    spec.test_cases = {{.input = "1", .expected_output = "x1", .points = 20, .hidden = false},
                       {.input = "2", .expected_output = "x2", .points = 15, .hidden = false},
                       {.input = "3", .expected_output = "not what it prints", .points = 10, .hidden = true}};

    auto res = grade_coding(question, spec, CodeAnswer{.code = "x", .language = ""}, *sandbox);

    REQUIRE(res.auto_graded);
    REQUIRE(res.points_earned == 35);
    REQUIRE(res.test_outcomes.size() == 3);
    REQUIRE(res.test_outcomes[0].passed);
    REQUIRE(res.test_outcomes[1].passed);
    REQUIRE_FALSE(res.test_outcomes[2].passed);
}

TEST_CASE("Coding questions without test cases wait for a reviewer") {
    auto sandbox = echo_sandbox();
    auto question = testing::coding("q");
    std::get<Coding>(question.payload).test_cases.clear();

    auto res = grade_coding(question, std::get<Coding>(question.payload), CodeAnswer{.code = "x", .language = ""},
                            *sandbox);

    REQUIRE_FALSE(res.auto_graded);
    REQUIRE(res.points_earned == 0);
    REQUIRE(res.note.has_value());
}

TEST_CASE("A cancelled grading run fails its cases") {
    auto sandbox = echo_sandbox();
    const auto question = testing::coding("q3");

    std::stop_source stop;
    stop.request_stop();

    auto res = grade_coding(question, std::get<Coding>(question.payload), CodeAnswer{.code = "x", .language = ""},
                            *sandbox, stop.get_token());

    REQUIRE(res.points_earned == 0);
    REQUIRE(res.test_outcomes.front().failure == ExecutionFailure::Cancelled);
}

TEST_CASE("QuestionGrader dispatches on the question kind") {
    QuestionGrader grader{echo_sandbox()};

    REQUIRE(grader.grade(testing::mcq_single("q1", 4), picked({"b"})).points_earned == 4);
    REQUIRE(grader.grade(testing::coding("q3"), CodeAnswer{.code = "x", .language = "python"}).points_earned == 10);

    auto text = grader.grade(testing::text_question("q4", 5), TextAnswer{"because"});
    REQUIRE_FALSE(text.auto_graded);
    REQUIRE(text.points_earned == 0);
}

TEST_CASE("QuestionGrader without a sandbox leaves code for manual grading") {
    QuestionGrader grader{nullptr};

    auto res = grader.grade(testing::coding("q3"), CodeAnswer{.code = "x", .language = ""});

    REQUIRE_FALSE(res.auto_graded);
    REQUIRE(res.points_earned == 0);
    REQUIRE(res.note == "no execution sandbox configured");
}

TEST_CASE("QuestionGrader turns grading failures into ungraded results") {
    QuestionGrader grader{nullptr};

    // Wrong answer kind slipping past validation
    auto res = grader.grade(testing::mcq_single("q1", 4), TextAnswer{"b"});

    REQUIRE_FALSE(res.auto_graded);
    REQUIRE(res.points_earned == 0);
    REQUIRE(res.note.has_value());
}
