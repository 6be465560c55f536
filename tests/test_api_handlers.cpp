#include "catch2_custom.hpp"

#include "attempt/attempt_lifecycle.hpp"
#include "attempt/attempt_store.hpp"
#include "common/error_types.hpp"
#include "exceptions.hpp"
#include "grading/question_grader.hpp"
#include "orchestrator/assessment_orchestrator.hpp"
#include "orchestrator/definition_registry.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "serialization/json_codec.hpp"
#include "server/api_handlers.hpp"
#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace assessgrader;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

constexpr std::string_view REVIEW_KEY = "s3cret";

const ClientInfo CLIENT{.ip_address = "10.0.0.1", .user_agent = "browser"};

struct Service
{
    explicit Service(std::shared_ptr<SandboxExecutor> sandbox_exec =
                         std::make_shared<SandboxExecutor>(testing::echo_backend(), nullptr))
        : sandbox{std::move(sandbox_exec)}
        , lifecycle{store, QuestionGrader{sandbox}, nullptr, clock.fn()}
        , orchestrator{registry, store, lifecycle, sandbox}
        , handlers{orchestrator, std::string{REVIEW_KEY}} {}

    /// Publishes ``def`` and invites "cand" through the review routes. Returns the access token
    std::string invite(AssessmentDefinition def = testing::sample_definition()) {
        auto published = handlers.publish(json(def).dump(), REVIEW_KEY);
        REQUIRE(published.status == 201);

        auto invited = handlers.invite(def.id, R"({"candidate_ref": "cand"})", REVIEW_KEY);
        REQUIRE(invited.status == 201);

        return invited.body.at("access_token").get<std::string>();
    }

    std::string started(AssessmentDefinition def = testing::sample_definition()) {
        auto token = invite(std::move(def));
        REQUIRE(handlers.start(token, CLIENT).status == 200);
        return token;
    }

    ApiResponse answer(const std::string& token, json body) {
        return handlers.submit_response(token, body.dump(), CLIENT);
    }

    testing::ManualClock clock;
    std::shared_ptr<SandboxExecutor> sandbox;
    DefinitionRegistry registry;
    AttemptStore store;
    AttemptLifecycle lifecycle;
    AssessmentOrchestrator orchestrator;
    ApiHandlers handlers;
};

} // namespace

TEST_CASE("Engine errors map onto HTTP statuses") {
    REQUIRE(http_status_for(ErrorKind::InvalidAccessToken) == 401);
    REQUIRE(http_status_for(ErrorKind::AccessTokenExpired) == 401);
    REQUIRE(http_status_for(ErrorKind::AttemptLimitReached) == 403);
    REQUIRE(http_status_for(ErrorKind::QuestionNotFound) == 404);
    REQUIRE(http_status_for(ErrorKind::AssessmentNotFound) == 404);
    REQUIRE(http_status_for(ErrorKind::InvalidPayload) == 400);
    REQUIRE(http_status_for(ErrorKind::AttemptClosed) == 409);
    REQUIRE(http_status_for(ErrorKind::AlreadyStarted) == 409);
    REQUIRE(http_status_for(ErrorKind::TimeExpired) == 410);
    REQUIRE(http_status_for(ErrorKind::InvalidManualGrade) == 422);
    REQUIRE(http_status_for(ErrorKind::SandboxUnavailable) == 503);
    REQUIRE(http_status_for(ErrorKind::UnknownError) == 500);
}

TEST_CASE("Error codes are snake case") {
    REQUIRE(error_code_name(ErrorKind::AttemptClosed) == "attempt_closed");
    REQUIRE(error_code_name(ErrorKind::InvalidAccessToken) == "invalid_access_token");
    REQUIRE(error_code_name(ErrorKind::TimeExpired) == "time_expired");
}

TEST_CASE("Unknown tokens are rejected") {
    Service service;

    auto res = service.handlers.access("not-a-token", CLIENT);

    REQUIRE(res.status == 401);
    REQUIRE(res.body["error"] == "invalid_access_token");
}

TEST_CASE("A full candidate session") {
    Service service;
    auto token = service.invite();

    auto before = service.handlers.access(token, CLIENT);
    REQUIRE(before.status == 200);
    REQUIRE(before.body["attempt"]["status"] == "not_started");
    REQUIRE_FALSE(before.body.contains("questions"));
    REQUIRE(before.body["assessment"]["total_points"] == 40);

    REQUIRE(service.answer(token, {{"question_id", "q1"}, {"answer", {{"selected_option", "b"}}}}).status == 409);

    auto started = service.handlers.start(token, CLIENT);
    REQUIRE(started.status == 200);
    REQUIRE(started.body["attempt"]["status"] == "in_progress");
    REQUIRE(started.body["questions"].size() == 4);
    REQUIRE_FALSE(started.body["questions"][0].contains("correct_answer"));

    auto recorded = service.answer(token, {{"question_id", "q1"}, {"answer", {{"selected_option", "b"}}},
                                           {"time_spent_seconds", 12}});
    REQUIRE(recorded.status == 200);
    REQUIRE(recorded.body["recorded"] == true);
    REQUIRE(recorded.body["question_id"] == "q1");

    REQUIRE(service.answer(token, {{"question_id", "q3"}, {"answer", {{"code", "x"}, {"language", "python"}}}})
                .status == 200);

    SECTION("results wait for submission") {
        auto early = service.handlers.results(token, CLIENT);
        REQUIRE(early.status == 409);
        REQUIRE(early.body["error"] == "attempt_not_finalized");
    }

    SECTION("submission and results") {
        auto submitted = service.handlers.submit(token, CLIENT);
        REQUIRE(submitted.status == 200);
        REQUIRE(submitted.body["attempt"]["is_submitted"] == true);
        REQUIRE(submitted.body["attempt"]["score"]["points_earned"] == 20);

        auto results = service.handlers.results(token, CLIENT);
        REQUIRE(results.status == 200);
        REQUIRE(results.body["responses"].size() == 2);
        REQUIRE_FALSE(results.body["responses"][0].contains("correct_answers"));

        const auto& code_results = results.body["responses"][1]["test_results"];
        REQUIRE(code_results[0]["actual_output"] == "x1\n");
        REQUIRE(code_results[1]["actual_output"] == "[Hidden]");

        // Nothing changes after submission
        auto late = service.answer(token, {{"question_id", "q1"}, {"answer", {{"selected_option", "a"}}}});
        REQUIRE(late.status == 409);
        REQUIRE(late.body["error"] == "attempt_closed");

        REQUIRE(service.handlers.start(token, CLIENT).status == 409);
    }
}

TEST_CASE("Correct answers are shown when the assessment allows it") {
    Service service;
    auto def = testing::sample_definition();
    def.show_correct_answers = true;
    auto token = service.started(def);

    service.answer(token, {{"question_id", "q1"}, {"answer", {{"selected_option", "a"}}}});
    service.handlers.submit(token, CLIENT);

    auto results = service.handlers.results(token, CLIENT);
    REQUIRE(results.body["responses"][0]["correct_answers"] == json::array({"b"}));
}

TEST_CASE("Malformed requests are payload errors") {
    Service service;
    auto token = service.started();

    REQUIRE(service.handlers.submit_response(token, "{ nope", CLIENT).status == 400);
    REQUIRE(service.handlers.submit_response(token, "[]", CLIENT).status == 400);
    REQUIRE(service.answer(token, {{"answer", {{"selected_option", "b"}}}}).status == 400);
    REQUIRE(service.answer(token, {{"question_id", "q1"}, {"answer", {{"text_response", "b"}}}}).status == 400);
    REQUIRE(service.answer(token, {{"question_id", "q1"}, {"answer", {{"selected_option", "zz"}}}}).status == 400);

    auto unknown = service.answer(token, {{"question_id", "q77"}, {"answer", {{"selected_option", "b"}}}});
    REQUIRE(unknown.status == 404);
    REQUIRE(unknown.body["error"] == "question_not_found");

    REQUIRE(service.handlers.report_activity(token, R"({"event_type": "mouse_wiggle"})", CLIENT).status == 400);
}

TEST_CASE("Activity reports reach the anti-cheat monitor") {
    Service service;
    auto token = service.started();

    auto first = service.handlers.report_activity(token, R"({"event_type": "tab_switch"})", CLIENT);
    REQUIRE(first.status == 200);
    REQUIRE(first.body["tab_switch_count"] == 1);
    REQUIRE(first.body["disqualified"] == false);

    service.handlers.report_activity(token, R"({"event_type": "copy_paste", "details": "500 chars"})", CLIENT);
    service.handlers.report_activity(token, R"({"event_type": "tab_switch"})", CLIENT);
    auto third = service.handlers.report_activity(token, R"({"event_type": "tab_switch"})", CLIENT);

    REQUIRE(third.status == 200);
    REQUIRE(third.body["disqualified"] == true);
    REQUIRE(third.body["status"] == "submitted");
    REQUIRE(third.body["flagged_for_review"] == true);

    REQUIRE(service.handlers.results(token, CLIENT).status == 200);
}

TEST_CASE("A changed client address is flagged") {
    Service service;
    auto token = service.started();

    ClientInfo moved = CLIENT;
    moved.ip_address = "192.168.7.7";

    service.answer(token, {{"question_id", "q1"}, {"answer", {{"selected_option", "b"}}}});
    REQUIRE(service.handlers.submit_response(
                    token, json{{"question_id", "q1"}, {"answer", {{"selected_option", "b"}}}}.dump(), moved)
                .status == 200);

    auto attempt = service.store.by_token(token)->snapshot();
    REQUIRE(attempt.flagged_for_review);
    REQUIRE(attempt.ip_address == "192.168.7.7");
}

TEST_CASE("Expired time limits finalize and say so") {
    Service service;
    auto def = testing::sample_definition();
    def.time_limit = std::chrono::minutes{10};
    auto token = service.started(def);

    service.answer(token, {{"question_id", "q1"}, {"answer", {{"selected_option", "b"}}}});
    service.clock.advance(11min);

    auto late = service.answer(token, {{"question_id", "q2"}, {"answer", {{"selected_options", {"a", "b"}}}}});

    REQUIRE(late.status == 410);
    REQUIRE(late.body["error"] == "time_expired");
    REQUIRE(late.body["attempt"]["finalize_reason"] == "time_expired");
    REQUIRE(late.body["attempt"]["score"]["points_earned"] == 10);

    auto results = service.handlers.results(token, CLIENT);
    REQUIRE(results.status == 200);
    REQUIRE(results.body["responses"].size() == 1);
}

TEST_CASE("Every route finalizes an attempt past its time limit") {
    auto backend = testing::echo_backend();
    Service service{std::make_shared<SandboxExecutor>(backend, nullptr)};
    auto def = testing::sample_definition();
    def.time_limit = std::chrono::minutes{30};
    auto token = service.started(def);

    service.clock.advance(31min);

    SECTION("viewing the attempt") {
        auto viewed = service.handlers.access(token, CLIENT);

        REQUIRE(viewed.status == 410);
        REQUIRE_FALSE(viewed.body.contains("questions"));
        REQUIRE(viewed.body["attempt"]["status"] == "submitted");
        REQUIRE(viewed.body["attempt"]["finalize_reason"] == "time_expired");

        auto again = service.handlers.access(token, CLIENT);
        REQUIRE(again.status == 200);
        REQUIRE(again.body["time_remaining_seconds"] == 0);
        REQUIRE_FALSE(again.body.contains("questions"));
    }

    SECTION("running code") {
        auto ran = service.handlers.execute_code(token, R"({"question_id": "q3", "code": "x"})", CLIENT);

        REQUIRE(ran.status == 410);
        REQUIRE(backend->calls == 0);
    }

    SECTION("listing questions") {
        REQUIRE_THROWS_AS(service.orchestrator.questions(token), TimeExpiredError);
        REQUIRE_THROWS_AS(service.orchestrator.questions(token), AttemptClosedError);
    }
}

TEST_CASE("Resuming after the time limit reports the finalized attempt") {
    Service service;
    auto def = testing::sample_definition();
    def.time_limit = std::chrono::minutes{10};
    auto token = service.started(def);

    service.clock.advance(1h);

    auto resumed = service.handlers.start(token, CLIENT);
    REQUIRE(resumed.status == 410);
    REQUIRE(resumed.body["attempt"]["is_submitted"] == true);
}

TEST_CASE("Expired invitations") {
    Service service;
    auto def = testing::sample_definition();
    def.access_token_ttl = 1h;
    auto token = service.invite(def);

    service.clock.advance(2h);

    auto res = service.handlers.start(token, CLIENT);
    REQUIRE(res.status == 401);
    REQUIRE(res.body["error"] == "access_token_expired");
}

TEST_CASE("Running code") {
    Service service;
    auto token = service.started();

    auto ran = service.handlers.execute_code(token, R"({"question_id": "q3", "code": "hello ", "stdin": "world"})",
                                             CLIENT);
    REQUIRE(ran.status == 200);
    REQUIRE(ran.body["status"] == "success");
    REQUIRE(ran.body["stdout"] == "hello world\n");

    // Running is not answering
    REQUIRE(service.orchestrator.attempt_record(service.store.by_token(token)->snapshot().id).responses.empty());

    auto not_code = service.handlers.execute_code(token, R"({"question_id": "q1", "code": "x"})", CLIENT);
    REQUIRE(not_code.status == 400);
}

TEST_CASE("Running code without a sandbox") {
    Service service{nullptr};
    auto token = service.started();

    auto res = service.handlers.execute_code(token, R"({"question_id": "q3", "code": "x"})", CLIENT);

    REQUIRE(res.status == 503);
    REQUIRE(res.body["error"] == "sandbox_unavailable");
}

TEST_CASE("Review routes need the review key") {
    Service service;
    service.invite();

    REQUIRE(service.handlers.list_attempts("quiz", std::nullopt).status == 401);
    REQUIRE(service.handlers.list_attempts("quiz", "wrong").status == 401);
    REQUIRE(service.handlers.publish(json(testing::sample_definition("x")).dump(), std::nullopt).status == 401);

    auto listed = service.handlers.list_attempts("quiz", REVIEW_KEY);
    REQUIRE(listed.status == 200);
    REQUIRE(listed.body["attempts"].size() == 1);

    REQUIRE(service.handlers.list_attempts("nope", REVIEW_KEY).status == 404);
    REQUIRE(service.handlers.attempt_record("nope", REVIEW_KEY).status == 404);
}

TEST_CASE("Invitations follow attempt rules") {
    Service service;
    service.invite();

    auto again = service.handlers.invite("quiz", R"({"candidate_ref": "cand"})", REVIEW_KEY);
    REQUIRE(again.status == 409);
    REQUIRE(again.body["error"] == "already_started");

    REQUIRE(service.handlers.invite("missing", R"({"candidate_ref": "cand"})", REVIEW_KEY).status == 404);

    // Inviting freezes the definition
    auto changed = testing::sample_definition();
    changed.title = "Changed";
    auto republished = service.handlers.publish(json(changed).dump(), REVIEW_KEY);
    REQUIRE(republished.status == 409);
    REQUIRE(republished.body["error"] == "definition_frozen");
}

TEST_CASE("Publishing validates the definition") {
    Service service;

    auto res = service.handlers.publish(R"({"id": "empty", "questions": []})", REVIEW_KEY);

    REQUIRE(res.status == 400);
    REQUIRE(res.body["error"] == "invalid_definition");
}

TEST_CASE("Manual grading through the review routes") {
    Service service;
    auto token = service.started();

    service.answer(token, {{"question_id", "q4"}, {"answer", {{"text_response", "an essay"}}}});
    auto attempt_id = service.store.by_token(token)->snapshot().id;

    auto too_early = service.handlers.manual_grade(attempt_id, "q4", R"({"points": 5, "graded_by": "rev"})", REVIEW_KEY);
    REQUIRE(too_early.status == 409);

    service.handlers.submit(token, CLIENT);

    auto out_of_range =
        service.handlers.manual_grade(attempt_id, "q4", R"({"points": 50, "graded_by": "rev"})", REVIEW_KEY);
    REQUIRE(out_of_range.status == 422);

    auto graded = service.handlers.manual_grade(
        attempt_id, "q4", R"({"points": 7, "comments": "solid", "graded_by": "rev"})", REVIEW_KEY);
    REQUIRE(graded.status == 200);
    REQUIRE(graded.body["attempt"]["score"]["points_earned"] == 7);

    auto record = service.handlers.attempt_record(attempt_id, REVIEW_KEY);
    REQUIRE(record.status == 200);
    REQUIRE(record.body["responses"][0]["graded_by"] == "rev");
    REQUIRE(record.body["responses"][0]["grader_comments"] == "solid");
}

TEST_CASE("Health reports the languages") {
    Service service;

    auto res = service.handlers.health();

    REQUIRE(res.status == 200);
    REQUIRE(res.body["status"] == "ok");
    REQUIRE(res.body["languages"] == json::array({"python"}));
}
