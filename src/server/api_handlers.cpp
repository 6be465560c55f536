#include "server/api_handlers.hpp"

#include "exceptions.hpp"
#include "logging.hpp"
#include "serialization/json_codec.hpp"
#include "version.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace assessgrader {

using nlohmann::json;

namespace {

json parse_body(std::string_view body) {
    auto parsed = json::parse(body);

    if (!parsed.is_object()) {
        throw InvalidPayloadError("request body must be a JSON object");
    }

    return parsed;
}

ApiResponse error_response(const AssessmentError& err) {
    return ApiResponse{.status = http_status_for(err.get_error()),
                       .body = {{"error", error_code_name(err.get_error())}, {"message", err.what()}}};
}

ActivityType parse_activity_type(const std::string& name) {
    if (name == "tab_switch") {
        return ActivityType::TabSwitch;
    }
    if (name == "ip_change") {
        return ActivityType::IpChange;
    }
    if (name == "copy_paste") {
        return ActivityType::CopyPaste;
    }
    if (name == "full_screen_exit") {
        return ActivityType::FullScreenExit;
    }

    throw InvalidPayloadError(fmt::format("unknown event_type '{}'", name));
}

json assessment_summary(const AssessmentDefinition& definition) {
    return {{"id", definition.id},
            {"title", definition.title},
            {"description", definition.description},
            {"time_limit_minutes", definition.time_limit ? json(definition.time_limit->count()) : nullptr},
            {"total_points", definition.total_points()},
            {"question_count", definition.questions.size()},
            {"passing_score_percentage", definition.passing_score_percentage}};
}

json time_remaining_json(const std::optional<std::chrono::seconds>& remaining) {
    if (!remaining) {
        return nullptr;
    }
    return remaining->count();
}

json responses_json(const AttemptRecord& record, bool reveal_hidden, bool reveal_answers) {
    auto result = json::array();

    for (const auto& response : record.responses) {
        auto view = response_view(response, reveal_hidden);

        if (reveal_answers) {
            if (const auto* question = record.definition->find_question(response.question_id)) {
                view["correct_answers"] = answer_key(*question);
            }
        }

        result.push_back(std::move(view));
    }

    return result;
}

} // namespace

int http_status_for(ErrorKind error) {
    switch (error) {
    case ErrorKind::InvalidAccessToken:
    case ErrorKind::AccessTokenExpired:
        return 401;
    case ErrorKind::AttemptLimitReached:
        return 403;
    case ErrorKind::AttemptNotFound:
    case ErrorKind::QuestionNotFound:
    case ErrorKind::AssessmentNotFound:
        return 404;
    case ErrorKind::InvalidPayload:
    case ErrorKind::InvalidDefinition:
    case ErrorKind::UnsupportedLanguage:
        return 400;
    case ErrorKind::AttemptClosed:
    case ErrorKind::AlreadyStarted:
    case ErrorKind::AttemptNotStarted:
    case ErrorKind::AttemptNotFinalized:
    case ErrorKind::DefinitionFrozen:
        return 409;
    case ErrorKind::TimeExpired:
        return 410;
    case ErrorKind::InvalidManualGrade:
        return 422;
    case ErrorKind::SandboxUnavailable:
        return 503;
    default:
        return 500;
    }
}

std::string error_code_name(ErrorKind error) {
    // "AttemptClosed" -> "attempt_closed"
    auto camel = fmt::format("{}", error);
    std::string snake;

    for (char chr : camel) {
        if (std::isupper(static_cast<unsigned char>(chr)) != 0) {
            if (!snake.empty()) {
                snake += '_';
            }
            snake += static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
        } else {
            snake += chr;
        }
    }

    return snake;
}

ApiHandlers::ApiHandlers(AssessmentOrchestrator& orchestrator, std::optional<std::string> review_key)
    : orchestrator_{orchestrator}
    , review_key_{std::move(review_key)} {}

template <typename Handler>
ApiResponse ApiHandlers::guarded(std::string_view token, Handler&& handler) {
    try {
        return std::forward<Handler>(handler)();
    } catch (const TimeExpiredError& ex) {
        auto response = error_response(ex);

        try {
            response.body["attempt"] = attempt_summary(orchestrator_.results(token).attempt);
        } catch (const AssessmentError& inner) {
            LOG_WARN("Could not attach the expired attempt to the response: {}", inner.what());
        }

        return response;
    } catch (const AssessmentError& ex) {
        LOG_DEBUG("Request failed: {}", ex);
        return error_response(ex);
    } catch (const nlohmann::json::exception& ex) {
        return ApiResponse{.status = 400, .body = {{"error", "invalid_payload"}, {"message", ex.what()}}};
    } catch (const std::exception& ex) {
        LOG_ERROR("Unhandled exception while serving a request: {}", ex.what());
        return ApiResponse{.status = 500, .body = {{"error", "internal_error"}, {"message", "internal error"}}};
    }
}

template <typename Handler>
ApiResponse ApiHandlers::guarded_review(std::optional<std::string_view> review_key, Handler&& handler) {
    if (review_key_ && (!review_key || *review_key != *review_key_)) {
        LOG_WARN("Rejected review request with a missing or wrong review key");
        return ApiResponse{.status = 401, .body = {{"error", "unauthorized"}, {"message", "review key required"}}};
    }

    return guarded("", std::forward<Handler>(handler));
}

json ApiHandlers::attempt_summary(const Attempt& attempt) const {
    return {{"id", attempt.id},
            {"assessment_id", attempt.assessment_id},
            {"attempt_number", attempt.attempt_number},
            {"status", json(attempt).at("status")},
            {"started_at", attempt.started_at ? time_to_json(*attempt.started_at) : nullptr},
            {"submitted_at", attempt.submitted_at ? time_to_json(*attempt.submitted_at) : nullptr},
            {"is_submitted", attempt.is_submitted()},
            {"finalize_reason", json(attempt).at("finalize_reason")},
            {"time_elapsed_seconds", attempt.time_elapsed_seconds ? json(*attempt.time_elapsed_seconds) : nullptr},
            {"score", attempt.score ? json(*attempt.score) : nullptr}};
}

ApiResponse ApiHandlers::access(std::string_view token, const ClientInfo& client) {
    return guarded(token, [&] {
        auto view = orchestrator_.access(token, client.ip_address);

        json body = {{"attempt", attempt_summary(view.attempt)},
                     {"assessment", assessment_summary(*view.definition)},
                     {"time_remaining_seconds", time_remaining_json(view.time_remaining)}};

        if (view.attempt.is_in_progress()) {
            auto questions = json::array();
            for (const auto& question : orchestrator_.questions(token)) {
                questions.push_back(candidate_question_view(question));
            }
            body["questions"] = std::move(questions);
        }

        return ApiResponse{.status = 200, .body = std::move(body)};
    });
}

ApiResponse ApiHandlers::start(std::string_view token, const ClientInfo& client) {
    return guarded(token, [&] {
        auto attempt = orchestrator_.start(token, client.ip_address, client.user_agent);

        if (attempt.is_submitted()) {
            // Resumed after the time limit elapsed: the attempt was finalized on the spot
            return ApiResponse{.status = http_status_for(ErrorKind::TimeExpired),
                               .body = {{"error", error_code_name(ErrorKind::TimeExpired)},
                                        {"message", "time limit elapsed before the attempt was resumed"},
                                        {"attempt", attempt_summary(attempt)}}};
        }

        auto questions = json::array();
        for (const auto& question : orchestrator_.questions(token)) {
            questions.push_back(candidate_question_view(question));
        }

        auto view = orchestrator_.access(token, client.ip_address);

        return ApiResponse{.status = 200,
                           .body = {{"attempt", attempt_summary(attempt)},
                                    {"assessment", assessment_summary(*view.definition)},
                                    {"time_remaining_seconds", time_remaining_json(view.time_remaining)},
                                    {"questions", std::move(questions)}}};
    });
}

ApiResponse ApiHandlers::submit_response(std::string_view token, std::string_view body, const ClientInfo& client) {
    return guarded(token, [&] {
        orchestrator_.report_activity(token, ActivityType::IpChange, "", client.ip_address);

        auto request = parse_body(body);
        auto question = orchestrator_.question(token, request.at("question_id").get<std::string>());
        auto answer = parse_answer(question, request.at("answer"));

        std::optional<int> time_spent;
        if (request.contains("time_spent_seconds") && !request.at("time_spent_seconds").is_null()) {
            time_spent = request.at("time_spent_seconds").get<int>();
        }

        auto response = orchestrator_.submit_response(token, question.id, answer, time_spent);

        return ApiResponse{.status = 200,
                           .body = {{"question_id", response.question_id},
                                    {"recorded", true},
                                    {"submitted_at", time_to_json(response.submitted_at)},
                                    {"updated_at", time_to_json(response.updated_at)}}};
    });
}

ApiResponse ApiHandlers::submit(std::string_view token, const ClientInfo& client) {
    return guarded(token, [&] {
        orchestrator_.report_activity(token, ActivityType::IpChange, "", client.ip_address);

        auto attempt = orchestrator_.submit(token);

        return ApiResponse{.status = 200, .body = {{"attempt", attempt_summary(attempt)}}};
    });
}

ApiResponse ApiHandlers::results(std::string_view token, const ClientInfo& client) {
    return guarded(token, [&] {
        orchestrator_.report_activity(token, ActivityType::IpChange, "", client.ip_address);

        auto record = orchestrator_.results(token);

        return ApiResponse{
            .status = 200,
            .body = {{"attempt", attempt_summary(record.attempt)},
                     {"assessment", assessment_summary(*record.definition)},
                     {"responses", responses_json(record, false, record.definition->show_correct_answers)}}};
    });
}

ApiResponse ApiHandlers::report_activity(std::string_view token, std::string_view body, const ClientInfo& client) {
    return guarded(token, [&] {
        auto request = parse_body(body);
        auto type = parse_activity_type(request.at("event_type").get<std::string>());
        std::string details = request.value("details", "");

        auto attempt = orchestrator_.report_activity(token, type, std::move(details), client.ip_address);

        return ApiResponse{
            .status = 200,
            .body = {{"status", json(attempt).at("status")},
                     {"tab_switch_count", attempt.tab_switch_count},
                     {"flagged_for_review", attempt.flagged_for_review},
                     {"disqualified", attempt.finalize_reason == FinalizeReason::Disqualified}}};
    });
}

ApiResponse ApiHandlers::execute_code(std::string_view token, std::string_view body, const ClientInfo& client) {
    return guarded(token, [&] {
        orchestrator_.report_activity(token, ActivityType::IpChange, "", client.ip_address);

        auto request = parse_body(body);

        auto result = orchestrator_.execute_code(token, request.at("question_id").get<std::string>(),
                                                 request.at("code").get<std::string>(), request.value("language", ""),
                                                 request.value("stdin", ""));

        return ApiResponse{.status = 200, .body = result};
    });
}

ApiResponse ApiHandlers::list_attempts(std::string_view assessment_id, std::optional<std::string_view> review_key) {
    return guarded_review(review_key, [&] {
        auto attempts = json::array();
        for (const auto& attempt : orchestrator_.list_attempts(assessment_id)) {
            attempts.push_back(json(attempt));
        }

        return ApiResponse{.status = 200, .body = {{"attempts", std::move(attempts)}}};
    });
}

ApiResponse ApiHandlers::attempt_record(std::string_view attempt_id, std::optional<std::string_view> review_key) {
    return guarded_review(review_key, [&] {
        auto record = orchestrator_.attempt_record(attempt_id);

        return ApiResponse{.status = 200,
                           .body = {{"attempt", record.attempt},
                                    {"assessment", assessment_summary(*record.definition)},
                                    {"responses", responses_json(record, true, true)}}};
    });
}

ApiResponse ApiHandlers::manual_grade(std::string_view attempt_id, std::string_view question_id,
                                      std::string_view body, std::optional<std::string_view> review_key) {
    return guarded_review(review_key, [&] {
        auto request = parse_body(body);

        std::optional<std::string> comments;
        if (request.contains("comments") && !request.at("comments").is_null()) {
            comments = request.at("comments").get<std::string>();
        }

        auto attempt = orchestrator_.manual_grade(attempt_id, question_id, request.at("points").get<int>(),
                                                  std::move(comments), request.at("graded_by").get<std::string>());

        return ApiResponse{.status = 200, .body = {{"attempt", attempt}}};
    });
}

ApiResponse ApiHandlers::publish(std::string_view body, std::optional<std::string_view> review_key) {
    return guarded_review(review_key, [&] {
        auto definition = orchestrator_.publish(parse_definition(parse_body(body)));

        return ApiResponse{.status = 201,
                           .body = {{"assessment", assessment_summary(*definition)}}};
    });
}

ApiResponse ApiHandlers::invite(std::string_view assessment_id, std::string_view body,
                                std::optional<std::string_view> review_key) {
    return guarded_review(review_key, [&] {
        auto request = parse_body(body);
        auto attempt = orchestrator_.invite(assessment_id, request.at("candidate_ref").get<std::string>());

        return ApiResponse{.status = 201,
                           .body = {{"attempt_id", attempt.id},
                                    {"attempt_number", attempt.attempt_number},
                                    {"access_token", attempt.access_token},
                                    {"access_token_expires_at", time_to_json(attempt.access_token_expires_at)}}};
    });
}

ApiResponse ApiHandlers::health() const {
    return ApiResponse{.status = 200,
                       .body = {{"status", "ok"},
                                {"version", ASSESSGRADER_VERSION_STRING},
                                {"languages", orchestrator_.supported_languages()}}};
}

} // namespace assessgrader
