#include "orchestrator/assessment_orchestrator.hpp"

#include "exceptions.hpp"
#include "logging.hpp"
#include "proctoring/anti_cheat_monitor.hpp"

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace assessgrader {

AssessmentOrchestrator::AssessmentOrchestrator(DefinitionRegistry& registry, AttemptStore& store,
                                               AttemptLifecycle& lifecycle, std::shared_ptr<SandboxExecutor> sandbox)
    : registry_{registry}
    , store_{store}
    , lifecycle_{lifecycle}
    , sandbox_{std::move(sandbox)} {}

std::shared_ptr<const AssessmentDefinition> AssessmentOrchestrator::publish(AssessmentDefinition definition) {
    return registry_.publish(std::move(definition));
}

Attempt AssessmentOrchestrator::invite(std::string_view assessment_id, const std::string& candidate_ref) {
    auto definition = registry_.get(assessment_id);

    auto attempt = lifecycle_.issue(definition, candidate_ref);
    registry_.freeze(assessment_id);

    return attempt;
}

AccessView AssessmentOrchestrator::access(std::string_view token, std::string_view ip_address) {
    auto attempt_id = resolve(token);

    return AccessView{.attempt = lifecycle_.report_ip(attempt_id, ip_address),
                      .definition = lifecycle_.definition_of(attempt_id),
                      .time_remaining = lifecycle_.time_remaining(attempt_id)};
}

std::vector<Question> AssessmentOrchestrator::questions(std::string_view token) {
    auto attempt_id = resolve(token);
    auto attempt = lifecycle_.enforce_time_limit(attempt_id);

    if (!attempt.is_in_progress()) {
        if (attempt.is_submitted()) {
            throw AttemptClosedError(fmt::format("attempt {} has already been submitted", attempt.id));
        }
        throw AttemptNotStartedError(fmt::format("attempt {} has not been started", attempt.id));
    }

    return randomize_order(*lifecycle_.definition_of(attempt_id), attempt.id);
}

Attempt AssessmentOrchestrator::start(std::string_view token, std::string_view ip_address,
                                      std::string_view user_agent) {
    return lifecycle_.begin(resolve(token), ip_address, user_agent);
}

Question AssessmentOrchestrator::question(std::string_view token, std::string_view question_id) {
    auto definition = lifecycle_.definition_of(resolve(token));
    const Question* found = definition->find_question(question_id);

    if (found == nullptr) {
        throw QuestionNotFoundError(fmt::format("question '{}' is not part of '{}'", question_id, definition->id));
    }

    return *found;
}

Response AssessmentOrchestrator::submit_response(std::string_view token, std::string_view question_id,
                                                 const AnswerPayload& answer, std::optional<int> time_spent_seconds) {
    return lifecycle_.submit_response(resolve(token), question_id, answer, time_spent_seconds);
}

Attempt AssessmentOrchestrator::submit(std::string_view token) {
    return lifecycle_.finalize(resolve(token), FinalizeReason::CandidateSubmitted);
}

AttemptRecord AssessmentOrchestrator::results(std::string_view token) {
    auto attempt_id = resolve(token);
    auto attempt = lifecycle_.snapshot(attempt_id);

    if (!attempt.is_submitted()) {
        throw AttemptNotFinalizedError(fmt::format("results of attempt {} are available after submission", attempt.id));
    }

    return AttemptRecord{.attempt = std::move(attempt),
                         .definition = lifecycle_.definition_of(attempt_id),
                         .responses = lifecycle_.responses(attempt_id)};
}

Attempt AssessmentOrchestrator::report_activity(std::string_view token, ActivityType type, std::string details,
                                                std::string_view ip_address) {
    auto attempt_id = resolve(token);

    LOG_DEBUG("Attempt {} reported {}", attempt_id, type);

    switch (type) {
    case ActivityType::TabSwitch:
        return lifecycle_.report_tab_switch(attempt_id);
    case ActivityType::IpChange:
        return lifecycle_.report_ip(attempt_id, ip_address);
    case ActivityType::CopyPaste:
        return lifecycle_.report_copy_paste(attempt_id, std::move(details));
    case ActivityType::FullScreenExit:
        return lifecycle_.report_full_screen_exit(attempt_id);
    }

    throw InvalidPayloadError(fmt::format("unknown activity type {}", fmt::underlying(type)));
}

ExecutionResult AssessmentOrchestrator::execute_code(std::string_view token, std::string_view question_id,
                                                     std::string code, std::string language,
                                                     std::string stdin_text) {
    auto attempt_id = resolve(token);
    auto attempt = lifecycle_.enforce_time_limit(attempt_id);

    if (attempt.is_submitted()) {
        throw AttemptClosedError(fmt::format("attempt {} has already been submitted", attempt.id));
    }
    if (!attempt.is_in_progress()) {
        throw AttemptNotStartedError(fmt::format("attempt {} has not been started", attempt.id));
    }

    auto target = question(token, question_id);
    const auto* coding = std::get_if<Coding>(&target.payload);

    if (coding == nullptr) {
        throw InvalidPayloadError(fmt::format("question '{}' does not take code", question_id));
    }

    if (sandbox_ == nullptr) {
        throw SandboxUnavailableError("no code execution backend is configured");
    }

    if (language.empty()) {
        language = coding->language;
    }

    return sandbox_->execute(
        ExecutionRequest{.code = std::move(code),
                         .language = std::move(language),
                         .stdin_text = std::move(stdin_text),
                         .timeout = coding->execution_timeout});
}

std::vector<Attempt> AssessmentOrchestrator::list_attempts(std::string_view assessment_id) {
    // Unknown ids are reported rather than answered with an empty list
    registry_.get(assessment_id);

    return store_.for_assessment(assessment_id) |
           ranges::views::transform([](const std::shared_ptr<AttemptSlot>& slot) { return slot->snapshot(); }) |
           ranges::to<std::vector>();
}

AttemptRecord AssessmentOrchestrator::attempt_record(std::string_view attempt_id) {
    return AttemptRecord{.attempt = lifecycle_.snapshot(attempt_id),
                         .definition = lifecycle_.definition_of(attempt_id),
                         .responses = lifecycle_.responses(attempt_id)};
}

Attempt AssessmentOrchestrator::manual_grade(std::string_view attempt_id, std::string_view question_id, int points,
                                             std::optional<std::string> comments, std::string graded_by) {
    return lifecycle_.manual_grade(attempt_id, question_id, points, std::move(comments), std::move(graded_by));
}

std::size_t AssessmentOrchestrator::expire_overdue() {
    return lifecycle_.expire_overdue();
}

std::vector<std::string> AssessmentOrchestrator::supported_languages() const {
    if (sandbox_ == nullptr) {
        return {};
    }

    return sandbox_->supported_languages();
}

std::string AssessmentOrchestrator::resolve(std::string_view token) const {
    auto slot = store_.by_token(token);

    if (slot == nullptr) {
        throw InvalidAccessTokenError("unknown access token");
    }

    std::scoped_lock lock{slot->mutex};
    const auto& attempt = slot->attempt;

    if (attempt.state == AttemptState::NotStarted && attempt.access_token_expires_at <= lifecycle_.now()) {
        throw AccessTokenExpiredError(fmt::format("invitation for attempt {} expired", attempt.id));
    }

    return attempt.id;
}

} // namespace assessgrader
