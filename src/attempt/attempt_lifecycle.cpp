#include "attempt/attempt_lifecycle.hpp"

#include "common/linux.hpp"
#include "exceptions.hpp"
#include "grading/scoring_aggregator.hpp"
#include "logging.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/any_of.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace assessgrader {

namespace {

constexpr std::size_t ACCESS_TOKEN_BYTES = 32;

/// RFC 4648 base64url without padding
std::string base64url_encode(std::string_view bytes) {
    static constexpr std::string_view ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string out;
    out.reserve((bytes.size() * 4 + 2) / 3);

    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        std::uint32_t chunk = (std::uint32_t{static_cast<unsigned char>(bytes[i])} << 16) |
                              (std::uint32_t{static_cast<unsigned char>(bytes[i + 1])} << 8) |
                              std::uint32_t{static_cast<unsigned char>(bytes[i + 2])};

        out += ALPHABET[(chunk >> 18) & 0x3F];
        out += ALPHABET[(chunk >> 12) & 0x3F];
        out += ALPHABET[(chunk >> 6) & 0x3F];
        out += ALPHABET[chunk & 0x3F];
    }

    if (std::size_t rest = bytes.size() - i; rest > 0) {
        std::uint32_t chunk = std::uint32_t{static_cast<unsigned char>(bytes[i])} << 16;
        if (rest == 2) {
            chunk |= std::uint32_t{static_cast<unsigned char>(bytes[i + 1])} << 8;
        }

        out += ALPHABET[(chunk >> 18) & 0x3F];
        out += ALPHABET[(chunk >> 12) & 0x3F];
        if (rest == 2) {
            out += ALPHABET[(chunk >> 6) & 0x3F];
        }
    }

    return out;
}

std::string generate_access_token() {
    auto bytes = linux::getrandom(ACCESS_TOKEN_BYTES);

    if (!bytes) {
        throw std::system_error(bytes.error(), "could not generate an access token");
    }

    return base64url_encode(bytes.value());
}

std::string generate_attempt_id() {
    // random_generator is not thread safe; callers hold the issue mutex
    static boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

} // namespace

AttemptLifecycle::AttemptLifecycle(AttemptStore& store, QuestionGrader grader, AttemptEventSerializer* events,
                                   ClockFn clock)
    : store_{store}
    , grader_{std::move(grader)}
    , events_{events}
    , clock_{std::move(clock)}
    , monitor_{clock_} {}

Attempt AttemptLifecycle::issue(std::shared_ptr<const AssessmentDefinition> definition,
                                const std::string& candidate_ref) {
    std::scoped_lock issue_lock{issue_mutex_};

    const auto now = clock_();
    auto existing = store_.for_candidate(definition->id, candidate_ref);

    // Invitations that lapsed without ever being started are not open
    bool has_open = ranges::any_of(existing, [now](const std::shared_ptr<AttemptSlot>& slot) {
        std::scoped_lock lock{slot->mutex};
        const auto& attempt = slot->attempt;

        if (attempt.is_submitted()) {
            return false;
        }

        return attempt.is_in_progress() || attempt.access_token_expires_at > now;
    });

    if (has_open && !definition->allow_retakes) {
        throw AlreadyStartedError(
            fmt::format("candidate '{}' already has an open attempt at '{}'", candidate_ref, definition->id));
    }

    if (std::cmp_greater_equal(existing.size(), definition->max_attempts)) {
        throw AttemptLimitReachedError(fmt::format("candidate '{}' has used all {} attempt(s) at '{}'", candidate_ref,
                                                   definition->max_attempts, definition->id));
    }

    Attempt attempt{.id = generate_attempt_id(),
                    .assessment_id = definition->id,
                    .candidate_ref = candidate_ref,
                    .attempt_number = static_cast<int>(existing.size()) + 1,
                    .access_token = generate_access_token(),
                    .access_token_expires_at = now + definition->access_token_ttl,
                    .state = AttemptState::NotStarted,
                    .created_at = now};

    LOG_INFO("Issued attempt {} (#{}) at '{}' to '{}'", attempt.id, attempt.attempt_number, attempt.assessment_id,
             candidate_ref);

    store_.insert(attempt, std::move(definition));

    return attempt;
}

Attempt AttemptLifecycle::begin(std::string_view attempt_id, std::string_view ip_address,
                                std::string_view user_agent) {
    auto slot = get_slot(attempt_id);
    const auto& definition = *slot->definition;

    Attempt started;

    {
        std::unique_lock lock{slot->mutex};
        auto& attempt = slot->attempt;

        if (attempt.is_submitted() || slot->closing) {
            throw AttemptClosedError(fmt::format("attempt {} has already been submitted", attempt.id));
        }

        if (attempt.is_in_progress()) {
            if (is_overdue(attempt, definition)) {
                lock.unlock();
                LOG_INFO("Attempt {} resumed after its time limit elapsed", attempt_id);
                return finalize_slot(*slot, FinalizeReason::TimeExpired);
            }

            monitor_.on_ip_observed(attempt, definition.anti_cheat, ip_address);
            LOG_DEBUG("Attempt {} resumed", attempt.id);

            return attempt;
        }

        const auto now = clock_();

        if (attempt.access_token_expires_at <= now) {
            throw AccessTokenExpiredError(fmt::format("invitation for attempt {} has expired", attempt.id));
        }

        attempt.state = AttemptState::InProgress;
        attempt.started_at = now;
        attempt.tab_switch_count = 0;
        attempt.suspicious_activities.clear();
        attempt.flagged_for_review = false;
        attempt.ip_address = std::string{ip_address};
        attempt.user_agent = std::string{user_agent};

        started = attempt;
    }

    LOG_INFO("Attempt {} started", started.id);

    if (events_ != nullptr) {
        events_->on_attempt_started(started);
    }

    return started;
}

Attempt AttemptLifecycle::start(std::shared_ptr<const AssessmentDefinition> definition,
                                const std::string& candidate_ref, std::string_view ip_address,
                                std::string_view user_agent) {
    auto issued = issue(std::move(definition), candidate_ref);
    return begin(issued.id, ip_address, user_agent);
}

Response AttemptLifecycle::submit_response(std::string_view attempt_id, std::string_view question_id,
                                           const AnswerPayload& answer, std::optional<int> time_spent_seconds) {
    auto slot = get_slot(attempt_id);
    const auto& definition = *slot->definition;

    const Question* question = definition.find_question(question_id);
    if (question == nullptr) {
        throw QuestionNotFoundError(fmt::format("question '{}' is not part of '{}'", question_id, definition.id));
    }

    {
        std::unique_lock lock{slot->mutex};

        if (check_open(*slot) == OpenState::Overdue) {
            lock.unlock();
            expire(*slot);
        }

        ++slot->inflight;
    }

    auto release = gsl::finally([&slot] {
        std::scoped_lock lock{slot->mutex};
        if (--slot->inflight == 0) {
            slot->drained.notify_all();
        }
    });

    validate_answer(*question, answer);

    GradeResult grade = DEBUG_TIME(grader_.grade(*question, answer, slot->cancel.get_token()));

    auto response_row = slot->row(question->id);
    Response recorded;

    {
        std::scoped_lock lock{response_row->mutex};
        const auto now = clock_();

        Response response{.attempt_id = std::string{attempt_id},
                          .question_id = question->id,
                          .answer = answer,
                          .points_earned = grade.points_earned,
                          .auto_graded = grade.auto_graded,
                          .grading_note = std::move(grade.note),
                          .test_outcomes = std::move(grade.test_outcomes),
                          .submitted_at = now,
                          .updated_at = now,
                          .time_spent_seconds = time_spent_seconds};

        if (response_row->response) {
            response.submitted_at = response_row->response->submitted_at;
        }

        response_row->response = std::move(response);
        recorded = *response_row->response;
    }

    LOG_DEBUG("Recorded response to '{}' in attempt {}: {}", question->id, attempt_id, recorded);

    if (events_ != nullptr) {
        events_->on_response_recorded(slot->snapshot(), recorded);
    }

    return recorded;
}

Attempt AttemptLifecycle::finalize(std::string_view attempt_id, FinalizeReason reason) {
    auto slot = get_slot(attempt_id);

    {
        std::scoped_lock lock{slot->mutex};
        if (slot->attempt.state == AttemptState::NotStarted) {
            throw AttemptNotStartedError(fmt::format("attempt {} was never started", slot->attempt.id));
        }
    }

    return finalize_slot(*slot, reason);
}

Attempt AttemptLifecycle::finalize_slot(AttemptSlot& slot, FinalizeReason reason, std::string_view detail) {
    std::scoped_lock finalize_lock{slot.finalize_mutex};

    {
        std::scoped_lock lock{slot.mutex};

        if (slot.attempt.is_submitted()) {
            return slot.attempt;
        }

        slot.closing = true;
    }

    // In-flight sandbox calls are abandoned. Their test cases count as failed
    slot.cancel.request_stop();

    {
        std::unique_lock lock{slot.mutex};
        slot.drained.wait(lock, [&slot] { return slot.inflight == 0; });
    }

    const auto responses = slot.responses();
    Attempt finalized;

    {
        std::scoped_lock lock{slot.mutex};
        auto& attempt = slot.attempt;
        const auto now = clock_();

        attempt.time_elapsed_seconds = attempt.started_at ? seconds_between(*attempt.started_at, now) : 0;
        attempt.score = aggregate(attempt, responses, *slot.definition);
        attempt.state = AttemptState::Submitted;
        attempt.submitted_at = now;
        attempt.finalize_reason = reason;

        if (reason == FinalizeReason::Disqualified) {
            attempt.suspicious_activities.push_back(
                {.timestamp = now, .kind = activity::Disqualified{std::string{detail}}});
            attempt.flagged_for_review = true;
        }

        finalized = attempt;
    }

    LOG_INFO("Attempt {} finalized ({}): {}/{} points, {:.1f}%, {}", finalized.id, reason,
             finalized.score->points_earned, finalized.score->total_points, finalized.score->percentage,
             finalized.score->passed ? "passed" : "failed");

    if (events_ != nullptr) {
        events_->on_attempt_finalized(finalized);
    }

    return finalized;
}

Attempt AttemptLifecycle::manual_grade(std::string_view attempt_id, std::string_view question_id, int points,
                                       std::optional<std::string> comments, std::string graded_by) {
    auto slot = get_slot(attempt_id);
    const auto& definition = *slot->definition;

    const Question* question = definition.find_question(question_id);
    if (question == nullptr) {
        throw QuestionNotFoundError(fmt::format("question '{}' is not part of '{}'", question_id, definition.id));
    }

    std::scoped_lock finalize_lock{slot->finalize_mutex};

    {
        std::scoped_lock lock{slot->mutex};
        if (!slot->attempt.is_submitted()) {
            throw AttemptNotFinalizedError(
                fmt::format("attempt {} must be submitted before manual grading", slot->attempt.id));
        }
    }

    auto response_row = slot->find_row(question->id);
    Response graded;

    {
        if (response_row == nullptr) {
            throw QuestionNotFoundError(
                fmt::format("attempt {} has no response to question '{}'", attempt_id, question->id));
        }

        std::scoped_lock lock{response_row->mutex};

        if (!response_row->response) {
            throw QuestionNotFoundError(
                fmt::format("attempt {} has no response to question '{}'", attempt_id, question->id));
        }

        auto& response = *response_row->response;

        if (response.auto_graded) {
            throw InvalidManualGradeError(fmt::format("response to '{}' was graded automatically", question->id));
        }

        if (points < 0 || points > question->points) {
            throw InvalidManualGradeError(
                fmt::format("{} points is outside [0, {}] for question '{}'", points, question->points, question->id));
        }

        const auto now = clock_();
        response.points_earned = points;
        response.grader_comments = std::move(comments);
        response.graded_by = std::move(graded_by);
        response.graded_at = now;
        response.updated_at = now;

        graded = response;
    }

    const auto responses = slot->responses();
    Attempt regraded;

    {
        std::scoped_lock lock{slot->mutex};
        slot->attempt.score = aggregate(slot->attempt, responses, definition);
        regraded = slot->attempt;
    }

    LOG_INFO("Manual grade by '{}' on attempt {} question '{}': {}/{}", graded.graded_by.value_or(""), attempt_id,
             question->id, points, question->points);

    if (events_ != nullptr) {
        events_->on_manual_grade(regraded, graded);
    }

    return regraded;
}

Attempt AttemptLifecycle::report_tab_switch(std::string_view attempt_id) {
    auto slot = get_slot(attempt_id);
    const auto& config = slot->definition->anti_cheat;

    MonitorVerdict verdict = MonitorVerdict::Continue;
    Attempt current;

    {
        std::unique_lock lock{slot->mutex};

        if (check_open(*slot) == OpenState::Overdue) {
            lock.unlock();
            expire(*slot);
        }

        verdict = monitor_.on_tab_switch(slot->attempt, config);

        // No response may slip in before finalize_slot takes over
        if (verdict == MonitorVerdict::Disqualify) {
            slot->closing = true;
        }

        current = slot->attempt;
    }

    if (verdict == MonitorVerdict::Disqualify) {
        LOG_WARN("Attempt {} disqualified after {} tab switches", attempt_id, current.tab_switch_count);
        return finalize_slot(*slot, FinalizeReason::Disqualified,
                             fmt::format("exceeded the maximum of {} tab switches", config.max_tab_switches));
    }

    return current;
}

Attempt AttemptLifecycle::report_ip(std::string_view attempt_id, std::string_view ip_address) {
    auto slot = get_slot(attempt_id);

    std::unique_lock lock{slot->mutex};

    if (slot->attempt.is_in_progress() && !slot->closing) {
        if (is_overdue(slot->attempt, *slot->definition)) {
            lock.unlock();
            expire(*slot);
        }

        monitor_.on_ip_observed(slot->attempt, slot->definition->anti_cheat, ip_address);
    }

    return slot->attempt;
}

Attempt AttemptLifecycle::enforce_time_limit(std::string_view attempt_id) {
    auto slot = get_slot(attempt_id);

    std::unique_lock lock{slot->mutex};

    if (slot->attempt.is_in_progress() && !slot->closing && is_overdue(slot->attempt, *slot->definition)) {
        lock.unlock();
        expire(*slot);
    }

    return slot->attempt;
}

Attempt AttemptLifecycle::report_copy_paste(std::string_view attempt_id, std::string details) {
    auto slot = get_slot(attempt_id);

    std::unique_lock lock{slot->mutex};

    if (check_open(*slot) == OpenState::Overdue) {
        lock.unlock();
        expire(*slot);
    }

    monitor_.on_copy_paste(slot->attempt, std::move(details));

    return slot->attempt;
}

Attempt AttemptLifecycle::report_full_screen_exit(std::string_view attempt_id) {
    auto slot = get_slot(attempt_id);

    std::unique_lock lock{slot->mutex};

    if (check_open(*slot) == OpenState::Overdue) {
        lock.unlock();
        expire(*slot);
    }

    monitor_.on_full_screen_exit(slot->attempt);

    return slot->attempt;
}

std::size_t AttemptLifecycle::expire_overdue() {
    std::size_t num_expired = 0;

    for (const auto& slot : store_.all()) {
        bool overdue = false;

        {
            std::scoped_lock lock{slot->mutex};
            overdue = slot->attempt.is_in_progress() && !slot->closing && is_overdue(slot->attempt, *slot->definition);
        }

        if (overdue) {
            finalize_slot(*slot, FinalizeReason::TimeExpired);
            ++num_expired;
        }
    }

    if (num_expired > 0) {
        LOG_INFO("Expired {} overdue attempt(s)", num_expired);
    }

    return num_expired;
}

std::optional<std::chrono::seconds> AttemptLifecycle::time_remaining(std::string_view attempt_id) const {
    auto slot = get_slot(attempt_id);
    const auto& time_limit = slot->definition->time_limit;

    if (!time_limit) {
        return std::nullopt;
    }

    std::scoped_lock lock{slot->mutex};
    const auto& attempt = slot->attempt;

    if (attempt.is_submitted()) {
        return std::chrono::seconds{0};
    }

    if (!attempt.started_at) {
        return std::chrono::duration_cast<std::chrono::seconds>(*time_limit);
    }

    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(*time_limit) -
                     std::chrono::seconds{seconds_between(*attempt.started_at, clock_())};

    return std::max(remaining, std::chrono::seconds{0});
}

Attempt AttemptLifecycle::snapshot(std::string_view attempt_id) const {
    return get_slot(attempt_id)->snapshot();
}

std::vector<Response> AttemptLifecycle::responses(std::string_view attempt_id) const {
    return get_slot(attempt_id)->responses();
}

std::shared_ptr<const AssessmentDefinition> AttemptLifecycle::definition_of(std::string_view attempt_id) const {
    return get_slot(attempt_id)->definition;
}

std::shared_ptr<AttemptSlot> AttemptLifecycle::get_slot(std::string_view attempt_id) const {
    auto slot = store_.by_id(attempt_id);

    if (slot == nullptr) {
        throw AttemptNotFoundError(fmt::format("no attempt with id '{}'", attempt_id));
    }

    return slot;
}

AttemptLifecycle::OpenState AttemptLifecycle::check_open(const AttemptSlot& slot) const {
    const auto& attempt = slot.attempt;

    if (attempt.is_submitted() || slot.closing) {
        throw AttemptClosedError(fmt::format("attempt {} has already been submitted", attempt.id));
    }

    if (!attempt.is_in_progress()) {
        throw AttemptNotStartedError(fmt::format("attempt {} has not been started", attempt.id));
    }

    if (is_overdue(attempt, *slot.definition)) {
        return OpenState::Overdue;
    }

    return OpenState::Open;
}

bool AttemptLifecycle::is_overdue(const Attempt& attempt, const AssessmentDefinition& definition) const {
    if (!definition.time_limit || !attempt.started_at) {
        return false;
    }

    return clock_() - *attempt.started_at > *definition.time_limit;
}

void AttemptLifecycle::expire(AttemptSlot& slot) {
    auto finalized = finalize_slot(slot, FinalizeReason::TimeExpired);

    throw TimeExpiredError(fmt::format("time limit of attempt {} has elapsed", finalized.id));
}

} // namespace assessgrader
