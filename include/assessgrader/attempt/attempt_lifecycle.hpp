#pragma once

#include <assessgrader/attempt/attempt_store.hpp>
#include <assessgrader/common/class_traits.hpp>
#include <assessgrader/common/time.hpp>
#include <assessgrader/grading/question_grader.hpp>
#include <assessgrader/model/assessment.hpp>
#include <assessgrader/model/attempt.hpp>
#include <assessgrader/model/response.hpp>
#include <assessgrader/output/serializer.hpp>
#include <assessgrader/proctoring/anti_cheat_monitor.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace assessgrader {

/// State machine of a candidate attempt: NotStarted -> InProgress -> Submitted.
///
/// Every operation identifies the attempt by id, throws an AssessmentError subclass on failure
/// and returns a copy of the record as it stands afterwards. Operations on different attempts
/// never contend; responses to different questions of one attempt are graded concurrently.
class AttemptLifecycle : NonCopyable
{
public:
    /// ``events`` may be null
    AttemptLifecycle(AttemptStore& store, QuestionGrader grader, AttemptEventSerializer* events = nullptr,
                     ClockFn clock = system_clock_fn());

    /// New NotStarted attempt with a fresh access token.
    /// Throws AlreadyStartedError if the candidate has an open attempt and retakes are not allowed,
    /// AttemptLimitReachedError once ``max_attempts`` attempts exist
    Attempt issue(std::shared_ptr<const AssessmentDefinition> definition, const std::string& candidate_ref);

    /// Starts a NotStarted attempt, or resumes an InProgress one. A resumed attempt whose time
    /// limit elapsed in the meantime is finalized and returned as such
    Attempt begin(std::string_view attempt_id, std::string_view ip_address, std::string_view user_agent);

    Attempt start(std::shared_ptr<const AssessmentDefinition> definition, const std::string& candidate_ref,
                  std::string_view ip_address, std::string_view user_agent);

    /// Validate, grade and record an answer. A later answer to the same question replaces the earlier one
    Response submit_response(std::string_view attempt_id, std::string_view question_id, const AnswerPayload& answer,
                             std::optional<int> time_spent_seconds = std::nullopt);

    /// Idempotent: once finalized, every call returns the same record
    Attempt finalize(std::string_view attempt_id, FinalizeReason reason);

    /// Only for finalized attempts and responses that were not auto-graded
    Attempt manual_grade(std::string_view attempt_id, std::string_view question_id, int points,
                         std::optional<std::string> comments, std::string graded_by);

    Attempt report_tab_switch(std::string_view attempt_id);
    /// Silently ignored unless the attempt is in progress. Throws TimeExpiredError once the time limit elapsed
    Attempt report_ip(std::string_view attempt_id, std::string_view ip_address);
    Attempt report_copy_paste(std::string_view attempt_id, std::string details);
    Attempt report_full_screen_exit(std::string_view attempt_id);

    /// Finalizes an overdue attempt in progress and throws TimeExpiredError; otherwise returns it unchanged
    Attempt enforce_time_limit(std::string_view attempt_id);

    /// Finalizes every in-progress attempt past its time limit. Returns how many were finalized
    std::size_t expire_overdue();

    /// Nullopt for untimed assessments
    std::optional<std::chrono::seconds> time_remaining(std::string_view attempt_id) const;

    Attempt snapshot(std::string_view attempt_id) const;
    std::vector<Response> responses(std::string_view attempt_id) const;
    std::shared_ptr<const AssessmentDefinition> definition_of(std::string_view attempt_id) const;

    TimePoint now() const { return clock_(); }

private:
    std::shared_ptr<AttemptSlot> get_slot(std::string_view attempt_id) const;

    enum class OpenState { Open, Overdue };

    /// Must be called with ``slot.mutex`` held. Throws if the attempt cannot take new input
    OpenState check_open(const AttemptSlot& slot) const;

    bool is_overdue(const Attempt& attempt, const AssessmentDefinition& definition) const;

    Attempt finalize_slot(AttemptSlot& slot, FinalizeReason reason, std::string_view detail = "");

    /// Finalizes for an elapsed time limit and throws TimeExpiredError
    [[noreturn]] void expire(AttemptSlot& slot);

    AttemptStore& store_;
    QuestionGrader grader_;
    AttemptEventSerializer* events_;
    ClockFn clock_;
    AntiCheatMonitor monitor_;

    /// Serializes issuing so that attempt limits hold under concurrent invitations
    std::mutex issue_mutex_;
};

} // namespace assessgrader
