#pragma once

#include <assessgrader/attempt/attempt_lifecycle.hpp>
#include <assessgrader/attempt/attempt_store.hpp>
#include <assessgrader/common/class_traits.hpp>
#include <assessgrader/common/formatters/macros.hpp>
#include <assessgrader/model/assessment.hpp>
#include <assessgrader/model/attempt.hpp>
#include <assessgrader/model/response.hpp>
#include <assessgrader/orchestrator/definition_registry.hpp>
#include <assessgrader/sandbox/execution.hpp>
#include <assessgrader/sandbox/sandbox_executor.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace assessgrader {

/// Activities a candidate's browser can report
enum class ActivityType { TabSwitch, IpChange, CopyPaste, FullScreenExit };

/// What a token holder may see of their attempt
struct AccessView
{
    Attempt attempt;
    std::shared_ptr<const AssessmentDefinition> definition;
    std::optional<std::chrono::seconds> time_remaining;
};

/// An attempt with everything recorded against it
struct AttemptRecord
{
    Attempt attempt;
    std::shared_ptr<const AssessmentDefinition> definition;
    std::vector<Response> responses;
};

/// Entry point of the engine for the candidate session, management and review collaborators.
///
/// Candidate operations are authorized by the access token alone. Unknown tokens throw
/// InvalidAccessTokenError; invitations that lapsed before being started throw AccessTokenExpiredError.
class AssessmentOrchestrator : NonCopyable
{
public:
    /// ``sandbox`` may be null, disabling the run button
    AssessmentOrchestrator(DefinitionRegistry& registry, AttemptStore& store, AttemptLifecycle& lifecycle,
                           std::shared_ptr<SandboxExecutor> sandbox);

    // Management

    std::shared_ptr<const AssessmentDefinition> publish(AssessmentDefinition definition);

    /// Issue a NotStarted attempt; its access token is the candidate's link
    Attempt invite(std::string_view assessment_id, const std::string& candidate_ref);

    // Candidate session

    /// Also feeds ``ip_address`` to the anti-cheat monitor
    AccessView access(std::string_view token, std::string_view ip_address);

    /// The attempt's questions in its own (possibly randomized) order. Requires an attempt in progress
    std::vector<Question> questions(std::string_view token);

    Attempt start(std::string_view token, std::string_view ip_address, std::string_view user_agent);

    /// Find a question of the token's assessment. Throws QuestionNotFoundError
    Question question(std::string_view token, std::string_view question_id);

    Response submit_response(std::string_view token, std::string_view question_id, const AnswerPayload& answer,
                             std::optional<int> time_spent_seconds = std::nullopt);

    Attempt submit(std::string_view token);

    /// Throws AttemptNotFinalizedError until the attempt is submitted
    AttemptRecord results(std::string_view token);

    Attempt report_activity(std::string_view token, ActivityType type, std::string details,
                            std::string_view ip_address);

    /// Run the candidate's code against ``stdin_text`` without grading it
    ExecutionResult execute_code(std::string_view token, std::string_view question_id, std::string code,
                                 std::string language, std::string stdin_text);

    // Review

    std::vector<Attempt> list_attempts(std::string_view assessment_id);

    AttemptRecord attempt_record(std::string_view attempt_id);

    Attempt manual_grade(std::string_view attempt_id, std::string_view question_id, int points,
                         std::optional<std::string> comments, std::string graded_by);

    // Maintenance

    std::size_t expire_overdue();

    /// Languages the run button and coding questions can use. Empty without a sandbox
    std::vector<std::string> supported_languages() const;

private:
    /// Attempt id behind ``token``
    std::string resolve(std::string_view token) const;

    DefinitionRegistry& registry_;
    AttemptStore& store_;
    AttemptLifecycle& lifecycle_;
    std::shared_ptr<SandboxExecutor> sandbox_;
};

} // namespace assessgrader

FMT_SERIALIZE_ENUM(::assessgrader::ActivityType, TabSwitch, IpChange, CopyPaste, FullScreenExit);
