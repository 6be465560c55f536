#pragma once

#include <assessgrader/common/formatters/macros.hpp>
#include <assessgrader/common/time.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace assessgrader {

enum class AttemptState { NotStarted, InProgress, Submitted };

enum class FinalizeReason { CandidateSubmitted, TimeExpired, Disqualified };

namespace activity {

/// Recorded once, when the candidate reaches the tab switch limit
struct TabSwitch
{
    int count = 0;
};

struct IpChange
{
    std::string previous_ip;
    std::string new_ip;
};

struct CopyPaste
{
    std::string details;
};

struct FullScreenExit
{
};

struct Disqualified
{
    std::string reason;
};

} // namespace activity

using ActivityKind =
    std::variant<activity::TabSwitch, activity::IpChange, activity::CopyPaste, activity::FullScreenExit,
                 activity::Disqualified>;

/// Wire name of an activity kind ("tab_switch", "ip_change", ...)
std::string_view activity_name(const ActivityKind& kind);

struct SuspiciousActivity
{
    TimePoint timestamp;
    ActivityKind kind;
};

struct ScoreSummary
{
    int points_earned = 0;
    int total_points = 0;
    double percentage = 0.0;
    bool passed = false;
    int questions_correct = 0;

    bool operator==(const ScoreSummary&) const = default;
};

struct Attempt
{
    std::string id;
    std::string assessment_id;
    std::string candidate_ref;
    int attempt_number = 1;

    /// Sole credential of the candidate
    std::string access_token;
    TimePoint access_token_expires_at;

    AttemptState state = AttemptState::NotStarted;
    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> submitted_at;

    int tab_switch_count = 0;
    std::string ip_address;
    std::string user_agent;
    std::vector<SuspiciousActivity> suspicious_activities;
    bool flagged_for_review = false;

    std::optional<FinalizeReason> finalize_reason;
    std::optional<long long> time_elapsed_seconds;

    /// Set on finalize, recomputed by manual grading
    std::optional<ScoreSummary> score;

    bool is_submitted() const { return state == AttemptState::Submitted; }

    bool is_in_progress() const { return state == AttemptState::InProgress; }
};

} // namespace assessgrader

FMT_SERIALIZE_ENUM(::assessgrader::AttemptState, NotStarted, InProgress, Submitted);
FMT_SERIALIZE_ENUM(::assessgrader::FinalizeReason, CandidateSubmitted, TimeExpired, Disqualified);
FMT_SERIALIZE_CLASS(::assessgrader::ScoreSummary, points_earned, total_points, percentage, passed, questions_correct);
FMT_SERIALIZE_CLASS(::assessgrader::Attempt, id, assessment_id, candidate_ref, attempt_number, state,
                    tab_switch_count, flagged_for_review, finalize_reason, score);
