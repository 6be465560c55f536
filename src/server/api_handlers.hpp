#pragma once

#include "common/class_traits.hpp"
#include "common/error_types.hpp"
#include "orchestrator/assessment_orchestrator.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace assessgrader {

struct ApiResponse
{
    int status = 200;
    nlohmann::json body;
};

/// Who is calling, as far as the transport can tell
struct ClientInfo
{
    std::string ip_address;
    std::string user_agent;
};

/// HTTP status reported for an engine error
int http_status_for(ErrorKind error);

/// Wire name of an engine error, e.g. "attempt_closed"
std::string error_code_name(ErrorKind error);

/// Transport independent request handlers of the candidate, review and management routes.
///
/// Every handler returns a response instead of throwing. Request bodies are raw JSON text.
class ApiHandlers : NonCopyable
{
public:
    /// Review and management routes require ``review_key`` when one is set
    ApiHandlers(AssessmentOrchestrator& orchestrator, std::optional<std::string> review_key);

    // Candidate session, authorized by the access token

    ApiResponse access(std::string_view token, const ClientInfo& client);
    ApiResponse start(std::string_view token, const ClientInfo& client);
    ApiResponse submit_response(std::string_view token, std::string_view body, const ClientInfo& client);
    ApiResponse submit(std::string_view token, const ClientInfo& client);
    ApiResponse results(std::string_view token, const ClientInfo& client);
    ApiResponse report_activity(std::string_view token, std::string_view body, const ClientInfo& client);
    ApiResponse execute_code(std::string_view token, std::string_view body, const ClientInfo& client);

    // Review and management, authorized by the review key

    ApiResponse list_attempts(std::string_view assessment_id, std::optional<std::string_view> review_key);
    ApiResponse attempt_record(std::string_view attempt_id, std::optional<std::string_view> review_key);
    ApiResponse manual_grade(std::string_view attempt_id, std::string_view question_id, std::string_view body,
                             std::optional<std::string_view> review_key);
    ApiResponse publish(std::string_view body, std::optional<std::string_view> review_key);
    ApiResponse invite(std::string_view assessment_id, std::string_view body,
                       std::optional<std::string_view> review_key);

    ApiResponse health() const;

private:
    /// Runs ``handler``, turning exceptions into error responses. A TimeExpiredError response
    /// carries the finalized attempt of ``token``
    template <typename Handler>
    ApiResponse guarded(std::string_view token, Handler&& handler);

    template <typename Handler>
    ApiResponse guarded_review(std::optional<std::string_view> review_key, Handler&& handler);

    nlohmann::json attempt_summary(const Attempt& attempt) const;

    AssessmentOrchestrator& orchestrator_;
    std::optional<std::string> review_key_;
};

} // namespace assessgrader
