#pragma once

#include <assessgrader/common/error_types.hpp>
#include <assessgrader/common/formatters/debug.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>

namespace assessgrader {

/// Base of every engine-level failure reported to a caller of the public API
class AssessmentError : public std::runtime_error
{
public:
    explicit AssessmentError(ErrorKind error, const std::string& msg = "")
        : std::runtime_error{msg}
        , error_{error} {}

    ErrorKind get_error() const { return error_; };

private:
    ErrorKind error_ = ErrorKind::UnknownError;
};

#define ASSESSGRADER_DEFINE_ERROR(name, kind)                                                                          \
    class name : public AssessmentError                                                                                \
    {                                                                                                                  \
    public:                                                                                                            \
        explicit name(const std::string& msg = "")                                                                     \
            : AssessmentError{ErrorKind::kind, msg} {}                                                                 \
    }

ASSESSGRADER_DEFINE_ERROR(AttemptClosedError, AttemptClosed);
ASSESSGRADER_DEFINE_ERROR(TimeExpiredError, TimeExpired);
ASSESSGRADER_DEFINE_ERROR(SandboxUnavailableError, SandboxUnavailable);
ASSESSGRADER_DEFINE_ERROR(InvalidManualGradeError, InvalidManualGrade);
ASSESSGRADER_DEFINE_ERROR(AlreadyStartedError, AlreadyStarted);
ASSESSGRADER_DEFINE_ERROR(InvalidAccessTokenError, InvalidAccessToken);
ASSESSGRADER_DEFINE_ERROR(AccessTokenExpiredError, AccessTokenExpired);
ASSESSGRADER_DEFINE_ERROR(AttemptLimitReachedError, AttemptLimitReached);
ASSESSGRADER_DEFINE_ERROR(AttemptNotStartedError, AttemptNotStarted);
ASSESSGRADER_DEFINE_ERROR(AttemptNotFinalizedError, AttemptNotFinalized);
ASSESSGRADER_DEFINE_ERROR(InvalidPayloadError, InvalidPayload);
ASSESSGRADER_DEFINE_ERROR(QuestionNotFoundError, QuestionNotFound);
ASSESSGRADER_DEFINE_ERROR(AttemptNotFoundError, AttemptNotFound);
ASSESSGRADER_DEFINE_ERROR(AssessmentNotFoundError, AssessmentNotFound);
ASSESSGRADER_DEFINE_ERROR(InvalidDefinitionError, InvalidDefinition);
ASSESSGRADER_DEFINE_ERROR(DefinitionFrozenError, DefinitionFrozen);

#undef ASSESSGRADER_DEFINE_ERROR

} // namespace assessgrader

template <>
struct fmt::formatter<::assessgrader::AssessmentError> : ::assessgrader::DebugFormatter
{
    auto format(const ::assessgrader::AssessmentError& from, format_context& ctx) const {
        return format_to(ctx.out(), "{} : {}", from.get_error(), from.what());
    }
};
