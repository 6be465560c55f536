#pragma once

#include <assessgrader/common/expected.hpp>
#include <assessgrader/common/formatters/macros.hpp>

#include <boost/preprocessor/cat.hpp>

namespace assessgrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,            ///< Operation surpassed its deadline
    Cancelled,           ///< Operation was stopped through its stop_token
    SandboxUnavailable,  ///< Execution backend could not be reached, or the worker queue is full
    UnsupportedLanguage, ///< No backend knows how to run the requested language
    BadResponse,         ///< A backend answered with something that could not be interpreted
    SyscallFailure,      ///< A Linux syscall failed

    AttemptClosed,       ///< Attempt is submitted, or being finalized
    TimeExpired,         ///< Attempt's time limit has elapsed
    AttemptNotStarted,   ///< Attempt has not been started yet
    AttemptNotFinalized, ///< Operation requires a submitted attempt
    AlreadyStarted,      ///< An active attempt exists for the same candidate and assessment
    AttemptLimitReached, ///< Candidate used up every allowed attempt
    InvalidAccessToken,  ///< Token does not identify any attempt
    AccessTokenExpired,  ///< Invitation expired before it was used
    InvalidManualGrade,  ///< Manual grade is out of range or targets an auto-graded response
    InvalidPayload,      ///< Answer or request body does not match what the question expects
    QuestionNotFound,    ///< Question id is not part of the assessment
    AttemptNotFound,     ///< Attempt id is unknown
    AssessmentNotFound,  ///< Assessment id is unknown
    InvalidDefinition,   ///< Assessment definition failed validation
    DefinitionFrozen,    ///< Definition is referenced by an attempt and cannot be replaced

    UnknownError, ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace assessgrader

FMT_SERIALIZE_ENUM(::assessgrader::ErrorKind, TimedOut, Cancelled, SandboxUnavailable, UnsupportedLanguage, BadResponse,
                   SyscallFailure, AttemptClosed, TimeExpired, AttemptNotStarted, AttemptNotFinalized, AlreadyStarted,
                   AttemptLimitReached, InvalidAccessToken, AccessTokenExpired, InvalidManualGrade, InvalidPayload,
                   QuestionNotFound, AttemptNotFound, AssessmentNotFound, InvalidDefinition, DefinitionFrozen,
                   UnknownError, MaxErrorNum);

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::assessgrader::ErrorKind;                                                                      \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
