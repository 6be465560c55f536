#pragma once

#include <assessgrader/common/class_traits.hpp>
#include <assessgrader/model/attempt.hpp>
#include <assessgrader/model/response.hpp>
#include <assessgrader/output/sink.hpp>

namespace assessgrader {

/// Receives scoring events as attempts move through their lifecycle.
/// Implementations must be safe to call from several request threads at once.
class AttemptEventSerializer : NonCopyable
{
public:
    explicit AttemptEventSerializer(Sink& sink)
        : sink_{sink} {}

    virtual ~AttemptEventSerializer() = default;

    virtual void on_attempt_started(const Attempt& attempt) = 0;
    virtual void on_response_recorded(const Attempt& attempt, const Response& response) = 0;
    virtual void on_attempt_finalized(const Attempt& attempt) = 0;
    virtual void on_manual_grade(const Attempt& attempt, const Response& response) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
};

} // namespace assessgrader
