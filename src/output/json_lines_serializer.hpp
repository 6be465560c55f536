#pragma once

#include "output/serializer.hpp"
#include "output/sink.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <string_view>

namespace assessgrader {

/// One JSON object per line: ``{"event": ..., "at": ..., "attempt": {...}, ...}``
class JsonLinesSerializer : public AttemptEventSerializer
{
public:
    explicit JsonLinesSerializer(Sink& sink);

    void on_attempt_started(const Attempt& attempt) override;
    void on_response_recorded(const Attempt& attempt, const Response& response) override;
    void on_attempt_finalized(const Attempt& attempt) override;
    void on_manual_grade(const Attempt& attempt, const Response& response) override;

    void finalize() override;

private:
    void emit(std::string_view event, nlohmann::json body);

    std::mutex mutex_;
};

} // namespace assessgrader
