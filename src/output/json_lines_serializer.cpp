#include "output/json_lines_serializer.hpp"

#include "common/time.hpp"
#include "logging.hpp"
#include "serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace assessgrader {

namespace {

nlohmann::json attempt_header(const Attempt& attempt) {
    return {{"id", attempt.id},
            {"assessment_id", attempt.assessment_id},
            {"candidate_ref", attempt.candidate_ref},
            {"attempt_number", attempt.attempt_number}};
}

} // namespace

JsonLinesSerializer::JsonLinesSerializer(Sink& sink)
    : AttemptEventSerializer{sink} {}

void JsonLinesSerializer::on_attempt_started(const Attempt& attempt) {
    auto body = attempt_header(attempt);
    body["started_at"] = attempt.started_at ? time_to_json(*attempt.started_at) : nullptr;
    body["ip_address"] = attempt.ip_address;

    emit("attempt_started", {{"attempt", std::move(body)}});
}

void JsonLinesSerializer::on_response_recorded(const Attempt& attempt, const Response& response) {
    emit("response_recorded", {{"attempt", attempt_header(attempt)}, {"response", response_view(response, true)}});
}

void JsonLinesSerializer::on_attempt_finalized(const Attempt& attempt) {
    emit("attempt_finalized", {{"attempt", attempt}});
}

void JsonLinesSerializer::on_manual_grade(const Attempt& attempt, const Response& response) {
    emit("manual_grade", {{"attempt", attempt_header(attempt)},
                          {"response", response_view(response, true)},
                          {"score", attempt.score ? nlohmann::json(*attempt.score) : nullptr}});
}

void JsonLinesSerializer::finalize() {
    std::scoped_lock lock{mutex_};
    sink_.flush();
}

void JsonLinesSerializer::emit(std::string_view event, nlohmann::json body) {
    body["event"] = std::string{event};
    body["at"] = time_to_json(Clock::now());

    // Replace invalid UTF-8 from candidate output instead of throwing
    std::string line = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line += '\n';

    std::scoped_lock lock{mutex_};
    sink_.write(line);
    sink_.flush();

    LOG_TRACE("Emitted {} event", event);
}

} // namespace assessgrader
