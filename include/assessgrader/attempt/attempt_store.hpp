#pragma once

#include <assessgrader/common/class_traits.hpp>
#include <assessgrader/model/assessment.hpp>
#include <assessgrader/model/attempt.hpp>
#include <assessgrader/model/response.hpp>

#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace assessgrader {

/// Latest response to one question of one attempt
struct ResponseRow : NonMovable
{
    std::mutex mutex;
    std::optional<Response> response;
};

/// Everything the engine keeps about a single attempt.
///
/// Lock order: ``finalize_mutex`` -> ``mutex`` -> ``rows_mutex`` -> ``ResponseRow::mutex``.
/// ``mutex`` is never held while grading.
struct AttemptSlot : NonMovable
{
    AttemptSlot(Attempt initial, std::shared_ptr<const AssessmentDefinition> def)
        : definition{std::move(def)}
        , attempt{std::move(initial)} {}

    /// The definition as it was published when the attempt was issued
    const std::shared_ptr<const AssessmentDefinition> definition;

    /// Serializes finalization and manual grading
    std::mutex finalize_mutex;

    /// Guards ``attempt``, ``closing`` and ``inflight``
    std::mutex mutex;
    std::condition_variable drained;
    Attempt attempt;
    /// Set once finalization begins. No new responses are accepted from then on
    bool closing = false;
    /// Responses currently being graded
    int inflight = 0;

    /// Fired by finalize to abandon in-flight sandbox calls
    std::stop_source cancel;

    std::mutex rows_mutex;
    std::map<std::string, std::shared_ptr<ResponseRow>, std::less<>> rows;

    /// Get or create the row of ``question_id``
    std::shared_ptr<ResponseRow> row(std::string_view question_id);

    /// Row of ``question_id`` or nullptr if nothing was ever submitted for it
    std::shared_ptr<ResponseRow> find_row(std::string_view question_id);

    /// Copies of all recorded responses, in the definition's question order
    std::vector<Response> responses();

    Attempt snapshot();
};

/// In-memory attempt repository, indexed by id and by access token
class AttemptStore : NonCopyable
{
public:
    AttemptStore() = default;

    std::shared_ptr<AttemptSlot> insert(Attempt attempt, std::shared_ptr<const AssessmentDefinition> definition);

    /// nullptr if unknown
    std::shared_ptr<AttemptSlot> by_id(std::string_view attempt_id) const;
    /// nullptr if unknown
    std::shared_ptr<AttemptSlot> by_token(std::string_view access_token) const;

    std::vector<std::shared_ptr<AttemptSlot>> for_candidate(std::string_view assessment_id,
                                                            std::string_view candidate_ref) const;
    std::vector<std::shared_ptr<AttemptSlot>> for_assessment(std::string_view assessment_id) const;
    std::vector<std::shared_ptr<AttemptSlot>> all() const;

    std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;

    // Attempt ids, assessment ids and candidate refs never change after insertion, so they can
    // be read without the slot's lock
    struct Entry
    {
        std::string assessment_id;
        std::string candidate_ref;
        std::shared_ptr<AttemptSlot> slot;
    };

    std::vector<std::string> insertion_order_;
    std::unordered_map<std::string, Entry> by_id_;
    std::unordered_map<std::string, std::string> token_to_id_;
};

} // namespace assessgrader
