#include "attempt/attempt_store.hpp"

#include "logging.hpp"

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace assessgrader {

std::shared_ptr<ResponseRow> AttemptSlot::row(std::string_view question_id) {
    std::scoped_lock lock{rows_mutex};

    if (auto iter = rows.find(question_id); iter != rows.end()) {
        return iter->second;
    }

    auto new_row = std::make_shared<ResponseRow>();
    rows.emplace(std::string{question_id}, new_row);

    return new_row;
}

std::shared_ptr<ResponseRow> AttemptSlot::find_row(std::string_view question_id) {
    std::scoped_lock lock{rows_mutex};

    if (auto iter = rows.find(question_id); iter != rows.end()) {
        return iter->second;
    }

    return nullptr;
}

std::vector<Response> AttemptSlot::responses() {
    std::vector<std::shared_ptr<ResponseRow>> snapshot_rows;

    {
        std::scoped_lock lock{rows_mutex};
        for (const auto& [question_id, response_row] : rows) {
            snapshot_rows.push_back(response_row);
        }
    }

    std::vector<Response> result;
    for (const auto& response_row : snapshot_rows) {
        std::scoped_lock lock{response_row->mutex};
        if (response_row->response) {
            result.push_back(*response_row->response);
        }
    }

    const auto& questions = definition->questions;
    auto position = [&questions](const Response& response) {
        auto iter = ranges::find_if(questions, [&](const Question& q) { return q.id == response.question_id; });
        return iter - questions.begin();
    };

    ranges::sort(result, [&](const Response& lhs, const Response& rhs) { return position(lhs) < position(rhs); });

    return result;
}

Attempt AttemptSlot::snapshot() {
    std::scoped_lock lock{mutex};
    return attempt;
}

std::shared_ptr<AttemptSlot> AttemptStore::insert(Attempt attempt,
                                                  std::shared_ptr<const AssessmentDefinition> definition) {
    std::string attempt_id = attempt.id;
    std::string token = attempt.access_token;
    std::string assessment_id = attempt.assessment_id;
    std::string candidate_ref = attempt.candidate_ref;

    auto slot = std::make_shared<AttemptSlot>(std::move(attempt), std::move(definition));

    std::unique_lock lock{mutex_};

    if (by_id_.contains(attempt_id) || token_to_id_.contains(token)) {
        throw std::logic_error(fmt::format("attempt {} is already stored", attempt_id));
    }

    by_id_.emplace(attempt_id, Entry{std::move(assessment_id), std::move(candidate_ref), slot});
    token_to_id_.emplace(std::move(token), attempt_id);
    insertion_order_.push_back(std::move(attempt_id));

    LOG_TRACE("Stored attempt #{}", by_id_.size());

    return slot;
}

std::shared_ptr<AttemptSlot> AttemptStore::by_id(std::string_view attempt_id) const {
    std::shared_lock lock{mutex_};

    if (auto iter = by_id_.find(std::string{attempt_id}); iter != by_id_.end()) {
        return iter->second.slot;
    }

    return nullptr;
}

std::shared_ptr<AttemptSlot> AttemptStore::by_token(std::string_view access_token) const {
    std::shared_lock lock{mutex_};

    auto token_iter = token_to_id_.find(std::string{access_token});
    if (token_iter == token_to_id_.end()) {
        return nullptr;
    }

    return by_id_.at(token_iter->second).slot;
}

std::vector<std::shared_ptr<AttemptSlot>> AttemptStore::for_candidate(std::string_view assessment_id,
                                                                      std::string_view candidate_ref) const {
    std::shared_lock lock{mutex_};
    std::vector<std::shared_ptr<AttemptSlot>> result;

    for (const auto& attempt_id : insertion_order_) {
        const auto& entry = by_id_.at(attempt_id);
        if (entry.assessment_id == assessment_id && entry.candidate_ref == candidate_ref) {
            result.push_back(entry.slot);
        }
    }

    return result;
}

std::vector<std::shared_ptr<AttemptSlot>> AttemptStore::for_assessment(std::string_view assessment_id) const {
    std::shared_lock lock{mutex_};
    std::vector<std::shared_ptr<AttemptSlot>> result;

    for (const auto& attempt_id : insertion_order_) {
        const auto& entry = by_id_.at(attempt_id);
        if (entry.assessment_id == assessment_id) {
            result.push_back(entry.slot);
        }
    }

    return result;
}

std::vector<std::shared_ptr<AttemptSlot>> AttemptStore::all() const {
    std::shared_lock lock{mutex_};
    std::vector<std::shared_ptr<AttemptSlot>> result;
    result.reserve(insertion_order_.size());

    for (const auto& attempt_id : insertion_order_) {
        result.push_back(by_id_.at(attempt_id).slot);
    }

    return result;
}

std::size_t AttemptStore::size() const {
    std::shared_lock lock{mutex_};
    return by_id_.size();
}

} // namespace assessgrader
