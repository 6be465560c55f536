#pragma once

#include <assessgrader/model/assessment.hpp>
#include <assessgrader/model/attempt.hpp>
#include <assessgrader/model/response.hpp>

#include <vector>

namespace assessgrader {

/// Sum up the responses of an attempt.
/// Ungraded responses count as 0; responses to questions not in ``definition`` are ignored.
ScoreSummary aggregate(const Attempt& attempt, const std::vector<Response>& responses,
                       const AssessmentDefinition& definition);

} // namespace assessgrader
