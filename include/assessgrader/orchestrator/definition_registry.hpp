#pragma once

#include <assessgrader/common/class_traits.hpp>
#include <assessgrader/model/assessment.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace assessgrader {

/// Published assessment definitions, keyed by id.
///
/// Definitions are shared immutably with the attempts issued against them. Once an attempt
/// references a definition it is frozen: republishing it with different content is refused.
class DefinitionRegistry : NonCopyable
{
public:
    DefinitionRegistry() = default;

    /// Normalizes and validates ``definition`` before publishing it.
    /// Throws InvalidDefinitionError, or DefinitionFrozenError when replacing a frozen definition
    std::shared_ptr<const AssessmentDefinition> publish(AssessmentDefinition definition);

    /// Throws AssessmentNotFoundError if unknown
    std::shared_ptr<const AssessmentDefinition> get(std::string_view assessment_id) const;

    /// nullptr if unknown
    std::shared_ptr<const AssessmentDefinition> find(std::string_view assessment_id) const;

    void freeze(std::string_view assessment_id);
    bool is_frozen(std::string_view assessment_id) const;

    std::vector<std::string> ids() const;
    std::size_t size() const;

    /// Publishes one JSON definition file. Throws InvalidDefinitionError if it cannot be read or parsed
    std::shared_ptr<const AssessmentDefinition> load_file(const std::filesystem::path& path);

    /// Publishes every ``*.json`` file directly inside ``dir``, in name order. Files that fail to
    /// load are logged and skipped. Returns the number published
    std::size_t load_directory(const std::filesystem::path& dir);

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const AssessmentDefinition>, std::less<>> definitions_;
    std::set<std::string, std::less<>> frozen_;
};

} // namespace assessgrader
