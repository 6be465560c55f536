#include "orchestrator/definition_registry.hpp"

#include "exceptions.hpp"
#include "logging.hpp"
#include "serialization/json_codec.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace assessgrader {

std::shared_ptr<const AssessmentDefinition> DefinitionRegistry::publish(AssessmentDefinition definition) {
    definition.normalize();

    if (auto res = definition.validate(); !res) {
        throw InvalidDefinitionError(fmt::format("assessment '{}': {}", definition.id, res.error()));
    }

    std::unique_lock lock{mutex_};

    if (auto iter = definitions_.find(definition.id); iter != definitions_.end()) {
        if (*iter->second == definition) {
            LOG_DEBUG("Assessment '{}' republished unchanged", definition.id);
            return iter->second;
        }

        if (frozen_.contains(definition.id)) {
            throw DefinitionFrozenError(
                fmt::format("assessment '{}' already has attempts and cannot be changed", definition.id));
        }
    }

    auto shared = std::make_shared<const AssessmentDefinition>(std::move(definition));
    definitions_.insert_or_assign(shared->id, shared);

    LOG_INFO("Published assessment '{}' ({} questions, {} points)", shared->id, shared->questions.size(),
             shared->total_points());

    return shared;
}

std::shared_ptr<const AssessmentDefinition> DefinitionRegistry::get(std::string_view assessment_id) const {
    auto definition = find(assessment_id);

    if (definition == nullptr) {
        throw AssessmentNotFoundError(fmt::format("no published assessment '{}'", assessment_id));
    }

    return definition;
}

std::shared_ptr<const AssessmentDefinition> DefinitionRegistry::find(std::string_view assessment_id) const {
    std::shared_lock lock{mutex_};

    if (auto iter = definitions_.find(assessment_id); iter != definitions_.end()) {
        return iter->second;
    }

    return nullptr;
}

void DefinitionRegistry::freeze(std::string_view assessment_id) {
    std::unique_lock lock{mutex_};
    frozen_.emplace(assessment_id);
}

bool DefinitionRegistry::is_frozen(std::string_view assessment_id) const {
    std::shared_lock lock{mutex_};
    return frozen_.contains(assessment_id);
}

std::vector<std::string> DefinitionRegistry::ids() const {
    std::shared_lock lock{mutex_};
    std::vector<std::string> result;

    for (const auto& [id, definition] : definitions_) {
        result.push_back(id);
    }

    return result;
}

std::size_t DefinitionRegistry::size() const {
    std::shared_lock lock{mutex_};
    return definitions_.size();
}

std::shared_ptr<const AssessmentDefinition> DefinitionRegistry::load_file(const std::filesystem::path& path) {
    std::ifstream in{path};

    if (!in) {
        throw InvalidDefinitionError(fmt::format("could not open {}: {}", path.string(), get_err_msg()));
    }

    nlohmann::json json;

    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& ex) {
        throw InvalidDefinitionError(fmt::format("{} is not valid JSON: {}", path.string(), ex.what()));
    }

    return publish(parse_definition(json));
}

std::size_t DefinitionRegistry::load_directory(const std::filesystem::path& dir) {
    std::error_code err;
    std::vector<std::filesystem::path> files;

    for (const auto& entry : std::filesystem::directory_iterator{dir, err}) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }

    if (err) {
        throw InvalidDefinitionError(fmt::format("could not list {}: {}", dir.string(), err.message()));
    }

    ranges::sort(files);

    std::size_t num_loaded = 0;

    for (const auto& file : files) {
        try {
            load_file(file);
            ++num_loaded;
        } catch (const AssessmentError& ex) {
            LOG_ERROR("Skipping definition {}: {}", file.string(), ex.what());
        }
    }

    LOG_INFO("Loaded {} of {} definition file(s) from {}", num_loaded, files.size(), dir.string());

    return num_loaded;
}

} // namespace assessgrader
