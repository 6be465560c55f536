#include "user/program_options.hpp"

#include "common/expected.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace assessgrader {

Expected<ProgramOptions::BackendKind, std::string> ProgramOptions::parse_backend(std::string_view name) {
    using enum BackendKind;

    if (name == "judge0") {
        return Judge0;
    }
    if (name == "piston") {
        return Piston;
    }
    if (name == "local") {
        return Local;
    }
    if (name == "none") {
        return None;
    }

    return fmt::format("unknown sandbox backend {:?} (expected judge0, piston, local or none)", name);
}

Expected<void, std::string> ProgramOptions::validate() const {
    TRY(ensure_is_directory(definitions_dir, "Definitions directory {:?}"));

    constexpr int MAX_PORT = 65535;
    if (port <= 0 || port > MAX_PORT) {
        return fmt::format("Port {} is outside [1, {}]", port, MAX_PORT);
    }

    if (primary == BackendKind::None && fallback != BackendKind::None) {
        return std::string{"A fallback sandbox backend requires a primary one"};
    }

    if (primary != BackendKind::None && primary == fallback) {
        return fmt::format("Primary and fallback sandbox backends are both {}", primary);
    }

    if (sandbox_workers == 0) {
        return std::string{"At least one sandbox worker is required"};
    }

    if (sweep_interval.count() <= 0) {
        return std::string{"Sweep interval must be positive"};
    }

    for (const auto& spec : local_languages) {
        auto sep = spec.find('=');
        if (sep == std::string::npos || sep == 0 || sep + 1 == spec.size()) {
            return fmt::format("Local language {:?} is not of the form LANG=CMD", spec);
        }
    }

    if (events_path && *events_path != "-") {
        auto parent = std::filesystem::path{*events_path}.parent_path();
        if (!parent.empty()) {
            TRY(ensure_is_directory(parent, "Events directory {:?}"));
        }
    }

    return {};
}

} // namespace assessgrader
