#pragma once

#include "common/error_types.hpp"
#include "common/expected.hpp"
#include "common/formatters/debug.hpp"
#include "common/formatters/macros.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace assessgrader {

struct ProgramOptions
{
    enum class BackendKind { Judge0, Piston, Local, None };

    // ###### Argument fields

    /// Relative to the default log level: each -v lowers the threshold by one, each -q raises it
    int verbosity = 0;

    std::filesystem::path definitions_dir = std::string{DEFAULT_DEFINITIONS_DIR};

    std::string host = std::string{DEFAULT_HOST};
    int port = DEFAULT_PORT;

    BackendKind primary = BackendKind::Local;
    BackendKind fallback = BackendKind::None;

    std::string judge0_url;
    std::optional<std::string> judge0_key;
    std::string piston_url;

    std::size_t sandbox_workers = DEFAULT_SANDBOX_WORKERS;
    std::size_t sandbox_queue = DEFAULT_SANDBOX_QUEUE;
    /// Extra wall-clock time granted to a backend on top of a question's own timeout
    std::chrono::seconds sandbox_grace{DEFAULT_SANDBOX_GRACE_SECONDS};

    std::chrono::seconds sweep_interval{DEFAULT_SWEEP_INTERVAL_SECONDS};

    /// JSON-lines scoring events. "-" is stdout; absent disables them
    std::optional<std::string> events_path;

    /// Extra local languages as "LANG=CMD", e.g. "lua=lua {src}"
    std::vector<std::string> local_languages;

    std::optional<std::string> review_key;

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_DEFINITIONS_DIR = "assessments";
    static constexpr std::string_view DEFAULT_HOST = "127.0.0.1";
    static constexpr int DEFAULT_PORT = 8080;
    static constexpr std::size_t DEFAULT_SANDBOX_WORKERS = 4;
    static constexpr std::size_t DEFAULT_SANDBOX_QUEUE = 64;
    static constexpr int DEFAULT_SANDBOX_GRACE_SECONDS = 5;
    static constexpr int DEFAULT_SWEEP_INTERVAL_SECONDS = 15;
    static constexpr std::string_view DEFAULT_JUDGE0_URL = "https://judge0-ce.p.rapidapi.com";
    static constexpr std::string_view DEFAULT_PISTON_URL = "https://emkc.org/api/v2/piston";

    static Expected<BackendKind, std::string> parse_backend(std::string_view name);

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const;
};

} // namespace assessgrader

FMT_SERIALIZE_ENUM(::assessgrader::ProgramOptions::BackendKind, Judge0, Piston, Local, None);

template <>
struct fmt::formatter<::assessgrader::ProgramOptions> : ::assessgrader::DebugFormatter
{
    auto format(const ::assessgrader::ProgramOptions& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "ProgramOptions{{verbosity = {}, definitions_dir = {}, host = {}, port = {}, "
                              "primary = {}, fallback = {}, sandbox_workers = {}, sandbox_queue = {}, "
                              "events_path = {}, local_languages = {}, review_key = {}}}",
                              from.verbosity, from.definitions_dir.string(), from.host, from.port, from.primary,
                              from.fallback, from.sandbox_workers, from.sandbox_queue,
                              from.events_path.value_or("<none>"), from.local_languages,
                              from.review_key ? "<set>" : "<none>");
    }
};
