#include "user/cl_args.hpp"

#include "common/expected.hpp"
#include "logging.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace assessgrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ ASSESSGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

const char* getenv_or_null(const char* name) {
    const char* value = std::getenv(name);

    if (value == nullptr || *value == '\0') {
        return nullptr;
    }

    return value;
}

ProgramOptions::BackendKind backend_or_throw(const std::string& name) {
    auto kind = ProgramOptions::parse_backend(name);

    if (!kind) {
        throw std::invalid_argument(kind.error());
    }

    return kind.value();
}

} // namespace

void CommandLineArgs::setup_parser() {
    constexpr std::size_t DEFAULT_MAX_WIDTH = 100;
    arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);

    arg_parser_.add_description(fmt::format("AssessGrader v{} - skills assessment engine", ASSESSGRADER_VERSION_STRING));

    // clang-format off

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", ASSESSGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.verbosity++; })
        .append()
        .help("Increase log verbosity (repeatable)");

    arg_parser_.add_argument("-q", "--quiet")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.verbosity--; })
        .append()
        .help("Decrease log verbosity (repeatable)");

    arg_parser_.add_argument("-d", "--definitions")
        .default_value(std::string{ProgramOptions::DEFAULT_DEFINITIONS_DIR})
        .nargs(1)
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.definitions_dir = opt; })
        .help("Directory of JSON assessment definitions to publish at startup");

    arg_parser_.add_argument("--host")
        .default_value(std::string{ProgramOptions::DEFAULT_HOST})
        .nargs(1)
        .metavar("ADDR")
        .store_into(opts_buffer_.host)
        .help("Address to listen on");

    arg_parser_.add_argument("-p", "--port")
        .default_value(ProgramOptions::DEFAULT_PORT)
        .nargs(1)
        .metavar("PORT")
        .action([this] (const std::string& opt) { opts_buffer_.port = std::stoi(opt); })
        .help("Port to listen on");

    arg_parser_.add_argument("--primary")
        .choices("judge0", "piston", "local", "none")
        .default_value(std::string{"local"})
        .metavar("BACKEND")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.primary = backend_or_throw(opt); })
        .help("Primary code execution backend");

    arg_parser_.add_argument("--fallback")
        .choices("judge0", "piston", "local", "none")
        .default_value(std::string{"none"})
        .metavar("BACKEND")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.fallback = backend_or_throw(opt); })
        .help("Backend tried once when the primary fails or cannot be reached");

    arg_parser_.add_argument("--judge0-url")
        .nargs(1)
        .metavar("URL")
        .store_into(opts_buffer_.judge0_url)
        .help("Judge0 base URL [env: ASSESSGRADER_JUDGE0_URL]");

    arg_parser_.add_argument("--piston-url")
        .nargs(1)
        .metavar("URL")
        .store_into(opts_buffer_.piston_url)
        .help("Piston base URL [env: ASSESSGRADER_PISTON_URL]");

    arg_parser_.add_argument("--sandbox-workers")
        .nargs(1)
        .metavar("N")
        .action([this] (const std::string& opt) { opts_buffer_.sandbox_workers = std::stoul(opt); })
        .help(fmt::format("Concurrent code executions (default {})", ProgramOptions::DEFAULT_SANDBOX_WORKERS));

    arg_parser_.add_argument("--sandbox-queue")
        .nargs(1)
        .metavar("N")
        .action([this] (const std::string& opt) { opts_buffer_.sandbox_queue = std::stoul(opt); })
        .help(fmt::format("Executions allowed to wait for a worker (default {})", ProgramOptions::DEFAULT_SANDBOX_QUEUE));

    arg_parser_.add_argument("--sandbox-timeout")
        .nargs(1)
        .metavar("SECONDS")
        .action([this] (const std::string& opt) { opts_buffer_.sandbox_grace = std::chrono::seconds{std::stol(opt)}; })
        .help(fmt::format("Grace period on top of a question's timeout before a backend is abandoned (default {}s)",
                          ProgramOptions::DEFAULT_SANDBOX_GRACE_SECONDS));

    arg_parser_.add_argument("--sweep-interval")
        .nargs(1)
        .metavar("SECONDS")
        .action([this] (const std::string& opt) { opts_buffer_.sweep_interval = std::chrono::seconds{std::stol(opt)}; })
        .help(fmt::format("How often overdue attempts are finalized (default {}s)",
                          ProgramOptions::DEFAULT_SWEEP_INTERVAL_SECONDS));

    arg_parser_.add_argument("--events")
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.events_path = opt; })
        .help("Append JSON-lines scoring events to FILE ('-' for stdout)");

    arg_parser_.add_argument("--local-lang")
        .nargs(1)
        .metavar("LANG=CMD")
        .append()
        .action([this] (const std::string& opt) { opts_buffer_.local_languages.push_back(opt); })
        .help("Add or replace a language of the local backend, e.g. 'lua=lua {src}' (repeatable)");

    // clang-format on
}

void CommandLineArgs::apply_environment() {
    if (opts_buffer_.judge0_url.empty()) {
        const char* env = getenv_or_null("ASSESSGRADER_JUDGE0_URL");
        opts_buffer_.judge0_url = env != nullptr ? env : std::string{ProgramOptions::DEFAULT_JUDGE0_URL};
    }

    if (opts_buffer_.piston_url.empty()) {
        const char* env = getenv_or_null("ASSESSGRADER_PISTON_URL");
        opts_buffer_.piston_url = env != nullptr ? env : std::string{ProgramOptions::DEFAULT_PISTON_URL};
    }

    if (const char* key = getenv_or_null("ASSESSGRADER_JUDGE0_KEY")) {
        opts_buffer_.judge0_key = key;
    }

    if (const char* key = getenv_or_null("ASSESSGRADER_REVIEW_KEY")) {
        opts_buffer_.review_key = key;
    }
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    apply_environment();

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.help_message());
        std::exit(exit_code);
    }

    if (auto valid = opts_res->validate(); !valid) {
        fmt::print(stderr, "{}\n", fmt::styled(valid.error(), fmt::fg(fmt::color::red)));
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace assessgrader
