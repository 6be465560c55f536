#include "catch2_custom.hpp"

#include "sandbox/execution.hpp"
#include "sandbox/local_process_backend.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

using namespace assessgrader;
using namespace std::chrono_literals;

namespace {

/// "shell" runs its source with sh; "broken" fails to compile
LocalProcessBackend shell_backend() {
    LocalProcessConfig config;
    config.languages = {
        {"shell", LocalLanguage::from_run_command("sh {src}", "main.sh")},
        {"broken",
         LocalLanguage{.source_file = "main.txt",
                       .compile_command = {"sh", "-c", "echo 'error: expected ;' >&2; exit 1"},
                       .run_command = {"{bin}"}}},
    };
    config.isolate_network = false;
    config.memory_limit_mb = 0;
    return LocalProcessBackend{config};
}

ExecutionRequest shell(std::string code, std::string input = "", std::chrono::milliseconds timeout = 5s) {
    return ExecutionRequest{.code = std::move(code), .language = "shell", .stdin_text = std::move(input), .timeout = timeout};
}

} // namespace

TEST_CASE("Run commands are split into words") {
    auto lang = LocalLanguage::from_run_command("  python3   -u {src} ", "main.py");

    REQUIRE(lang.run_command == std::vector<std::string>{"python3", "-u", "{src}"});
    REQUIRE(lang.compile_command.empty());
    REQUIRE(lang.source_file == "main.py");
}

TEST_CASE("Local languages are listed") {
    auto backend = shell_backend();

    REQUIRE(backend.languages() == std::vector<std::string>{"broken", "shell"});
    REQUIRE(backend.supports("shell"));
    REQUIRE_FALSE(backend.supports("python"));
}

TEST_CASE("Successful runs capture stdout") {
    auto backend = shell_backend();

    auto res = backend.execute(shell("read x; echo \"got $x\"", "42\n"), {});

    REQUIRE(res);
    REQUIRE(res->status == ExecutionStatus::Success);
    REQUIRE(res->stdout_text == "got 42\n");
    REQUIRE(res->backend == "local");
}

TEST_CASE("Non-zero exits are runtime errors") {
    auto backend = shell_backend();

    auto res = backend.execute(shell("echo bad >&2; exit 1"), {});

    REQUIRE(res);
    REQUIRE(res->status == ExecutionStatus::Error);
    REQUIRE(res->failure == ExecutionFailure::RuntimeError);
    REQUIRE(res->stderr_text == "bad\n");
}

TEST_CASE("Slow programs time out") {
    auto backend = shell_backend();

    auto res = backend.execute(shell("sleep 5", "", 200ms), {});

    REQUIRE(res);
    REQUIRE(res->status == ExecutionStatus::Timeout);
    REQUIRE_FALSE(res->failure.has_value());
}

TEST_CASE("Compile errors stop before running") {
    auto backend = shell_backend();

    auto res = backend.execute(
        ExecutionRequest{.code = "int main(", .language = "broken", .stdin_text = "", .timeout = 5s}, {});

    REQUIRE(res);
    REQUIRE(res->failure == ExecutionFailure::CompileError);
    REQUIRE(res->stderr_text == "error: expected ;\n");
}

TEST_CASE("Unknown languages are reported, not failed") {
    auto backend = shell_backend();

    auto res = backend.execute(
        ExecutionRequest{.code = "", .language = "cobol", .stdin_text = "", .timeout = 1s}, {});

    REQUIRE(res);
    REQUIRE(res->failure == ExecutionFailure::UnsupportedLanguage);
}

TEST_CASE("A stopped request does not run") {
    auto backend = shell_backend();

    std::stop_source stop;
    stop.request_stop();

    auto res = backend.execute(shell("echo hi"), stop.get_token());

    REQUIRE(res);
    REQUIRE(res->failure == ExecutionFailure::Cancelled);
}

TEST_CASE("Scratch directories are cleaned up") {
    auto scratch = std::filesystem::temp_directory_path() / "assessgrader-local-backend-test";
    std::filesystem::remove_all(scratch);
    std::filesystem::create_directories(scratch);

    LocalProcessConfig config;
    config.languages = {{"shell", LocalLanguage::from_run_command("sh {src}", "main.sh")}};
    config.scratch_dir = scratch;
    config.isolate_network = false;
    LocalProcessBackend backend{config};

    auto res = backend.execute(shell("pwd"), {});

    REQUIRE(res);
    REQUIRE(res->ok());
    REQUIRE(std::filesystem::is_empty(scratch));

    std::filesystem::remove_all(scratch);
}
