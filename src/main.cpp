#include "app/server_app.hpp"
#include "logging.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstddef>
#include <span>
#include <thread>

#include <pthread.h>
#include <signal.h>

namespace {

/// Each -v/-q step moves one spdlog level from the default
void apply_verbosity(int verbosity) {
    auto level = static_cast<int>(spdlog::get_level()) - verbosity;
    level = std::clamp(level, static_cast<int>(spdlog::level::trace), static_cast<int>(spdlog::level::off));

    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
}

/// SIGINT and SIGTERM are blocked in every thread and collected here, so the
/// server can be stopped outside of signal handler context
void start_signal_watcher() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::thread{[signals] {
        int received = 0;
        if (sigwait(&signals, &received) == 0) {
            LOG_INFO("Received signal {}, shutting down", received);
            assessgrader::ServerApp::request_shutdown();
        }
    }}.detach();
}

} // namespace

int main(int argc, const char* argv[]) {
    using namespace assessgrader;

    init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    const ProgramOptions options = parse_args_or_exit(args);
    apply_verbosity(options.verbosity);

    start_signal_watcher();

    ServerApp app{options};

    return app.run();
}
