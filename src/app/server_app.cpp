#include "app/server_app.hpp"

#include "attempt/attempt_lifecycle.hpp"
#include "attempt/attempt_store.hpp"
#include "grading/question_grader.hpp"
#include "logging.hpp"
#include "orchestrator/assessment_orchestrator.hpp"
#include "orchestrator/definition_registry.hpp"
#include "output/file_sink.hpp"
#include "output/json_lines_serializer.hpp"
#include "output/sink.hpp"
#include "output/stdout_sink.hpp"
#include "sandbox/judge0_backend.hpp"
#include "sandbox/local_process_backend.hpp"
#include "sandbox/piston_backend.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "server/api_handlers.hpp"
#include "server/http_server.hpp"

#include <fmt/format.h>

#include <atomic>
#include <memory>
#include <string>
#include <utility>

namespace assessgrader {

namespace {

std::atomic<HttpServer*> running_server{nullptr};

} // namespace

void ServerApp::request_shutdown() {
    if (auto* server = running_server.load()) {
        server->stop();
    }
}

std::shared_ptr<SandboxBackend> ServerApp::make_backend(ProgramOptions::BackendKind kind) const {
    using enum ProgramOptions::BackendKind;

    switch (kind) {
    case Judge0:
        return std::make_shared<Judge0Backend>(Judge0Config{.base_url = OPTS.judge0_url, .api_key = OPTS.judge0_key});
    case Piston:
        return std::make_shared<PistonBackend>(PistonConfig{.base_url = OPTS.piston_url});
    case Local: {
        LocalProcessConfig config;

        for (const auto& spec : OPTS.local_languages) {
            auto sep = spec.find('=');
            config.languages.insert_or_assign(spec.substr(0, sep), LocalLanguage::from_run_command(spec.substr(sep + 1)));
        }

        return std::make_shared<LocalProcessBackend>(std::move(config));
    }
    case None:
        return nullptr;
    }

    return nullptr;
}

int ServerApp::run_impl() {
    DefinitionRegistry registry;

    if (registry.load_directory(OPTS.definitions_dir) == 0) {
        LOG_WARN("No assessment definitions were loaded from {}", OPTS.definitions_dir.string());
    }

    std::shared_ptr<SandboxExecutor> sandbox;

    if (auto primary = make_backend(OPTS.primary)) {
        auto fallback = make_backend(OPTS.fallback);

        LOG_INFO("Code execution on {}{}", primary->name(),
                 fallback ? fmt::format(", falling back to {}", fallback->name()) : "");

        sandbox = std::make_shared<SandboxExecutor>(
            std::move(primary), std::move(fallback),
            SandboxConfig{.workers = OPTS.sandbox_workers, .max_queue = OPTS.sandbox_queue, .grace = OPTS.sandbox_grace});
    } else {
        LOG_WARN("No sandbox backend configured; coding answers will wait for manual grading");
    }

    std::unique_ptr<Sink> event_sink;
    std::unique_ptr<AttemptEventSerializer> events;

    if (OPTS.events_path) {
        if (*OPTS.events_path == "-") {
            event_sink = std::make_unique<StdoutSink>();
        } else {
            event_sink = std::make_unique<FileSink>(*OPTS.events_path);
        }

        events = std::make_unique<JsonLinesSerializer>(*event_sink);
    }

    AttemptStore store;
    AttemptLifecycle lifecycle{store, QuestionGrader{sandbox}, events.get()};
    AssessmentOrchestrator orchestrator{registry, store, lifecycle, sandbox};
    ApiHandlers handlers{orchestrator, OPTS.review_key};

    if (!OPTS.review_key) {
        LOG_WARN("ASSESSGRADER_REVIEW_KEY is not set; review routes are open to anyone who can reach the server");
    }

    HttpServer server{handlers, orchestrator,
                      ServerConfig{.host = OPTS.host, .port = OPTS.port, .sweep_interval = OPTS.sweep_interval}};

    running_server.store(&server);
    bool listened = server.run();
    running_server.store(nullptr);

    if (events) {
        events->finalize();
    }

    return listened ? 0 : 1;
}

} // namespace assessgrader
