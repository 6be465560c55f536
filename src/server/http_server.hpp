#pragma once

#include "common/class_traits.hpp"
#include "orchestrator/assessment_orchestrator.hpp"
#include "server/api_handlers.hpp"

#include <httplib.h>

#include <chrono>
#include <string>
#include <thread>

namespace assessgrader {

struct ServerConfig
{
    std::string host = "127.0.0.1";
    int port = 8080;
    /// How often overdue attempts are finalized in the background
    std::chrono::milliseconds sweep_interval{std::chrono::seconds{15}};
};

/// Binds ApiHandlers to HTTP routes and runs the expiry sweep alongside the listener
class HttpServer : NonMovable
{
public:
    HttpServer(ApiHandlers& handlers, AssessmentOrchestrator& orchestrator, ServerConfig config);

    ~HttpServer();

    /// Blocks until ``stop`` is called or the listener fails. Returns false if it could not bind
    bool run();

    void stop();

private:
    void register_routes();

    ApiHandlers& handlers_;
    AssessmentOrchestrator& orchestrator_;
    ServerConfig config_;

    httplib::Server server_;
    std::jthread sweeper_;
};

} // namespace assessgrader
