#include "server/http_server.hpp"

#include "logging.hpp"
#include "sandbox/http_util.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace assessgrader {

namespace {

constexpr std::string_view REVIEW_KEY_HEADER = "X-Review-Key";

ClientInfo client_of(const httplib::Request& req) {
    ClientInfo client{.ip_address = req.remote_addr, .user_agent = req.get_header_value("User-Agent")};

    // Behind a reverse proxy the first hop is the candidate
    if (req.has_header("X-Forwarded-For")) {
        auto forwarded = req.get_header_value("X-Forwarded-For");
        client.ip_address = forwarded.substr(0, forwarded.find(','));
    }

    return client;
}

std::optional<std::string_view> review_key_of(const httplib::Request& req) {
    if (!req.has_header(REVIEW_KEY_HEADER.data())) {
        return std::nullopt;
    }

    // Headers live as long as the request
    auto iter = req.headers.find(REVIEW_KEY_HEADER.data());
    return std::string_view{iter->second};
}

void reply(httplib::Response& res, const ApiResponse& response) {
    res.status = response.status;
    res.set_content(response.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json");
}

} // namespace

HttpServer::HttpServer(ApiHandlers& handlers, AssessmentOrchestrator& orchestrator, ServerConfig config)
    : handlers_{handlers}
    , orchestrator_{orchestrator}
    , config_{std::move(config)} {
    register_routes();
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::run() {
    sweeper_ = std::jthread{[this](const std::stop_token& stop) {
        while (detail::interruptible_sleep(config_.sweep_interval, stop)) {
            try {
                orchestrator_.expire_overdue();
            } catch (const std::exception& ex) {
                LOG_ERROR("Expiry sweep failed: {}", ex.what());
            }
        }
    }};

    LOG_INFO("Listening on {}:{}", config_.host, config_.port);

    if (!server_.listen(config_.host, config_.port)) {
        LOG_ERROR("Could not listen on {}:{}", config_.host, config_.port);
        sweeper_.request_stop();
        return false;
    }

    return true;
}

void HttpServer::stop() {
    if (server_.is_running()) {
        LOG_INFO("Stopping server");
        server_.stop();
    }

    sweeper_.request_stop();
}

void HttpServer::register_routes() {
    server_.Get("/health", [this](const httplib::Request& /*req*/, httplib::Response& res) {
        reply(res, handlers_.health());
    });

    // Candidate session

    server_.Get("/assessments/:token", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, handlers_.access(req.path_params.at("token"), client_of(req)));
    });

    server_.Post("/assessments/:token/start", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, handlers_.start(req.path_params.at("token"), client_of(req)));
    });

    server_.Post("/assessments/:token/responses", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, handlers_.submit_response(req.path_params.at("token"), req.body, client_of(req)));
    });

    server_.Post("/assessments/:token/submit", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, handlers_.submit(req.path_params.at("token"), client_of(req)));
    });

    server_.Get("/assessments/:token/results", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, handlers_.results(req.path_params.at("token"), client_of(req)));
    });

    server_.Post("/assessments/:token/report-activity", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, handlers_.report_activity(req.path_params.at("token"), req.body, client_of(req)));
    });

    server_.Post("/assessments/:token/execute-code", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, handlers_.execute_code(req.path_params.at("token"), req.body, client_of(req)));
    });

    // Review and management

    server_.Get("/review/assessments/:id/attempts", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, handlers_.list_attempts(req.path_params.at("id"), review_key_of(req)));
    });

    server_.Get("/review/attempts/:id", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, handlers_.attempt_record(req.path_params.at("id"), review_key_of(req)));
    });

    server_.Post("/review/attempts/:id/responses/:question_id/grade",
                 [this](const httplib::Request& req, httplib::Response& res) {
                     reply(res, handlers_.manual_grade(req.path_params.at("id"), req.path_params.at("question_id"),
                                                       req.body, review_key_of(req)));
                 });

    server_.Post("/review/assessments", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, handlers_.publish(req.body, review_key_of(req)));
    });

    server_.Post("/review/assessments/:id/invitations", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, handlers_.invite(req.path_params.at("id"), req.body, review_key_of(req)));
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& ex) {
            LOG_ERROR("Unhandled exception on {} {}: {}", req.method, req.path, ex.what());
        }

        res.status = 500;
        res.set_content(R"({"error":"internal_error","message":"internal error"})", "application/json");
    });

    server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_DEBUG("{} {} -> {}", req.method, req.path, res.status);
    });
}

} // namespace assessgrader
