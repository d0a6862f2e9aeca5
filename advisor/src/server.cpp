#include "server.hpp"
#include "errors.hpp"
#include "response.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

AdvisorServer::AdvisorServer(const Config& config, const Advisor& advisor, const HealthCheck& health)
    : config_(config)
    , advisor_(advisor)
    , health_(health)
    , server_(std::make_unique<httplib::Server>())
{}

AdvisorServer::~AdvisorServer() {
    stop();
}

void AdvisorServer::start() {
    if (running_) return;

    setup_routes();
    running_ = true;
    stopping_ = false;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}",
                     config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP server failed to listen on {}:{}",
                          config_.listen_addr, config_.listen_port);
            running_ = false;
        }
    });

    spdlog::info("Advisor server started");
}

void AdvisorServer::stop() {
    stopping_ = true;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        if (!inflight_.empty()) {
            spdlog::info("Cancelling {} in-flight request(s)", inflight_.size());
        }
        for (const auto& token : inflight_) {
            token->cancel();
        }
    }

    if (!running_ && !server_thread_.joinable()) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("Advisor server stopped");
}

void AdvisorServer::setup_routes() {
    server_->Post("/api/analyze",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_analyze(req, res);
        });

    server_->Get("/api/health",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });
}

void AdvisorServer::reply(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void AdvisorServer::track(const CancelTokenPtr& token) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    inflight_.insert(token);
}

void AdvisorServer::untrack(const CancelTokenPtr& token) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    inflight_.erase(token);
}

AdvisorServer::InflightGuard::InflightGuard(AdvisorServer& server, CancelTokenPtr token)
    : server_(server), token_(std::move(token)) {
    server_.track(token_);
}

AdvisorServer::InflightGuard::~InflightGuard() {
    server_.untrack(token_);
}

size_t AdvisorServer::in_flight() const {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    return inflight_.size();
}

void AdvisorServer::handle_analyze(const httplib::Request& req, httplib::Response& res) {
    if (stopping_) {
        reply(res, 503, ResponseBuilder::error("Service is shutting down"));
        return;
    }

    auto token = std::make_shared<CancelToken>(std::chrono::milliseconds(config_.request_deadline_ms));
    InflightGuard guard(*this, token);

    try {
        nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            throw InputError("Request body must be a JSON object");
        }
        if (!body.contains("text") || !body["text"].is_string()) {
            throw InputError("Field 'text' is required");
        }

        auto result = advisor_.analyze(body["text"].get<std::string>(), *token);
        reply(res, 200, ResponseBuilder::success(result));

    } catch (const InputError& e) {
        spdlog::warn("Rejected analyze request: {}", e.what());
        reply(res, 400, ResponseBuilder::error(e.what()));
    } catch (const CancelledError& e) {
        spdlog::warn("Analyze request cancelled: {}", e.what());
        reply(res, 503, ResponseBuilder::error("Request cancelled"));
    } catch (const std::exception& e) {
        spdlog::error("Analyze handler error: {}", e.what());
        reply(res, 500, ResponseBuilder::error("Internal server error"));
    }
}

void AdvisorServer::handle_health(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    reply(res, health_.is_healthy() ? 200 : 503, health_.get_status());
}
