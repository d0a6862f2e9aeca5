#pragma once

#include "advisor.hpp"
#include "cancel_token.hpp"
#include "config.hpp"
#include "health.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

class AdvisorServer {
public:
    AdvisorServer(const Config& config, const Advisor& advisor, const HealthCheck& health);
    ~AdvisorServer();

    void start();

    // Cancels in-flight requests, then stops accepting connections
    void stop();
    bool is_running() const { return running_; }

    // Handlers are public so tests can drive them without a socket
    void handle_analyze(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    size_t in_flight() const;

private:
    const Config& config_;
    const Advisor& advisor_;
    const HealthCheck& health_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::thread server_thread_;

    mutable std::mutex inflight_mutex_;
    std::set<CancelTokenPtr> inflight_;

    // Keeps a request's token cancellable by stop() for the handler's scope
    class InflightGuard {
    public:
        InflightGuard(AdvisorServer& server, CancelTokenPtr token);
        ~InflightGuard();
        InflightGuard(const InflightGuard&) = delete;
        InflightGuard& operator=(const InflightGuard&) = delete;

    private:
        AdvisorServer& server_;
        CancelTokenPtr token_;
    };

    void setup_routes();
    void track(const CancelTokenPtr& token);
    void untrack(const CancelTokenPtr& token);
    static void reply(httplib::Response& res, int status, const nlohmann::json& body);
};
