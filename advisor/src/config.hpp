#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>

struct Config {
    // HTTP
    std::string listen_addr;
    int listen_port;

    // Upstreams
    std::string market_data_base;
    std::string finnhub_base;
    std::string finnhub_api_key;
    std::string alpha_vantage_base;
    std::string alpha_vantage_api_key;
    std::string gemini_base;
    std::string gemini_api_key;
    std::string gemini_model;

    // Fetch policy
    int request_timeout_ms;
    int fetch_retries;
    int fetch_concurrency;
    int catalog_refresh_sec;
    int economic_cache_ttl_sec;
    int news_limit;

    // Analysis
    int request_deadline_ms;
    int max_assets;
    int exact_max_candidates;
    int heuristic_iterations;
    int risk_simulations;
    double var_confidence;
    double headline_weight;
    uint64_t random_seed;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    bool news_configured() const { return !finnhub_api_key.empty(); }
    bool economic_configured() const { return !alpha_vantage_api_key.empty(); }
    bool gemini_configured() const { return !gemini_api_key.empty(); }

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
