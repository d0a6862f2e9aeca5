#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 5000);

    cfg.market_data_base = get_env("MARKET_DATA_BASE", "https://query1.finance.yahoo.com/v8/finance/chart");
    cfg.finnhub_base = get_env("FINNHUB_BASE", "https://finnhub.io/api/v1");
    cfg.finnhub_api_key = get_env("FINNHUB_API_KEY");
    cfg.alpha_vantage_base = get_env("ALPHA_VANTAGE_BASE", "https://www.alphavantage.co/query");
    cfg.alpha_vantage_api_key = get_env("ALPHA_VANTAGE_API_KEY");
    cfg.gemini_base = get_env("GEMINI_BASE", "https://generativelanguage.googleapis.com/v1beta");
    cfg.gemini_api_key = get_env("GEMINI_API_KEY");
    cfg.gemini_model = get_env("GEMINI_MODEL", "gemini-2.0-flash");

    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 10000);
    cfg.fetch_retries = get_env_int("FETCH_RETRIES", 3);
    cfg.fetch_concurrency = get_env_int("FETCH_CONCURRENCY", 4);
    cfg.catalog_refresh_sec = get_env_int("CATALOG_REFRESH_SEC", 3600);
    cfg.economic_cache_ttl_sec = get_env_int("ECONOMIC_CACHE_TTL_SEC", 3600);
    cfg.news_limit = get_env_int("NEWS_LIMIT", 5);

    cfg.request_deadline_ms = get_env_int("REQUEST_DEADLINE_MS", 20000);
    cfg.max_assets = get_env_int("MAX_ASSETS", 4);
    cfg.exact_max_candidates = get_env_int("EXACT_MAX_CANDIDATES", 14);
    cfg.heuristic_iterations = get_env_int("HEURISTIC_ITERATIONS", 200);
    cfg.risk_simulations = get_env_int("RISK_SIMULATIONS", 10000);
    cfg.var_confidence = get_env_double("VAR_CONFIDENCE", 0.95);
    cfg.headline_weight = get_env_double("HEADLINE_WEIGHT", 0.3);
    cfg.random_seed = static_cast<uint64_t>(get_env_int("RANDOM_SEED", 42));

    cfg.service_name = get_env("SERVICE_NAME", "advisor");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be in 1..65535");
    }
    if (fetch_retries < 1) {
        throw std::runtime_error("FETCH_RETRIES must be at least 1");
    }
    if (fetch_concurrency < 1) {
        throw std::runtime_error("FETCH_CONCURRENCY must be at least 1");
    }
    if (catalog_refresh_sec < 1) {
        throw std::runtime_error("CATALOG_REFRESH_SEC must be at least 1");
    }
    if (request_deadline_ms < 1) {
        throw std::runtime_error("REQUEST_DEADLINE_MS must be positive");
    }
    if (max_assets < 1) {
        throw std::runtime_error("MAX_ASSETS must be at least 1");
    }
    if (risk_simulations < 100) {
        throw std::runtime_error("RISK_SIMULATIONS must be at least 100");
    }
    if (var_confidence <= 0.5 || var_confidence >= 1.0) {
        throw std::runtime_error("VAR_CONFIDENCE must be in (0.5, 1)");
    }
    if (headline_weight < 0.0 || headline_weight > 1.0) {
        throw std::runtime_error("HEADLINE_WEIGHT must be in [0, 1]");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Portfolio: max_assets={}, exact_max_candidates={}", max_assets, exact_max_candidates);
    spdlog::info("  Risk: simulations={}, confidence={}", risk_simulations, var_confidence);
    spdlog::info("  Fetch: timeout={}ms, retries={}, concurrency={}",
                 request_timeout_ms, fetch_retries, fetch_concurrency);
    spdlog::info("  News: {}, Economic data: {}",
                 news_configured() ? "configured" : "disabled",
                 economic_configured() ? "configured" : "fallback values");
    spdlog::info("  Narrative model: {}",
                 gemini_configured() ? gemini_model : "disabled, lexicon heuristics only");
}
