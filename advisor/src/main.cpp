#include "advisor.hpp"
#include "config.hpp"
#include "economic.hpp"
#include "errors.hpp"
#include "health.hpp"
#include "http_client.hpp"
#include "market_data.hpp"
#include "narrative.hpp"
#include "news_client.hpp"
#include "optimizer.hpp"
#include "regime.hpp"
#include "risk.hpp"
#include "server.hpp"
#include "universe.hpp"
#include "url_extractor.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    (void)signal;
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("quantadvisor", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

// Reloads the catalog every `interval_sec`; the first load runs immediately
void catalog_refresh_loop(CatalogStore& catalog,
                          const CancelToken& token,
                          int interval_sec) {
    spdlog::info("Starting catalog refresher (every {}s)", interval_sec);

    while (!shutdown_requested) {
        try {
            catalog.refresh(token);
        } catch (const CancelledError&) {
            break;
        } catch (const std::exception& e) {
            spdlog::error("Catalog refresh error: {}", e.what());
        }

        for (int i = 0; i < interval_sec && !shutdown_requested; i++) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("Catalog refresher stopped");
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    try {
        auto config = Config::from_env();

        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("QuantAdvisor v1.0");
        spdlog::info("==============================================");

        config.validate();

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        auto http = std::make_shared<HttpClient>(config.request_timeout_ms, config.fetch_retries);

        std::shared_ptr<NewsSource> news;
        if (config.news_configured()) {
            news = std::make_shared<FinnhubNewsClient>(config.finnhub_base, config.finnhub_api_key, http);
        } else {
            spdlog::info("FINNHUB_API_KEY not set, classifying from text only");
        }

        std::shared_ptr<NarrativeAnalyzer> analyzer;
        if (config.gemini_configured()) {
            analyzer = std::make_shared<GeminiClient>(config.gemini_base, config.gemini_api_key,
                                                      config.gemini_model, http);
        } else {
            spdlog::info("GEMINI_API_KEY not set, regime comes from lexicon heuristics");
        }

        auto classifier = std::make_shared<RegimeClassifier>(
            SentimentScorer(config.headline_weight), news, config.news_limit,
            RegimeThresholds(), analyzer);

        auto market = std::make_shared<YahooChartClient>(config.market_data_base, http);
        auto universe = std::make_shared<CandidateUniverse>(
            default_catalog(), market, config.fetch_concurrency, config.random_seed);
        auto catalog = std::make_shared<CatalogStore>(universe);

        OptimizerOptions opt;
        opt.max_assets = config.max_assets;
        opt.exact_max_candidates = config.exact_max_candidates;
        auto optimizer = std::make_shared<PortfolioOptimizer>(
            opt,
            std::make_unique<ExactSolver>(),
            std::make_unique<HeuristicSolver>(config.random_seed, config.heuristic_iterations));

        RiskOptions risk_opt;
        risk_opt.num_simulations = config.risk_simulations;
        risk_opt.confidence = config.var_confidence;
        risk_opt.seed = config.random_seed;
        auto risk = std::make_shared<RiskAnalyzer>(risk_opt);

        auto economic = std::make_shared<CachedEconomicSource>(
            std::make_shared<AlphaVantageClient>(config.alpha_vantage_base,
                                                 config.alpha_vantage_api_key, http),
            config.economic_cache_ttl_sec);

        auto extractor = std::make_shared<UrlTextExtractor>(http);

        Advisor advisor(classifier, catalog, optimizer, risk, economic, extractor);
        HealthCheck health(config, catalog);

        CancelToken refresh_token;
        std::thread refresher(catalog_refresh_loop,
                              std::ref(*catalog),
                              std::cref(refresh_token),
                              config.catalog_refresh_sec);

        AdvisorServer server(config, advisor, health);
        server.start();

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        spdlog::info("Shutdown requested");

        server.stop();

        refresh_token.cancel();
        if (refresher.joinable()) refresher.join();

        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
