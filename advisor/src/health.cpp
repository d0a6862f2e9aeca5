#include "health.hpp"

HealthCheck::HealthCheck(const Config& config, std::shared_ptr<CatalogStore> catalog)
    : config_(config), catalog_(std::move(catalog)) {}

nlohmann::json HealthCheck::get_status() const {
    auto snap = catalog_->snapshot();

    return {
        {"status", "healthy"},
        {"service", config_.service_name},
        {"news_configured", config_.news_configured()},
        {"economic_configured", config_.economic_configured()},
        {"gemini_configured", config_.gemini_configured()},
        {"catalog", {
            {"size", snap->tickers.size()},
            {"synthetic", snap->synthetic_count()},
            {"refreshed_at", snap->refreshed_at}
        }}
    };
}

// The service answers with synthetic data when upstreams are down, so only
// a missing catalog counts as unhealthy
bool HealthCheck::is_healthy() const {
    return catalog_->snapshot() != nullptr;
}
