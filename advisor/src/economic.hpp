#pragma once

#include "cancel_token.hpp"
#include "http_client.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Raw macro readings, before interpretation
struct EconomicIndicators {
    double cpi_yoy_change;     // percent
    double fed_rate_value;     // percent
    double gdp_growth;         // percent, quarter over quarter
    bool fallback = false;     // published defaults, not live values
};

struct EconomicSnapshot {
    double cpi_yoy_change = 0.0;
    double fed_rate_value = 0.0;
    double gdp_growth = 0.0;
    std::string label;
    std::string recommendation;   // aggressive / defensive / neutral
    std::string description;
    bool fallback = false;
};

// Interpretation bands for each indicator
struct EconomicBands {
    bool cpi_high;
    bool cpi_low;
    bool rate_tight;
    bool rate_loose;
    bool gdp_contracting;
};

struct EconomicRule {
    std::string label;
    std::function<bool(const EconomicBands&)> applies;
    std::string recommendation;
    std::string description;
};

class EconomicContextResolver {
public:
    // Pure; throws InputError when any input is not finite
    static EconomicSnapshot resolve(double cpi, double fed_rate, double gdp_growth);
    static EconomicSnapshot resolve(const EconomicIndicators& indicators);

    static EconomicBands bands(double cpi, double fed_rate, double gdp_growth);

    // Ordered, first match wins; the last rule always applies
    static const std::vector<EconomicRule>& rules();
};

class EconomicDataSource {
public:
    virtual ~EconomicDataSource() = default;

    // Never throws for upstream failures: falls back to published defaults
    virtual EconomicIndicators fetch(const CancelToken& token) = 0;
};

EconomicIndicators fallback_indicators();

class AlphaVantageClient : public EconomicDataSource {
public:
    AlphaVantageClient(const std::string& base_url, const std::string& api_key,
                       std::shared_ptr<HttpClient> http);

    EconomicIndicators fetch(const CancelToken& token) override;

    // Exposed for tests: {"data": [{"date", "value"}, ...]} newest first
    static std::vector<double> parse_series(const nlohmann::json& payload);
    static double yoy_change(const std::vector<double>& monthly);
    static double period_growth(const std::vector<double>& series);

private:
    std::string base_url_;
    std::string api_key_;
    std::shared_ptr<HttpClient> http_;

    std::vector<double> fetch_series(const std::string& function, const std::string& interval,
                                     const CancelToken& token);
};

// Holds the last fetched indicators for `ttl_seconds`
class CachedEconomicSource : public EconomicDataSource {
public:
    CachedEconomicSource(std::shared_ptr<EconomicDataSource> inner, int ttl_seconds = 3600);

    EconomicIndicators fetch(const CancelToken& token) override;
    void clear();

private:
    std::shared_ptr<EconomicDataSource> inner_;
    int ttl_seconds_;
    std::mutex mutex_;
    std::optional<EconomicIndicators> cached_;
    std::chrono::steady_clock::time_point cached_at_;

    bool is_expired() const;
};
