#pragma once

#include "cancel_token.hpp"
#include "http_client.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    // Trailing one year of daily simple returns, oldest first.
    // Throws DataUnavailableError.
    virtual std::vector<double> fetch_daily_returns(const std::string& symbol,
                                                    const CancelToken& token) = 0;
};

class YahooChartClient : public MarketDataSource {
public:
    YahooChartClient(const std::string& base_url, std::shared_ptr<HttpClient> http);

    std::vector<double> fetch_daily_returns(const std::string& symbol,
                                            const CancelToken& token) override;

    static constexpr size_t MIN_OBSERVATIONS = 20;

    // Exposed for tests: chart payload -> daily returns
    static std::vector<double> parse_chart(const nlohmann::json& payload);

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
};

// Annualized drift and volatility used to calibrate synthetic series
struct SeriesModel {
    double annual_drift;
    double annual_vol;
};

SeriesModel model_for_sector(const std::string& sector);

// Seeded geometric random walk, reproducible per (symbol, seed)
std::vector<double> synthesize_returns(const std::string& symbol,
                                       const std::string& sector,
                                       uint64_t seed,
                                       int days = 252);
