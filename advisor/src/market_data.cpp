#include "market_data.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <map>
#include <random>

YahooChartClient::YahooChartClient(const std::string& base_url, std::shared_ptr<HttpClient> http)
    : base_url_(base_url), http_(http) {}

std::vector<double> YahooChartClient::parse_chart(const nlohmann::json& payload) {
    if (!payload.contains("chart") || !payload["chart"].contains("result") ||
        !payload["chart"]["result"].is_array() || payload["chart"]["result"].empty()) {
        throw DataUnavailableError("Chart payload has no result");
    }

    const auto& result = payload["chart"]["result"][0];
    const auto& indicators = result.value("indicators", nlohmann::json::object());

    nlohmann::json closes;
    if (indicators.contains("adjclose") && !indicators["adjclose"].empty() &&
        indicators["adjclose"][0].contains("adjclose")) {
        closes = indicators["adjclose"][0]["adjclose"];
    } else if (indicators.contains("quote") && !indicators["quote"].empty() &&
               indicators["quote"][0].contains("close")) {
        closes = indicators["quote"][0]["close"];
    } else {
        throw DataUnavailableError("Chart payload has no closes");
    }

    std::vector<double> prices;
    for (const auto& c : closes) {
        // Holidays and halts come back as null
        if (c.is_number() && c.get<double>() > 0.0) {
            prices.push_back(c.get<double>());
        }
    }

    std::vector<double> returns;
    for (size_t i = 1; i < prices.size(); i++) {
        returns.push_back(prices[i] / prices[i - 1] - 1.0);
    }

    if (returns.size() < MIN_OBSERVATIONS) {
        throw DataUnavailableError("Insufficient data points: " + std::to_string(returns.size()));
    }
    return returns;
}

std::vector<double> YahooChartClient::fetch_daily_returns(const std::string& symbol,
                                                          const CancelToken& token) {
    std::string url = base_url_ + "/" + HttpClient::escape(symbol) + "?range=1y&interval=1d";
    auto payload = http_->get_json(url, token);
    auto returns = parse_chart(payload);
    spdlog::debug("Fetched {} daily returns for {}", returns.size(), symbol);
    return returns;
}

SeriesModel model_for_sector(const std::string& sector) {
    static const std::map<std::string, SeriesModel> models = {
        {"Technology",       {0.15, 0.28}},
        {"Semiconductors",   {0.18, 0.40}},
        {"AI",               {0.20, 0.50}},
        {"Crypto",           {0.25, 0.70}},
        {"Growth",           {0.15, 0.45}},
        {"Gold",             {0.06, 0.15}},
        {"Utilities",        {0.06, 0.16}},
        {"Bonds",            {0.03, 0.08}},
        {"Consumer Staples", {0.06, 0.14}},
        {"Healthcare",       {0.07, 0.18}},
        {"Energy",           {0.08, 0.28}},
        {"Financials",       {0.09, 0.24}},
        {"Broad Market",     {0.08, 0.16}},
        {"Diversified",      {0.07, 0.14}},
    };

    auto it = models.find(sector);
    if (it != models.end()) return it->second;
    return {0.07, 0.20};
}

std::vector<double> synthesize_returns(const std::string& symbol,
                                       const std::string& sector,
                                       uint64_t seed,
                                       int days) {
    auto model = model_for_sector(sector);
    double dt = 1.0 / 252.0;
    double mu = (model.annual_drift - 0.5 * model.annual_vol * model.annual_vol) * dt;
    double sigma = model.annual_vol * std::sqrt(dt);

    std::mt19937_64 gen(seed ^ util::fnv1a(symbol));
    std::normal_distribution<double> dist(mu, sigma);

    std::vector<double> returns;
    returns.reserve(days);
    for (int i = 0; i < days; i++) {
        returns.push_back(std::exp(dist(gen)) - 1.0);
    }
    return returns;
}
