#include "economic.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>

namespace {

constexpr double kFallbackCpi = 3.2;
constexpr double kFallbackRate = 5.25;
constexpr double kFallbackGdp = 2.8;

} // namespace

EconomicIndicators fallback_indicators() {
    return {kFallbackCpi, kFallbackRate, kFallbackGdp, true};
}

EconomicBands EconomicContextResolver::bands(double cpi, double fed_rate, double gdp_growth) {
    return {
        cpi > 3.0,
        cpi < 1.0,
        fed_rate > 4.0,
        fed_rate < 2.0,
        gdp_growth <= 0.0
    };
}

const std::vector<EconomicRule>& EconomicContextResolver::rules() {
    static const std::vector<EconomicRule> table = {
        {"Stagflation Risk",
         [](const EconomicBands& b) { return b.cpi_high && b.rate_tight; },
         "defensive",
         "High inflation with tight policy. Favor a defensive allocation."},
        {"Recession Risk",
         [](const EconomicBands& b) { return b.gdp_contracting; },
         "defensive",
         "Output is contracting. Favor safe assets such as bonds and gold."},
        {"Growth Favorable",
         [](const EconomicBands& b) { return b.cpi_low && b.rate_loose; },
         "aggressive",
         "Low inflation with loose policy. Favor growth equities."},
        {"Balanced",
         [](const EconomicBands&) { return true; },
         "neutral",
         "Balanced macro backdrop. Favor a diversified allocation."}
    };
    return table;
}

EconomicSnapshot EconomicContextResolver::resolve(double cpi, double fed_rate, double gdp_growth) {
    if (!std::isfinite(cpi) || !std::isfinite(fed_rate) || !std::isfinite(gdp_growth)) {
        throw InputError("Economic indicators must be finite numbers");
    }

    EconomicSnapshot snap;
    snap.cpi_yoy_change = cpi;
    snap.fed_rate_value = fed_rate;
    snap.gdp_growth = gdp_growth;

    auto b = bands(cpi, fed_rate, gdp_growth);
    for (const auto& rule : rules()) {
        if (rule.applies(b)) {
            snap.label = rule.label;
            snap.recommendation = rule.recommendation;
            snap.description = rule.description;
            break;
        }
    }
    return snap;
}

EconomicSnapshot EconomicContextResolver::resolve(const EconomicIndicators& indicators) {
    auto snap = resolve(indicators.cpi_yoy_change, indicators.fed_rate_value, indicators.gdp_growth);
    snap.fallback = indicators.fallback;
    return snap;
}

AlphaVantageClient::AlphaVantageClient(const std::string& base_url, const std::string& api_key,
                                       std::shared_ptr<HttpClient> http)
    : base_url_(base_url), api_key_(api_key), http_(std::move(http)) {}

std::vector<double> AlphaVantageClient::parse_series(const nlohmann::json& payload) {
    std::vector<double> values;
    if (!payload.contains("data") || !payload["data"].is_array()) {
        return values;
    }

    for (const auto& point : payload["data"]) {
        if (!point.contains("value")) continue;
        const auto& v = point["value"];
        try {
            // Values arrive as strings; "." marks a missing observation
            double x = v.is_string() ? std::stod(v.get<std::string>()) : v.get<double>();
            if (std::isfinite(x)) values.push_back(x);
        } catch (const std::exception& e) {
            spdlog::debug("Skipping unparsable observation: {}", e.what());
        }
    }
    return values;
}

double AlphaVantageClient::yoy_change(const std::vector<double>& monthly) {
    if (monthly.size() < 2) {
        throw DataUnavailableError("CPI series too short");
    }
    double latest = monthly[0];
    double base = monthly.size() > 12 ? monthly[12] : monthly[1];
    if (base == 0.0) {
        throw DataUnavailableError("CPI base value is zero");
    }
    return (latest - base) / base * 100.0;
}

double AlphaVantageClient::period_growth(const std::vector<double>& series) {
    if (series.size() < 2) {
        throw DataUnavailableError("GDP series too short");
    }
    if (series[1] == 0.0) {
        throw DataUnavailableError("GDP base value is zero");
    }
    return (series[0] - series[1]) / series[1] * 100.0;
}

std::vector<double> AlphaVantageClient::fetch_series(const std::string& function,
                                                     const std::string& interval,
                                                     const CancelToken& token) {
    std::string url = fmt::format("{}?function={}&interval={}&apikey={}",
                                  base_url_, function, interval, HttpClient::escape(api_key_));
    auto payload = http_->get_json(url, token);

    auto values = parse_series(payload);
    if (values.empty()) {
        // Rate-limit notices come back as 200 with a "Note" or "Information" field
        throw DataUnavailableError(fmt::format("No {} observations in response", function));
    }
    return values;
}

EconomicIndicators AlphaVantageClient::fetch(const CancelToken& token) {
    if (api_key_.empty()) {
        spdlog::debug("Economic data source not configured, using published defaults");
        return fallback_indicators();
    }

    try {
        EconomicIndicators ind;
        ind.cpi_yoy_change = yoy_change(fetch_series("CPI", "monthly", token));
        ind.fed_rate_value = fetch_series("FEDERAL_FUNDS_RATE", "monthly", token).front();
        ind.gdp_growth = period_growth(fetch_series("REAL_GDP", "quarterly", token));
        ind.fallback = false;

        spdlog::info("Economic indicators: cpi_yoy={:.2f}%, fed_rate={:.2f}%, gdp_growth={:.2f}%",
                     ind.cpi_yoy_change, ind.fed_rate_value, ind.gdp_growth);
        return ind;

    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("Economic data unavailable ({}), using published defaults", e.what());
        return fallback_indicators();
    }
}

CachedEconomicSource::CachedEconomicSource(std::shared_ptr<EconomicDataSource> inner, int ttl_seconds)
    : inner_(std::move(inner)), ttl_seconds_(ttl_seconds) {}

bool CachedEconomicSource::is_expired() const {
    auto now = std::chrono::steady_clock::now();
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - cached_at_).count();
    return age > ttl_seconds_;
}

EconomicIndicators CachedEconomicSource::fetch(const CancelToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cached_ && !is_expired()) {
            return *cached_;
        }
    }

    // Fetched without the lock so a slow upstream never queues other requests
    auto fresh = inner_->fetch(token);

    // Defaults are not cached so the next request retries the upstream
    if (!fresh.fallback) {
        std::lock_guard<std::mutex> lock(mutex_);
        cached_ = fresh;
        cached_at_ = std::chrono::steady_clock::now();
    }
    return fresh;
}

void CachedEconomicSource::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.reset();
}
