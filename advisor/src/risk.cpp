#include "risk.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <random>

namespace {

double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

} // namespace

RiskAnalyzer::RiskAnalyzer(RiskOptions options) : options_(options) {}

SeriesMap RiskAnalyzer::series_of(const std::vector<Ticker>& tickers) {
    SeriesMap out;
    for (const auto& t : tickers) {
        out[t.symbol] = t.returns;
    }
    return out;
}

std::vector<double> RiskAnalyzer::portfolio_returns(const std::vector<double>& weights,
                                                    const std::vector<const std::vector<double>*>& series) {
    if (series.empty()) return {};

    size_t window = series.front()->size();
    for (const auto* s : series) {
        window = std::min(window, s->size());
    }

    std::vector<double> out(window, 0.0);
    for (size_t i = 0; i < series.size(); i++) {
        const auto& s = *series[i];
        size_t offset = s.size() - window;
        for (size_t t = 0; t < window; t++) {
            out[t] += weights[i] * s[offset + t];
        }
    }
    return out;
}

double RiskAnalyzer::max_drawdown(const std::vector<double>& returns) {
    double equity = 1.0;
    double peak = 1.0;
    double worst = 0.0;

    for (double r : returns) {
        equity *= (1.0 + r);
        peak = std::max(peak, equity);
        if (peak > 0.0) {
            worst = std::max(worst, (peak - equity) / peak);
        }
    }
    return clamp01(worst);
}

RiskMetrics RiskAnalyzer::analyze(const PortfolioSelection& selection, const SeriesMap& series) const {
    CancelToken token;
    return analyze(selection, series, token);
}

RiskMetrics RiskAnalyzer::analyze(const PortfolioSelection& selection, const SeriesMap& series,
                                  const CancelToken& token) const {
    RiskMetrics metrics;
    metrics.confidence = options_.confidence;

    if (selection.empty()) {
        return metrics;
    }

    std::vector<const std::vector<double>*> constituents;
    for (const auto& symbol : selection.selected_tickers) {
        auto it = series.find(symbol);
        if (it == series.end()) {
            throw InternalError("No return series for " + symbol);
        }
        constituents.push_back(&it->second);
    }

    auto daily = portfolio_returns(selection.weights, constituents);
    if (daily.empty()) {
        return metrics;
    }

    metrics.max_drawdown = max_drawdown(daily);

    std::mt19937_64 gen(options_.seed);
    std::uniform_int_distribution<size_t> pick(0, daily.size() - 1);
    std::vector<double> outcomes(static_cast<size_t>(options_.num_simulations));

    for (size_t p = 0; p < outcomes.size(); p++) {
        if ((p & 255) == 0) token.throw_if_cancelled();

        double growth = 1.0;
        for (int d = 0; d < options_.horizon_days; d++) {
            growth *= (1.0 + daily[pick(gen)]);
        }
        outcomes[p] = growth - 1.0;
    }

    double n = static_cast<double>(outcomes.size());
    double sum = 0.0;
    size_t losses = 0;
    for (double r : outcomes) {
        sum += r;
        if (r < 0.0) losses++;
    }
    metrics.expected_return = sum / n;
    metrics.risk_probability = clamp01(static_cast<double>(losses) / n);

    double sq = 0.0;
    for (double r : outcomes) {
        sq += (r - metrics.expected_return) * (r - metrics.expected_return);
    }
    metrics.volatility = outcomes.size() > 1 ? std::sqrt(sq / (n - 1.0)) : 0.0;

    std::sort(outcomes.begin(), outcomes.end());
    size_t tail = static_cast<size_t>(std::floor((1.0 - options_.confidence) * n));
    tail = std::max<size_t>(1, std::min(tail, outcomes.size()));

    double threshold = outcomes[tail - 1];
    double tail_sum = 0.0;
    for (size_t i = 0; i < tail; i++) tail_sum += outcomes[i];

    // Tail mean sits at or below the threshold, so cvar >= var by construction
    metrics.var = clamp01(-threshold);
    metrics.cvar = std::max(metrics.var, clamp01(-tail_sum / static_cast<double>(tail)));

    spdlog::debug("Risk: p_loss={:.3f}, var={:.4f}, cvar={:.4f}, vol={:.4f}, mdd={:.4f}",
                  metrics.risk_probability, metrics.var, metrics.cvar,
                  metrics.volatility, metrics.max_drawdown);

    return metrics;
}
