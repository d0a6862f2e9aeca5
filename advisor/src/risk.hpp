#pragma once

#include "cancel_token.hpp"
#include "optimizer.hpp"
#include "universe.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct RiskMetrics {
    double expected_return = 0.0;    // mean simulated horizon return
    double risk_probability = 0.0;   // P(horizon return < 0)
    double var = 0.0;                // loss at `confidence`, [0, 1]
    double cvar = 0.0;               // mean loss beyond VaR, >= var
    double volatility = 0.0;         // stddev of horizon returns
    double max_drawdown = 0.0;       // historical peak-to-trough, [0, 1]
    double confidence = 0.95;
};

struct RiskOptions {
    int num_simulations = 10000;
    int horizon_days = 252;
    double confidence = 0.95;
    uint64_t seed = 42;
};

using SeriesMap = std::map<std::string, std::vector<double>>;

// Historical bootstrap of the weighted portfolio. Seeded, so identical
// inputs always produce identical metrics.
class RiskAnalyzer {
public:
    explicit RiskAnalyzer(RiskOptions options = RiskOptions());

    // Throws InternalError if a selected symbol has no series
    RiskMetrics analyze(const PortfolioSelection& selection, const SeriesMap& series) const;
    RiskMetrics analyze(const PortfolioSelection& selection, const SeriesMap& series,
                        const CancelToken& token) const;

    static SeriesMap series_of(const std::vector<Ticker>& tickers);

    // Weighted daily returns over the trailing window common to all series
    static std::vector<double> portfolio_returns(const std::vector<double>& weights,
                                                 const std::vector<const std::vector<double>*>& series);
    static double max_drawdown(const std::vector<double>& returns);

    const RiskOptions& options() const { return options_; }

private:
    RiskOptions options_;
};
