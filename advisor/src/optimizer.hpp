#pragma once

#include "cancel_token.hpp"
#include "regime.hpp"
#include "universe.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct PortfolioSelection {
    std::vector<std::string> selected_tickers;
    std::vector<std::string> selected_names;
    std::vector<double> weights;        // parallel to selected_tickers
    double expected_return = 0.0;       // annualized
    double volatility = 0.0;            // annualized estimate
    std::string solver;

    bool empty() const { return selected_tickers.empty(); }
};

// Annualized moments of the candidate set, estimated on the trailing window
// the candidate series have in common.
struct OptimizationProblem {
    std::vector<std::string> symbols;
    std::vector<std::string> names;
    std::vector<double> mu;
    std::vector<std::vector<double>> cov;
    double vol_ceiling;
    int max_assets;

    size_t size() const { return symbols.size(); }

    static OptimizationProblem from_tickers(const std::vector<Ticker>& candidates,
                                            double vol_ceiling, int max_assets);
};

struct SubsetSolution {
    std::vector<int> members;       // ascending problem indices, zero weights pruned
    std::vector<double> weights;    // parallel to members, sums to 1
    double expected_return = 0.0;
    double volatility = 0.0;
    bool feasible = false;          // volatility within the ceiling
};

// True when `a` should be preferred over `b`: feasible first, then higher
// return, lower volatility, fewer members, lexicographic symbols.
bool better_solution(const SubsetSolution& a, const SubsetSolution& b,
                     const OptimizationProblem& problem);

// Highest-return nonnegative weights over `members` whose volatility stays
// within the ceiling. Falls back to minimum variance (feasible=false) when
// the subset cannot meet it.
SubsetSolution solve_weights(const OptimizationProblem& problem, const std::vector<int>& members);

class PortfolioSolver {
public:
    virtual ~PortfolioSolver() = default;

    virtual std::string name() const = 0;

    // Problem must be non-empty
    virtual SubsetSolution solve(const OptimizationProblem& problem,
                                 const CancelToken& token) const = 0;
};

// Enumerates every subset up to max_assets. Throws OptimizationTimeoutError
// when the token's deadline passes mid-enumeration.
class ExactSolver : public PortfolioSolver {
public:
    std::string name() const override { return "exact"; }
    SubsetSolution solve(const OptimizationProblem& problem,
                         const CancelToken& token) const override;

    static uint64_t subset_count(int n, int max_k);
};

// Greedy forward selection followed by seeded swap/add/drop local search.
// Returns the best solution found so far when the deadline passes.
class HeuristicSolver : public PortfolioSolver {
public:
    HeuristicSolver(uint64_t seed, int iterations);

    std::string name() const override { return "heuristic"; }
    SubsetSolution solve(const OptimizationProblem& problem,
                         const CancelToken& token) const override;

private:
    uint64_t seed_;
    int iterations_;
};

struct OptimizerOptions {
    int max_assets = 4;
    int exact_max_candidates = 14;
    double subset_cost_us = 250.0;      // enumeration cost estimate per subset

    double ceiling_defensive = 0.15;
    double ceiling_neutral = 0.25;
    double ceiling_aggressive = 0.40;
};

class PortfolioOptimizer {
public:
    PortfolioOptimizer(OptimizerOptions options,
                       std::unique_ptr<PortfolioSolver> exact,
                       std::unique_ptr<PortfolioSolver> heuristic);

    PortfolioSelection optimize(const std::vector<Ticker>& candidates, MarketRegime regime) const;
    PortfolioSelection optimize(const std::vector<Ticker>& candidates, MarketRegime regime,
                                const CancelToken& token) const;

    double ceiling_for(MarketRegime regime) const;

    // Which strategy optimize() would start with for `n` candidates
    const PortfolioSolver& choose_solver(size_t n, const CancelToken& token) const;

private:
    OptimizerOptions options_;
    std::unique_ptr<PortfolioSolver> exact_;
    std::unique_ptr<PortfolioSolver> heuristic_;
};
