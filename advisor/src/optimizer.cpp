#include "optimizer.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>
#include <random>

namespace {

constexpr double kTieEps = 1e-9;
constexpr double kFeasibleEps = 1e-7;
constexpr double kPruneEps = 1e-9;
constexpr int kMinVarIterations = 500;
constexpr int kUtilityIterations = 200;
constexpr int kBisectionSteps = 30;

using Matrix = std::vector<std::vector<double>>;

double dot(const std::vector<double>& a, const std::vector<double>& b) {
    double s = 0.0;
    for (size_t i = 0; i < a.size(); i++) s += a[i] * b[i];
    return s;
}

double quad_form(const Matrix& m, const std::vector<double>& w) {
    double s = 0.0;
    for (size_t i = 0; i < w.size(); i++) {
        for (size_t j = 0; j < w.size(); j++) {
            s += w[i] * m[i][j] * w[j];
        }
    }
    return s;
}

double volatility_of(const Matrix& cov, const std::vector<double>& w) {
    return std::sqrt(std::max(0.0, quad_form(cov, w)));
}

// Euclidean projection onto {w >= 0, sum w = 1}
void project_simplex(std::vector<double>& v) {
    std::vector<double> u(v);
    std::sort(u.begin(), u.end(), std::greater<double>());

    double cumsum = 0.0;
    double theta = 0.0;
    for (size_t i = 0; i < u.size(); i++) {
        cumsum += u[i];
        double t = (cumsum - 1.0) / static_cast<double>(i + 1);
        if (u[i] - t > 0.0) theta = t;
    }
    for (auto& x : v) {
        x = std::max(0.0, x - theta);
    }
}

// Projected gradient ascent on w.mu - lambda/2 w'Cw (mu ignored for min variance)
void ascend(const std::vector<double>& mu, const Matrix& cov, double lambda,
            bool use_mu, std::vector<double>& w, int iterations) {
    double bound = 0.0;
    for (const auto& row : cov) {
        double s = 0.0;
        for (double c : row) s += std::abs(c);
        bound = std::max(bound, s);
    }
    double step = 1.0 / std::max(lambda * bound, 1e-12);

    size_t k = w.size();
    std::vector<double> grad(k);
    for (int it = 0; it < iterations; it++) {
        for (size_t i = 0; i < k; i++) {
            double cw = 0.0;
            for (size_t j = 0; j < k; j++) cw += cov[i][j] * w[j];
            grad[i] = (use_mu ? mu[i] : 0.0) - lambda * cw;
        }
        for (size_t i = 0; i < k; i++) w[i] += step * grad[i];
        project_simplex(w);
    }
}

SubsetSolution finalize(const OptimizationProblem& problem, const std::vector<int>& members,
                        const std::vector<double>& raw_weights) {
    SubsetSolution sol;
    double total = 0.0;
    for (size_t i = 0; i < members.size(); i++) {
        if (raw_weights[i] > kPruneEps) {
            sol.members.push_back(members[i]);
            sol.weights.push_back(raw_weights[i]);
            total += raw_weights[i];
        }
    }
    if (sol.members.empty()) {
        // Projection never yields all zeros; keep the first member to stay total
        sol.members.push_back(members.front());
        sol.weights.push_back(1.0);
        total = 1.0;
    }
    for (auto& w : sol.weights) w /= total;

    for (size_t i = 0; i < sol.members.size(); i++) {
        sol.expected_return += sol.weights[i] * problem.mu[sol.members[i]];
    }
    double var = 0.0;
    for (size_t i = 0; i < sol.members.size(); i++) {
        for (size_t j = 0; j < sol.members.size(); j++) {
            var += sol.weights[i] * sol.weights[j] * problem.cov[sol.members[i]][sol.members[j]];
        }
    }
    sol.volatility = std::sqrt(std::max(0.0, var));
    sol.feasible = sol.volatility <= problem.vol_ceiling + kFeasibleEps;
    return sol;
}

std::vector<std::string> sorted_symbols(const SubsetSolution& s, const OptimizationProblem& p) {
    std::vector<std::string> out;
    for (int m : s.members) out.push_back(p.symbols[m]);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

OptimizationProblem OptimizationProblem::from_tickers(const std::vector<Ticker>& candidates,
                                                      double vol_ceiling, int max_assets) {
    OptimizationProblem p;
    p.vol_ceiling = vol_ceiling;
    p.max_assets = max_assets;

    size_t n = candidates.size();
    if (n == 0) return p;

    size_t window = candidates.front().returns.size();
    for (const auto& t : candidates) {
        p.symbols.push_back(t.symbol);
        p.names.push_back(t.name);
        window = std::min(window, t.returns.size());
    }

    p.mu.assign(n, 0.0);
    p.cov.assign(n, std::vector<double>(n, 0.0));

    if (window < 2) {
        for (size_t i = 0; i < n; i++) p.mu[i] = candidates[i].annualized_mean();
        return p;
    }

    // Trailing common window, so every pair is measured over the same days
    std::vector<std::vector<double>> x(n);
    std::vector<double> mean(n, 0.0);
    for (size_t i = 0; i < n; i++) {
        const auto& r = candidates[i].returns;
        x[i].assign(r.end() - window, r.end());
        mean[i] = std::accumulate(x[i].begin(), x[i].end(), 0.0) / static_cast<double>(window);
        p.mu[i] = mean[i] * 252.0;
    }

    for (size_t i = 0; i < n; i++) {
        for (size_t j = i; j < n; j++) {
            double s = 0.0;
            for (size_t t = 0; t < window; t++) {
                s += (x[i][t] - mean[i]) * (x[j][t] - mean[j]);
            }
            double c = s / static_cast<double>(window - 1) * 252.0;
            p.cov[i][j] = c;
            p.cov[j][i] = c;
        }
    }

    return p;
}

bool better_solution(const SubsetSolution& a, const SubsetSolution& b,
                     const OptimizationProblem& problem) {
    if (a.feasible != b.feasible) return a.feasible;

    if (a.feasible) {
        if (std::abs(a.expected_return - b.expected_return) > kTieEps) {
            return a.expected_return > b.expected_return;
        }
        if (std::abs(a.volatility - b.volatility) > kTieEps) {
            return a.volatility < b.volatility;
        }
    } else {
        // Nothing meets the ceiling: least risky wins
        if (std::abs(a.volatility - b.volatility) > kTieEps) {
            return a.volatility < b.volatility;
        }
        if (std::abs(a.expected_return - b.expected_return) > kTieEps) {
            return a.expected_return > b.expected_return;
        }
    }

    if (a.members.size() != b.members.size()) {
        return a.members.size() < b.members.size();
    }

    auto sa = sorted_symbols(a, problem);
    auto sb = sorted_symbols(b, problem);
    return std::lexicographical_compare(sa.begin(), sa.end(), sb.begin(), sb.end());
}

SubsetSolution solve_weights(const OptimizationProblem& problem, const std::vector<int>& members) {
    size_t k = members.size();
    std::vector<double> mu(k);
    Matrix cov(k, std::vector<double>(k));
    for (size_t i = 0; i < k; i++) {
        mu[i] = problem.mu[members[i]];
        for (size_t j = 0; j < k; j++) {
            cov[i][j] = problem.cov[members[i]][members[j]];
        }
    }

    double ceiling = problem.vol_ceiling + kFeasibleEps;

    // Unconstrained optimum is the single highest-return member
    size_t top = 0;
    for (size_t i = 1; i < k; i++) {
        if (mu[i] > mu[top] + kTieEps ||
            (std::abs(mu[i] - mu[top]) <= kTieEps && cov[i][i] < cov[top][top])) {
            top = i;
        }
    }
    std::vector<double> corner(k, 0.0);
    corner[top] = 1.0;
    if (volatility_of(cov, corner) <= ceiling) {
        return finalize(problem, members, corner);
    }

    std::vector<double> w_min(k, 1.0 / static_cast<double>(k));
    ascend(mu, cov, 1.0, false, w_min, kMinVarIterations);
    if (volatility_of(cov, w_min) > ceiling) {
        return finalize(problem, members, w_min);
    }

    // Bisection on risk aversion: smallest lambda whose optimum meets the ceiling
    std::vector<double> best = w_min;
    double best_return = dot(mu, w_min);
    double lo = std::log(1e-6);
    double hi = std::log(1e6);
    std::vector<double> w = w_min;

    for (int step = 0; step < kBisectionSteps; step++) {
        double mid = 0.5 * (lo + hi);
        ascend(mu, cov, std::exp(mid), true, w, kUtilityIterations);

        if (volatility_of(cov, w) <= ceiling) {
            double r = dot(mu, w);
            if (r > best_return) {
                best = w;
                best_return = r;
            }
            hi = mid;
        } else {
            lo = mid;
            w = best;
        }
    }

    return finalize(problem, members, best);
}

uint64_t ExactSolver::subset_count(int n, int max_k) {
    uint64_t total = 0;
    uint64_t c = 1;
    for (int k = 1; k <= std::min(n, max_k); k++) {
        // C(n, k) = C(n, k-1) * (n-k+1) / k
        c = c * static_cast<uint64_t>(n - k + 1) / static_cast<uint64_t>(k);
        total += c;
    }
    return total;
}

SubsetSolution ExactSolver::solve(const OptimizationProblem& problem,
                                  const CancelToken& token) const {
    int n = static_cast<int>(problem.size());
    int max_k = std::min(problem.max_assets, n);

    SubsetSolution best;
    bool have_best = false;
    uint64_t visited = 0;

    for (int k = 1; k <= max_k; k++) {
        std::vector<int> idx(k);
        std::iota(idx.begin(), idx.end(), 0);

        while (true) {
            if ((visited++ & 63) == 0) {
                token.throw_if_cancelled();
                if (token.expired()) {
                    throw OptimizationTimeoutError("Exact enumeration exceeded deadline after " +
                                                   std::to_string(visited - 1) + " subsets");
                }
            }

            auto sol = solve_weights(problem, idx);
            if (!have_best || better_solution(sol, best, problem)) {
                best = std::move(sol);
                have_best = true;
            }

            int i = k - 1;
            while (i >= 0 && idx[i] == n - k + i) i--;
            if (i < 0) break;
            idx[i]++;
            for (int j = i + 1; j < k; j++) idx[j] = idx[j - 1] + 1;
        }
    }

    spdlog::debug("Exact solver evaluated {} subsets", visited);
    return best;
}

HeuristicSolver::HeuristicSolver(uint64_t seed, int iterations)
    : seed_(seed), iterations_(std::max(0, iterations)) {}

SubsetSolution HeuristicSolver::solve(const OptimizationProblem& problem,
                                      const CancelToken& token) const {
    int n = static_cast<int>(problem.size());
    size_t max_k = static_cast<size_t>(std::min(problem.max_assets, n));
    std::mt19937_64 rng(seed_);

    token.throw_if_cancelled();

    SubsetSolution best;
    std::vector<int> set;
    for (int i = 0; i < n; i++) {
        auto sol = solve_weights(problem, {i});
        if (set.empty() || better_solution(sol, best, problem)) {
            best = std::move(sol);
            set = {i};
        }
    }

    // Greedy: add whichever asset improves the portfolio most
    while (set.size() < max_k && !token.expired()) {
        token.throw_if_cancelled();

        SubsetSolution step_best = best;
        std::vector<int> step_set;
        for (int j = 0; j < n; j++) {
            if (std::find(set.begin(), set.end(), j) != set.end()) continue;
            std::vector<int> cand = set;
            cand.push_back(j);
            std::sort(cand.begin(), cand.end());

            auto sol = solve_weights(problem, cand);
            if (better_solution(sol, step_best, problem)) {
                step_best = std::move(sol);
                step_set = cand;
            }
        }
        if (step_set.empty()) break;
        best = std::move(step_best);
        set = std::move(step_set);
    }

    for (int it = 0; it < iterations_; it++) {
        token.throw_if_cancelled();
        if (token.expired()) {
            spdlog::debug("Heuristic search stopped at deadline after {} iterations", it);
            break;
        }

        std::vector<int> outside;
        for (int j = 0; j < n; j++) {
            if (std::find(set.begin(), set.end(), j) == set.end()) outside.push_back(j);
        }

        std::vector<int> cand = set;
        uint64_t op = rng() % 3;
        if (op == 0 && !outside.empty()) {
            cand[rng() % cand.size()] = outside[rng() % outside.size()];
        } else if (op == 1 && cand.size() < max_k && !outside.empty()) {
            cand.push_back(outside[rng() % outside.size()]);
        } else if (op == 2 && cand.size() > 1) {
            cand.erase(cand.begin() + static_cast<long>(rng() % cand.size()));
        } else {
            continue;
        }
        std::sort(cand.begin(), cand.end());

        auto sol = solve_weights(problem, cand);
        if (better_solution(sol, best, problem)) {
            best = std::move(sol);
            set = std::move(cand);
        }
    }

    return best;
}

PortfolioOptimizer::PortfolioOptimizer(OptimizerOptions options,
                                       std::unique_ptr<PortfolioSolver> exact,
                                       std::unique_ptr<PortfolioSolver> heuristic)
    : options_(options)
    , exact_(std::move(exact))
    , heuristic_(std::move(heuristic))
{}

double PortfolioOptimizer::ceiling_for(MarketRegime regime) const {
    switch (regime) {
        case MarketRegime::Defensive: return options_.ceiling_defensive;
        case MarketRegime::Aggressive: return options_.ceiling_aggressive;
        default: return options_.ceiling_neutral;
    }
}

const PortfolioSolver& PortfolioOptimizer::choose_solver(size_t n, const CancelToken& token) const {
    if (static_cast<int>(n) > options_.exact_max_candidates) {
        return *heuristic_;
    }

    uint64_t subsets = ExactSolver::subset_count(static_cast<int>(n), options_.max_assets);
    double estimate_ms = static_cast<double>(subsets) * options_.subset_cost_us / 1000.0;
    double remaining_ms = static_cast<double>(token.remaining().count());

    if (token.expired() || estimate_ms > remaining_ms) {
        spdlog::info("Exact enumeration of {} subsets (~{:.0f}ms) exceeds remaining time, "
                     "using heuristic", subsets, estimate_ms);
        return *heuristic_;
    }
    return *exact_;
}

PortfolioSelection PortfolioOptimizer::optimize(const std::vector<Ticker>& candidates,
                                                MarketRegime regime) const {
    CancelToken token;
    return optimize(candidates, regime, token);
}

PortfolioSelection PortfolioOptimizer::optimize(const std::vector<Ticker>& candidates,
                                                MarketRegime regime,
                                                const CancelToken& token) const {
    PortfolioSelection selection;
    if (candidates.empty()) {
        selection.solver = "none";
        return selection;
    }

    token.throw_if_cancelled();

    auto problem = OptimizationProblem::from_tickers(candidates, ceiling_for(regime), options_.max_assets);

    const PortfolioSolver* solver = &choose_solver(problem.size(), token);
    SubsetSolution solution;
    try {
        solution = solver->solve(problem, token);
    } catch (const OptimizationTimeoutError& e) {
        spdlog::warn("{}; falling back to heuristic solver", e.what());
        solver = heuristic_.get();
        solution = solver->solve(problem, token);
    }

    if (!solution.feasible) {
        spdlog::warn("No subset meets the {:.2f} volatility ceiling, using minimum-volatility portfolio",
                     problem.vol_ceiling);
    }

    double total = std::accumulate(solution.weights.begin(), solution.weights.end(), 0.0);
    for (size_t i = 0; i < solution.members.size(); i++) {
        int m = solution.members[i];
        selection.selected_tickers.push_back(problem.symbols[m]);
        selection.selected_names.push_back(problem.names[m]);
        selection.weights.push_back(solution.weights[i] / total);
    }
    selection.expected_return = solution.expected_return;
    selection.volatility = solution.volatility;
    selection.solver = solver->name();

    spdlog::info("Selected {} of {} candidates via {} solver (return={:.4f}, vol={:.4f})",
                 selection.selected_tickers.size(), candidates.size(), selection.solver,
                 selection.expected_return, selection.volatility);

    return selection;
}
