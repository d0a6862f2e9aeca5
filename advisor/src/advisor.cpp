#include "advisor.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>

Advisor::Advisor(std::shared_ptr<RegimeClassifier> classifier,
                 std::shared_ptr<CatalogStore> catalog,
                 std::shared_ptr<PortfolioOptimizer> optimizer,
                 std::shared_ptr<RiskAnalyzer> risk,
                 std::shared_ptr<EconomicDataSource> economic,
                 std::shared_ptr<UrlTextExtractor> extractor)
    : classifier_(std::move(classifier))
    , catalog_(std::move(catalog))
    , optimizer_(std::move(optimizer))
    , risk_(std::move(risk))
    , economic_(std::move(economic))
    , extractor_(std::move(extractor))
{}

std::string Advisor::resolve_narrative(const std::string& text, const CancelToken& token) const {
    std::string trimmed = util::trim(text);
    if (trimmed.empty()) {
        throw InputError("Input text is empty");
    }

    if (!util::is_url(trimmed)) {
        return text;
    }
    if (!extractor_) {
        throw InputError("Could not fetch text from URL");
    }

    spdlog::info("Narrative is a URL, extracting article text");
    return extractor_->extract(trimmed, token);
}

UniverseSnapshotPtr Advisor::current_snapshot(const CancelToken& token) const {
    auto snap = catalog_->snapshot();
    if (!snap->tickers.empty()) {
        return snap;
    }

    // First request before the background refresher has published anything
    spdlog::info("Catalog not loaded yet, loading inline");
    return catalog_->ensure_loaded(token);
}

AnalysisResult Advisor::analyze(const std::string& text, const CancelToken& token) const {
    std::string narrative = resolve_narrative(text, token);

    auto economic_future = std::async(std::launch::async, [this, &token]() {
        return economic_ ? economic_->fetch(token) : fallback_indicators();
    });

    // The future joins in its destructor, so an early throw below still
    // waits for the macro fetch before `token` goes out of scope
    AnalysisResult result;
    result.assessment = classifier_->classify(narrative, token);

    token.throw_if_cancelled();
    auto snapshot = current_snapshot(token);
    result.candidates = snapshot->filter(result.assessment.sectors);

    token.throw_if_cancelled();
    result.selection = optimizer_->optimize(result.candidates, result.assessment.regime, token);
    result.risk = risk_->analyze(result.selection, RiskAnalyzer::series_of(result.candidates), token);

    result.economic = EconomicContextResolver::resolve(economic_future.get());

    bool synthetic_candidates = std::any_of(result.candidates.begin(), result.candidates.end(),
                                            [](const Ticker& t) { return t.synthetic; });
    result.synthetic = result.assessment.synthetic || synthetic_candidates;

    spdlog::info("Analysis complete: regime={}, candidates={}, selected={}, solver={}, var={:.4f}, cvar={:.4f}{}",
                 regime_to_string(result.assessment.regime),
                 result.candidates.size(),
                 result.selection.selected_tickers.size(),
                 result.selection.solver,
                 result.risk.var, result.risk.cvar,
                 result.synthetic ? " (synthetic data)" : "");

    return result;
}
