#pragma once

#include "cancel_token.hpp"
#include "economic.hpp"
#include "optimizer.hpp"
#include "regime.hpp"
#include "risk.hpp"
#include "universe.hpp"
#include "url_extractor.hpp"
#include <memory>
#include <string>
#include <vector>

struct AnalysisResult {
    RegimeAssessment assessment;
    std::vector<Ticker> candidates;    // filtered by the sector tilt
    PortfolioSelection selection;
    RiskMetrics risk;
    EconomicSnapshot economic;
    bool synthetic = false;            // news fallback or any synthetic candidate
};

// One request end to end: narrative -> regime -> candidates -> weights -> risk,
// with the macro context fetched alongside classification.
class Advisor {
public:
    Advisor(std::shared_ptr<RegimeClassifier> classifier,
            std::shared_ptr<CatalogStore> catalog,
            std::shared_ptr<PortfolioOptimizer> optimizer,
            std::shared_ptr<RiskAnalyzer> risk,
            std::shared_ptr<EconomicDataSource> economic,
            std::shared_ptr<UrlTextExtractor> extractor = nullptr);

    // Throws InputError, CancelledError or InternalError; never returns a
    // partial result.
    AnalysisResult analyze(const std::string& text, const CancelToken& token) const;

private:
    std::shared_ptr<RegimeClassifier> classifier_;
    std::shared_ptr<CatalogStore> catalog_;
    std::shared_ptr<PortfolioOptimizer> optimizer_;
    std::shared_ptr<RiskAnalyzer> risk_;
    std::shared_ptr<EconomicDataSource> economic_;
    std::shared_ptr<UrlTextExtractor> extractor_;

    std::string resolve_narrative(const std::string& text, const CancelToken& token) const;
    UniverseSnapshotPtr current_snapshot(const CancelToken& token) const;
};
