#pragma once

#include "cancel_token.hpp"
#include "news_client.hpp"
#include "sentiment.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class MarketRegime {
    Aggressive,
    Defensive,
    Neutral
};

std::string regime_to_string(MarketRegime regime);
std::optional<MarketRegime> regime_from_string(const std::string& name);

class NarrativeAnalyzer;

struct RegimeAssessment {
    MarketRegime regime;
    std::vector<std::string> sectors;
    std::string reasoning;
    double sentiment;                       // [0, 1]
    std::vector<std::string> headlines;
    std::vector<std::string> risk_off_terms;
    std::vector<std::string> risk_on_terms;
    bool synthetic;                         // news or model requested but unavailable
};

// Inputs the rule table is evaluated against
struct RegimeSignals {
    std::optional<MarketRegime> model_regime;   // set when the narrative model answered
    std::string model_reasoning;
    double sentiment;
    std::vector<std::string> risk_off_terms;
    std::vector<std::string> risk_on_terms;
};

struct RegimeRule {
    std::string name;
    std::function<bool(const RegimeSignals&)> applies;
    MarketRegime regime;
    std::function<std::string(const RegimeSignals&)> explain;
};

struct RegimeThresholds {
    double bearish = 0.35;
    double bullish = 0.65;
};

class RegimeClassifier {
public:
    explicit RegimeClassifier(SentimentScorer scorer,
                              std::shared_ptr<NewsSource> news = nullptr,
                              int news_limit = 5,
                              RegimeThresholds thresholds = RegimeThresholds(),
                              std::shared_ptr<NarrativeAnalyzer> analyzer = nullptr);

    // Throws InputError for empty or whitespace-only text
    RegimeAssessment classify(const std::string& text) const;
    RegimeAssessment classify(const std::string& text, const CancelToken& token) const;

    // Ordered; the first rule whose predicate holds decides the regime.
    // A model answer comes first, then sentiment, then keywords.
    const std::vector<RegimeRule>& rules() const { return rules_; }

    static const std::vector<std::string>& sectors_for(MarketRegime regime);
    static const std::vector<std::string>& risk_off_keywords();
    static const std::vector<std::string>& risk_on_keywords();

    // The curated sectors for `regime`, narrowed to those in `suggested`
    // when any overlap
    static std::vector<std::string> tilt_for(MarketRegime regime,
                                             const std::vector<std::string>& suggested);

private:
    SentimentScorer scorer_;
    std::shared_ptr<NewsSource> news_;
    int news_limit_;
    std::shared_ptr<NarrativeAnalyzer> analyzer_;
    RegimeThresholds thresholds_;
    std::vector<RegimeRule> rules_;

    static std::vector<RegimeRule> build_rules(const RegimeThresholds& t);
    static std::vector<std::string> match_keywords(const std::string& normalized,
                                                   const std::vector<std::string>& keywords);
};
