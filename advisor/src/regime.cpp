#include "regime.hpp"
#include "errors.hpp"
#include "narrative.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

std::string with_terms(const std::string& label, const std::vector<std::string>& terms) {
    if (terms.empty()) return "";
    return fmt::format(" with {} signals ({})", label, join(terms));
}

} // namespace

std::string regime_to_string(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::Aggressive: return "aggressive";
        case MarketRegime::Defensive: return "defensive";
        case MarketRegime::Neutral: return "neutral";
        default: return "neutral";
    }
}

std::optional<MarketRegime> regime_from_string(const std::string& name) {
    std::string key = util::normalize_text(util::trim(name));
    if (key == "aggressive") return MarketRegime::Aggressive;
    if (key == "defensive") return MarketRegime::Defensive;
    if (key == "neutral") return MarketRegime::Neutral;
    return std::nullopt;
}

const std::vector<std::string>& RegimeClassifier::sectors_for(MarketRegime regime) {
    static const std::vector<std::string> defensive = {
        "Gold", "Utilities", "Bonds", "Consumer Staples", "Healthcare"
    };
    static const std::vector<std::string> aggressive = {
        "Technology", "Semiconductors", "AI", "Crypto", "Growth"
    };
    static const std::vector<std::string> neutral = {
        "Broad Market", "Diversified", "Financials", "Healthcare"
    };

    switch (regime) {
        case MarketRegime::Defensive: return defensive;
        case MarketRegime::Aggressive: return aggressive;
        default: return neutral;
    }
}

const std::vector<std::string>& RegimeClassifier::risk_off_keywords() {
    static const std::vector<std::string> keywords = {
        "gold", "safe haven", "flight to safety", "recession", "war", "inflation",
        "crisis", "fear", "fears", "selloff", "default", "bonds", "treasuries",
        "defensive", "uncertainty", "stagflation", "conflict", "sanctions",
        "layoffs", "rate hike", "rate hikes", "downturn", "volatility",
        "インフレ", "戦争", "不況", "守り"
    };
    return keywords;
}

const std::vector<std::string>& RegimeClassifier::risk_on_keywords() {
    static const std::vector<std::string> keywords = {
        "growth", "tech", "technology", "boom", "rally", "ai", "semiconductor",
        "semiconductors", "crypto", "bitcoin", "bull market", "expansion",
        "innovation", "rate cut", "rate cuts", "stimulus", "earnings beat",
        "risk on", "breakout",
        "成長", "テック", "攻め", "半導体"
    };
    return keywords;
}

std::vector<std::string> RegimeClassifier::tilt_for(MarketRegime regime,
                                                    const std::vector<std::string>& suggested) {
    const auto& curated = sectors_for(regime);

    std::vector<std::string> wanted;
    for (const auto& s : suggested) {
        wanted.push_back(util::normalize_text(s));
    }

    std::vector<std::string> tilt;
    for (const auto& sector : curated) {
        if (std::find(wanted.begin(), wanted.end(), util::normalize_text(sector)) != wanted.end()) {
            tilt.push_back(sector);
        }
    }
    return tilt.empty() ? curated : tilt;
}

std::vector<RegimeRule> RegimeClassifier::build_rules(const RegimeThresholds& t) {
    std::vector<RegimeRule> rules;

    for (auto regime : {MarketRegime::Defensive, MarketRegime::Aggressive, MarketRegime::Neutral}) {
        rules.push_back({
            "model_" + regime_to_string(regime),
            [regime](const RegimeSignals& s) { return s.model_regime && *s.model_regime == regime; },
            regime,
            [regime](const RegimeSignals& s) {
                if (s.model_reasoning.empty()) {
                    return fmt::format("Narrative model reads a {} market (sentiment {:.2f}).",
                                       regime_to_string(regime), s.sentiment);
                }
                return s.model_reasoning;
            }
        });
    }

    rules.push_back({
        "bearish_sentiment",
        [t](const RegimeSignals& s) { return s.sentiment <= t.bearish; },
        MarketRegime::Defensive,
        [](const RegimeSignals& s) {
            return fmt::format("Bearish sentiment ({:.2f}){}; favoring safe-haven assets.",
                               s.sentiment, with_terms("risk-off", s.risk_off_terms));
        }
    });

    rules.push_back({
        "bullish_sentiment",
        [t](const RegimeSignals& s) { return s.sentiment >= t.bullish; },
        MarketRegime::Aggressive,
        [](const RegimeSignals& s) {
            return fmt::format("Bullish sentiment ({:.2f}){}; favoring growth assets.",
                               s.sentiment, with_terms("risk-on", s.risk_on_terms));
        }
    });

    rules.push_back({
        "risk_off_keywords",
        [](const RegimeSignals& s) { return s.risk_off_terms.size() > s.risk_on_terms.size(); },
        MarketRegime::Defensive,
        [](const RegimeSignals& s) {
            return fmt::format("Risk-off signals ({}) outweigh risk-on signals; "
                               "favoring defensive sectors.", join(s.risk_off_terms));
        }
    });

    rules.push_back({
        "risk_on_keywords",
        [](const RegimeSignals& s) { return s.risk_on_terms.size() > s.risk_off_terms.size(); },
        MarketRegime::Aggressive,
        [](const RegimeSignals& s) {
            return fmt::format("Risk-on signals ({}) outweigh risk-off signals; "
                               "favoring growth sectors.", join(s.risk_on_terms));
        }
    });

    rules.push_back({
        "no_signal",
        [](const RegimeSignals&) { return true; },
        MarketRegime::Neutral,
        [](const RegimeSignals& s) {
            return fmt::format("No decisive signal (sentiment {:.2f}); "
                               "favoring a diversified allocation.", s.sentiment);
        }
    });

    return rules;
}

RegimeClassifier::RegimeClassifier(SentimentScorer scorer,
                                   std::shared_ptr<NewsSource> news,
                                   int news_limit,
                                   RegimeThresholds thresholds,
                                   std::shared_ptr<NarrativeAnalyzer> analyzer)
    : scorer_(std::move(scorer))
    , news_(std::move(news))
    , news_limit_(news_limit)
    , analyzer_(std::move(analyzer))
    , thresholds_(thresholds)
    , rules_(build_rules(thresholds))
{}

std::vector<std::string> RegimeClassifier::match_keywords(const std::string& normalized,
                                                          const std::vector<std::string>& keywords) {
    std::vector<std::string> hits;
    for (const auto& kw : keywords) {
        if (util::count_phrase(normalized, kw) > 0) {
            hits.push_back(kw);
        }
    }
    return hits;
}

RegimeAssessment RegimeClassifier::classify(const std::string& text) const {
    CancelToken token;
    return classify(text, token);
}

RegimeAssessment RegimeClassifier::classify(const std::string& text, const CancelToken& token) const {
    if (util::is_blank(text)) {
        throw InputError("Input text is empty");
    }

    RegimeAssessment result;
    result.regime = MarketRegime::Neutral;
    result.synthetic = false;

    if (news_) {
        try {
            result.headlines = news_->fetch_headlines(news_limit_, token);
        } catch (const DataUnavailableError& e) {
            spdlog::warn("News unavailable, classifying on text only: {}", e.what());
            result.synthetic = true;
        }
    }

    std::optional<NarrativeView> view;
    if (analyzer_) {
        try {
            view = analyzer_->analyze(text, token);
        } catch (const DataUnavailableError& e) {
            spdlog::warn("Narrative model unavailable, using lexicon heuristics: {}", e.what());
            result.synthetic = true;
        }
    }

    std::string normalized = util::normalize_text(text);

    RegimeSignals signals;
    if (view) {
        signals.model_regime = view->regime;
        signals.model_reasoning = view->reasoning;
    }
    signals.sentiment = scorer_.score(text, result.headlines);
    signals.risk_off_terms = match_keywords(normalized, risk_off_keywords());
    signals.risk_on_terms = match_keywords(normalized, risk_on_keywords());

    for (const auto& rule : rules_) {
        if (!rule.applies(signals)) continue;

        result.regime = rule.regime;
        result.reasoning = rule.explain(signals);
        spdlog::info("Regime: {} via rule {} (sentiment={:.2f}, risk_off={}, risk_on={})",
                     regime_to_string(rule.regime), rule.name, signals.sentiment,
                     signals.risk_off_terms.size(), signals.risk_on_terms.size());
        break;
    }

    // Model sector picks only narrow the tilt when the model decided the regime
    result.sectors = (view && view->regime == result.regime)
        ? tilt_for(result.regime, view->sectors)
        : sectors_for(result.regime);
    result.sentiment = signals.sentiment;
    result.risk_off_terms = std::move(signals.risk_off_terms);
    result.risk_on_terms = std::move(signals.risk_on_terms);

    return result;
}
