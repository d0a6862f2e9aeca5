#include "sentiment.hpp"
#include "util.hpp"
#include <algorithm>
#include <unordered_set>

namespace {

const std::unordered_set<std::string> kNegators = {"not", "no", "never", "without"};

bool has_non_ascii(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return c >= 0x80; });
}

} // namespace

SentimentLexicon SentimentLexicon::market_default() {
    SentimentLexicon lex;

    lex.positive = {
        {"growth", 1.0}, {"boom", 1.5}, {"rally", 1.5}, {"surge", 1.0},
        {"gain", 0.8}, {"gains", 0.8}, {"bull", 1.0}, {"bullish", 1.5},
        {"optimism", 1.0}, {"optimistic", 1.0}, {"strong", 0.8}, {"recovery", 1.0},
        {"record", 0.6}, {"beat", 0.8}, {"expansion", 1.0}, {"innovation", 0.8},
        {"stimulus", 0.8}, {"upgrade", 0.8}, {"profit", 0.8}, {"profits", 0.8},
        {"soar", 1.2}, {"soaring", 1.2}, {"easing", 0.6}, {"breakthrough", 1.0},
        {"confidence", 0.6}, {"hiring", 0.6}, {"positive", 0.6},
        {"好調", 1.0}, {"成長", 1.0}, {"上昇", 1.0}, {"回復", 1.0}
    };

    lex.negative = {
        {"war", 1.5}, {"escalation", 1.0}, {"inflation", 1.0}, {"recession", 1.5},
        {"fear", 1.0}, {"fears", 1.0}, {"crisis", 1.5}, {"crash", 1.5},
        {"selloff", 1.2}, {"decline", 0.8}, {"bear", 1.0}, {"bearish", 1.5},
        {"default", 1.0}, {"layoffs", 1.0}, {"tension", 0.8}, {"tensions", 0.8},
        {"conflict", 1.0}, {"slowdown", 1.0}, {"downgrade", 0.8}, {"loss", 0.8},
        {"losses", 0.8}, {"uncertainty", 0.8}, {"panic", 1.5}, {"sanctions", 0.8},
        {"stagflation", 1.5}, {"collapse", 1.5}, {"weak", 0.8}, {"volatile", 0.6},
        {"戦争", 1.5}, {"不況", 1.5}, {"インフレ", 1.0}, {"暴落", 1.5}, {"下落", 1.0}
    };

    return lex;
}

SentimentScorer::SentimentScorer(double headline_weight, SentimentLexicon lexicon)
    : headline_weight_(std::max(0.0, std::min(1.0, headline_weight)))
    , lexicon_(std::move(lexicon))
{}

void SentimentScorer::accumulate(const std::string& text, double& pos, double& neg) const {
    std::string normalized = util::normalize_text(text);

    bool negate = false;
    for (const auto& token : util::split(normalized, ' ')) {
        if (has_non_ascii(token)) continue;
        if (kNegators.count(token)) {
            negate = true;
            continue;
        }

        double p = 0.0, n = 0.0;
        auto pit = lexicon_.positive.find(token);
        if (pit != lexicon_.positive.end()) p = pit->second;
        auto nit = lexicon_.negative.find(token);
        if (nit != lexicon_.negative.end()) n = nit->second;

        if (p == 0.0 && n == 0.0) continue;

        if (negate) std::swap(p, n);
        pos += p;
        neg += n;
        negate = false;
    }

    // Unsegmented scripts: substring matches, no negation handling
    for (const auto& [term, weight] : lexicon_.positive) {
        if (has_non_ascii(term)) pos += weight * util::count_phrase(normalized, term);
    }
    for (const auto& [term, weight] : lexicon_.negative) {
        if (has_non_ascii(term)) neg += weight * util::count_phrase(normalized, term);
    }
}

double SentimentScorer::score(const std::string& text) const {
    double pos = 0.0, neg = 0.0;
    accumulate(text, pos, neg);

    if (pos == 0.0 && neg == 0.0) return 0.5;

    double s = 0.5 + 0.5 * (pos - neg) / (pos + neg + 1.0);
    return std::max(0.0, std::min(1.0, s));
}

double SentimentScorer::score(const std::string& text,
                              const std::vector<std::string>& headlines) const {
    double text_score = score(text);
    if (headlines.empty() || headline_weight_ == 0.0) return text_score;

    double sum = 0.0;
    for (const auto& h : headlines) {
        sum += score(h);
    }
    double headline_score = sum / static_cast<double>(headlines.size());

    return (1.0 - headline_weight_) * text_score + headline_weight_ * headline_score;
}
