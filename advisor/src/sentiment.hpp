#pragma once

#include <string>
#include <vector>
#include <unordered_map>

struct SentimentLexicon {
    std::unordered_map<std::string, double> positive;
    std::unordered_map<std::string, double> negative;

    static SentimentLexicon market_default();
};

// Lexicon scorer. Always returns a value in [0, 1]; 0.5 when nothing scores.
class SentimentScorer {
public:
    explicit SentimentScorer(double headline_weight = 0.3,
                             SentimentLexicon lexicon = SentimentLexicon::market_default());

    double score(const std::string& text) const;
    double score(const std::string& text, const std::vector<std::string>& headlines) const;

    double headline_weight() const { return headline_weight_; }

private:
    double headline_weight_;
    SentimentLexicon lexicon_;

    void accumulate(const std::string& text, double& pos, double& neg) const;
};
