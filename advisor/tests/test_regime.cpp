#include <catch2/catch_test_macros.hpp>
#include "../src/regime.hpp"
#include "../src/errors.hpp"
#include "fakes.hpp"
#include <algorithm>

namespace {

bool has(const std::vector<std::string>& v, const std::string& x) {
    return std::find(v.begin(), v.end(), x) != v.end();
}

} // namespace

TEST_CASE("Regime classification", "[regime]") {
    RegimeClassifier classifier{SentimentScorer()};

    SECTION("Empty or whitespace text is rejected") {
        REQUIRE_THROWS_AS(classifier.classify(""), InputError);
        REQUIRE_THROWS_AS(classifier.classify("   \n\t"), InputError);
    }

    SECTION("Safe-haven narrative is defensive with gold") {
        auto a = classifier.classify("gold safe haven recession fear");
        REQUIRE(a.regime == MarketRegime::Defensive);
        REQUIRE(has(a.sectors, "Gold"));
        REQUIRE(has(a.risk_off_terms, "safe haven"));
        REQUIRE_FALSE(a.reasoning.empty());
        REQUIRE_FALSE(a.synthetic);
    }

    SECTION("War narrative is defensive") {
        auto a = classifier.classify("war escalation, inflation fears, flight to safety");
        REQUIRE(a.regime == MarketRegime::Defensive);
        REQUIRE(has(a.risk_off_terms, "flight to safety"));
    }

    SECTION("Bullish narrative is aggressive") {
        auto a = classifier.classify("AI boom and a record tech rally");
        REQUIRE(a.regime == MarketRegime::Aggressive);
        REQUIRE(has(a.sectors, "Technology"));
        REQUIRE(has(a.sectors, "Semiconductors"));
    }

    SECTION("No signal is neutral with broad sectors") {
        auto a = classifier.classify("the committee met on tuesday");
        REQUIRE(a.regime == MarketRegime::Neutral);
        REQUIRE(a.sentiment == 0.5);
        REQUIRE(has(a.sectors, "Broad Market"));
    }

    SECTION("Sentiment outranks keywords") {
        // "ai" is a risk-on keyword but the crash drags sentiment below 0.35
        auto a = classifier.classify("ai crash");
        REQUIRE(a.risk_on_terms.size() > a.risk_off_terms.size());
        REQUIRE(a.regime == MarketRegime::Defensive);
    }

    SECTION("Keywords decide when sentiment is mild") {
        // No lexicon hits, two risk-off keywords
        auto a = classifier.classify("treasuries and bonds");
        REQUIRE(a.sentiment == 0.5);
        REQUIRE(a.regime == MarketRegime::Defensive);
    }

    SECTION("Rule table is ordered model, then sentiment, then keywords") {
        const auto& rules = classifier.rules();
        REQUIRE(rules.size() == 8);
        REQUIRE(rules[0].name == "model_defensive");
        REQUIRE(rules[2].name == "model_neutral");
        REQUIRE(rules[3].name == "bearish_sentiment");
        REQUIRE(rules[4].name == "bullish_sentiment");
        REQUIRE(rules[5].name == "risk_off_keywords");
        REQUIRE(rules.back().regime == MarketRegime::Neutral);
    }
}

TEST_CASE("Regime classification with news", "[regime]") {
    SECTION("Headlines are carried into the assessment") {
        auto news = std::make_shared<StubNewsSource>(std::vector<std::string>{
            "Stocks rally on strong earnings", "Tech surge continues", "Markets calm", "Extra"});
        RegimeClassifier classifier(SentimentScorer(0.3), news, 3);

        auto a = classifier.classify("the committee met on tuesday");
        REQUIRE(a.headlines.size() == 3);
        REQUIRE(a.sentiment > 0.5);
        REQUIRE_FALSE(a.synthetic);
    }

    SECTION("Unavailable news falls back to text and flags synthetic") {
        RegimeClassifier classifier(SentimentScorer(), std::make_shared<FailingNewsSource>());

        auto a = classifier.classify("gold safe haven recession fear");
        REQUIRE(a.synthetic);
        REQUIRE(a.headlines.empty());
        REQUIRE(a.regime == MarketRegime::Defensive);
    }
}

TEST_CASE("Regime classification with a narrative model", "[regime]") {
    SECTION("Model answer outranks sentiment") {
        auto model = std::make_shared<StubNarrativeAnalyzer>(
            NarrativeView{MarketRegime::Defensive, {"gold", "Bonds", "Shipping"}, "Conflict risk is rising."});
        RegimeClassifier classifier(SentimentScorer(), nullptr, 5, RegimeThresholds(), model);

        auto a = classifier.classify("AI boom and a record tech rally");
        REQUIRE(a.regime == MarketRegime::Defensive);
        REQUIRE(a.reasoning == "Conflict risk is rising.");
        REQUIRE(a.sectors == std::vector<std::string>{"Gold", "Bonds"});
        REQUIRE(a.sentiment > 0.5);
        REQUIRE_FALSE(a.synthetic);
        REQUIRE(model->calls == 1);
    }

    SECTION("Sectors outside the curated tilt are ignored") {
        auto model = std::make_shared<StubNarrativeAnalyzer>(
            NarrativeView{MarketRegime::Neutral, {"Shipping"}, ""});
        RegimeClassifier classifier(SentimentScorer(), nullptr, 5, RegimeThresholds(), model);

        auto a = classifier.classify("the committee met on tuesday");
        REQUIRE(a.regime == MarketRegime::Neutral);
        REQUIRE(a.sectors == RegimeClassifier::sectors_for(MarketRegime::Neutral));
        REQUIRE_FALSE(a.reasoning.empty());
    }

    SECTION("Unavailable model falls back to heuristics and flags synthetic") {
        RegimeClassifier classifier(SentimentScorer(), nullptr, 5, RegimeThresholds(),
                                    std::make_shared<FailingNarrativeAnalyzer>());

        auto a = classifier.classify("gold safe haven recession fear");
        REQUIRE(a.synthetic);
        REQUIRE(a.regime == MarketRegime::Defensive);
        REQUIRE(a.sectors == RegimeClassifier::sectors_for(MarketRegime::Defensive));
    }

    SECTION("Regime names parse case-insensitively") {
        REQUIRE(regime_from_string(" Aggressive ") == MarketRegime::Aggressive);
        REQUIRE(regime_from_string("DEFENSIVE") == MarketRegime::Defensive);
        REQUIRE_FALSE(regime_from_string("bullish").has_value());
    }
}
