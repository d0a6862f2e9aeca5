#include <catch2/catch_test_macros.hpp>
#include "../src/sentiment.hpp"
#include <cmath>

TEST_CASE("Lexicon sentiment", "[sentiment]") {
    SentimentScorer scorer;

    SECTION("No lexicon hits is neutral") {
        REQUIRE(scorer.score("the committee met on tuesday") == 0.5);
        REQUIRE(scorer.score("") == 0.5);
    }

    SECTION("Negative terms pull below neutral") {
        double s = scorer.score("gold safe haven recession fear");
        // recession 1.5 + fear 1.0 against nothing positive
        REQUIRE(std::abs(s - (0.5 - 0.5 * 2.5 / 3.5)) < 1e-12);
        REQUIRE(s < 0.35);
    }

    SECTION("Positive terms push above neutral") {
        REQUIRE(scorer.score("Record rally, bullish optimism!") > 0.65);
    }

    SECTION("Negation flips the next scored term") {
        REQUIRE(scorer.score("growth") > 0.5);
        REQUIRE(scorer.score("no growth") < 0.5);
        REQUIRE(scorer.score("not a crash") > 0.5);
    }

    SECTION("Japanese terms are matched inside unsegmented text") {
        REQUIRE(scorer.score("戦争の懸念") < 0.5);
        REQUIRE(scorer.score("景気回復") > 0.5);
    }

    SECTION("Scores stay within [0, 1]") {
        std::string heavy;
        for (int i = 0; i < 200; i++) heavy += "crash panic collapse ";
        double s = scorer.score(heavy);
        REQUIRE(s >= 0.0);
        REQUIRE(s <= 1.0);
    }
}

TEST_CASE("Headline blending", "[sentiment]") {
    SentimentScorer scorer(0.3);

    SECTION("No headlines leaves the text score unchanged") {
        REQUIRE(scorer.score("rally", {}) == scorer.score("rally"));
    }

    SECTION("Headlines are weighted in") {
        double text = scorer.score("rally");
        double blended = scorer.score("rally", {"markets closed", "nothing happened"});
        REQUIRE(std::abs(blended - (0.7 * text + 0.3 * 0.5)) < 1e-12);
    }

    SECTION("Weight is clamped to [0, 1]") {
        REQUIRE(SentimentScorer(2.0).headline_weight() == 1.0);
        REQUIRE(SentimentScorer(-1.0).headline_weight() == 0.0);
    }
}
