#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include <stdexcept>
#include <stdlib.h>

TEST_CASE("Config from environment", "[config]") {
    unsetenv("LISTEN_PORT");
    unsetenv("MAX_ASSETS");
    unsetenv("VAR_CONFIDENCE");
    unsetenv("FINNHUB_API_KEY");
    unsetenv("ALPHA_VANTAGE_API_KEY");
    unsetenv("RANDOM_SEED");
    unsetenv("GEMINI_API_KEY");
    unsetenv("GEMINI_MODEL");

    SECTION("Defaults") {
        auto config = Config::from_env();
        REQUIRE(config.listen_port == 5000);
        REQUIRE(config.max_assets == 4);
        REQUIRE(config.exact_max_candidates == 14);
        REQUIRE(config.var_confidence == 0.95);
        REQUIRE(config.random_seed == 42);
        REQUIRE_FALSE(config.news_configured());
        REQUIRE_FALSE(config.economic_configured());
        REQUIRE_FALSE(config.gemini_configured());
        REQUIRE(config.gemini_model == "gemini-2.0-flash");
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Overrides") {
        setenv("LISTEN_PORT", "8081", 1);
        setenv("MAX_ASSETS", "3", 1);
        setenv("VAR_CONFIDENCE", "0.99", 1);
        setenv("FINNHUB_API_KEY", "abc", 1);
        setenv("GEMINI_API_KEY", "g-key", 1);

        auto config = Config::from_env();
        REQUIRE(config.listen_port == 8081);
        REQUIRE(config.max_assets == 3);
        REQUIRE(config.var_confidence == 0.99);
        REQUIRE(config.news_configured());
        REQUIRE(config.gemini_configured());

        unsetenv("GEMINI_API_KEY");
        unsetenv("LISTEN_PORT");
        unsetenv("MAX_ASSETS");
        unsetenv("VAR_CONFIDENCE");
        unsetenv("FINNHUB_API_KEY");
    }

    SECTION("Validation rejects out-of-range values") {
        auto config = Config::from_env();

        config.var_confidence = 1.0;
        REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

        config.var_confidence = 0.95;
        config.max_assets = 0;
        REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

        config.max_assets = 4;
        config.headline_weight = 1.5;
        REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    }
}
