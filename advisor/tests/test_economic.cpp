#include <catch2/catch_test_macros.hpp>
#include "../src/economic.hpp"
#include "../src/errors.hpp"
#include "fakes.hpp"
#include <chrono>
#include <cmath>
#include <limits>
#include <thread>

TEST_CASE("Economic regime rules", "[economic]") {
    SECTION("High inflation with tight policy") {
        auto s = EconomicContextResolver::resolve(4.5, 5.0, 1.5);
        REQUIRE(s.label == "Stagflation Risk");
        REQUIRE(s.recommendation == "defensive");
    }

    SECTION("Contracting output") {
        auto s = EconomicContextResolver::resolve(2.0, 3.0, -0.4);
        REQUIRE(s.label == "Recession Risk");
        REQUIRE(s.recommendation == "defensive");

        // Zero growth counts as contracting
        REQUIRE(EconomicContextResolver::resolve(2.0, 3.0, 0.0).label == "Recession Risk");
    }

    SECTION("Low inflation with loose policy") {
        auto s = EconomicContextResolver::resolve(0.5, 1.0, 2.0);
        REQUIRE(s.label == "Growth Favorable");
        REQUIRE(s.recommendation == "aggressive");
    }

    SECTION("Everything else is balanced") {
        auto s = EconomicContextResolver::resolve(2.0, 3.0, 2.0);
        REQUIRE(s.label == "Balanced");
        REQUIRE(s.recommendation == "neutral");
        REQUIRE_FALSE(s.description.empty());
    }

    SECTION("Stagflation outranks recession") {
        REQUIRE(EconomicContextResolver::resolve(4.0, 5.0, -1.0).label == "Stagflation Risk");
    }

    SECTION("Band edges are exclusive") {
        // 3.0 is not high and 4.0 is not tight
        REQUIRE(EconomicContextResolver::resolve(3.0, 4.0, 1.0).label == "Balanced");
    }

    SECTION("Inputs are echoed back") {
        auto s = EconomicContextResolver::resolve(2.5, 3.5, 1.25);
        REQUIRE(s.cpi_yoy_change == 2.5);
        REQUIRE(s.fed_rate_value == 3.5);
        REQUIRE(s.gdp_growth == 1.25);
    }

    SECTION("Non-finite input is rejected") {
        double nan = std::numeric_limits<double>::quiet_NaN();
        double inf = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS(EconomicContextResolver::resolve(nan, 3.0, 2.0), InputError);
        REQUIRE_THROWS_AS(EconomicContextResolver::resolve(2.0, inf, 2.0), InputError);
    }

    SECTION("Published defaults resolve and stay flagged") {
        auto s = EconomicContextResolver::resolve(fallback_indicators());
        REQUIRE(s.fallback);
        REQUIRE(s.cpi_yoy_change == 3.2);
        REQUIRE(s.fed_rate_value == 5.25);
        REQUIRE(s.gdp_growth == 2.8);
        REQUIRE(s.label == "Stagflation Risk");
    }
}

TEST_CASE("Alpha Vantage series handling", "[economic]") {
    SECTION("Parses string values and skips missing ones") {
        nlohmann::json payload = {
            {"data", {
                {{"date", "2024-11-01"}, {"value", "315.5"}},
                {{"date", "2024-10-01"}, {"value", "."}},
                {{"date", "2024-09-01"}, {"value", "314.0"}}
            }}
        };
        auto values = AlphaVantageClient::parse_series(payload);
        REQUIRE(values.size() == 2);
        REQUIRE(values[0] == 315.5);
        REQUIRE(values[1] == 314.0);
    }

    SECTION("Rate-limit notice has no observations") {
        nlohmann::json payload = {{"Note", "Thank you for using Alpha Vantage!"}};
        REQUIRE(AlphaVantageClient::parse_series(payload).empty());
    }

    SECTION("CPI change is year over year when a year of data exists") {
        std::vector<double> monthly = {110.0};
        for (int i = 0; i < 11; i++) monthly.push_back(105.0);
        monthly.push_back(100.0);
        REQUIRE(std::abs(AlphaVantageClient::yoy_change(monthly) - 10.0) < 1e-9);
    }

    SECTION("Short CPI series compares with the previous month") {
        REQUIRE(std::abs(AlphaVantageClient::yoy_change({102.0, 100.0}) - 2.0) < 1e-9);
        REQUIRE_THROWS_AS(AlphaVantageClient::yoy_change({100.0}), DataUnavailableError);
    }

    SECTION("GDP growth is period over period") {
        REQUIRE(std::abs(AlphaVantageClient::period_growth({99.0, 100.0}) + 1.0) < 1e-9);
    }

    SECTION("Unconfigured client returns defaults without fetching") {
        AlphaVantageClient client("https://www.alphavantage.co/query", "", nullptr);
        CancelToken token;
        auto ind = client.fetch(token);
        REQUIRE(ind.fallback);
        REQUIRE(ind.cpi_yoy_change == 3.2);
    }
}

TEST_CASE("Economic indicator cache", "[economic]") {
    CancelToken token;

    SECTION("Live values are served from cache within the TTL") {
        auto inner = std::make_shared<StubEconomicSource>(EconomicIndicators{2.0, 3.0, 1.0, false});
        CachedEconomicSource cache(inner, 3600);

        cache.fetch(token);
        auto second = cache.fetch(token);
        REQUIRE(inner->calls == 1);
        REQUIRE(second.cpi_yoy_change == 2.0);

        cache.clear();
        cache.fetch(token);
        REQUIRE(inner->calls == 2);
    }

    SECTION("Defaults are not cached") {
        auto inner = std::make_shared<StubEconomicSource>(fallback_indicators());
        CachedEconomicSource cache(inner, 3600);

        cache.fetch(token);
        cache.fetch(token);
        REQUIRE(inner->calls == 2);
    }

    SECTION("A slow upstream does not serialize callers") {
        auto inner = std::make_shared<GatedEconomicSource>(fallback_indicators());
        CachedEconomicSource cache(inner, 3600);

        std::thread first([&] { cache.fetch(token); });
        std::thread second([&] { cache.fetch(token); });

        bool overlapped = eventually([&] { return inner->peak.load() == 2; },
                                     std::chrono::milliseconds(2000));
        inner->gate.release();
        first.join();
        second.join();

        REQUIRE(overlapped);
        REQUIRE(inner->in_flight == 0);
    }
}
