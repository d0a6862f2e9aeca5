#include <catch2/catch_test_macros.hpp>
#include "../src/market_data.hpp"
#include "../src/errors.hpp"
#include <cmath>

namespace {

nlohmann::json chart_with(const nlohmann::json& indicators) {
    return {{"chart", {{"result", nlohmann::json::array({{{"indicators", indicators}}})}}}};
}

nlohmann::json closes(int n, bool with_null) {
    auto arr = nlohmann::json::array();
    for (int i = 0; i < n; i++) {
        if (with_null && i == 5) {
            arr.push_back(nullptr);
        } else {
            arr.push_back(100.0 + i);
        }
    }
    return arr;
}

} // namespace

TEST_CASE("Chart payload parsing", "[market_data]") {
    SECTION("Adjusted closes are preferred") {
        auto payload = chart_with({
            {"adjclose", nlohmann::json::array({{{"adjclose", closes(30, false)}}})},
            {"quote", nlohmann::json::array({{{"close", closes(10, false)}}})}
        });
        auto returns = YahooChartClient::parse_chart(payload);
        REQUIRE(returns.size() == 29);
        REQUIRE(std::abs(returns[0] - (101.0 / 100.0 - 1.0)) < 1e-12);
    }

    SECTION("Falls back to raw closes and skips nulls") {
        auto payload = chart_with({
            {"quote", nlohmann::json::array({{{"close", closes(30, true)}}})}
        });
        auto returns = YahooChartClient::parse_chart(payload);
        REQUIRE(returns.size() == 28);
    }

    SECTION("Too little history is unavailable") {
        auto payload = chart_with({
            {"quote", nlohmann::json::array({{{"close", closes(10, false)}}})}
        });
        REQUIRE_THROWS_AS(YahooChartClient::parse_chart(payload), DataUnavailableError);
    }

    SECTION("Error payloads are unavailable") {
        nlohmann::json payload = {{"chart", {{"result", nullptr}, {"error", "Not Found"}}}};
        REQUIRE_THROWS_AS(YahooChartClient::parse_chart(payload), DataUnavailableError);
    }
}

TEST_CASE("Synthetic series", "[market_data]") {
    SECTION("Reproducible per symbol and seed") {
        auto a = synthesize_returns("GLD", "Gold", 42);
        auto b = synthesize_returns("GLD", "Gold", 42);
        auto c = synthesize_returns("GLD", "Gold", 43);
        auto d = synthesize_returns("NEM", "Gold", 42);

        REQUIRE(a.size() == 252);
        REQUIRE(a == b);
        REQUIRE(a != c);
        REQUIRE(a != d);
    }

    SECTION("Returns stay above -100%") {
        for (double r : synthesize_returns("COIN", "Crypto", 7)) {
            REQUIRE(r > -1.0);
        }
    }

    SECTION("Sector calibration") {
        REQUIRE(model_for_sector("Bonds").annual_vol < model_for_sector("Crypto").annual_vol);
        REQUIRE(model_for_sector("Unknown Sector").annual_vol == 0.20);
    }
}
