#include <catch2/catch_test_macros.hpp>
#include "../src/narrative.hpp"
#include "../src/errors.hpp"
#include <curl/curl.h>

namespace {

nlohmann::json gemini_reply(const std::string& text) {
    return {
        {"candidates", {
            {{"content", {{"parts", {{{"text", text}}}}, {"role", "model"}}}}
        }}
    };
}

} // namespace

TEST_CASE("Gemini answer parsing", "[narrative]") {
    SECTION("Plain JSON answer") {
        auto view = GeminiClient::parse_view(
            R"({"regime": "defensive", "sectors": ["Gold", "Utilities"], "reasoning": " War risk. "})");
        REQUIRE(view.regime == MarketRegime::Defensive);
        REQUIRE(view.sectors == std::vector<std::string>{"Gold", "Utilities"});
        REQUIRE(view.reasoning == "War risk.");
    }

    SECTION("Markdown fence is stripped") {
        auto view = GeminiClient::parse_view(
            "```json\n{\"regime\": \"aggressive\", \"sectors\": [\"AI\"]}\n```");
        REQUIRE(view.regime == MarketRegime::Aggressive);
        REQUIRE(view.sectors.size() == 1);
        REQUIRE(view.reasoning.empty());
    }

    SECTION("Non-string sectors are skipped") {
        auto view = GeminiClient::parse_view(R"({"regime": "neutral", "sectors": ["Bonds", 3, null]})");
        REQUIRE(view.sectors == std::vector<std::string>{"Bonds"});
    }

    SECTION("Unknown regime or prose is rejected") {
        REQUIRE_THROWS_AS(GeminiClient::parse_view(R"({"regime": "bullish"})"), DataUnavailableError);
        REQUIRE_THROWS_AS(GeminiClient::parse_view(R"({"sectors": ["Gold"]})"), DataUnavailableError);
        REQUIRE_THROWS_AS(GeminiClient::parse_view("The market looks defensive."), DataUnavailableError);
    }

    SECTION("Response envelope") {
        auto view = GeminiClient::parse_response(gemini_reply(R"({"regime": "defensive"})"));
        REQUIRE(view.regime == MarketRegime::Defensive);

        REQUIRE_THROWS_AS(GeminiClient::parse_response(nlohmann::json::object()), DataUnavailableError);
        REQUIRE_THROWS_AS(GeminiClient::parse_response(gemini_reply("   ")), DataUnavailableError);
    }
}

TEST_CASE("Gemini request", "[narrative]") {
    SECTION("Prompt carries the narrative and the curated sectors") {
        auto prompt = GeminiClient::build_prompt("oil shock in the gulf");
        REQUIRE(prompt.find("oil shock in the gulf") != std::string::npos);
        REQUIRE(prompt.find("Semiconductors") != std::string::npos);
        REQUIRE(prompt.find("Consumer Staples") != std::string::npos);
    }

    SECTION("Body asks for a JSON answer") {
        auto body = GeminiClient::build_request("gold rally");
        REQUIRE(body["contents"][0]["parts"][0]["text"].get<std::string>().find("gold rally") != std::string::npos);
        REQUIRE(body["generationConfig"]["responseMimeType"] == "application/json");
    }

    SECTION("Unreachable endpoint is reported as unavailable") {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        auto http = std::make_shared<HttpClient>(500, 1);
        GeminiClient client("http://127.0.0.1:1/v1beta", "key", "gemini-2.0-flash", http);

        CancelToken token(std::chrono::milliseconds(2000));
        REQUIRE_THROWS_AS(client.analyze("gold rally", token), DataUnavailableError);
    }
}
