#include <catch2/catch_test_macros.hpp>
#include "../src/url_extractor.hpp"
#include "../src/errors.hpp"

TEST_CASE("HTML text extraction", "[url_extractor]") {
    SECTION("Title and paragraphs are joined") {
        std::string html =
            "<html><head><TITLE>Markets &amp; Macro</TITLE></head>"
            "<body><p class=\"lead\">War <b>escalation</b> lifts gold.</p>"
            "<pre>ignored code</pre>"
            "<P>Investors seek&nbsp;safety.</P></body></html>";

        auto text = UrlTextExtractor::extract_from_html(html);
        REQUIRE(text == "Markets & Macro War escalation lifts gold. Investors seek safety.");
    }

    SECTION("Pages without title or paragraphs give nothing") {
        REQUIRE(UrlTextExtractor::extract_from_html("<div>just a div</div>").empty());
    }

    SECTION("Output is capped") {
        std::string html = "<p>" + std::string(8000, 'a') + "</p>";
        REQUIRE(UrlTextExtractor::extract_from_html(html).size() == UrlTextExtractor::MAX_CHARS);
    }

    SECTION("Truncation never splits a multibyte character") {
        std::string body;
        while (body.size() < 6000) body += "戦争";
        auto text = UrlTextExtractor::extract_from_html("<p>" + body + "</p>");
        REQUIRE(text.size() <= UrlTextExtractor::MAX_CHARS);
        REQUIRE(text.size() % 3 == 0);
    }
}

TEST_CASE("HTML entity decoding", "[url_extractor]") {
    REQUIRE(UrlTextExtractor::decode_entities("a &lt;b&gt; &quot;c&quot;") == "a <b> \"c\"");
    REQUIRE(UrlTextExtractor::decode_entities("&#65;&#x42;") == "AB");
    REQUIRE(UrlTextExtractor::decode_entities("&#x6226;") == "戦");
    REQUIRE(UrlTextExtractor::decode_entities("AT&T & co") == "AT&T & co");
    REQUIRE(UrlTextExtractor::decode_entities("&bogus;") == "&bogus;");
}

TEST_CASE("URL fetch failure", "[url_extractor]") {
    // Nothing listens on port 1; a single short attempt fails fast
    auto http = std::make_shared<HttpClient>(500, 1);
    UrlTextExtractor extractor(http);
    CancelToken token;

    REQUIRE_THROWS_AS(extractor.extract("http://127.0.0.1:1/article", token), InputError);
}
