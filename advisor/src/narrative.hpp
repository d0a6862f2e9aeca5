#pragma once

#include "cancel_token.hpp"
#include "http_client.hpp"
#include "regime.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

// A language model's reading of the narrative
struct NarrativeView {
    MarketRegime regime;
    std::vector<std::string> sectors;
    std::string reasoning;
};

class NarrativeAnalyzer {
public:
    virtual ~NarrativeAnalyzer() = default;

    // Throws DataUnavailableError when the model is unreachable or answers
    // off-format, CancelledError when the token is cancelled.
    virtual NarrativeView analyze(const std::string& text, const CancelToken& token) = 0;
};

// Gemini generateContent over the shared HttpClient
class GeminiClient : public NarrativeAnalyzer {
public:
    GeminiClient(const std::string& base_url, const std::string& api_key,
                 const std::string& model, std::shared_ptr<HttpClient> http);

    NarrativeView analyze(const std::string& text, const CancelToken& token) override;

    static std::string build_prompt(const std::string& text);
    static nlohmann::json build_request(const std::string& text);

    // Exposed for tests
    static NarrativeView parse_response(const nlohmann::json& response);
    static NarrativeView parse_view(const std::string& model_text);

private:
    std::string base_url_;
    std::string api_key_;
    std::string model_;
    std::shared_ptr<HttpClient> http_;
};
