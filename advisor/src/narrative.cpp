#include "narrative.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

// Models often wrap JSON in a markdown fence
std::string strip_code_fence(const std::string& text) {
    std::string body = util::trim(text);
    if (body.compare(0, 3, "```") != 0) {
        return body;
    }

    size_t start = body.find('\n');
    if (start == std::string::npos) {
        return "";
    }
    size_t end = body.rfind("```");
    if (end == std::string::npos || end <= start) {
        end = body.size();
    }
    return util::trim(body.substr(start + 1, end - start - 1));
}

std::string known_sectors() {
    std::string out;
    for (auto regime : {MarketRegime::Aggressive, MarketRegime::Defensive, MarketRegime::Neutral}) {
        for (const auto& sector : RegimeClassifier::sectors_for(regime)) {
            if (out.find(sector) != std::string::npos) continue;
            if (!out.empty()) out += ", ";
            out += sector;
        }
    }
    return out;
}

} // namespace

GeminiClient::GeminiClient(const std::string& base_url, const std::string& api_key,
                           const std::string& model, std::shared_ptr<HttpClient> http)
    : base_url_(base_url), api_key_(api_key), model_(model), http_(http) {}

std::string GeminiClient::build_prompt(const std::string& text) {
    return fmt::format(
        "You are an expert financial market analyst. Read the market narrative below "
        "and classify the investment regime.\n\n"
        "Narrative: {}\n\n"
        "Answer with JSON only, no other text:\n"
        "{{\"regime\": \"aggressive\" | \"defensive\" | \"neutral\", "
        "\"sectors\": [up to three sectors], "
        "\"reasoning\": \"one or two sentences\"}}\n\n"
        "aggressive favors growth, tech and crypto; defensive favors gold, utilities, "
        "bonds and staples; neutral favors broad index exposure.\n"
        "Pick sectors from: {}.",
        text, known_sectors());
}

nlohmann::json GeminiClient::build_request(const std::string& text) {
    return {
        {"contents", nlohmann::json::array({
            {{"parts", nlohmann::json::array({{{"text", build_prompt(text)}}})}}
        })},
        {"generationConfig", {
            {"temperature", 0.2},
            {"responseMimeType", "application/json"}
        }}
    };
}

NarrativeView GeminiClient::parse_view(const std::string& model_text) {
    auto doc = nlohmann::json::parse(strip_code_fence(model_text), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw DataUnavailableError("Gemini answer is not a JSON object");
    }
    if (!doc.contains("regime") || !doc["regime"].is_string()) {
        throw DataUnavailableError("Gemini answer has no regime");
    }

    auto regime = regime_from_string(doc["regime"].get<std::string>());
    if (!regime) {
        throw DataUnavailableError("Gemini answered unknown regime '" +
                                   doc["regime"].get<std::string>() + "'");
    }

    NarrativeView view;
    view.regime = *regime;
    if (doc.contains("sectors") && doc["sectors"].is_array()) {
        for (const auto& s : doc["sectors"]) {
            if (s.is_string()) view.sectors.push_back(s.get<std::string>());
        }
    }
    if (doc.contains("reasoning") && doc["reasoning"].is_string()) {
        view.reasoning = util::trim(doc["reasoning"].get<std::string>());
    }
    return view;
}

NarrativeView GeminiClient::parse_response(const nlohmann::json& response) {
    const auto& candidates = response.value("candidates", nlohmann::json::array());
    if (!candidates.is_array() || candidates.empty()) {
        throw DataUnavailableError("Gemini returned no candidates");
    }

    const auto& candidate = candidates[0];
    if (!candidate.is_object() || !candidate.contains("content")) {
        throw DataUnavailableError("Gemini candidate has no content");
    }
    const auto& parts = candidate["content"].value("parts", nlohmann::json::array());

    std::string text;
    for (const auto& part : parts) {
        if (part.is_object() && part.contains("text") && part["text"].is_string()) {
            text += part["text"].get<std::string>();
        }
    }
    if (util::is_blank(text)) {
        throw DataUnavailableError("Gemini candidate has no text");
    }
    return parse_view(text);
}

NarrativeView GeminiClient::analyze(const std::string& text, const CancelToken& token) {
    std::string url = fmt::format("{}/models/{}:generateContent?key={}",
                                  base_url_, model_, HttpClient::escape(api_key_));

    NarrativeView view;
    try {
        view = parse_response(http_->post_json(url, build_request(text), token));
    } catch (const nlohmann::json::exception& e) {
        throw DataUnavailableError(std::string("Malformed Gemini response: ") + e.what());
    }

    spdlog::debug("Gemini classified narrative as {} ({} sectors)",
                  regime_to_string(view.regime), view.sectors.size());
    return view;
}
