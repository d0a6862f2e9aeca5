#include "response.hpp"

nlohmann::json ResponseBuilder::analysis_json(const AnalysisResult& r) {
    return {
        {"regime", regime_to_string(r.assessment.regime)},
        {"reasoning", r.assessment.reasoning},
        {"sectors", r.assessment.sectors},
        {"sentiment", {{"overall", r.assessment.sentiment}}},
        {"news_headlines", r.assessment.headlines},
        {"synthetic", r.synthetic}
    };
}

nlohmann::json ResponseBuilder::candidates_json(const std::vector<Ticker>& candidates) {
    auto tickers = nlohmann::json::array();
    auto names = nlohmann::json::array();
    auto returns = nlohmann::json::array();

    for (const auto& t : candidates) {
        tickers.push_back(t.symbol);
        names.push_back(t.name);
        returns.push_back(t.return_1y());
    }

    return {{"tickers", tickers}, {"names", names}, {"returns_1y", returns}};
}

nlohmann::json ResponseBuilder::economic_json(const EconomicSnapshot& e) {
    return {
        {"cpi", {{"yoy_change", e.cpi_yoy_change}}},
        {"fed_rate", {{"value", e.fed_rate_value}}},
        {"gdp", {{"growth", e.gdp_growth}}},
        {"regime", {{"label", e.label}, {"description", e.description}}}
    };
}

nlohmann::json ResponseBuilder::success(const AnalysisResult& r) {
    const auto& sel = r.selection;

    nlohmann::json out;
    out["status"] = "success";
    out["analysis"] = analysis_json(r);
    out["result"] = {
        {"selected_tickers", sel.selected_tickers},
        {"selected_names", sel.selected_names},
        {"weights", sel.weights},
        {"expected_return", sel.expected_return},
        {"risk_probability", r.risk.risk_probability}
    };
    out["risk"] = {
        {"var_classical", r.risk.var},
        {"cvar", r.risk.cvar},
        {"volatility", r.risk.volatility},
        {"max_drawdown", r.risk.max_drawdown}
    };
    out["candidates"] = candidates_json(r.candidates);
    out["economic"] = economic_json(r.economic);
    return out;
}

nlohmann::json ResponseBuilder::error(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}
