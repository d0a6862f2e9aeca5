#pragma once

#include "advisor.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Wire format of POST /api/analyze. Field names and nesting are part of the
// contract with the front end.
class ResponseBuilder {
public:
    static nlohmann::json success(const AnalysisResult& result);
    static nlohmann::json error(const std::string& message);

private:
    static nlohmann::json analysis_json(const AnalysisResult& result);
    static nlohmann::json candidates_json(const std::vector<Ticker>& candidates);
    static nlohmann::json economic_json(const EconomicSnapshot& economic);
};
