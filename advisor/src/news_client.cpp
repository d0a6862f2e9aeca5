#include "news_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

FinnhubNewsClient::FinnhubNewsClient(const std::string& base_url, const std::string& api_key,
                                     std::shared_ptr<HttpClient> http)
    : base_url_(base_url), api_key_(api_key), http_(http) {}

std::vector<std::string> FinnhubNewsClient::fetch_headlines(int limit, const CancelToken& token) {
    std::string url = base_url_ + "/news?category=general&token=" + HttpClient::escape(api_key_);
    auto response = http_->get_json(url, token);

    if (!response.is_array()) {
        throw DataUnavailableError("Unexpected Finnhub news payload");
    }

    std::vector<std::string> headlines;
    for (const auto& item : response) {
        if (static_cast<int>(headlines.size()) >= limit) break;
        if (!item.is_object() || !item.contains("headline") || !item["headline"].is_string()) {
            continue;
        }
        std::string headline = util::trim(item["headline"].get<std::string>());
        if (!headline.empty()) {
            headlines.push_back(headline);
        }
    }

    spdlog::debug("Fetched {} headlines from Finnhub", headlines.size());
    return headlines;
}
