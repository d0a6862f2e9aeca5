#pragma once

#include "cancel_token.hpp"
#include "http_client.hpp"
#include <memory>
#include <string>
#include <vector>

class NewsSource {
public:
    virtual ~NewsSource() = default;

    // Latest market headlines, newest first. Throws DataUnavailableError.
    virtual std::vector<std::string> fetch_headlines(int limit, const CancelToken& token) = 0;
};

class FinnhubNewsClient : public NewsSource {
public:
    FinnhubNewsClient(const std::string& base_url, const std::string& api_key,
                      std::shared_ptr<HttpClient> http);

    std::vector<std::string> fetch_headlines(int limit, const CancelToken& token) override;

private:
    std::string base_url_;
    std::string api_key_;
    std::shared_ptr<HttpClient> http_;
};
