#pragma once

#include "cancel_token.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Blocking GET/POST with per-attempt timeout and bounded retries. One easy handle
// per call, so a single client is safe to share across fetch workers.
class HttpClient {
public:
    HttpClient(int timeout_ms, int max_retries);

    // Throws DataUnavailableError once retries are exhausted and
    // CancelledError when the token is cancelled.
    std::string get_text(const std::string& url, const CancelToken& token);
    nlohmann::json get_json(const std::string& url, const CancelToken& token);

    // POSTs `payload` as application/json, same retry policy as GET
    nlohmann::json post_json(const std::string& url, const nlohmann::json& payload,
                             const CancelToken& token);

    static std::string escape(const std::string& value);

private:
    int timeout_ms_;
    int max_retries_;

    struct Attempt {
        bool ok;
        bool retryable;
        long status;
        std::string body;
        std::string error;
    };

    Attempt perform(const std::string& url, const std::string* body, const CancelToken& token);
    std::string execute(const std::string& url, const std::string* body, const CancelToken& token);
    static nlohmann::json parse_body(const std::string& url, const std::string& body);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                 curl_off_t ultotal, curl_off_t ulnow);
};
