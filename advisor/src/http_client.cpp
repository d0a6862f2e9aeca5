#include "http_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

std::string strip_query(const std::string& url) {
    // Keep API keys out of the logs
    return url.substr(0, url.find('?'));
}

} // namespace

HttpClient::HttpClient(int timeout_ms, int max_retries)
    : timeout_ms_(timeout_ms)
    , max_retries_(std::max(1, max_retries))
{}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

int HttpClient::progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* token = static_cast<const CancelToken*>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    return token->should_stop() ? 1 : 0;
}

std::string HttpClient::escape(const std::string& value) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }
    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.length()));
    std::string out(escaped ? escaped : "");
    curl_free(escaped);
    return out;
}

HttpClient::Attempt HttpClient::perform(const std::string& url, const std::string* body,
                                       const CancelToken& token) {
    Attempt attempt{false, true, 0, "", ""};

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        attempt.error = "Failed to initialize CURL";
        return attempt;
    }

    long timeout = timeout_ms_;
    auto remaining = token.remaining().count();
    if (remaining < timeout) {
        timeout = std::max<long>(1, static_cast<long>(remaining));
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &attempt.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT,
                     "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36");
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &token);

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, curl_slist_free_all);
    if (body) {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        attempt.error = curl_easy_strerror(res);
        attempt.retryable = (res != CURLE_ABORTED_BY_CALLBACK);
        return attempt;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &attempt.status);
    if (attempt.status >= 200 && attempt.status < 300) {
        attempt.ok = true;
    } else {
        attempt.error = "HTTP " + std::to_string(attempt.status);
        attempt.retryable = (attempt.status == 429 || attempt.status >= 500);
    }
    return attempt;
}

std::string HttpClient::execute(const std::string& url, const std::string* body,
                                const CancelToken& token) {
    const char* method = body ? "POST" : "GET";
    std::string last_error;

    for (int i = 1; i <= max_retries_; i++) {
        token.throw_if_cancelled();
        if (token.expired()) {
            throw DataUnavailableError("Deadline exceeded before fetching " + strip_query(url));
        }

        auto attempt = perform(url, body, token);
        if (attempt.ok) {
            return attempt.body;
        }

        token.throw_if_cancelled();
        last_error = attempt.error;
        spdlog::debug("{} {} attempt {}/{} failed: {}", method, strip_query(url), i, max_retries_, last_error);

        if (!attempt.retryable) break;
        if (i < max_retries_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(
                200 * i + util::random_jitter(0, 100)));
        }
    }

    throw DataUnavailableError(std::string(method) + " " + strip_query(url) + " failed: " + last_error);
}

nlohmann::json HttpClient::parse_body(const std::string& url, const std::string& body) {
    try {
        return nlohmann::json::parse(body);
    } catch (const std::exception& e) {
        throw DataUnavailableError("Invalid JSON from " + strip_query(url) + ": " + e.what());
    }
}

std::string HttpClient::get_text(const std::string& url, const CancelToken& token) {
    return execute(url, nullptr, token);
}

nlohmann::json HttpClient::get_json(const std::string& url, const CancelToken& token) {
    return parse_body(url, execute(url, nullptr, token));
}

nlohmann::json HttpClient::post_json(const std::string& url, const nlohmann::json& payload,
                                     const CancelToken& token) {
    std::string body = payload.dump();
    return parse_body(url, execute(url, &body, token));
}
