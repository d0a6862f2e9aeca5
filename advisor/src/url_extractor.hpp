#pragma once

#include "cancel_token.hpp"
#include "http_client.hpp"
#include <memory>
#include <string>

// Turns an article URL into plain narrative text: the page title followed by
// its paragraph text.
class UrlTextExtractor {
public:
    static constexpr size_t MAX_CHARS = 5000;

    explicit UrlTextExtractor(std::shared_ptr<HttpClient> http);

    // Throws InputError("Could not fetch text from URL") on fetch failure or
    // when the page has no usable text. CancelledError passes through.
    std::string extract(const std::string& url, const CancelToken& token) const;

    static std::string extract_from_html(const std::string& html);
    static std::string strip_tags(const std::string& fragment);
    static std::string decode_entities(const std::string& text);

private:
    std::shared_ptr<HttpClient> http_;
};
