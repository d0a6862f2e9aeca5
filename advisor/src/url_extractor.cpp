#include "url_extractor.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Opening tag `<name` followed by '>' or whitespace, so <p> matches but <pre> does not
size_t find_open_tag(const std::string& lower, const std::string& name, size_t from) {
    std::string needle = "<" + name;
    size_t pos = lower.find(needle, from);
    while (pos != std::string::npos) {
        size_t after = pos + needle.size();
        if (after < lower.size() && (lower[after] == '>' || std::isspace(static_cast<unsigned char>(lower[after])))) {
            return pos;
        }
        pos = lower.find(needle, after);
    }
    return std::string::npos;
}

void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Cut at `max` bytes without splitting a UTF-8 sequence
std::string truncate_utf8(const std::string& s, size_t max) {
    if (s.size() <= max) return s;
    size_t end = max;
    while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) {
        end--;
    }
    return s.substr(0, end);
}

} // namespace

UrlTextExtractor::UrlTextExtractor(std::shared_ptr<HttpClient> http) : http_(std::move(http)) {}

std::string UrlTextExtractor::strip_tags(const std::string& fragment) {
    std::string out;
    out.reserve(fragment.size());
    bool in_tag = false;
    for (char c : fragment) {
        if (c == '<') {
            in_tag = true;
        } else if (c == '>' && in_tag) {
            in_tag = false;
            out.push_back(' ');
        } else if (!in_tag) {
            out.push_back(c);
        }
    }
    return out;
}

std::string UrlTextExtractor::decode_entities(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out.push_back(text[i++]);
            continue;
        }

        size_t semi = text.find(';', i);
        if (semi == std::string::npos || semi - i > 10) {
            out.push_back(text[i++]);
            continue;
        }

        std::string name = text.substr(i + 1, semi - i - 1);
        bool decoded = true;
        if (name == "amp") out.push_back('&');
        else if (name == "lt") out.push_back('<');
        else if (name == "gt") out.push_back('>');
        else if (name == "quot") out.push_back('"');
        else if (name == "apos") out.push_back('\'');
        else if (name == "nbsp") out.push_back(' ');
        else if (name.size() > 1 && name[0] == '#') {
            try {
                unsigned long cp = (name[1] == 'x' || name[1] == 'X')
                    ? std::stoul(name.substr(2), nullptr, 16)
                    : std::stoul(name.substr(1), nullptr, 10);
                append_utf8(out, cp);
            } catch (const std::exception&) {
                decoded = false;
            }
        } else {
            decoded = false;
        }

        if (decoded) {
            i = semi + 1;
        } else {
            out.push_back(text[i++]);
        }
    }
    return out;
}

std::string UrlTextExtractor::extract_from_html(const std::string& html) {
    std::string lower = to_lower(html);
    std::vector<std::string> parts;

    size_t t = find_open_tag(lower, "title", 0);
    if (t != std::string::npos) {
        size_t start = lower.find('>', t);
        size_t end = lower.find("</title", start);
        if (start != std::string::npos && end != std::string::npos) {
            parts.push_back(html.substr(start + 1, end - start - 1));
        }
    }

    size_t pos = 0;
    while ((pos = find_open_tag(lower, "p", pos)) != std::string::npos) {
        size_t start = lower.find('>', pos);
        if (start == std::string::npos) break;
        size_t end = lower.find("</p", start);
        if (end == std::string::npos) end = lower.size();
        parts.push_back(html.substr(start + 1, end - start - 1));
        pos = end;
    }

    std::string text;
    for (const auto& part : parts) {
        std::string clean = decode_entities(strip_tags(part));

        // Collapse whitespace runs
        std::string collapsed;
        for (char c : clean) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (!collapsed.empty() && collapsed.back() != ' ') collapsed.push_back(' ');
            } else {
                collapsed.push_back(c);
            }
        }
        collapsed = util::trim(collapsed);
        if (collapsed.empty()) continue;

        if (!text.empty()) text.push_back(' ');
        text += collapsed;
        if (text.size() >= MAX_CHARS) break;
    }

    return truncate_utf8(text, MAX_CHARS);
}

std::string UrlTextExtractor::extract(const std::string& url, const CancelToken& token) const {
    std::string html;
    try {
        html = http_->get_text(url, token);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("URL fetch failed: {}", e.what());
        throw InputError("Could not fetch text from URL");
    }

    std::string text = extract_from_html(html);
    if (util::is_blank(text)) {
        spdlog::warn("No title or paragraph text found at URL");
        throw InputError("Could not fetch text from URL");
    }

    spdlog::info("Extracted {} chars from URL", text.size());
    return text;
}
