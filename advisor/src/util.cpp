#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int random_jitter(int min_ms, int max_ms) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(min_ms, max_ms);
    return dis(gen);
}

std::string trim(const std::string& str) {
    size_t b = str.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = str.find_last_not_of(" \t\r\n");
    return str.substr(b, e - b + 1);
}

bool is_blank(const std::string& str) {
    return trim(str).empty();
}

bool is_url(const std::string& str) {
    return str.rfind("http://", 0) == 0 || str.rfind("https://", 0) == 0;
}

std::string normalize_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (c >= 0x80) {
            out.push_back(static_cast<char>(c));
        } else if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (!out.empty() && out.back() != ' ') {
            out.push_back(' ');
        }
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

int count_phrase(const std::string& normalized, const std::string& phrase) {
    if (phrase.empty()) return 0;

    bool ascii = std::all_of(phrase.begin(), phrase.end(),
                             [](unsigned char c) { return c < 0x80; });

    std::string haystack = ascii ? " " + normalized + " " : normalized;
    std::string needle = ascii ? " " + phrase + " " : phrase;

    int count = 0;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        count++;
        // Step past the phrase but keep the trailing space for the next match
        pos = haystack.find(needle, pos + needle.size() - (ascii ? 1 : 0));
    }
    return count;
}

uint64_t fnv1a(const std::string& str) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : str) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace util
