#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    int random_jitter(int min_ms, int max_ms);

    std::string trim(const std::string& str);
    bool is_blank(const std::string& str);
    bool is_url(const std::string& str);

    // Lowercase ASCII, runs of ASCII punctuation/space -> one space.
    // Non-ASCII bytes are kept.
    std::string normalize_text(const std::string& text);
    std::vector<std::string> split(const std::string& str, char delim);

    // Counts whole-word occurrences of an ASCII phrase, or raw substring
    // occurrences when the phrase contains non-ASCII bytes.
    int count_phrase(const std::string& normalized, const std::string& phrase);

    uint64_t fnv1a(const std::string& str);
}
