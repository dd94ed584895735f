#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace mindsync {

/**
 * SearchResult - One hit of LocalStore::search.
 *
 * node_id is empty when the match is on the map title itself.
 */
struct SearchResult {
    std::string map_id;
    std::string map_title;
    std::optional<std::string> node_id;
    std::string node_title;
    std::string snippet;

    bool operator==(const SearchResult&) const = default;
};

[[nodiscard]] inline std::string to_lower_ascii(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

/**
 * Case-insensitive containment, the same rule the SQL LIKE filter applies
 * to ASCII text.
 */
[[nodiscard]] inline bool contains_ci(std::string_view text, std::string_view query) {
    if (query.empty()) return true;
    return to_lower_ascii(text).find(to_lower_ascii(query)) != std::string::npos;
}

/**
 * Escape % _ and \ for a LIKE pattern using ESCAPE '\'.
 */
[[nodiscard]] inline std::string like_pattern(std::string_view query) {
    std::string pattern;
    pattern.reserve(query.size() + 2);
    pattern += '%';
    for (char c : query) {
        if (c == '%' || c == '_' || c == '\\') pattern += '\\';
        pattern += c;
    }
    pattern += '%';
    return pattern;
}

/**
 * Snippet of `text` around the first case-insensitive match of `query`,
 * with "..." where it was cut.
 */
[[nodiscard]] inline std::string create_snippet(
    std::string_view text,
    std::string_view query,
    size_t context_chars = 40
) {
    size_t match_pos = query.empty()
        ? std::string::npos
        : to_lower_ascii(text).find(to_lower_ascii(query));

    if (match_pos == std::string::npos) {
        if (text.size() <= context_chars * 2) return std::string(text);
        return std::string(text.substr(0, context_chars * 2)) + "...";
    }

    size_t start = match_pos > context_chars ? match_pos - context_chars : 0;
    size_t end = std::min(text.size(), match_pos + query.size() + context_chars);

    std::string snippet;
    if (start > 0) snippet += "...";
    snippet += text.substr(start, end - start);
    if (end < text.size()) snippet += "...";
    return snippet;
}

} // namespace mindsync
