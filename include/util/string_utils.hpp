#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace uploader {

inline std::string_view Trim(std::string_view s) {
    const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

inline std::string ToLowerAscii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool EndsWithIgnoreCase(std::string_view s, std::string_view suffix) {
    if (s.size() < suffix.size()) return false;
    return ToLowerAscii(s.substr(s.size() - suffix.size())) == ToLowerAscii(suffix);
}

// Byte-wise search after ASCII lower-casing; UTF-8 keywords match verbatim.
inline bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return false;
    return ToLowerAscii(haystack).find(ToLowerAscii(needle)) != std::string::npos;
}

// Quotes |s| for display in a POSIX shell command line. Plain words stay unquoted.
inline std::string ShellQuote(std::string_view s) {
    const bool plain = !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '/' || c == ':' ||
               c == '@' || c == '=' || c == '+' || c == ',';
    });
    if (plain) return std::string(s);

    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

} // namespace uploader
