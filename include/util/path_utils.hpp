#pragma once

#include "util/string_utils.hpp"

#include <array>
#include <regex>
#include <string>
#include <string_view>

namespace uploader {

// Detached signature/checksum files shipped beside the assets.
inline bool IsSignatureFile(std::string_view filename) {
    static constexpr std::array<std::string_view, 5> kSuffixes = {
        ".asc", ".cms", ".p7s", ".crl", ".sha256"};
    for (const auto suffix : kSuffixes) {
        if (EndsWithIgnoreCase(filename, suffix)) return true;
    }
    return false;
}

// Manifest authors write "xxx" (three or more) where a version is not known yet.
inline bool HasPlaceholder(std::string_view pattern) {
    return pattern.find("xxx") != std::string_view::npos;
}

inline bool HasGlobChars(std::string_view pattern) {
    return pattern.find_first_of("*?[") != std::string_view::npos;
}

// "redis-xxxxx-amd64.tar" -> "redis-*-amd64.tar"
inline std::string PlaceholderToGlob(const std::string& pattern) {
    static const std::regex kPlaceholder("x{3,}");
    return std::regex_replace(pattern, kPlaceholder, "*");
}

// Joins an object-storage prefix and a file name with exactly one '/'.
inline std::string JoinObjectPath(std::string_view prefix, std::string_view name) {
    std::string out(prefix);
    while (!out.empty() && out.back() == '/') out.pop_back();
    while (!name.empty() && name.front() == '/') name.remove_prefix(1);
    out.push_back('/');
    out.append(name);
    return out;
}

} // namespace uploader
