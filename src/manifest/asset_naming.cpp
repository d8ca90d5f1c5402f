#include "manifest/asset_naming.hpp"

#include "util/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <vector>

namespace uploader {

namespace {

// Longest first so ".tar.gz" wins over ".gz"-less ".tar" checks.
constexpr std::array<std::string_view, 7> kArchiveExtensions = {
    ".tar.gz", ".tar.xz", ".tar.bz2", ".tar.zst", ".tgz", ".tar", ".zip",
};

struct SuffixPattern {
    const char* label;
    std::regex re;
};

// Trailing filename segments that describe the build, not the asset.
const std::vector<SuffixPattern>& SuffixTable() {
    static const std::vector<SuffixPattern> kTable = [] {
        const auto flags = std::regex::ECMAScript | std::regex::icase;
        std::vector<SuffixPattern> t;
        t.push_back({"architecture",
                     std::regex("[-_.](x86_64|amd64|aarch64|arm64|armv7l|armv7|armhf|i386|i686|"
                                "ppc64le|s390x|noarch)$",
                                flags)});
        t.push_back({"platform", std::regex("[-_.](linux|el7|el8|el9)$", flags)});
        t.push_back({"build", std::regex("[-_.](build|b)[0-9]+$", flags)});
        return t;
    }();
    return kTable;
}

bool IsSeparator(char c) { return c == '-' || c == '_'; }

bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

bool StartsVersionToken(std::string_view rest) {
    if (rest.empty()) return false;
    if (IsDigit(rest[0])) return true;
    if ((rest[0] == 'v' || rest[0] == 'V') && rest.size() > 1 && IsDigit(rest[1])) return true;
    if (rest.starts_with("xxx") || rest[0] == '*') return true;
    return false;
}

std::string StripBuildSuffixes(std::string stem) {
    bool stripped = true;
    while (stripped) {
        stripped = false;
        for (const auto& pattern : SuffixTable()) {
            std::smatch m;
            if (std::regex_search(stem, m, pattern.re) && m.position(0) > 0) {
                stem.erase(static_cast<size_t>(m.position(0)));
                stripped = true;
            }
        }
    }
    return stem;
}

bool IsValidName(std::string_view name) {
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.';
    });
}

bool IsValidTag(std::string_view tag) {
    return std::none_of(tag.begin(), tag.end(), [](unsigned char c) {
        return c == ':' || c == '/' || std::isspace(c);
    });
}

} // namespace

const char* ToString(AssetKind kind) {
    switch (kind) {
        case AssetKind::Image:   return "image";
        case AssetKind::Archive: return "archive";
    }
    return "unknown";
}

std::string_view StripArchiveExtension(std::string_view filename) {
    for (const auto ext : kArchiveExtensions) {
        if (filename.size() > ext.size() && EndsWithIgnoreCase(filename, ext)) {
            return filename.substr(0, filename.size() - ext.size());
        }
    }
    return {};
}

std::expected<AssetIdentity, std::string> ParseAssetFilename(std::string_view filename) {
    const size_t slash = filename.find_last_of('/');
    const std::string_view base = slash == std::string_view::npos ? filename : filename.substr(slash + 1);

    if (base.empty()) {
        return std::unexpected("empty filename");
    }
    if (std::any_of(base.begin(), base.end(), [](unsigned char c) { return std::isspace(c); })) {
        return std::unexpected("filename contains whitespace: " + std::string(base));
    }

    const std::string_view stem_view = StripArchiveExtension(base);
    if (stem_view.empty()) {
        return std::unexpected("unrecognized archive extension: " + std::string(base));
    }

    const std::string stem = StripBuildSuffixes(std::string(stem_view));

    AssetIdentity id;
    id.tag = "latest";
    size_t split = std::string::npos;
    for (size_t i = 1; i + 1 < stem.size(); ++i) {
        if (IsSeparator(stem[i]) && StartsVersionToken(std::string_view(stem).substr(i + 1))) {
            split = i;
            break;
        }
    }

    if (split == std::string::npos) {
        id.name = ToLowerAscii(stem);
    } else {
        id.name = ToLowerAscii(std::string_view(stem).substr(0, split));
        id.tag = stem.substr(split + 1);
    }

    if (id.name.empty() || !IsValidName(id.name)) {
        return std::unexpected("cannot derive image name from: " + std::string(base));
    }
    if (!IsValidTag(id.tag)) {
        return std::unexpected("cannot derive tag from: " + std::string(base));
    }
    return id;
}

} // namespace uploader
