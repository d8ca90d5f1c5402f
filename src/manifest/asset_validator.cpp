#include "manifest/asset_validator.hpp"

#include "manifest/asset_naming.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fnmatch.h>
#include <unordered_map>

namespace fs = std::filesystem;

namespace uploader {

namespace {

bool IsRegularFile(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

std::vector<std::string> ListRegularFiles(const fs::path& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return names;
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_regular_file(type_ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

std::set<std::string> ValidationReport::PresentKeys() const {
    std::set<std::string> keys;
    for (const auto& a : present) keys.insert(a.identity.Key());
    return keys;
}

std::set<std::string> ValidationReport::MissingKeys() const {
    std::set<std::string> keys;
    for (const auto& a : missing) keys.insert(a.identity.Key());
    return keys;
}

std::optional<std::string> AssetValidator::FindMatchingFile(const std::string& directory,
                                                            const std::string& entry) {
    const fs::path rel(entry);
    const fs::path dir = fs::path(directory) / rel.parent_path();
    const std::string base = rel.filename().string();

    if (!HasPlaceholder(base) && !HasGlobChars(base)) {
        const fs::path candidate = dir / base;
        if (IsRegularFile(candidate)) return candidate.string();
        return std::nullopt;
    }

    const std::string glob = PlaceholderToGlob(base);
    std::vector<std::string> matches;
    for (const auto& name : ListRegularFiles(dir)) {
        if (IsSignatureFile(name)) continue;
        if (::fnmatch(glob.c_str(), name.c_str(), FNM_PERIOD) == 0) {
            matches.push_back(name);
        }
    }

    if (matches.empty()) return std::nullopt;
    if (matches.size() > 1) {
        std::string all;
        for (const auto& m : matches) {
            if (!all.empty()) all += ", ";
            all += m;
        }
        LogWarn("Multiple matches for '%s': %s (using %s)", entry.c_str(), all.c_str(), matches.front().c_str());
    }
    return (dir / matches.front()).string();
}

ValidationReport AssetValidator::Validate(const std::vector<Asset>& assets, const std::string& directory) {
    ValidationReport report;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        LogWarn("Asset directory does not exist: %s", directory.c_str());
    }

    std::unordered_map<std::string, size_t> seen;   // key -> manifest line
    for (const auto& asset : assets) {
        auto match = FindMatchingFile(directory, asset.entry);
        if (!match) {
            report.missing.push_back(asset);
            continue;
        }

        Asset resolved = asset;
        resolved.source_path = std::move(*match);
        if (auto id = ParseAssetFilename(fs::path(resolved.source_path).filename().string())) {
            resolved.identity = std::move(*id);
        } else {
            LogWarn("Line %zu: cannot derive identity from %s (%s), keeping %s",
                    asset.line,
                    resolved.source_path.c_str(),
                    id.error().c_str(),
                    asset.identity.Key().c_str());
        }

        const std::string key = resolved.identity.Key();
        auto [it, inserted] = seen.emplace(key, asset.line);
        if (!inserted) {
            LogWarn("Line %zu: '%s' resolves to %s, already declared on line %zu; skipped",
                    asset.line,
                    asset.entry.c_str(),
                    key.c_str(),
                    it->second);
            continue;
        }
        report.present.push_back(std::move(resolved));
    }
    return report;
}

EntryReport AssetValidator::CheckEntries(const std::vector<ManifestEntry>& entries, const std::string& directory) {
    EntryReport report;
    for (const auto& entry : entries) {
        if (auto match = FindMatchingFile(directory, entry.text)) {
            report.found.push_back({entry, std::move(*match)});
        } else {
            report.missing.push_back(entry);
        }
    }
    return report;
}

} // namespace uploader
