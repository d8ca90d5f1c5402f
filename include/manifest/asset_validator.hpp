#pragma once

#include "manifest/asset.hpp"
#include "manifest/manifest_parser.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace uploader {

struct ValidationReport {
    std::vector<Asset> present;   // source_path filled in
    std::vector<Asset> missing;

    bool Ok() const { return missing.empty(); }
    std::set<std::string> PresentKeys() const;
    std::set<std::string> MissingKeys() const;
};

// Pre-flight view over every manifest entry, recognized section or not.
struct EntryReport {
    struct Found {
        ManifestEntry entry;
        std::string source_path;
    };
    std::vector<Found> found;
    std::vector<ManifestEntry> missing;

    bool Ok() const { return missing.empty(); }
};

class AssetValidator {
public:
    // Read-only: checks every asset and reports all of them, never stops early.
    // A present asset takes its identity from the file it matched, so a
    // placeholder entry is keyed by the version actually on disk. A second
    // entry resolving to an identity already present is dropped with a warning.
    static ValidationReport Validate(const std::vector<Asset>& assets, const std::string& directory);

    // Matches entries by pattern only; no identity is derived.
    static EntryReport CheckEntries(const std::vector<ManifestEntry>& entries, const std::string& directory);

    // Resolves one manifest entry against |directory|. Placeholder runs ("xxx...")
    // and glob characters match like a shell glob; signature files never match.
    static std::optional<std::string> FindMatchingFile(const std::string& directory,
                                                       const std::string& entry);
};

} // namespace uploader
