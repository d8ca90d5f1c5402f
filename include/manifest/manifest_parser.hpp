#pragma once

#include "manifest/asset.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace uploader {

// Which manifest sections the run cares about. A section header matches when it
// contains one of the keywords (ASCII case-insensitive).
struct PartitionPolicy {
    std::vector<std::string> image_keywords = {"镜像", "image", "images"};
    std::vector<std::string> archive_keywords;
};

struct ManifestEntry {
    std::string partition;
    std::string text;
    std::size_t line = 0;
};

struct ManifestWarning {
    std::size_t line = 0;
    std::string message;
};

struct ParsedManifest {
    std::vector<ManifestEntry> entries;   // every entry of every section
    std::vector<Asset> assets;            // recognized sections only, manifest order
    std::vector<ManifestWarning> warnings;
};

class ManifestParser {
  public:
    explicit ManifestParser(PartitionPolicy policy = {});

    ParsedManifest Parse(const std::string& text) const;

  private:
    bool Classify(const std::string& partition, AssetKind& out_kind) const;

    PartitionPolicy policy_;
};

std::expected<ParsedManifest, std::string> LoadManifestFile(const std::string& path,
                                                            const PartitionPolicy& policy);

} // namespace uploader
