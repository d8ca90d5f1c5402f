#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace uploader {

enum class AssetKind {
    Image,
    Archive,
};

const char* ToString(AssetKind kind);

struct AssetIdentity {
    std::string name;
    std::string tag;

    // Ledger key, "name:tag".
    std::string Key() const { return name + ":" + tag; }

    bool operator==(const AssetIdentity&) const = default;
};

struct Asset {
    AssetIdentity identity;
    std::string entry;          // filename or pattern as written in the manifest
    std::string partition;      // header of the manifest section
    AssetKind kind = AssetKind::Image;
    std::size_t line = 0;       // 1-based manifest line

    std::string source_path;    // resolved by AssetValidator
};

} // namespace uploader
