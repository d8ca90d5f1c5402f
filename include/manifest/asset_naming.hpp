#pragma once

#include "manifest/asset.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace uploader {

// Maps an asset filename to its canonical (name, tag) identity.
//
//   "mas-api-server_2.3.1_x86_64.tar"  -> mas-api-server:2.3.1
//   "Redis-7.0.12-rc1-linux-amd64.tgz" -> redis:7.0.12-rc1
//   "nginx-xxxxx-arm64.tar.gz"         -> nginx:xxxxx
//   "busybox.tar"                      -> busybox:latest
//
// Pure function: the filesystem is never consulted.
std::expected<AssetIdentity, std::string> ParseAssetFilename(std::string_view filename);

// Strips one recognized archive extension; empty when none matches.
std::string_view StripArchiveExtension(std::string_view filename);

} // namespace uploader
