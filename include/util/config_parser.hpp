#pragma once

#include "manifest/manifest_parser.hpp"
#include "upload/asset_pipeline.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace uploader::config {

inline constexpr const char kDefaultConfigFile[] = "config.json";
inline constexpr const char kDefaultProgressFile[] = ".progress.json";

struct UploaderConfig {
    std::string assets_file;          // resolved against the config file directory
    std::string registry_endpoint;
    std::string registry_org;
    bool cleanup_after_push = false;
    std::string storage_path;
    std::string storage_cli = "obsutil";
    std::string docker_cli = "docker";
    std::optional<std::vector<std::string>> image_partitions;
    std::vector<std::string> archive_partitions;
    std::string progress_file = kDefaultProgressFile;
    std::string log_file;
    std::optional<LogLevel> log_level;

    void Reset();
    Result LoadFile(const std::string& path);

    PartitionPolicy Partitions() const;
    UploadOptions ToUploadOptions(bool dry_run) const;
};

} // namespace uploader::config
