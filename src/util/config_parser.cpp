#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

#include <filesystem>

namespace uploader::config {

void UploaderConfig::Reset() {
    *this = UploaderConfig{};
}

Result UploaderConfig::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(-1, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(-1, "Config: " + err + " in " + path);
    }

    const std::filesystem::path assets(assets_file);
    if (assets.is_relative()) {
        assets_file = (std::filesystem::path(path).parent_path() / assets).lexically_normal().string();
    }

    return Result::Ok();
}

PartitionPolicy UploaderConfig::Partitions() const {
    PartitionPolicy policy;
    if (image_partitions) policy.image_keywords = *image_partitions;
    policy.archive_keywords = archive_partitions;
    return policy;
}

UploadOptions UploaderConfig::ToUploadOptions(bool dry_run) const {
    UploadOptions opts;
    opts.registry_endpoint = registry_endpoint;
    opts.registry_org = registry_org;
    opts.storage_path = storage_path;
    opts.docker_cli = docker_cli;
    opts.storage_cli = storage_cli;
    opts.cleanup_after_push = cleanup_after_push;
    opts.dry_run = dry_run;
    return opts;
}

} // namespace uploader::config
