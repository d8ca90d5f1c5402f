#include "util/config_json_utils.hpp"

#include <fstream>

namespace uploader::config::detail {

namespace {

// The Get*IfPresent helpers return false only for a present key of the wrong type.

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be true or false";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetStringListIfPresent(const nlohmann::json& j,
                            const char* key,
                            std::optional<std::vector<std::string>>& out,
                            std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& v : *it) {
        if (!v.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return true;
}

// "<section>": {"<key>": ...} wins over the flat "<flat_key>" spelling.
bool GetSectionStringIfPresent(const nlohmann::json& j,
                               const char* section,
                               const char* key,
                               const char* flat_key,
                               std::string& out,
                               std::string& err) {
    if (!GetStringIfPresent(j, flat_key, out, err))
        return false;

    auto it = j.find(section);
    if (it == j.end())
        return true;
    if (!it->is_object()) {
        err = std::string(section) + " must be a JSON object";
        return false;
    }
    if (!GetStringIfPresent(*it, key, out, err)) {
        err = std::string(section) + "." + err;
        return false;
    }
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const nlohmann::json::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, UploaderConfig& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "assets_file", cfg.assets_file, err))
        return false;
    if (!GetSectionStringIfPresent(j, "registry", "endpoint", "registry_endpoint", cfg.registry_endpoint, err))
        return false;
    if (!GetSectionStringIfPresent(j, "registry", "org", "registry_org", cfg.registry_org, err))
        return false;
    if (!GetSectionStringIfPresent(j, "storage", "path", "storage_path", cfg.storage_path, err))
        return false;
    if (!GetSectionStringIfPresent(j, "storage", "cli", "storage_cli", cfg.storage_cli, err))
        return false;
    if (!GetStringIfPresent(j, "docker_cli", cfg.docker_cli, err))
        return false;
    if (!GetBoolIfPresent(j, "cleanup_after_push", cfg.cleanup_after_push, err))
        return false;
    if (!GetStringListIfPresent(j, "image_partitions", cfg.image_partitions, err))
        return false;
    {
        std::optional<std::vector<std::string>> archive;
        if (!GetStringListIfPresent(j, "archive_partitions", archive, err))
            return false;
        if (archive)
            cfg.archive_partitions = std::move(*archive);
    }
    if (!GetStringIfPresent(j, "progress_file", cfg.progress_file, err))
        return false;
    if (!GetStringIfPresent(j, "log_file", cfg.log_file, err))
        return false;
    {
        std::string level;
        if (!GetStringIfPresent(j, "log_level", level, err))
            return false;
        if (!level.empty()) {
            cfg.log_level = ParseLogLevel(level);
            if (!cfg.log_level) {
                err = "log_level must be one of debug, info, warn, error";
                return false;
            }
        }
    }

    if (cfg.assets_file.empty()) {
        err = "missing assets_file";
        return false;
    }
    if (cfg.registry_endpoint.empty() || cfg.registry_org.empty()) {
        err = "missing registry.endpoint/registry.org";
        return false;
    }
    if (!cfg.archive_partitions.empty() && cfg.storage_path.empty()) {
        err = "archive_partitions requires storage.path";
        return false;
    }
    if (cfg.docker_cli.empty() || cfg.storage_cli.empty()) {
        err = "docker_cli/storage.cli must not be empty";
        return false;
    }
    if (cfg.progress_file.empty()) {
        err = "progress_file must not be empty";
        return false;
    }

    return true;
}

} // namespace uploader::config::detail
