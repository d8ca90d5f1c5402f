#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uploader {

// Re-homes |loaded_ref| under |endpoint|/|org|. A leading registry host (first
// component containing '.' or ':') and the namespace right after it are dropped:
//   "some.registry/ns/name:tag" -> "<endpoint>/<org>/name:tag"
//   "library/redis:7"           -> "<endpoint>/<org>/redis:7"
std::string BuildTargetRef(std::string_view endpoint, std::string_view org, std::string_view loaded_ref);

bool IsImageIdRef(std::string_view ref);

// References named by "Loaded image: <ref>" / "Loaded image ID: <id>" lines of
// `docker load` output, in order of appearance.
std::vector<std::string> ParseLoadedImages(std::string_view load_output);

struct PushDigest {
    std::string digest;                  // "sha256:..."
    std::optional<std::uint64_t> size;
};

// Parses the "<tag>: digest: sha256:... size: N" line printed by `docker push`.
std::optional<PushDigest> ParsePushDigest(std::string_view push_output);

} // namespace uploader
