#include "manifest/manifest_parser.hpp"

#include "manifest/asset_naming.hpp"
#include "util/fs_utils.hpp"
#include "util/string_utils.hpp"

#include <sstream>
#include <unordered_map>

namespace uploader {

namespace {

constexpr const char kDefaultPartition[] = "default";

bool MatchesAny(const std::string& header, const std::vector<std::string>& keywords) {
    for (const auto& keyword : keywords) {
        if (ContainsIgnoreCase(header, keyword)) return true;
    }
    return false;
}

std::string_view StripBom(std::string_view line) {
    constexpr std::string_view kBom = "\xEF\xBB\xBF";
    if (line.starts_with(kBom)) line.remove_prefix(kBom.size());
    return line;
}

} // namespace

ManifestParser::ManifestParser(PartitionPolicy policy) : policy_(std::move(policy)) {}

bool ManifestParser::Classify(const std::string& partition, AssetKind& out_kind) const {
    if (MatchesAny(partition, policy_.image_keywords)) {
        out_kind = AssetKind::Image;
        return true;
    }
    if (MatchesAny(partition, policy_.archive_keywords)) {
        out_kind = AssetKind::Archive;
        return true;
    }
    return false;
}

ParsedManifest ManifestParser::Parse(const std::string& text) const {
    ParsedManifest out;
    std::unordered_map<std::string, std::size_t> seen;   // identity -> first line

    std::string partition = kDefaultPartition;
    AssetKind kind = AssetKind::Image;
    bool recognized = Classify(partition, kind);
    bool any_recognized = false;

    std::istringstream is(text);
    std::string raw;
    std::size_t line_no = 0;
    while (std::getline(is, raw)) {
        ++line_no;
        std::string_view line = Trim(line_no == 1 ? StripBom(raw) : std::string_view(raw));
        if (line.empty()) continue;

        if (line.front() == '#') {
            const size_t first = line.find_first_not_of('#');
            partition = first == std::string_view::npos ? std::string() : std::string(Trim(line.substr(first)));
            recognized = Classify(partition, kind);
            continue;
        }

        out.entries.push_back({partition, std::string(line), line_no});
        if (!recognized) continue;
        any_recognized = true;

        auto id = ParseAssetFilename(line);
        if (!id) {
            out.warnings.push_back({line_no, id.error()});
            continue;
        }

        const std::string key = id->Key();
        if (auto it = seen.find(key); it != seen.end()) {
            out.warnings.push_back(
                {line_no, "duplicate asset " + key + " (first declared on line " + std::to_string(it->second) + ")"});
            continue;
        }
        seen.emplace(key, line_no);

        Asset asset;
        asset.identity = std::move(*id);
        asset.entry = std::string(line);
        asset.partition = partition;
        asset.kind = kind;
        asset.line = line_no;
        out.assets.push_back(std::move(asset));
    }

    if (!any_recognized) {
        out.warnings.push_back({0, "no image or archive section found in manifest"});
    }
    return out;
}

std::expected<ParsedManifest, std::string> LoadManifestFile(const std::string& path,
                                                            const PartitionPolicy& policy) {
    std::string text;
    auto read_res = ReadFileToString(path, text);
    if (!read_res.is_ok()) {
        return std::unexpected("Assets file not readable: " + read_res.message());
    }
    ManifestParser parser(policy);
    return parser.Parse(text);
}

} // namespace uploader
