#include "upload/registry_ref.hpp"

#include "util/string_utils.hpp"

#include <charconv>
#include <regex>
#include <sstream>

namespace uploader {

namespace {

std::vector<std::string_view> SplitPath(std::string_view ref) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const size_t slash = ref.find('/', start);
        if (slash == std::string_view::npos) {
            parts.push_back(ref.substr(start));
            break;
        }
        parts.push_back(ref.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

bool LooksLikeRegistryHost(std::string_view component) {
    return component.find('.') != std::string_view::npos || component.find(':') != std::string_view::npos ||
           component == "localhost";
}

} // namespace

std::string BuildTargetRef(std::string_view endpoint, std::string_view org, std::string_view loaded_ref) {
    const auto parts = SplitPath(loaded_ref);

    std::string name_tag;
    if (parts.size() >= 2 && LooksLikeRegistryHost(parts[0])) {
        const size_t first = parts.size() > 2 ? 2 : 1;
        for (size_t i = first; i < parts.size(); ++i) {
            if (!name_tag.empty()) name_tag.push_back('/');
            name_tag.append(parts[i]);
        }
    } else {
        name_tag = std::string(parts.back());
    }

    std::string out(endpoint);
    while (!out.empty() && out.back() == '/') out.pop_back();
    out.push_back('/');
    out.append(org);
    out.push_back('/');
    out.append(name_tag);
    return out;
}

bool IsImageIdRef(std::string_view ref) {
    return ref.starts_with("sha256:");
}

std::vector<std::string> ParseLoadedImages(std::string_view load_output) {
    static const std::regex kLoaded(R"(^\s*Loaded image(?:\s+ID)?:\s*(\S.*?)\s*$)", std::regex::icase);

    std::vector<std::string> refs;
    std::istringstream is{std::string(load_output)};
    std::string line;
    while (std::getline(is, line)) {
        std::smatch m;
        if (std::regex_match(line, m, kLoaded)) {
            refs.push_back(m[1].str());
        }
    }
    return refs;
}

std::optional<PushDigest> ParsePushDigest(std::string_view push_output) {
    static const std::regex kDigest(R"(digest:\s*(sha256:[0-9a-fA-F]{64})(?:\s+size:\s*([0-9]+))?)");

    const std::string text(push_output);
    std::smatch m;
    if (!std::regex_search(text, m, kDigest)) return std::nullopt;

    PushDigest out;
    out.digest = ToLowerAscii(m[1].str());
    if (m[2].matched) {
        const std::string size_text = m[2].str();
        std::uint64_t v = 0;
        const auto [ptr, ec] = std::from_chars(size_text.data(), size_text.data() + size_text.size(), v);
        if (ec == std::errc() && ptr == size_text.data() + size_text.size()) {
            out.size = v;
        }
    }
    return out;
}

} // namespace uploader
