#include "upload/asset_pipeline.hpp"

#include "upload/registry_ref.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace uploader {

namespace {

Result RunStep(const PipelineContext& ctx, Command cmd, CommandResult* out = nullptr) {
    CommandResult res = ctx.runner.Run(cmd);
    if (!res.Succeeded()) {
        return Result::Fail(res.exit_code, res.Describe());
    }
    if (out) *out = std::move(res);
    return Result::Ok();
}

std::string JoinRefs(const std::vector<std::string>& refs) {
    std::string out;
    for (const auto& r : refs) {
        if (!out.empty()) out += ", ";
        out += r;
    }
    return out;
}

} // namespace

bool ImagePipeline::Supports(const Asset& asset) const {
    return asset.kind == AssetKind::Image;
}

Result ImagePipeline::Load(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const {
    CommandResult out;
    auto res = RunStep(ctx, {ctx.options.docker_cli, {"load", "-i", asset.source_path}}, &out);
    if (!res.is_ok()) return res;

    work.loaded_refs = ParseLoadedImages(out.stdout_text);
    if (work.loaded_refs.empty()) {
        if (!ctx.options.dry_run) {
            return Result::Fail(-1, "Could not parse loaded image from output: " + out.Describe());
        }
        work.loaded_refs.push_back(asset.identity.Key());
    }

    std::error_code ec;
    const auto bytes = std::filesystem::file_size(asset.source_path, ec);
    if (!ec) work.size = static_cast<std::uint64_t>(bytes);

    LogInfo("Loaded: %s", JoinRefs(work.loaded_refs).c_str());
    return Result::Ok();
}

Result ImagePipeline::Tag(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const {
    work.targets.clear();
    for (const auto& ref : work.loaded_refs) {
        // An untagged image only has an ID; it is published under the manifest identity.
        const std::string name_ref = IsImageIdRef(ref) ? asset.identity.Key() : ref;
        std::string target = BuildTargetRef(ctx.options.registry_endpoint, ctx.options.registry_org, name_ref);

        auto res = RunStep(ctx, {ctx.options.docker_cli, {"tag", ref, target}});
        if (!res.is_ok()) return res.WithContext(ref);
        work.targets.push_back(std::move(target));
    }
    return Result::Ok();
}

Result ImagePipeline::Push(const Asset&, const PipelineContext& ctx, AssetWork& work) const {
    for (const auto& target : work.targets) {
        CommandResult out;
        auto res = RunStep(ctx, {ctx.options.docker_cli, {"push", target}}, &out);
        if (!res.is_ok()) return res.WithContext(target);

        if (auto digest = ParsePushDigest(out.stdout_text); digest && work.digest.empty()) {
            work.digest = digest->digest;
            if (digest->size) work.size = digest->size;
        }
        LogInfo("[PUSHED] %s", target.c_str());
    }
    return Result::Ok();
}

Result ImagePipeline::Cleanup(const Asset&, const PipelineContext& ctx, const AssetWork& work) const {
    std::vector<std::string> images = work.targets;
    images.insert(images.end(), work.loaded_refs.begin(), work.loaded_refs.end());

    std::string errors;
    for (const auto& image : images) {
        auto res = RunStep(ctx, {ctx.options.docker_cli, {"rmi", image}});
        if (!res.is_ok()) {
            LogWarn("Failed to remove image %s: %s", image.c_str(), res.message().c_str());
            if (!errors.empty()) errors += "; ";
            errors += image + ": " + res.message();
        }
    }
    if (!errors.empty()) return Result::Fail(-1, errors);
    return Result::Ok();
}

std::vector<std::unique_ptr<IAssetPipeline>> CreateDefaultPipelines() {
    std::vector<std::unique_ptr<IAssetPipeline>> out;
    out.emplace_back(std::make_unique<ImagePipeline>());
    out.emplace_back(std::make_unique<ArchivePipeline>());
    return out;
}

} // namespace uploader
