#include "upload/asset_pipeline.hpp"

#include "crypto/sha256.hpp"
#include "upload/archive_verifier.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>

namespace uploader {

bool ArchivePipeline::Supports(const Asset& asset) const {
    return asset.kind == AssetKind::Archive;
}

Result ArchivePipeline::Load(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const {
    if (ctx.options.dry_run) {
        LogInfo("[dry-run] would verify archive %s", asset.source_path.c_str());
        return Result::Ok();
    }

    ArchiveSummary summary;
    auto res = ArchiveVerifier::Verify(asset.source_path, summary);
    if (!res.is_ok()) return res;

    std::string hex;
    std::uint64_t size = 0;
    res = Sha256HexFile(asset.source_path, hex, size);
    if (!res.is_ok()) return res;

    work.digest = "sha256:" + hex;
    work.size = size;
    LogInfo("Verified archive %s: %llu entries, %llu bytes, %s",
            asset.source_path.c_str(),
            (unsigned long long)summary.entries,
            (unsigned long long)size,
            work.digest.c_str());
    return Result::Ok();
}

Result ArchivePipeline::Tag(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const {
    if (ctx.options.storage_path.empty()) {
        return Result::Fail(-1, "storage path not configured for archive " + asset.identity.Key());
    }
    const std::string name = std::filesystem::path(asset.source_path).filename().string();
    work.targets = {JoinObjectPath(ctx.options.storage_path, name)};
    return Result::Ok();
}

Result ArchivePipeline::Push(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const {
    for (const auto& target : work.targets) {
        const CommandResult out = ctx.runner.Run({ctx.options.storage_cli, {"cp", asset.source_path, target}});
        if (!out.Succeeded()) {
            return Result::Fail(out.exit_code, out.Describe()).WithContext(target);
        }
        LogInfo("[UPLOADED] %s", target.c_str());
    }
    return Result::Ok();
}

Result ArchivePipeline::Cleanup(const Asset& asset, const PipelineContext& ctx, const AssetWork&) const {
    const CommandResult out = ctx.runner.Run({"rm", {"-f", asset.source_path}});
    if (!out.Succeeded()) {
        return Result::Fail(out.exit_code, out.Describe());
    }
    return Result::Ok();
}

} // namespace uploader
