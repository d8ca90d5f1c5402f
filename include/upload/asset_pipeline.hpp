#pragma once

#include "exec/command_runner.hpp"
#include "manifest/asset.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace uploader {

struct UploadOptions {
    std::string registry_endpoint;
    std::string registry_org;
    std::string storage_path;            // object-storage prefix for archives
    std::string docker_cli = "docker";
    std::string storage_cli = "obsutil";
    bool cleanup_after_push = false;
    bool dry_run = false;
};

struct PipelineContext {
    ICommandRunner& runner;
    const UploadOptions& options;
};

// State carried between the steps of one asset.
struct AssetWork {
    std::vector<std::string> loaded_refs;   // local names after the load step
    std::vector<std::string> targets;       // destination references / object URLs
    std::string digest;
    std::optional<std::uint64_t> size;
};

// Steps of one partition's upload flow. The orchestrator owns the state machine
// and calls Load -> Tag -> Push -> (Cleanup); each step reports through Result.
class IAssetPipeline {
public:
    virtual ~IAssetPipeline() = default;
    virtual bool Supports(const Asset& asset) const = 0;
    virtual Result Load(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const = 0;
    virtual Result Tag(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const = 0;
    virtual Result Push(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const = 0;
    virtual Result Cleanup(const Asset& asset, const PipelineContext& ctx, const AssetWork& work) const = 0;
};

// docker load / tag / push / rmi
class ImagePipeline final : public IAssetPipeline {
public:
    bool Supports(const Asset& asset) const override;
    Result Load(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const override;
    Result Tag(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const override;
    Result Push(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const override;
    Result Cleanup(const Asset& asset, const PipelineContext& ctx, const AssetWork& work) const override;
};

// archive check + sha256 / object-storage cp / rm
class ArchivePipeline final : public IAssetPipeline {
public:
    bool Supports(const Asset& asset) const override;
    Result Load(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const override;
    Result Tag(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const override;
    Result Push(const Asset& asset, const PipelineContext& ctx, AssetWork& work) const override;
    Result Cleanup(const Asset& asset, const PipelineContext& ctx, const AssetWork& work) const override;
};

std::vector<std::unique_ptr<IAssetPipeline>> CreateDefaultPipelines();

} // namespace uploader
