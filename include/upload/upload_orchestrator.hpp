#pragma once

#include "exec/command_runner.hpp"
#include "ledger/progress_store.hpp"
#include "manifest/asset_validator.hpp"
#include "upload/asset_pipeline.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace uploader {

// Per-asset states of one run. Only Pushed and Failed reach the ledger.
enum class AssetState {
    Pending,
    Loading,
    Tagged,
    Pushed,
    Failed,
    Skipped,
};

const char* ToString(AssetState state);

struct AssetFailure {
    std::string identity;
    std::string detail;
};

struct RunSummary {
    std::size_t pushed = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t missing = 0;
    std::size_t ledger_errors = 0;
    bool interrupted = false;
    std::vector<AssetFailure> failures;

    bool Succeeded() const { return failed == 0 && ledger_errors == 0 && !interrupted; }
};

class UploadOrchestrator {
public:
    UploadOrchestrator(ProgressStore& store, ICommandRunner& runner, UploadOptions options);
    UploadOrchestrator(ProgressStore& store,
                       ICommandRunner& runner,
                       UploadOptions options,
                       std::vector<std::unique_ptr<IAssetPipeline>> pipelines);

    // Drives every present asset through its pipeline in manifest order. Missing
    // assets are reported and counted but not touched. The store must be loaded.
    RunSummary Run(const ValidationReport& report);

private:
    void ProcessAsset(const Asset& asset, RunSummary& summary);
    void Transition(const Asset& asset, AssetState from, AssetState to) const;
    void MarkFailed(const Asset& asset, AssetState from, const char* step, const Result& res, RunSummary& summary);
    void Persist(const Asset& asset, AssetStatus status, const RecordDetail& detail, RunSummary& summary);
    const IAssetPipeline* FindPipeline(const Asset& asset) const;

    ProgressStore& store_;
    ICommandRunner& runner_;
    UploadOptions options_;
    std::vector<std::unique_ptr<IAssetPipeline>> pipelines_;
};

} // namespace uploader
