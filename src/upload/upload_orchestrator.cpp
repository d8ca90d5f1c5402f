#include "upload/upload_orchestrator.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <utility>

namespace uploader {

const char* ToString(AssetState state) {
    switch (state) {
        case AssetState::Pending: return "PENDING";
        case AssetState::Loading: return "LOADING";
        case AssetState::Tagged:  return "TAGGED";
        case AssetState::Pushed:  return "PUSHED";
        case AssetState::Failed:  return "FAILED";
        case AssetState::Skipped: return "SKIPPED";
    }
    return "PENDING";
}

UploadOrchestrator::UploadOrchestrator(ProgressStore& store, ICommandRunner& runner, UploadOptions options)
    : UploadOrchestrator(store, runner, std::move(options), CreateDefaultPipelines()) {}

UploadOrchestrator::UploadOrchestrator(ProgressStore& store,
                                       ICommandRunner& runner,
                                       UploadOptions options,
                                       std::vector<std::unique_ptr<IAssetPipeline>> pipelines)
    : store_(store), runner_(runner), options_(std::move(options)), pipelines_(std::move(pipelines)) {}

RunSummary UploadOrchestrator::Run(const ValidationReport& report) {
    RunSummary summary;

    LogInfo("Starting: %zu asset(s) present, %zu missing, dry_run=%s",
            report.present.size(),
            report.missing.size(),
            options_.dry_run ? "true" : "false");
    if (options_.dry_run) {
        LogInfo("DRY RUN MODE - commands are printed, not executed; progress file is not modified");
    }

    for (const auto& asset : report.missing) {
        LogWarn("[MISSING] %s: no file for '%s'", asset.identity.Key().c_str(), asset.entry.c_str());
        ++summary.missing;
    }

    for (size_t i = 0; i < report.present.size(); ++i) {
        if (g_cancel.load(std::memory_order_relaxed)) {
            summary.interrupted = true;
            LogWarn("Interrupted: %zu asset(s) not started, rerun to resume", report.present.size() - i);
            break;
        }
        ProcessAsset(report.present[i], summary);
    }
    // A signal during the last asset lets it finish but still fails the run.
    if (!summary.interrupted && g_cancel.load(std::memory_order_relaxed)) {
        summary.interrupted = true;
        LogWarn("Interrupted after the last asset");
    }

    LogInfo("=== Summary: %zu pushed, %zu skipped, %zu failed, %zu missing ===",
            summary.pushed,
            summary.skipped,
            summary.failed,
            summary.missing);
    for (const auto& f : summary.failures) {
        LogError("  FAILED %s: %s", f.identity.c_str(), f.detail.c_str());
    }
    if (summary.ledger_errors > 0) {
        LogError("%zu progress update(s) could not be written to %s",
                 summary.ledger_errors,
                 store_.Path().c_str());
    }
    return summary;
}

void UploadOrchestrator::ProcessAsset(const Asset& asset, RunSummary& summary) {
    const std::string key = asset.identity.Key();

    if (const ProgressRecord* rec = store_.Find(key)) {
        if (rec->status == AssetStatus::Pushed) {
            Transition(asset, AssetState::Pending, AssetState::Skipped);
            ++summary.skipped;
            return;
        }
        if (rec->status == AssetStatus::Failed) {
            LogInfo("[%s] retrying, last attempt failed: %s", key.c_str(), rec->detail.c_str());
        }
    }

    const IAssetPipeline* pipeline = FindPipeline(asset);
    if (!pipeline) {
        MarkFailed(asset,
                   AssetState::Pending,
                   "dispatch",
                   Result::Fail(-1, std::string("no pipeline for ") + ToString(asset.kind) + " assets"),
                   summary);
        return;
    }

    LogInfo("[%s] %s asset %s", key.c_str(), ToString(asset.kind), asset.source_path.c_str());

    const PipelineContext ctx{runner_, options_};
    AssetWork work;

    Transition(asset, AssetState::Pending, AssetState::Loading);
    if (auto res = pipeline->Load(asset, ctx, work); !res.is_ok()) {
        MarkFailed(asset, AssetState::Loading, "load", res, summary);
        return;
    }

    if (auto res = pipeline->Tag(asset, ctx, work); !res.is_ok()) {
        MarkFailed(asset, AssetState::Loading, "tag", res, summary);
        return;
    }
    Transition(asset, AssetState::Loading, AssetState::Tagged);

    if (auto res = pipeline->Push(asset, ctx, work); !res.is_ok()) {
        MarkFailed(asset, AssetState::Tagged, "push", res, summary);
        return;
    }
    Transition(asset, AssetState::Tagged, AssetState::Pushed);
    Persist(asset, AssetStatus::Pushed, {.message = {}, .digest = work.digest, .size = work.size}, summary);
    ++summary.pushed;

    if (options_.cleanup_after_push) {
        if (auto res = pipeline->Cleanup(asset, ctx, work); !res.is_ok()) {
            LogWarn("[%s] cleanup failed, asset stays pushed: %s", key.c_str(), res.message().c_str());
        }
    }
}

void UploadOrchestrator::Transition(const Asset& asset, AssetState from, AssetState to) const {
    LogInfo("[%s] %s -> %s", asset.identity.Key().c_str(), ToString(from), ToString(to));
}

void UploadOrchestrator::MarkFailed(const Asset& asset,
                                    AssetState from,
                                    const char* step,
                                    const Result& res,
                                    RunSummary& summary) {
    const std::string detail = std::string(step) + " failed: " + res.message();
    Transition(asset, from, AssetState::Failed);
    LogError("[%s] %s", asset.identity.Key().c_str(), detail.c_str());

    Persist(asset, AssetStatus::Failed, {.message = detail, .digest = {}, .size = std::nullopt}, summary);
    ++summary.failed;
    summary.failures.push_back({asset.identity.Key(), detail});
}

void UploadOrchestrator::Persist(const Asset& asset,
                                 AssetStatus status,
                                 const RecordDetail& detail,
                                 RunSummary& summary) {
    if (options_.dry_run) return;

    auto res = store_.Record(asset.identity.Key(), status, detail);
    if (!res.is_ok()) {
        LogError("[%s] %s", asset.identity.Key().c_str(), res.message().c_str());
        ++summary.ledger_errors;
    }
}

const IAssetPipeline* UploadOrchestrator::FindPipeline(const Asset& asset) const {
    for (const auto& pipeline : pipelines_) {
        if (pipeline->Supports(asset)) return pipeline.get();
    }
    return nullptr;
}

} // namespace uploader
