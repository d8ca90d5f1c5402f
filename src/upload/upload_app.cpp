#include "upload/upload_app.hpp"

#include "ledger/ledger_lock.hpp"
#include "ledger/progress_store.hpp"
#include "manifest/asset_validator.hpp"
#include "manifest/manifest_parser.hpp"
#include "upload/upload_orchestrator.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <utility>

namespace uploader {

namespace {

bool LoadManifest(const config::UploaderConfig& cfg, ParsedManifest& out) {
    auto manifest = LoadManifestFile(cfg.assets_file, cfg.Partitions());
    if (!manifest) {
        LogError("%s", manifest.error().c_str());
        return false;
    }
    for (const auto& w : manifest->warnings) {
        if (w.line > 0) {
            LogWarn("%s:%zu: %s", cfg.assets_file.c_str(), w.line, w.message.c_str());
        } else {
            LogWarn("%s: %s", cfg.assets_file.c_str(), w.message.c_str());
        }
    }
    out = std::move(*manifest);
    return true;
}

} // namespace

UploadApp::UploadApp() : UploadApp(std::make_unique<PosixCommandRunner>()) {}

UploadApp::UploadApp(std::unique_ptr<ICommandRunner> runner) : runner_(std::move(runner)) {}

int UploadApp::Run(const CliOptions& opts) {
    if (opts.reset_all || !opts.reset_keys.empty()) {
        return RunReset(opts);
    }

    config::UploaderConfig cfg;
    if (auto r = cfg.LoadFile(opts.config_path); !r.is_ok()) {
        (void)ApplyLogging(opts, nullptr);
        LogError("%s", r.message().c_str());
        return 1;
    }
    if (auto r = ApplyLogging(opts, &cfg); !r.is_ok()) {
        LogError("%s", r.message().c_str());
        return 1;
    }

    if (opts.validate_only) {
        return RunValidate(opts, cfg);
    }
    return RunUpload(opts, cfg);
}

int UploadApp::RunReset(const CliOptions& opts) {
    config::UploaderConfig cfg;
    const bool cfg_ok = cfg.LoadFile(opts.config_path).is_ok();
    (void)ApplyLogging(opts, cfg_ok ? &cfg : nullptr);
    if (!cfg_ok) {
        LogDebug("Config %s not loaded, using default progress file", opts.config_path.c_str());
    }

    const std::string path = ProgressPath(opts, cfg_ok ? &cfg : nullptr);

    LedgerLock lock;
    if (auto r = LedgerLock::Acquire(path, lock); !r.is_ok()) {
        LogError("%s", r.message().c_str());
        return 1;
    }

    ProgressStore store(path);
    store.Load();

    if (opts.reset_all) {
        const size_t n = store.Records().size();
        if (auto r = store.ResetAll(); !r.is_ok()) {
            LogError("%s", r.message().c_str());
            return 1;
        }
        LogInfo("Cleared %zu record(s) from %s", n, path.c_str());
        return 0;
    }

    for (const auto& key : opts.reset_keys) {
        bool found = false;
        if (auto r = store.Reset(key, &found); !r.is_ok()) {
            LogError("%s", r.message().c_str());
            return 1;
        }
        if (found) {
            LogInfo("Reset %s", key.c_str());
        } else {
            LogWarn("No record for %s in %s", key.c_str(), path.c_str());
        }
    }
    return 0;
}

int UploadApp::RunValidate(const CliOptions& opts, const config::UploaderConfig& cfg) {
    ParsedManifest manifest;
    if (!LoadManifest(cfg, manifest)) return 1;
    if (manifest.entries.empty()) {
        LogError("No entries found in %s", cfg.assets_file.c_str());
        return 1;
    }
    LogInfo("Manifest %s: %zu entries to check in %s",
            cfg.assets_file.c_str(),
            manifest.entries.size(),
            opts.directory.c_str());

    const EntryReport report = AssetValidator::CheckEntries(manifest.entries, opts.directory);
    for (const auto& f : report.found) {
        std::printf("OK       [%s] %-40s %s\n", f.entry.partition.c_str(), f.entry.text.c_str(), f.source_path.c_str());
    }
    for (const auto& e : report.missing) {
        std::printf("MISSING  [%s] %s (line %zu)\n", e.partition.c_str(), e.text.c_str(), e.line);
    }
    std::printf("Result: %zu found, %zu missing\n", report.found.size(), report.missing.size());
    std::fflush(stdout);

    return report.Ok() ? 0 : 1;
}

int UploadApp::RunUpload(const CliOptions& opts, const config::UploaderConfig& cfg) {
    ParsedManifest manifest;
    if (!LoadManifest(cfg, manifest)) return 1;
    if (manifest.assets.empty()) {
        LogError("No assets found in %s", cfg.assets_file.c_str());
        return 1;
    }
    LogInfo("Manifest %s: %zu asset(s) to check in %s",
            cfg.assets_file.c_str(),
            manifest.assets.size(),
            opts.directory.c_str());
    const ValidationReport report = AssetValidator::Validate(manifest.assets, opts.directory);

    const std::string path = ProgressPath(opts, &cfg);

    // Dry runs only read the ledger, so they do not compete for the lock.
    LedgerLock lock;
    if (!opts.dry_run) {
        if (auto r = LedgerLock::Acquire(path, lock); !r.is_ok()) {
            LogError("%s", r.message().c_str());
            return 1;
        }
    }

    ProgressStore store(path);
    store.Load();

    DryRunCommandRunner dry_runner;
    ICommandRunner& runner = opts.dry_run ? static_cast<ICommandRunner&>(dry_runner) : *runner_;

    UploadOrchestrator orchestrator(store, runner, cfg.ToUploadOptions(opts.dry_run));
    const RunSummary summary = orchestrator.Run(report);

    std::printf("Pushed: %zu  Skipped: %zu  Failed: %zu  Missing: %zu\n",
                summary.pushed,
                summary.skipped,
                summary.failed,
                summary.missing);
    std::fflush(stdout);

    return summary.Succeeded() ? 0 : 1;
}

Result UploadApp::ApplyLogging(const CliOptions& opts, const config::UploaderConfig* cfg) const {
    LogLevel level = LogLevel::Info;
    if (cfg && cfg->log_level) level = *cfg->log_level;
    if (opts.verbose) level = LogLevel::Debug;
    Logger::Instance().SetLevel(level);

    if (cfg && !cfg->log_file.empty()) {
        return Logger::Instance().SetLogFile(cfg->log_file).WithContext("log_file");
    }
    return Result::Ok();
}

std::string UploadApp::ProgressPath(const CliOptions& opts, const config::UploaderConfig* cfg) const {
    std::filesystem::path p = config::kDefaultProgressFile;
    if (opts.progress_file) {
        p = *opts.progress_file;
    } else if (cfg) {
        p = cfg->progress_file;
    }
    if (p.is_relative()) {
        p = std::filesystem::path(opts.directory) / p;
    }
    return p.lexically_normal().string();
}

} // namespace uploader
