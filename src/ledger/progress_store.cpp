#include "ledger/progress_store.hpp"

#include "util/fs_utils.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <ctime>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace uploader {

using json = nlohmann::json;

namespace {

constexpr int kLedgerFormatVersion = 1;

std::expected<ProgressRecord, std::string> ParseRecord(const std::string& key, const json& j) {
    if (!j.is_object()) {
        return std::unexpected("record for " + key + " must be an object");
    }
    auto status_it = j.find("status");
    if (status_it == j.end() || !status_it->is_string()) {
        return std::unexpected("record for " + key + " has no status");
    }
    auto status = ParseAssetStatus(status_it->get<std::string>());
    if (!status) {
        return std::unexpected("record for " + key + " has unknown status '" +
                               status_it->get<std::string>() + "'");
    }

    ProgressRecord rec;
    rec.status = *status;
    rec.updated_at = j.value("updated_at", "");
    rec.detail = j.value("detail", "");
    rec.digest = j.value("digest", "");
    if (auto size_it = j.find("size"); size_it != j.end() && size_it->is_number_unsigned()) {
        rec.size = size_it->get<std::uint64_t>();
    }
    return rec;
}

std::expected<Ledger, std::string> ParseLedger(const std::string& text) {
    try {
        const json j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected("ledger root must be an object");
        }
        auto assets_it = j.find("assets");
        if (assets_it == j.end() || !assets_it->is_object()) {
            return std::unexpected("ledger has no 'assets' object");
        }

        Ledger out;
        for (const auto& [key, val] : assets_it->items()) {
            auto rec = ParseRecord(key, val);
            if (!rec) return std::unexpected(rec.error());
            out.emplace(key, std::move(*rec));
        }
        return out;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    }
}

} // namespace

const char* ToString(AssetStatus status) {
    switch (status) {
        case AssetStatus::Pending:    return "pending";
        case AssetStatus::InProgress: return "in_progress";
        case AssetStatus::Pushed:     return "pushed";
        case AssetStatus::Failed:     return "failed";
        case AssetStatus::Skipped:    return "skipped";
    }
    return "pending";
}

std::optional<AssetStatus> ParseAssetStatus(std::string_view text) {
    if (text == "pending") return AssetStatus::Pending;
    if (text == "in_progress") return AssetStatus::InProgress;
    if (text == "pushed") return AssetStatus::Pushed;
    if (text == "failed") return AssetStatus::Failed;
    if (text == "skipped") return AssetStatus::Skipped;
    return std::nullopt;
}

std::string UtcTimestampNow() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    char buf[32]{};
    if (gmtime_r(&now, &tm) == nullptr) return {};
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

ProgressStore::ProgressStore(std::string path) : path_(std::move(path)) {}

const Ledger& ProgressStore::Load() {
    ledger_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        LogDebug("No progress file at %s, starting empty", path_.c_str());
        return ledger_;
    }

    std::string text;
    auto read_res = ReadFileToString(path_, text);
    if (!read_res.is_ok()) {
        LogWarn("Cannot read progress file (%s), starting fresh", read_res.message().c_str());
        return ledger_;
    }

    auto parsed = ParseLedger(text);
    if (!parsed) {
        LogWarn("Progress file %s is corrupt (%s), starting fresh", path_.c_str(), parsed.error().c_str());
        return ledger_;
    }

    ledger_ = std::move(*parsed);
    LogInfo("Loaded progress: %zu record(s) from %s", ledger_.size(), path_.c_str());
    return ledger_;
}

Result ProgressStore::Record(const std::string& identity, AssetStatus status, const RecordDetail& detail) {
    ProgressRecord& rec = ledger_[identity];
    rec.status = status;
    rec.updated_at = UtcTimestampNow();
    rec.detail = detail.message;
    rec.digest = detail.digest;
    rec.size = detail.size;
    return Flush();
}

Result ProgressStore::Reset(const std::string& identity, bool* found) {
    const bool erased = ledger_.erase(identity) > 0;
    if (found) *found = erased;
    return Flush();
}

Result ProgressStore::ResetAll() {
    ledger_.clear();
    return Flush();
}

AssetStatus ProgressStore::StatusOf(const std::string& identity) const {
    const ProgressRecord* rec = Find(identity);
    return rec ? rec->status : AssetStatus::Pending;
}

const ProgressRecord* ProgressStore::Find(const std::string& identity) const {
    auto it = ledger_.find(identity);
    return it == ledger_.end() ? nullptr : &it->second;
}

std::string ProgressStore::Serialize() const {
    json assets = json::object();
    for (const auto& [key, rec] : ledger_) {
        json r = {
            {"status", ToString(rec.status)},
            {"updated_at", rec.updated_at},
        };
        if (!rec.detail.empty()) r["detail"] = rec.detail;
        if (!rec.digest.empty()) r["digest"] = rec.digest;
        if (rec.size) r["size"] = *rec.size;
        assets[key] = std::move(r);
    }

    json root = {
        {"version", kLedgerFormatVersion},
        {"assets", std::move(assets)},
    };
    // Replace invalid UTF-8 from captured command output instead of throwing.
    return root.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

Result ProgressStore::Flush() const {
    auto res = WriteFileAtomic(path_, Serialize());
    if (!res.is_ok()) {
        return res.WithContext("cannot write progress file " + path_);
    }
    return Result::Ok();
}

} // namespace uploader
