#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace uploader {

enum class AssetStatus {
    Pending,
    InProgress,
    Pushed,
    Failed,
    Skipped,
};

const char* ToString(AssetStatus status);
std::optional<AssetStatus> ParseAssetStatus(std::string_view text);

struct ProgressRecord {
    AssetStatus status = AssetStatus::Pending;
    std::string updated_at;                 // UTC, ISO-8601
    std::string detail;                     // error text for failed records
    std::string digest;
    std::optional<std::uint64_t> size;

    bool operator==(const ProgressRecord&) const = default;
};

// Extra fields attached to a status transition.
struct RecordDetail {
    std::string message;
    std::string digest;
    std::optional<std::uint64_t> size;
};

// identity ("name:tag") -> record, sorted so the persisted file is deterministic.
using Ledger = std::map<std::string, ProgressRecord>;

} // namespace uploader
