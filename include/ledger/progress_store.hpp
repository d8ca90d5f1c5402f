#pragma once

#include "ledger/progress_record.hpp"
#include "util/result.hpp"

#include <string>

namespace uploader {

// Durable asset-status ledger for one working directory.
//
// The whole ledger is rewritten after every mutation (temp file + rename), so the
// file on disk is always a complete JSON document that is safe to `cat` while a
// run is in progress.
class ProgressStore {
public:
    explicit ProgressStore(std::string path);

    // Reads the ledger file. A missing file yields an empty ledger; an unreadable or
    // corrupt file is logged and also yields an empty ledger.
    const Ledger& Load();

    Result Record(const std::string& identity, AssetStatus status, const RecordDetail& detail = {});

    // Drops one record; the asset is pending again. |found| reports whether it existed.
    Result Reset(const std::string& identity, bool* found = nullptr);
    Result ResetAll();

    // Pending for identities without a record.
    AssetStatus StatusOf(const std::string& identity) const;
    const ProgressRecord* Find(const std::string& identity) const;

    const Ledger& Records() const { return ledger_; }
    const std::string& Path() const { return path_; }

    std::string Serialize() const;

private:
    Result Flush() const;

    std::string path_;
    Ledger ledger_;
};

// Current UTC time as "YYYY-mm-ddTHH:MM:SSZ".
std::string UtcTimestampNow();

} // namespace uploader
