#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>

namespace uploader {

// Exclusive advisory lock on "<ledger>.lock" held for the lifetime of the object.
// Only one mutating run may work on a ledger at a time.
class LedgerLock {
public:
    LedgerLock() = default;
    LedgerLock(const LedgerLock&) = delete;
    LedgerLock& operator=(const LedgerLock&) = delete;
    LedgerLock(LedgerLock&&) noexcept = default;
    LedgerLock& operator=(LedgerLock&&) noexcept = default;
    ~LedgerLock() = default;

    // Fails without blocking when another process holds the lock.
    static Result Acquire(const std::string& ledger_path, LedgerLock& out);

    bool Held() const { return fd_.Valid(); }
    const std::string& Path() const { return path_; }

private:
    Fd fd_;
    std::string path_;
};

} // namespace uploader
