#include "ledger/ledger_lock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/file.h>
#include <unistd.h>

namespace uploader {

Result LedgerLock::Acquire(const std::string& ledger_path, LedgerLock& out) {
    out.fd_.Close();
    out.path_ = ledger_path + ".lock";

    const std::filesystem::path parent = std::filesystem::path(out.path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    Fd fd(::open(out.path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
    if (!fd.Valid()) {
        const int err = errno;
        return Result::Fail(err, "cannot open lock file " + out.path_ + ": " + std::strerror(err));
    }

    if (::flock(fd.Get(), LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        if (err == EWOULDBLOCK) {
            return Result::Fail(err, "another upload run holds " + out.path_);
        }
        return Result::Fail(err, "flock failed on " + out.path_ + ": " + std::strerror(err));
    }

    // Holder PID, for operators inspecting a stuck lock.
    const std::string pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd.Get(), 0) == 0) {
        (void)::pwrite(fd.Get(), pid.data(), pid.size(), 0);
    }

    out.fd_ = std::move(fd);
    return Result::Ok();
}

} // namespace uploader
