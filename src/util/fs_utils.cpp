#include "util/fs_utils.hpp"

#include "io/fd.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace uploader {

namespace {

std::string BuildTempPath(const std::string& path) {
    static std::atomic<unsigned> counter{0};
    return path + ".tmp." + std::to_string(::getpid()) + "." +
           std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

Result WriteAllFd(int fd, std::string_view content) {
    while (!content.empty()) {
        const ssize_t n = ::write(fd, content.data(), content.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(err, std::string("write failed: ") + std::strerror(err));
        }
        content.remove_prefix(static_cast<size_t>(n));
    }
    return Result::Ok();
}

// Makes the rename itself durable. Failure here does not invalidate the new file.
void SyncParentDirectory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) parent = ".";
    Fd dir(::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (dir.Valid()) {
        (void)::fsync(dir.Get());
    }
}

} // namespace

Result WriteFileAtomic(const std::string& path, std::string_view content) {
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Result::Fail(ec.value(), "create_directories failed: " + parent.string() + ": " + ec.message());
        }
    }

    const std::string tmp_path = BuildTempPath(path);
    Fd fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (!fd.Valid()) {
        const int err = errno;
        return Result::Fail(err, "cannot create " + tmp_path + ": " + std::strerror(err));
    }

    auto write_res = WriteAllFd(fd.Get(), content);
    if (!write_res.is_ok()) {
        fd.Close();
        ::unlink(tmp_path.c_str());
        return write_res.WithContext(tmp_path);
    }

    if (::fsync(fd.Get()) != 0) {
        const int err = errno;
        fd.Close();
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "fsync failed for " + tmp_path + ": " + std::strerror(err));
    }
    fd.Close();

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "Atomic rename failed: " + std::string(std::strerror(err)));
    }

    SyncParentDirectory(path);
    return Result::Ok();
}

Result ReadFileToString(const std::string& path, std::string& out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return Result::Fail(ENOENT, "cannot open " + path);
    }
    out.assign(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
    if (is.bad()) {
        return Result::Fail(EIO, "read failed: " + path);
    }
    return Result::Ok();
}

} // namespace uploader
