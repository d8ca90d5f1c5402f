#include "crypto/sha256.hpp"

#include "io/fd.hpp"

#include <openssl/evp.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace uploader {

namespace {

constexpr size_t kReadChunk = 1024 * 1024;

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

std::string HexEncode(const std::uint8_t* bytes, size_t n) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(n * 2, '0');
    for (size_t i = 0; i < n; ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

Result OpenRegularFile(const std::string& path, Fd& out) {
    out.Reset(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!out.Valid()) {
        const int err = errno;
        return Result::Fail(err, "Failed to open " + path + " (" + std::strerror(err) + ")");
    }

    struct stat st{};
    if (::fstat(out.Get(), &st) != 0) {
        const int err = errno;
        return Result::Fail(err, "fstat failed for " + path + " (" + std::strerror(err) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(EINVAL, "Not a regular file: " + path);
    }
    return Result::Ok();
}

} // namespace

Result Sha256HexFile(const std::string& path, std::string& out_hex, std::uint64_t& out_size) {
    Fd fd;
    if (auto r = OpenRegularFile(path, fd); !r.is_ok()) return r;

    EvpCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Result::Fail(-1, "sha256 init failed: " + path);
    }

    std::vector<std::uint8_t> buf(kReadChunk);
    std::uint64_t hashed = 0;
    while (true) {
        const ssize_t n = ::read(fd.Get(), buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(err, "Read failed for " + path + " (" + std::strerror(err) + ")");
        }
        if (n == 0) break;
        if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
            return Result::Fail(-1, "sha256 update failed: " + path);
        }
        hashed += static_cast<std::uint64_t>(n);
    }

    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 || len != 32) {
        return Result::Fail(-1, "sha256 failed: " + path);
    }

    out_hex = HexEncode(digest.data(), len);
    out_size = hashed;
    return Result::Ok();
}

} // namespace uploader
