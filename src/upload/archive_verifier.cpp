#include "upload/archive_verifier.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <array>
#include <memory>

namespace uploader {

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) archive_read_free(a);
    }
};

using ArchivePtr = std::unique_ptr<struct archive, ArchiveReadDeleter>;

std::string ArchiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

} // namespace

Result ArchiveVerifier::Verify(const std::string& path, ArchiveSummary& out) {
    out = ArchiveSummary{};

    ArchivePtr a(archive_read_new());
    if (!a) return Result::Fail(-1, "archive_read_new failed");
    archive_read_support_format_all(a.get());
    archive_read_support_filter_all(a.get());

    if (archive_read_open_filename(a.get(), path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return Result::Fail(-1, "Could not open archive " + path + ": " + ArchiveError(a.get()));
    }

    std::array<char, 64 * 1024> buf{};
    struct archive_entry* entry = nullptr;
    while (true) {
        const int rc = archive_read_next_header(a.get(), &entry);
        if (rc == ARCHIVE_EOF) break;
        if (rc != ARCHIVE_OK && rc != ARCHIVE_WARN) {
            return Result::Fail(-1, "Corrupt archive " + path + " after " + std::to_string(out.entries) +
                                        " entries: " + ArchiveError(a.get()));
        }
        ++out.entries;

        while (true) {
            const la_ssize_t n = archive_read_data(a.get(), buf.data(), buf.size());
            if (n == 0) break;
            if (n < 0) {
                const char* name = archive_entry_pathname(entry);
                return Result::Fail(-1, std::string("Corrupt archive entry ") + (name ? name : "?") + " in " +
                                            path + ": " + ArchiveError(a.get()));
            }
            out.uncompressed_bytes += static_cast<std::uint64_t>(n);
        }
    }

    if (out.entries == 0) {
        return Result::Fail(-1, "Archive has no entries: " + path);
    }
    return Result::Ok();
}

} // namespace uploader
