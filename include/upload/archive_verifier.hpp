#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace uploader {

struct ArchiveSummary {
    std::uint64_t entries = 0;
    std::uint64_t uncompressed_bytes = 0;
};

class ArchiveVerifier {
public:
    // Reads every entry of the archive at |path| through libarchive so a truncated
    // or corrupt download is caught before it is uploaded.
    static Result Verify(const std::string& path, ArchiveSummary& out);
};

} // namespace uploader
