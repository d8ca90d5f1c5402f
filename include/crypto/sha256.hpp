#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace uploader {

// Hashes the regular file at |path| with SHA-256. |out_hex| receives the
// lowercase hex digest and |out_size| the number of bytes actually hashed.
Result Sha256HexFile(const std::string& path, std::string& out_hex, std::uint64_t& out_size);

} // namespace uploader
