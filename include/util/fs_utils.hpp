#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace uploader {

// Publishes |content| at |path| so readers only ever see the old or the new file:
// the bytes go to a temporary sibling, are fsync'ed, then renamed over |path|.
Result WriteFileAtomic(const std::string& path, std::string_view content);

Result ReadFileToString(const std::string& path, std::string& out);

} // namespace uploader
