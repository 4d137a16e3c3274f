#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace updater {

// Writes <path>.tmp, fsyncs it, renames it over path and fsyncs the directory.
// Readers see either the old or the new content, and the new content survives a crash.
Result WriteFileDurably(const std::string& path, std::string_view content, mode_t mode = 0644);

// Unlinks path and fsyncs its directory. A missing file is not an error.
Result RemoveFileDurably(const std::string& path);

Result FsyncParentDirectory(const std::string& path);

Result EnsureDirectory(const std::string& path);

// Bytes available to unprivileged users on the file system holding path.
// A path that does not exist yet is measured at its nearest existing ancestor.
Result AvailableBytes(const std::string& path, std::uint64_t& out);

// Fails with err == ENOENT when the file does not exist.
Result ReadFileToString(const std::string& path, std::string& out);

} // namespace updater
