#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <stop_token>
#include <sys/types.h>

namespace updater {

class IReader {
public:
    virtual ~IReader() = default;
    // Bytes read, 0 at end of input, -1 with errno set.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

// Total bytes copied so far.
using CopyProgressFn = std::function<void(std::uint64_t)>;

inline constexpr std::size_t kCopyChunkSize = 64 * 1024;

// Copies reader into writer in kCopyChunkSize chunks. Checks stop before every
// chunk and fails with ECANCELED once it is requested.
Result CopyStream(IReader& reader,
                  IWriter& writer,
                  std::stop_token stop = {},
                  const CopyProgressFn& on_progress = {});

} // namespace updater
