#include "io/io.hpp"

#include <vector>

namespace updater {

Result CopyStream(IReader& reader,
                  IWriter& writer,
                  std::stop_token stop,
                  const CopyProgressFn& on_progress) {
    std::vector<std::uint8_t> buf(kCopyChunkSize);
    std::uint64_t copied = 0;
    while (true) {
        if (stop.stop_requested()) return Result::Fail(ECANCELED, "copy cancelled");

        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::FromErrno("read failed");

        auto wr = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) return wr;

        copied += static_cast<std::uint64_t>(n);
        if (on_progress) on_progress(copied);
    }
    return Result::Ok();
}

} // namespace updater
