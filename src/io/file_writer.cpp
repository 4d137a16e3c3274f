#include "io/file_writer.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace updater {

Result FileWriter::Open(std::string path, FileWriter& out, mode_t mode) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        return Result::FromErrno("Failed to open output: " + out.path_);
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::FromErrno("Write failed: " + path_);
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::FromErrno("fsync failed: " + path_);
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    auto res = fd_.CloseChecked();
    if (!res.is_ok()) {
        return Result::Fail(res.err, res.msg + ": " + path_);
    }
    return Result::Ok();
}

} // namespace updater
