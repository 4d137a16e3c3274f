#include "io/file_reader.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace updater {

Result FileReader::Open(std::string path, FileReader& out) {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) return Result::FromErrno("open failed: " + path);

    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0) return Result::FromErrno("stat failed: " + path);
    if (!S_ISREG(st.st_mode)) return Result::Fail(EINVAL, "not a regular file: " + path);

    out.path_ = std::move(path);
    out.fd_ = std::move(fd);
    out.size_ = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        const ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0 || errno != EINTR) return n;
    }
}

} // namespace updater
