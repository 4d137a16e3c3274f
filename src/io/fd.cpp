#include "io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace updater {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

Result Fd::OpenDirectory(const std::string& path, Fd& out) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return Result::FromErrno("Failed to open directory: " + path);
    }
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

void Fd::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

Result Fd::CloseChecked() {
    if (fd_ < 0) return Result::Ok();
    const int fd = Release();
    if (::close(fd) != 0) {
        return Result::FromErrno("close failed");
    }
    return Result::Ok();
}

} // namespace updater
