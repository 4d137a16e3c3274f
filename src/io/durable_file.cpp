#include "io/durable_file.hpp"

#include "io/fd.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <sys/statvfs.h>
#include <unistd.h>

namespace updater {

Result FsyncParentDirectory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) parent = ".";

    Fd dir;
    auto open_res = Fd::OpenDirectory(parent.string(), dir);
    if (!open_res.is_ok()) return open_res;

    if (::fsync(dir.Get()) != 0) {
        return Result::FromErrno("fsync failed on directory: " + parent.string());
    }
    return Result::Ok();
}

Result AvailableBytes(const std::string& path, std::uint64_t& out) {
    std::filesystem::path at = path.empty() ? std::filesystem::path(".") : std::filesystem::path(path);
    std::error_code ec;
    while (!std::filesystem::exists(at, ec) && at.has_parent_path() && at != at.parent_path()) {
        at = at.parent_path();
    }

    struct statvfs st {};
    if (::statvfs(at.c_str(), &st) != 0) {
        return Result::FromErrno("statvfs failed: " + at.string());
    }
    out = static_cast<std::uint64_t>(st.f_bavail) * static_cast<std::uint64_t>(st.f_frsize);
    return Result::Ok();
}

Result EnsureDirectory(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return Result::Fail(ec.value(), "create_directories failed: " + path + ": " + ec.message());
    }
    return Result::Ok();
}

Result WriteFileDurably(const std::string& path, std::string_view content, mode_t mode) {
    const std::string tmp_path = path + ".tmp";

    FileWriter writer;
    auto open_res = FileWriter::Open(tmp_path, writer, mode);
    if (!open_res.is_ok()) return open_res;

    auto res = writer.WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(content.data()), content.size()));
    if (res.is_ok()) res = writer.FsyncNow();
    if (res.is_ok()) res = writer.Close();
    if (!res.is_ok()) {
        ::unlink(tmp_path.c_str());
        return res;
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        auto err = Result::FromErrno("atomic rename failed: " + path);
        ::unlink(tmp_path.c_str());
        return err;
    }

    return FsyncParentDirectory(path);
}

Result RemoveFileDurably(const std::string& path) {
    if (::unlink(path.c_str()) != 0) {
        if (errno == ENOENT) return Result::Ok();
        return Result::FromErrno("unlink failed: " + path);
    }
    return FsyncParentDirectory(path);
}

Result ReadFileToString(const std::string& path, std::string& out) {
    out.clear();

    FileReader reader;
    auto open_res = FileReader::Open(path, reader);
    if (!open_res.is_ok()) return open_res;

    std::array<std::uint8_t, 4096> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::FromErrno("read failed: " + path);
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return Result::Ok();
}

} // namespace updater
