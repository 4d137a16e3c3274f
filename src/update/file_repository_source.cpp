#include "update/file_repository_source.hpp"

#include "crypto/sha256.hpp"
#include "io/durable_file.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/json_utils.hpp"
#include "util/logger.hpp"
#include "util/version.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace updater {

namespace fs = std::filesystem;

namespace {

constexpr const char* kManifestName = "latest.json";

bool IsFileNameSafe(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '.' ||
           c == '-' || c == '_' || c == '+';
}

// Versions become part of a download file name; anything else is replaced.
std::string SanitizeVersion(const std::string& version) {
    std::string out = version;
    std::replace_if(out.begin(), out.end(), [](char c) { return !IsFileNameSafe(c); }, '_');
    return out;
}

} // namespace

FileRepositorySource::FileRepositorySource(Options opt) : opt_(std::move(opt)) {
    if (!opt_.sync_directory) opt_.sync_directory = FsyncParentDirectory;
}

std::string FileRepositorySource::ManifestPath(const std::string& channel,
                                               const std::string& platform,
                                               const std::string& arch) const {
    return (fs::path(opt_.repository_dir) / channel / (platform + "-" + arch) / kManifestName).string();
}

std::string FileRepositorySource::DownloadPath(const VersionInfo& info) const {
    const std::string name = fs::path(info.artifact_url).filename().string();
    return (fs::path(opt_.download_dir) / (SanitizeVersion(info.version) + "-" + name)).string();
}

std::expected<VersionInfo, std::string> FileRepositorySource::CheckLatest(const std::string& channel,
                                                                          const std::string& platform,
                                                                          const std::string& arch) {
    const std::string manifest_path = ManifestPath(channel, platform, arch);

    nlohmann::json j;
    std::string err;
    if (!json_utils::LoadJsonObjectFromFile(manifest_path, j, err)) {
        return std::unexpected("manifest: " + err);
    }

    VersionInfo info;
    info.channel = channel;
    info.platform = platform;
    info.arch = arch;
    std::string artifact;
    if (!json_utils::GetStringIfPresent(j, "version", info.version, err) ||
        !json_utils::GetStringIfPresent(j, "sha256", info.sha256, err) ||
        !json_utils::GetU64IfPresent(j, "size_bytes", info.size_bytes, err) ||
        !json_utils::GetStringIfPresent(j, "artifact", artifact, err)) {
        return std::unexpected("manifest " + manifest_path + ": " + err);
    }
    if (info.version.empty() || !Version::Parse(info.version)) {
        return std::unexpected("manifest " + manifest_path + ": missing or invalid version");
    }
    if (!std::all_of(info.version.begin(), info.version.end(), IsFileNameSafe)) {
        return std::unexpected("manifest " + manifest_path + ": version '" + info.version +
                               "' contains characters outside [A-Za-z0-9._+-]");
    }
    if (info.sha256.size() != 64) {
        return std::unexpected("manifest " + manifest_path + ": sha256 must be 64 hex characters");
    }
    if (artifact.empty()) {
        return std::unexpected("manifest " + manifest_path + ": missing artifact");
    }

    fs::path artifact_path(artifact);
    if (artifact_path.is_relative()) {
        artifact_path = fs::path(manifest_path).parent_path() / artifact_path;
    }
    info.artifact_url = artifact_path.string();

    LogDebug("Repository %s offers %s (%s)", manifest_path.c_str(), info.version.c_str(),
             info.artifact_url.c_str());
    return info;
}

std::expected<ArtifactHandle, std::string> FileRepositorySource::Download(const VersionInfo& info,
                                                                          std::stop_token stop,
                                                                          const DownloadProgressFn& progress) {
    auto dir_res = EnsureDirectory(opt_.download_dir);
    if (!dir_res.is_ok()) return std::unexpected(dir_res.msg);

    FileReader reader;
    auto open_res = FileReader::Open(info.artifact_url, reader);
    if (!open_res.is_ok()) return std::unexpected(open_res.msg);

    std::uint64_t total = info.size_bytes;
    if (total == 0) total = reader.TotalSize().value_or(0);

    const std::string final_path = DownloadPath(info);
    const std::string partial_path = final_path + ".partial";

    FileWriter writer;
    auto wopen = FileWriter::Open(partial_path, writer);
    if (!wopen.is_ok()) return std::unexpected(wopen.msg);

    auto fail = [&](std::string msg) -> std::expected<ArtifactHandle, std::string> {
        (void)writer.Close();
        ::unlink(partial_path.c_str());
        return std::unexpected(std::move(msg));
    };

    std::uint64_t done = 0;
    auto copied = CopyStream(reader, writer, stop, [&](std::uint64_t n) {
        done = n;
        if (progress && total > 0) {
            progress(static_cast<int>(std::min<std::uint64_t>(100, n * 100 / total)));
        }
    });
    if (copied.cancelled()) return fail("download cancelled");
    if (!copied.is_ok()) return fail(copied.WithContext("download of " + info.artifact_url).msg);

    auto sync_res = writer.FsyncNow();
    if (!sync_res.is_ok()) return fail(sync_res.msg);
    auto close_res = writer.Close();
    if (!close_res.is_ok()) {
        ::unlink(partial_path.c_str());
        return std::unexpected(close_res.msg);
    }

    if (std::rename(partial_path.c_str(), final_path.c_str()) != 0) {
        auto err = Result::FromErrno("rename of download failed: " + final_path);
        ::unlink(partial_path.c_str());
        return std::unexpected(err.msg);
    }

    LogInfo("Downloaded %s (%llu bytes) to %s", info.version.c_str(),
            static_cast<unsigned long long>(done), final_path.c_str());
    return ArtifactHandle{.info = info, .path = final_path};
}

Result FileRepositorySource::Verify(const ArtifactHandle& handle, std::stop_token stop) {
    struct stat st {};
    if (::stat(handle.path.c_str(), &st) != 0) {
        return Result::FromErrno("stat failed: " + handle.path);
    }
    if (handle.info.size_bytes > 0 &&
        static_cast<std::uint64_t>(st.st_size) != handle.info.size_bytes) {
        return Result::Fail(-1, "size mismatch: expected=" + std::to_string(handle.info.size_bytes) +
                                    " actual=" + std::to_string(st.st_size));
    }

    std::string actual;
    auto r = Sha256HexFile(handle.path, actual, stop);
    if (!r.is_ok()) return r;

    if (!DigestEquals(actual, handle.info.sha256)) {
        return Result::Fail(-1, "sha256 mismatch: expected=" + handle.info.sha256 + " actual=" + actual);
    }
    return Result::Ok();
}

Result FileRepositorySource::Install(const ArtifactHandle& handle) {
    if (opt_.binary_path.empty()) {
        return Result::Fail(-1, "binary_path is empty");
    }

    const std::string tmp_path = opt_.binary_path + ".new";

    FileReader reader;
    auto open_res = FileReader::Open(handle.path, reader);
    if (!open_res.is_ok()) return open_res;

    FileWriter writer;
    auto wopen = FileWriter::Open(tmp_path, writer, 0755);
    if (!wopen.is_ok()) return wopen;

    auto res = CopyStream(reader, writer);
    if (res.is_ok()) res = writer.FsyncNow();
    if (res.is_ok()) res = writer.Close();
    if (res.is_ok() && ::chmod(tmp_path.c_str(), 0755) != 0) {
        res = Result::FromErrno("chmod failed: " + tmp_path);
    }
    if (!res.is_ok()) {
        ::unlink(tmp_path.c_str());
        return res;
    }

    if (std::rename(tmp_path.c_str(), opt_.binary_path.c_str()) != 0) {
        auto err = Result::FromErrno("atomic rename failed: " + opt_.binary_path);
        ::unlink(tmp_path.c_str());
        return err;
    }

    // The binary is replaced once the rename succeeds, so Install reports success from here on.
    auto dir_res = opt_.sync_directory(opt_.binary_path);
    if (!dir_res.is_ok()) {
        LogWarn("Installed %s but the directory sync failed: %s", handle.info.version.c_str(),
                dir_res.msg.c_str());
    }

    LogInfo("Installed %s to %s", handle.info.version.c_str(), opt_.binary_path.c_str());
    return Result::Ok();
}

void FileRepositorySource::Discard(const ArtifactHandle& handle) {
    if (handle.path.empty()) return;
    for (const std::string& p : {handle.path, handle.path + ".partial"}) {
        if (::unlink(p.c_str()) != 0 && errno != ENOENT) {
            LogWarn("Could not remove %s: %s", p.c_str(), std::strerror(errno));
        }
    }
}

} // namespace updater
