#pragma once

#include "update/version_source.hpp"

#include <functional>
#include <string>

namespace updater {

/*
  Version source backed by a release directory:

      <repository_dir>/<channel>/<platform>-<arch>/latest.json
      {"version": "1.4.0", "sha256": "...", "size_bytes": 123, "artifact": "agent-1.4.0"}

  A relative artifact path is resolved against the manifest's directory.
*/
class FileRepositorySource final : public IVersionSource {
public:
    struct Options {
        std::string repository_dir;
        // Downloads land here as <name>.partial and are renamed when complete.
        std::string download_dir;
        // File replaced by Install.
        std::string binary_path;
        // Flushes the directory entry after the binary rename. Defaults to
        // FsyncParentDirectory; a failure there is logged, not returned.
        std::function<Result(const std::string&)> sync_directory;
    };

    explicit FileRepositorySource(Options opt);

    std::expected<VersionInfo, std::string> CheckLatest(const std::string& channel,
                                                        const std::string& platform,
                                                        const std::string& arch) override;
    std::expected<ArtifactHandle, std::string> Download(const VersionInfo& info,
                                                        std::stop_token stop,
                                                        const DownloadProgressFn& progress) override;
    Result Verify(const ArtifactHandle& handle, std::stop_token stop) override;
    Result Install(const ArtifactHandle& handle) override;
    void Discard(const ArtifactHandle& handle) override;

    std::string ManifestPath(const std::string& channel,
                             const std::string& platform,
                             const std::string& arch) const;

private:
    std::string DownloadPath(const VersionInfo& info) const;

    Options opt_;
};

} // namespace updater
