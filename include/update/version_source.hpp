#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>

namespace updater {

struct VersionInfo {
    std::string version;
    std::string channel;
    std::string platform;
    std::string arch;
    std::string sha256;
    std::uint64_t size_bytes = 0;
    std::string artifact_url;
};

struct ArtifactHandle {
    VersionInfo info;
    // Local path of the downloaded artifact.
    std::string path;
};

// Download progress in percent of the artifact, 0..100.
using DownloadProgressFn = std::function<void(int)>;

class IVersionSource {
public:
    virtual ~IVersionSource() = default;

    virtual std::expected<VersionInfo, std::string> CheckLatest(const std::string& channel,
                                                                const std::string& platform,
                                                                const std::string& arch) = 0;

    // Returns an error mentioning cancellation once stop is requested.
    virtual std::expected<ArtifactHandle, std::string> Download(const VersionInfo& info,
                                                                std::stop_token stop,
                                                                const DownloadProgressFn& progress) = 0;

    virtual Result Verify(const ArtifactHandle& handle, std::stop_token stop) = 0;

    // Replaces the running binary. Not interruptible. An error means the old
    // binary is still the one that will start next.
    virtual Result Install(const ArtifactHandle& handle) = 0;

    // Removes whatever Download left behind.
    virtual void Discard(const ArtifactHandle& handle) { (void)handle; }
};

} // namespace updater
