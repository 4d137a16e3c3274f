#pragma once

#include "util/clock.hpp"
#include "util/result.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace updater {

struct FailedVersionRecord {
    std::string version;
    TimePoint failed_at{};
    TimePoint excluded_until{};
    std::string reason;
};

// Remembers the last version that failed to come up and keeps it from
// being proposed again until the cool-down expires. Only that exact
// version is excluded; newer releases are proposed as usual.
class FailedVersionStore {
public:
    FailedVersionStore(std::string path, Clock clock = SystemClock());

    // Reads the persisted record; a missing or corrupt file means no exclusion.
    void Load();

    Result Record(const std::string& version, const std::string& reason, std::chrono::hours cooldown);

    bool IsExcluded(const std::string& version) const;

    // The record while its cool-down is running.
    std::optional<FailedVersionRecord> Active() const;

    // Clears the record if it names version.
    Result ClearFor(const std::string& version);
    Result Clear();

private:
    Result ClearLocked();

    std::string path_;
    Clock clock_;
    mutable std::mutex mu_;
    std::optional<FailedVersionRecord> record_;
};

} // namespace updater
