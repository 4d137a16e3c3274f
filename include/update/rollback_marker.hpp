#pragma once

#include "util/clock.hpp"
#include "util/result.hpp"

#include <expected>
#include <optional>
#include <string>

namespace updater {

// Written right before the binary is replaced; its presence on startup
// means the process runs after a self-initiated update.
struct RollbackMarker {
    std::string previous_version;
    std::string expected_new_version;
    TimePoint timestamp{};
    std::string run_id;
};

class RollbackMarkerStore {
public:
    explicit RollbackMarkerStore(std::string path);

    // tmp + fsync + rename + fsync(dir).
    Result Write(const RollbackMarker& marker);

    // nullopt when absent; an error when present but unreadable or corrupt.
    std::expected<std::optional<RollbackMarker>, std::string> Load() const;

    Result Clear();

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

} // namespace updater
