#pragma once

#include "update/failed_version_store.hpp"
#include "update/rollback_marker.hpp"
#include "update/update_status.hpp"
#include "util/result.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace updater {

// Optional check that the freshly started binary is actually healthy.
class IHealthProbe {
public:
    virtual ~IHealthProbe() = default;
    virtual Result Check() = 0;
};

struct ValidationOutcome {
    bool was_updated = false;
    std::string from_version;
    std::string to_version;
    // Idle when no marker was found; otherwise Succeeded, Failed or RolledBack.
    UpdateStatus status = UpdateStatus::Idle;
    Result result;
    std::string run_id;
    // Set on failure; result.msg is "<error_code>: <detail>".
    std::string error_code;
    std::string detail;
};

class PostUpdateValidator {
public:
    PostUpdateValidator(RollbackMarkerStore& markers,
                        FailedVersionStore& failed,
                        std::chrono::hours cooldown,
                        IHealthProbe* probe = nullptr);

    // Reads the marker. Unreadable or corrupt markers are logged, removed and
    // reported as absent.
    std::optional<RollbackMarker> TakeMarker();

    // Compares the marker against the running version, runs the probe when the
    // versions match, then clears the marker and updates the exclusion record.
    ValidationOutcome Judge(const RollbackMarker& marker, const std::string& running_version);

private:
    void ClearMarker();

    RollbackMarkerStore& markers_;
    FailedVersionStore& failed_;
    std::chrono::hours cooldown_;
    IHealthProbe* probe_;
};

} // namespace updater
