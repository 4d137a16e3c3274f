#include "update/update_status.hpp"

namespace updater {

const char* ToString(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::Idle:            return "idle";
        case UpdateStatus::Checking:        return "checking";
        case UpdateStatus::UpToDate:        return "up_to_date";
        case UpdateStatus::Available:       return "available";
        case UpdateStatus::Downloading:     return "downloading";
        case UpdateStatus::Verifying:       return "verifying";
        case UpdateStatus::Installing:      return "installing";
        case UpdateStatus::AwaitingRestart: return "awaiting_restart";
        case UpdateStatus::Validating:      return "validating";
        case UpdateStatus::Succeeded:       return "succeeded";
        case UpdateStatus::Failed:          return "failed";
        case UpdateStatus::RolledBack:      return "rolled_back";
        case UpdateStatus::Cancelled:       return "cancelled";
    }
    return "unknown";
}

bool IsCancellable(UpdateStatus status) {
    return status == UpdateStatus::Checking || status == UpdateStatus::Downloading ||
           status == UpdateStatus::Verifying;
}

bool IsTerminal(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::UpToDate:
        case UpdateStatus::Succeeded:
        case UpdateStatus::Failed:
        case UpdateStatus::RolledBack:
        case UpdateStatus::Cancelled:
            return true;
        default:
            return false;
    }
}

} // namespace updater
