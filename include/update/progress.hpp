#pragma once

#include "update/update_status.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace updater {

struct ProgressEvent {
    UpdateStatus status = UpdateStatus::Idle;
    std::string target_version;
    // 0..100 within a session, -1 on Failed/Cancelled/RolledBack.
    int progress = 0;
    std::string message;
    // "CODE: detail"; empty unless the event reports a failure.
    std::string error;
};

// Local observer, called synchronously on the publishing thread. See
// UpdateManager for which manager calls an observer may make.
class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

// Remote delivery, called from the hub's dispatcher thread.
class IProgressChannel {
  public:
    virtual ~IProgressChannel() = default;
    virtual Result Send(const ProgressEvent& e) = 0;
};

// target_version and error are omitted when empty.
nlohmann::json ToJson(const ProgressEvent& e);

} // namespace updater
