#pragma once

#include <string_view>

namespace updater {

enum class UpdateStatus {
    Idle,
    Checking,
    UpToDate,
    Available,
    Downloading,
    Verifying,
    Installing,
    AwaitingRestart,
    Validating,
    Succeeded,
    Failed,
    RolledBack,
    Cancelled,
};

const char* ToString(UpdateStatus status);

// Checking, Downloading and Verifying.
bool IsCancellable(UpdateStatus status);
// A session ends (and the manager returns to Idle) after one of these.
bool IsTerminal(UpdateStatus status);

// Codes carried in ProgressEvent::error ("CODE: detail") and telemetry.
namespace error_code {
inline constexpr std::string_view kServerError = "SERVER_ERROR";
inline constexpr std::string_view kDownloadFailed = "DOWNLOAD_FAILED";
inline constexpr std::string_view kInsufficientSpace = "INSUFFICIENT_SPACE";
inline constexpr std::string_view kHashMismatch = "HASH_MISMATCH";
inline constexpr std::string_view kMarkerWriteFailed = "MARKER_WRITE_FAILED";
inline constexpr std::string_view kApplyFailed = "APPLY_FAILED";
inline constexpr std::string_view kRestartFailed = "RESTART_FAILED";
inline constexpr std::string_view kVersionMismatch = "VERSION_MISMATCH";
inline constexpr std::string_view kHealthCheck = "HEALTH_CHECK";
inline constexpr std::string_view kRolledBack = "ROLLED_BACK";
inline constexpr std::string_view kPolicyDisabled = "POLICY_DISABLED";
inline constexpr std::string_view kCancelled = "CANCELLED";
} // namespace error_code

} // namespace updater
