#pragma once

#include "policy/policy_store.hpp"
#include "update/async_dispatcher.hpp"
#include "update/failed_version_store.hpp"
#include "update/post_update_validator.hpp"
#include "update/progress_hub.hpp"
#include "update/rollback_marker.hpp"
#include "update/telemetry.hpp"
#include "update/version_source.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace updater {

struct UpdateSession {
    UpdateStatus status = UpdateStatus::Idle;
    std::string target_version;
    int progress = 0;
    std::string message;
    bool cancellable = false;
    TimePoint started_at{};
    std::string run_id;
    bool forced = false;
    std::string reason;
};

struct ManagerStatus {
    UpdateSession session;
    std::string current_version;
    std::string latest_version;
    std::optional<TimePoint> last_check;
    std::optional<TimePoint> next_check;
    bool enabled = false;
    PolicySource policy_source = PolicySource::Disabled;
    int update_check_days = 0;
    std::string channel;
    std::string platform;
    std::string arch;
    std::optional<FailedVersionRecord> excluded;
};

nlohmann::json ToJson(const ManagerStatus& status);

// Operations the command layer drives.
class IUpdateController {
public:
    virtual ~IUpdateController() = default;

    virtual Result CheckNow(std::stop_token stop) = 0;
    virtual bool Cancel() = 0;
    virtual Result ForceInstallLatest(std::stop_token stop, const std::string& reason) = 0;
};

/*
  Owns the update session and drives it through
  Checking -> Available -> Downloading -> Verifying -> Installing -> AwaitingRestart.

  At most one session is live; CheckNow and ForceInstallLatest fail with
  EBUSY while one is. Every state change is published to the ProgressHub in
  transition order. Long phases run without holding the state lock, so
  Status() never waits on I/O.

  Observers run on the publishing thread and may call Status() and Cancel().
  A Cancel() made from an observer is published after the event being
  delivered. CheckNow, ForceInstallLatest and ValidatePostUpdate called from
  an observer fail with EDEADLK.
*/
class UpdateManager final : public IUpdateController {
public:
    struct Options {
        std::string current_version;
        std::string channel = "stable";
        std::string platform = "linux";
        std::string arch = "amd64";
        // Holds rollback_marker.json and failed_version.json.
        std::string state_dir;
        std::chrono::hours failed_version_cooldown{72};
        // Length of one update_check_days unit.
        std::chrono::milliseconds check_period_unit = std::chrono::hours(24);
        // Retry delay for a scheduled check that fell outside the maintenance window.
        std::chrono::milliseconds maintenance_retry = std::chrono::minutes(15);
        double max_jitter_fraction = 0.10;
        // A download needs three times the artifact size free under
        // state_dir (download, staging, backup), and never less than this.
        std::uint64_t min_free_space_bytes = 200ull * 1024 * 1024;
        // Reports free bytes for a path. Defaults to AvailableBytes; when it
        // fails the download goes ahead.
        std::function<Result(const std::string&, std::uint64_t&)> free_space;
        // Called after AwaitingRestart. Returning at all (success) leaves the
        // session in AwaitingRestart until the process exits.
        std::function<Result()> restart_hook;
        IHealthProbe* health_probe = nullptr;
        Clock clock = SystemClock();
    };

    UpdateManager(Options opt,
                  IPolicyProvider& policy,
                  IVersionSource& source,
                  ProgressHub& hub,
                  ITelemetrySink* telemetry = nullptr);
    ~UpdateManager() override;

    UpdateManager(const UpdateManager&) = delete;
    UpdateManager& operator=(const UpdateManager&) = delete;

    // Validates a pending update once, then starts the periodic check loop.
    // Stop requested on stop cancels cancellable sessions and ends the loop.
    void Start(std::stop_token stop);
    void Stop();

    Result CheckNow(std::stop_token stop) override;
    bool Cancel() override;
    Result ForceInstallLatest(std::stop_token stop, const std::string& reason) override;

    ValidationOutcome ValidatePostUpdate();

    // Re-resolves the policy and reschedules the periodic loop.
    void NotifyPolicyChanged();

    ManagerStatus Status() const;
    EffectivePolicy CurrentPolicy() const;

    // Waits for queued telemetry reports.
    void FlushTelemetry();

    std::string RollbackMarkerPath() const;
    std::string FailedVersionPath() const;

private:
    Result RunSession(std::stop_token outer, bool forced, const std::string& reason);
    Result BeginSession(bool forced, const std::string& reason, std::stop_source& session_stop);

    // Both return false when the session was cancelled in the meantime.
    bool Transition(UpdateStatus status, int progress, std::string message,
                    const std::string& target = {});
    bool UpdateDownloadProgress(int progress);

    Result Finish(UpdateStatus status, int progress, std::string message,
                  std::string_view code = {}, const std::string& detail = {});
    Result Fail(std::string_view code, const std::string& detail);
    Result EndCancelled();

    // Delivers ev, then any events queued by observers calling back in.
    void Publish(const ProgressEvent& ev);
    Result CheckDiskSpace(std::uint64_t artifact_bytes) const;
    EffectivePolicy ResolvePolicy();
    void Report(const UpdateSession& s, std::string_view code, const std::string& detail);

    void Loop(std::stop_token stop);
    std::optional<std::chrono::milliseconds> Period(const EffectivePolicy& p) const;

    Options opt_;
    IPolicyProvider& policy_provider_;
    IVersionSource& source_;
    ProgressHub& hub_;
    ITelemetrySink* telemetry_;

    RollbackMarkerStore markers_;
    FailedVersionStore failed_;
    PostUpdateValidator validator_;

    // Serializes "mutate + publish" so events leave in transition order.
    std::mutex emit_mu_;

    mutable std::shared_mutex mu_;
    std::optional<UpdateSession> session_;
    std::stop_source session_stop_;
    EffectivePolicy policy_;
    std::string latest_version_;
    std::optional<TimePoint> last_check_;
    std::optional<TimePoint> next_check_;

    std::mutex wake_mu_;
    std::condition_variable_any wake_cv_;
    bool wake_ = false;

    std::mt19937_64 rng_;
    std::optional<std::stop_callback<std::function<void()>>> outer_stop_;
    std::jthread loop_;
    AsyncDispatcher telemetry_queue_;
};

} // namespace updater
