#include "update/update_manager.hpp"

#include "io/durable_file.hpp"
#include "policy/policy_resolver.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <vector>

namespace updater {

namespace {

constexpr int kAvailablePercent = 10;
constexpr int kDownloadStartPercent = 10;
constexpr int kDownloadSpanPercent = 60;
constexpr int kVerifyingPercent = 75;
constexpr int kInstallingPercent = 85;
constexpr int kValidatingPercent = 50;
constexpr int kDonePercent = 100;
constexpr int kErrorPercent = -1;
constexpr std::uint64_t kSpaceFactor = 3;
constexpr std::uint64_t kMiB = 1024 * 1024;

int ScaleDownload(int pct) {
    return kDownloadStartPercent + std::clamp(pct, 0, 100) * kDownloadSpanPercent / 100;
}

std::string NewRunId(TimePoint now) {
    std::random_device rd;
    std::uniform_int_distribution<std::uint32_t> dist;
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%lld-%08x", static_cast<long long>(ToUnixSeconds(now)), dist(rd));
    return buf;
}

std::string WithCode(std::string_view code, const std::string& detail) {
    return std::string(code) + ": " + detail;
}

ProgressEvent ToEvent(const UpdateSession& s) {
    return ProgressEvent{
        .status = s.status,
        .target_version = s.target_version,
        .progress = s.progress,
        .message = s.message,
        .error = {},
    };
}

// Set while this thread delivers a manager's events to its observers.
// Operations an observer calls back into see it instead of re-locking emit_mu_.
struct PublishScope {
    const void* owner = nullptr;
    std::vector<ProgressEvent>* deferred = nullptr;
};

thread_local PublishScope t_publishing;

nlohmann::json TimeOrNull(const std::optional<TimePoint>& tp) {
    if (!tp) return nullptr;
    return ToUnixSeconds(*tp);
}

} // namespace

nlohmann::json ToJson(const ManagerStatus& s) {
    nlohmann::json j{
        {"status", ToString(s.session.status)},
        {"target_version", s.session.target_version},
        {"progress", s.session.progress},
        {"message", s.session.message},
        {"cancellable", s.session.cancellable},
        {"run_id", s.session.run_id},
        {"current_version", s.current_version},
        {"latest_version", s.latest_version},
        {"last_check", TimeOrNull(s.last_check)},
        {"next_check", TimeOrNull(s.next_check)},
        {"enabled", s.enabled},
        {"policy_source", ToString(s.policy_source)},
        {"update_check_days", s.update_check_days},
        {"channel", s.channel},
        {"platform", s.platform},
        {"arch", s.arch},
    };
    if (s.session.status != UpdateStatus::Idle) {
        j["started_at"] = ToUnixSeconds(s.session.started_at);
        j["forced"] = s.session.forced;
        if (!s.session.reason.empty()) j["reason"] = s.session.reason;
    }
    if (s.excluded) {
        j["excluded_version"] = s.excluded->version;
        j["excluded_until"] = ToUnixSeconds(s.excluded->excluded_until);
    }
    return j;
}

UpdateManager::UpdateManager(Options opt,
                             IPolicyProvider& policy,
                             IVersionSource& source,
                             ProgressHub& hub,
                             ITelemetrySink* telemetry)
    : opt_(std::move(opt)),
      policy_provider_(policy),
      source_(source),
      hub_(hub),
      telemetry_(telemetry),
      markers_((std::filesystem::path(opt_.state_dir) / "rollback_marker.json").string()),
      failed_((std::filesystem::path(opt_.state_dir) / "failed_version.json").string(), opt_.clock),
      validator_(markers_, failed_, opt_.failed_version_cooldown, opt_.health_probe),
      rng_(std::random_device{}()),
      telemetry_queue_("telemetry", 32) {
    if (!opt_.free_space) opt_.free_space = AvailableBytes;
    failed_.Load();
    ResolvePolicy();
}

UpdateManager::~UpdateManager() {
    Stop();
    telemetry_queue_.Shutdown();
}

std::string UpdateManager::RollbackMarkerPath() const { return markers_.Path(); }

std::string UpdateManager::FailedVersionPath() const {
    return (std::filesystem::path(opt_.state_dir) / "failed_version.json").string();
}

void UpdateManager::Start(std::stop_token stop) {
    if (loop_.joinable()) {
        LogWarn("Update manager already started");
        return;
    }

    const auto outcome = ValidatePostUpdate();
    if (outcome.was_updated) {
        LogInfo("Post-update validation %s -> %s: %s", outcome.from_version.c_str(),
                outcome.to_version.c_str(), ToString(outcome.status));
    }

    loop_ = std::jthread([this](std::stop_token st) { Loop(st); });
    outer_stop_.emplace(stop, [this] { loop_.request_stop(); });
}

void UpdateManager::Stop() {
    outer_stop_.reset();
    if (loop_.joinable()) {
        loop_.request_stop();
        loop_.join();
    }
}

Result UpdateManager::CheckNow(std::stop_token stop) {
    return RunSession(stop, false, {});
}

Result UpdateManager::ForceInstallLatest(std::stop_token stop, const std::string& reason) {
    return RunSession(stop, true, reason);
}

bool UpdateManager::Cancel() {
    const bool nested = t_publishing.owner == this;
    std::unique_lock<std::mutex> emit(emit_mu_, std::defer_lock);
    if (!nested) emit.lock();
    ProgressEvent ev;
    {
        std::unique_lock lock(mu_);
        if (!session_ || !IsCancellable(session_->status)) return false;
        session_->status = UpdateStatus::Cancelled;
        session_->progress = kErrorPercent;
        session_->message = "Update cancelled";
        session_->cancellable = false;
        session_stop_.request_stop();
        ev = ToEvent(*session_);
    }
    if (nested) {
        t_publishing.deferred->push_back(std::move(ev));
    } else {
        Publish(ev);
    }
    LogInfo("Update session cancelled");
    return true;
}

EffectivePolicy UpdateManager::ResolvePolicy() {
    const auto fleet = policy_provider_.GetFleetPolicy();
    EffectivePolicy p = PolicyResolver::Resolve(policy_provider_.GetAutoUpdateMode(),
                                                policy_provider_.GetLocalPolicy(), fleet.get());
    std::unique_lock lock(mu_);
    policy_ = p;
    return p;
}

EffectivePolicy UpdateManager::CurrentPolicy() const {
    std::shared_lock lock(mu_);
    return policy_;
}

void UpdateManager::NotifyPolicyChanged() {
    const auto p = ResolvePolicy();
    LogInfo("Update policy changed: source=%s enabled=%d check_days=%d strategy=%s",
            ToString(p.source), p.enabled ? 1 : 0, p.spec.update_check_days, ToString(p.spec.strategy));
    {
        std::lock_guard lock(wake_mu_);
        wake_ = true;
    }
    wake_cv_.notify_all();
}

ManagerStatus UpdateManager::Status() const {
    ManagerStatus s;
    {
        std::shared_lock lock(mu_);
        s.session = session_.value_or(UpdateSession{});
        s.latest_version = latest_version_;
        s.last_check = last_check_;
        s.next_check = next_check_;
        s.enabled = policy_.enabled;
        s.policy_source = policy_.source;
        s.update_check_days = policy_.spec.update_check_days;
    }
    s.current_version = opt_.current_version;
    s.channel = opt_.channel;
    s.platform = opt_.platform;
    s.arch = opt_.arch;
    s.excluded = failed_.Active();
    return s;
}

void UpdateManager::FlushTelemetry() { telemetry_queue_.WaitIdle(); }

void UpdateManager::Publish(const ProgressEvent& ev) {
    std::vector<ProgressEvent> deferred;
    const PublishScope saved = t_publishing;
    t_publishing = {.owner = this, .deferred = &deferred};
    hub_.Publish(ev);
    for (std::size_t i = 0; i < deferred.size(); ++i) {
        const ProgressEvent next = deferred[i];
        hub_.Publish(next);
    }
    t_publishing = saved;
}

Result UpdateManager::BeginSession(bool forced, const std::string& reason, std::stop_source& session_stop) {
    if (t_publishing.owner == this) {
        return Result::Fail(EDEADLK, "cannot start an update session from a progress observer");
    }
    const EffectivePolicy policy = ResolvePolicy();

    std::lock_guard emit(emit_mu_);
    ProgressEvent ev;
    {
        std::unique_lock lock(mu_);
        if (session_) {
            return Result::Fail(EBUSY, std::string("update operation already in progress: ") +
                                           ToString(session_->status));
        }
        if (!policy.enabled) {
            ev.status = UpdateStatus::Failed;
            ev.progress = kErrorPercent;
            ev.message = forced ? "Forced update refused: auto-update is disabled"
                                : "Update check refused: auto-update is disabled";
            ev.error = WithCode(error_code::kPolicyDisabled, "auto-update mode is never");
        } else {
            const TimePoint now = opt_.clock();
            session_ = UpdateSession{
                .status = UpdateStatus::Checking,
                .target_version = {},
                .progress = 0,
                .message = forced ? "Checking for updates (forced)" : "Checking for updates",
                .cancellable = true,
                .started_at = now,
                .run_id = NewRunId(now),
                .forced = forced,
                .reason = reason,
            };
            session_stop_ = std::stop_source();
            session_stop = session_stop_;
            ev = ToEvent(*session_);
        }
    }
    Publish(ev);

    if (!policy.enabled) {
        LogWarn("%s", ev.message.c_str());
        return Result::Fail(EPERM, ev.error);
    }
    return Result::Ok();
}

bool UpdateManager::Transition(UpdateStatus status, int progress, std::string message,
                               const std::string& target) {
    std::lock_guard emit(emit_mu_);
    ProgressEvent ev;
    UpdateSession snap;
    bool collect = false;
    {
        std::unique_lock lock(mu_);
        if (!session_ || session_->status == UpdateStatus::Cancelled) return false;
        if (IsCancellable(session_->status) && session_stop_.stop_requested()) return false;

        session_->status = status;
        session_->progress = std::max(session_->progress, progress);
        session_->message = std::move(message);
        session_->cancellable = IsCancellable(status);
        if (!target.empty()) session_->target_version = target;
        ev = ToEvent(*session_);
        snap = *session_;
        collect = policy_.spec.collect_telemetry;
    }
    Publish(ev);

    if (collect && (status == UpdateStatus::Available || status == UpdateStatus::AwaitingRestart)) {
        Report(snap, {}, {});
    }
    return true;
}

bool UpdateManager::UpdateDownloadProgress(int progress) {
    std::lock_guard emit(emit_mu_);
    ProgressEvent ev;
    {
        std::unique_lock lock(mu_);
        if (!session_ || session_->status != UpdateStatus::Downloading) return false;
        if (session_stop_.stop_requested()) return false;
        if (progress <= session_->progress) return true;
        session_->progress = progress;
        session_->message = "Downloading " + session_->target_version;
        ev = ToEvent(*session_);
    }
    Publish(ev);
    return true;
}

Result UpdateManager::Finish(UpdateStatus status, int progress, std::string message,
                             std::string_view code, const std::string& detail) {
    std::lock_guard emit(emit_mu_);
    ProgressEvent ev;
    UpdateSession snap;
    bool collect = false;
    bool cancelled = false;
    {
        std::unique_lock lock(mu_);
        if (!session_) return Result::Fail(-1, "no update session");

        if (session_->status == UpdateStatus::Cancelled) {
            // Cancel() already published the terminal event.
            cancelled = true;
        } else {
            session_->status = status;
            session_->progress = progress < 0 ? kErrorPercent : std::max(session_->progress, progress);
            session_->message = std::move(message);
            session_->cancellable = false;
            ev = ToEvent(*session_);
            if (!code.empty()) ev.error = WithCode(code, detail);
        }
        snap = *session_;
        collect = policy_.spec.collect_telemetry;
        session_.reset();
    }

    if (cancelled) {
        if (collect) Report(snap, error_code::kCancelled, snap.message);
        return Result::Fail(ECANCELED, snap.message);
    }

    Publish(ev);
    if (collect) Report(snap, code, detail);
    if (code.empty()) return Result::Ok();
    return Result::Fail(-1, ev.error);
}

Result UpdateManager::Fail(std::string_view code, const std::string& detail) {
    LogError("Update failed (%.*s): %s", static_cast<int>(code.size()), code.data(), detail.c_str());
    return Finish(UpdateStatus::Failed, kErrorPercent, "Update failed: " + detail, code, detail);
}

Result UpdateManager::EndCancelled() {
    std::lock_guard emit(emit_mu_);
    std::optional<ProgressEvent> ev;
    UpdateSession snap;
    bool collect = false;
    {
        std::unique_lock lock(mu_);
        if (!session_) return Result::Fail(ECANCELED, "update cancelled");
        if (session_->status != UpdateStatus::Cancelled) {
            session_->status = UpdateStatus::Cancelled;
            session_->progress = kErrorPercent;
            session_->message = "Update cancelled: agent shutting down";
            session_->cancellable = false;
            ev = ToEvent(*session_);
        }
        snap = *session_;
        collect = policy_.spec.collect_telemetry;
        session_.reset();
    }

    if (ev) Publish(*ev);
    if (collect) Report(snap, error_code::kCancelled, snap.message);
    LogInfo("%s", snap.message.c_str());
    return Result::Fail(ECANCELED, snap.message);
}

void UpdateManager::Report(const UpdateSession& s, std::string_view code, const std::string& detail) {
    if (!telemetry_) return;

    TelemetryPayload payload{
        .run_id = s.run_id,
        .status = s.status,
        .current_version = opt_.current_version,
        .target_version = s.target_version,
        .download_time_ms = 0,
        .size_bytes = 0,
        .error_code = std::string(code),
        .error_message = detail,
        .reason = s.reason,
        .timestamp = opt_.clock(),
    };
    const bool queued = telemetry_queue_.Post([this, payload] {
        auto r = telemetry_->ReportUpdateStatus(payload);
        if (!r.is_ok()) {
            LogWarn("Telemetry report (%s) failed: %s", ToString(payload.status), r.msg.c_str());
        }
    });
    if (!queued) LogDebug("Telemetry queue closed; report dropped");
}

Result UpdateManager::CheckDiskSpace(std::uint64_t artifact_bytes) const {
    const std::uint64_t required = std::max(artifact_bytes * kSpaceFactor, opt_.min_free_space_bytes);

    std::uint64_t available = 0;
    auto r = opt_.free_space(opt_.state_dir, available);
    if (!r.is_ok()) {
        LogWarn("Free space check failed, continuing: %s", r.msg.c_str());
        return Result::Ok();
    }
    if (available < required) {
        return Result::Fail(ENOSPC, "insufficient disk space: need " + std::to_string(required / kMiB) +
                                        " MB, have " + std::to_string(available / kMiB) + " MB");
    }
    return Result::Ok();
}

Result UpdateManager::RunSession(std::stop_token outer, bool forced, const std::string& reason) {
    std::stop_source session_src;
    auto begun = BeginSession(forced, reason, session_src);
    if (!begun.is_ok()) return begun;

    std::stop_callback on_shutdown(outer, [session_src]() mutable { session_src.request_stop(); });
    const std::stop_token stop = session_src.get_token();

    const EffectivePolicy policy = CurrentPolicy();
    const std::string& current = opt_.current_version;

    auto latest = source_.CheckLatest(opt_.channel, opt_.platform, opt_.arch);
    {
        std::unique_lock lock(mu_);
        last_check_ = opt_.clock();
        if (latest) latest_version_ = latest->version;
    }
    if (stop.stop_requested()) return EndCancelled();
    if (!latest) return Fail(error_code::kServerError, "version check failed: " + latest.error());

    const VersionInfo info = *latest;
    if (!forced) {
        const auto eligibility = PolicyResolver::CheckEligibility(policy.spec, current, info.version);
        if (!eligibility.eligible) {
            LogInfo("No update: %s", eligibility.reason.c_str());
            return Finish(UpdateStatus::UpToDate, kDonePercent, "Up to date: " + eligibility.reason);
        }
        if (failed_.IsExcluded(info.version)) {
            LogWarn("Version %s failed recently; not proposing it again yet", info.version.c_str());
            return Finish(UpdateStatus::UpToDate, kDonePercent,
                          "Up to date: version " + info.version + " recently failed and is excluded");
        }
    } else {
        LogInfo("Forced install of %s requested (reason: %s)", info.version.c_str(),
                reason.empty() ? "none" : reason.c_str());
    }

    if (!Transition(UpdateStatus::Available, kAvailablePercent,
                    "Update available: " + info.version, info.version)) {
        return EndCancelled();
    }
    auto space = CheckDiskSpace(info.size_bytes);
    if (!space.is_ok()) return Fail(error_code::kInsufficientSpace, space.msg);

    if (!Transition(UpdateStatus::Downloading, kDownloadStartPercent, "Downloading " + info.version)) {
        return EndCancelled();
    }

    auto handle = source_.Download(info, stop, [this](int pct) { UpdateDownloadProgress(ScaleDownload(pct)); });
    if (!handle) {
        if (stop.stop_requested()) return EndCancelled();
        return Fail(error_code::kDownloadFailed, handle.error());
    }

    if (!Transition(UpdateStatus::Verifying, kVerifyingPercent, "Verifying " + info.version)) {
        source_.Discard(*handle);
        return EndCancelled();
    }
    auto verified = source_.Verify(*handle, stop);
    if (stop.stop_requested()) {
        source_.Discard(*handle);
        return EndCancelled();
    }
    if (!verified.is_ok()) {
        source_.Discard(*handle);
        return Fail(error_code::kHashMismatch, verified.msg);
    }

    // Cancel is refused from here on.
    if (!Transition(UpdateStatus::Installing, kInstallingPercent, "Installing " + info.version)) {
        source_.Discard(*handle);
        return EndCancelled();
    }

    std::string run_id;
    {
        std::shared_lock lock(mu_);
        if (session_) run_id = session_->run_id;
    }
    const RollbackMarker marker{
        .previous_version = current,
        .expected_new_version = info.version,
        .timestamp = opt_.clock(),
        .run_id = run_id,
    };
    auto written = markers_.Write(marker);
    if (!written.is_ok()) {
        source_.Discard(*handle);
        return Fail(error_code::kMarkerWriteFailed, written.msg);
    }

    auto installed = source_.Install(*handle);
    source_.Discard(*handle);
    if (!installed.is_ok()) {
        auto cleared = markers_.Clear();
        if (!cleared.is_ok()) {
            LogError("Could not remove rollback marker after failed install: %s", cleared.msg.c_str());
        }
        return Fail(error_code::kApplyFailed, installed.msg);
    }

    if (!Transition(UpdateStatus::AwaitingRestart, kDonePercent,
                    "Update to " + info.version + " installed; restart required")) {
        LogWarn("Session ended before restart could be announced");
    }

    if (opt_.restart_hook) {
        auto restarted = opt_.restart_hook();
        if (!restarted.is_ok()) {
            return Fail(error_code::kRestartFailed, restarted.msg);
        }
    }
    return Result::Ok();
}

ValidationOutcome UpdateManager::ValidatePostUpdate() {
    if (t_publishing.owner == this) {
        ValidationOutcome nested;
        nested.result = Result::Fail(EDEADLK, "cannot validate an update from a progress observer");
        return nested;
    }
    {
        std::shared_lock lock(mu_);
        if (session_) {
            ValidationOutcome busy;
            busy.result = Result::Fail(EBUSY, std::string("update operation already in progress: ") +
                                                  ToString(session_->status));
            return busy;
        }
    }

    auto marker = validator_.TakeMarker();
    if (!marker) return ValidationOutcome{};

    {
        std::lock_guard emit(emit_mu_);
        ProgressEvent ev;
        {
            std::unique_lock lock(mu_);
            if (session_) {
                ValidationOutcome busy;
                busy.result = Result::Fail(EBUSY, "update operation already in progress");
                return busy;
            }
            session_ = UpdateSession{
                .status = UpdateStatus::Validating,
                .target_version = marker->expected_new_version,
                .progress = kValidatingPercent,
                .message = "Validating update to " + marker->expected_new_version,
                .cancellable = false,
                .started_at = opt_.clock(),
                .run_id = marker->run_id,
                .forced = false,
                .reason = {},
            };
            ev = ToEvent(*session_);
        }
        Publish(ev);
    }

    auto outcome = validator_.Judge(*marker, opt_.current_version);
    switch (outcome.status) {
        case UpdateStatus::Succeeded:
            (void)Finish(UpdateStatus::Succeeded, kDonePercent,
                         "Update to " + outcome.to_version + " succeeded");
            break;
        case UpdateStatus::RolledBack:
            (void)Finish(UpdateStatus::RolledBack, kErrorPercent,
                         "Update to " + outcome.to_version + " was rolled back to " + outcome.from_version,
                         outcome.error_code, outcome.detail);
            break;
        default:
            (void)Finish(UpdateStatus::Failed, kErrorPercent,
                         "Update to " + outcome.to_version + " failed validation",
                         outcome.error_code, outcome.detail);
            break;
    }
    return outcome;
}

std::optional<std::chrono::milliseconds> UpdateManager::Period(const EffectivePolicy& p) const {
    if (!p.enabled || p.spec.update_check_days <= 0) return std::nullopt;
    return opt_.check_period_unit * p.spec.update_check_days;
}

void UpdateManager::Loop(std::stop_token stop) {
    std::uniform_real_distribution<double> jitter(0.0, opt_.max_jitter_fraction);
    double jitter_fraction = jitter(rng_);
    TimePoint last_attempt = opt_.clock();
    bool deferred = false;

    while (!stop.stop_requested()) {
        const EffectivePolicy policy = ResolvePolicy();
        const auto period = Period(policy);

        std::optional<std::chrono::milliseconds> delay;
        const TimePoint now = opt_.clock();
        if (period) {
            if (deferred) {
                delay = opt_.maintenance_retry;
            } else {
                TimePoint base = last_attempt;
                {
                    std::shared_lock lock(mu_);
                    if (last_check_ && *last_check_ > base) base = *last_check_;
                }
                const auto span = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::duration<double, std::milli>(period->count() * (1.0 + jitter_fraction)));
                const auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(base + span - now);
                delay = std::max(remaining, std::chrono::milliseconds(0));
            }
        }
        {
            std::unique_lock lock(mu_);
            if (delay) {
                next_check_ = now + *delay;
            } else {
                next_check_.reset();
            }
        }

        bool woken = false;
        {
            std::unique_lock lock(wake_mu_);
            const auto pred = [this] { return wake_; };
            if (delay) {
                woken = wake_cv_.wait_for(lock, stop, *delay, pred);
            } else {
                woken = wake_cv_.wait(lock, stop, pred);
            }
            if (woken) wake_ = false;
        }
        if (stop.stop_requested()) break;
        if (woken) continue;

        if (!policy.spec.maintenance_window.Contains(opt_.clock())) {
            if (!deferred) LogInfo("Scheduled update check deferred until the maintenance window");
            deferred = true;
            continue;
        }
        deferred = false;
        last_attempt = opt_.clock();
        jitter_fraction = jitter(rng_);

        auto r = CheckNow(stop);
        if (!r.is_ok()) {
            if (r.busy()) {
                LogDebug("Scheduled check skipped: %s", r.msg.c_str());
            } else {
                LogWarn("Scheduled update check did not complete: %s", r.msg.c_str());
            }
        }
    }

    std::unique_lock lock(mu_);
    next_check_.reset();
}

} // namespace updater
