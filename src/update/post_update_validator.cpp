#include "update/post_update_validator.hpp"

#include "util/logger.hpp"
#include "util/version.hpp"

namespace updater {

namespace {

bool SameVersion(const std::string& a, const std::string& b) {
    return VersionComparator::Compare(a, b) == 0;
}

std::string WithCode(std::string_view code, const std::string& detail) {
    return std::string(code) + ": " + detail;
}

} // namespace

PostUpdateValidator::PostUpdateValidator(RollbackMarkerStore& markers,
                                         FailedVersionStore& failed,
                                         std::chrono::hours cooldown,
                                         IHealthProbe* probe)
    : markers_(markers), failed_(failed), cooldown_(cooldown), probe_(probe) {}

std::optional<RollbackMarker> PostUpdateValidator::TakeMarker() {
    auto loaded = markers_.Load();
    if (!loaded) {
        LogWarn("Discarding rollback marker %s: %s", markers_.Path().c_str(), loaded.error().c_str());
        ClearMarker();
        return std::nullopt;
    }
    return *loaded;
}

ValidationOutcome PostUpdateValidator::Judge(const RollbackMarker& marker,
                                             const std::string& running_version) {
    ValidationOutcome out;
    out.was_updated = true;
    out.from_version = marker.previous_version;
    out.to_version = marker.expected_new_version;
    out.run_id = marker.run_id;

    auto exclude = [&](std::string_view code, const std::string& detail) {
        out.error_code = std::string(code);
        out.detail = detail;
        out.result = Result::Fail(-1, WithCode(code, detail));
        auto r = failed_.Record(marker.expected_new_version, detail, cooldown_);
        if (!r.is_ok()) {
            LogError("Could not record failed version %s: %s",
                     marker.expected_new_version.c_str(), r.msg.c_str());
        }
    };

    if (SameVersion(running_version, marker.expected_new_version)) {
        Result health = probe_ ? probe_->Check() : Result::Ok();
        if (health.is_ok()) {
            out.status = UpdateStatus::Succeeded;
            out.result = Result::Ok();
            auto r = failed_.ClearFor(marker.expected_new_version);
            if (!r.is_ok()) LogWarn("Could not clear failed-version record: %s", r.msg.c_str());
            LogInfo("Update %s -> %s validated", marker.previous_version.c_str(),
                    marker.expected_new_version.c_str());
        } else {
            out.status = UpdateStatus::Failed;
            exclude(error_code::kHealthCheck, "health check failed after update to " +
                                                  marker.expected_new_version + ": " + health.msg);
        }
    } else if (SameVersion(running_version, marker.previous_version)) {
        out.status = UpdateStatus::RolledBack;
        exclude(error_code::kRolledBack, "still running " + running_version + " after update to " +
                                             marker.expected_new_version);
    } else {
        out.status = UpdateStatus::Failed;
        exclude(error_code::kVersionMismatch, "expected " + marker.expected_new_version +
                                                  " after update, running " + running_version);
    }

    ClearMarker();
    return out;
}

void PostUpdateValidator::ClearMarker() {
    auto r = markers_.Clear();
    if (!r.is_ok()) {
        LogError("Could not remove rollback marker %s: %s", markers_.Path().c_str(), r.msg.c_str());
    }
}

} // namespace updater
