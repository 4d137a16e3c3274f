#include "policy/policy_resolver.hpp"

#include "util/logger.hpp"
#include "util/version.hpp"

#include <optional>

namespace updater {

namespace {

Eligibility Ineligible(std::string reason) {
    return {.eligible = false, .reason = std::move(reason)};
}

Eligibility Eligible(std::string reason) {
    return {.eligible = true, .reason = std::move(reason)};
}

} // namespace

EffectivePolicy PolicyResolver::Resolve(AgentOverrideMode mode,
                                        const PolicySpec& local,
                                        const FleetUpdatePolicy* fleet) {
    switch (mode) {
        case AgentOverrideMode::Never:
            return {.enabled = false, .source = PolicySource::Disabled, .spec = local};
        case AgentOverrideMode::Local:
            return {.enabled = true, .source = PolicySource::Local, .spec = local};
        case AgentOverrideMode::Inherit:
            break;
    }

    if (fleet != nullptr) {
        return {.enabled = true, .source = PolicySource::Fleet, .spec = fleet->spec};
    }
    return {.enabled = true, .source = PolicySource::Fallback, .spec = local};
}

Eligibility PolicyResolver::CheckEligibility(const PolicySpec& policy,
                                             const std::string& running,
                                             const std::string& candidate) {
    const auto cur = Version::Parse(running);
    if (!cur) return Ineligible("running version is not a valid version: '" + running + "'");
    const auto cand = Version::Parse(candidate);
    if (!cand) return Ineligible("candidate version is not a valid version: '" + candidate + "'");

    // A non-empty target constrains every strategy; Pin additionally requires one.
    std::optional<Version> target;
    if (!policy.target_version.empty()) {
        target = Version::Parse(policy.target_version);
        if (!target) {
            LogWarn("target_version '%s' is not a valid version", policy.target_version.c_str());
            return Ineligible("target version is invalid");
        }
        if (CompareVersions(*cand, *target) != 0) {
            return Ineligible("candidate " + candidate + " is not the target version " +
                              policy.target_version);
        }
    }

    if (policy.strategy == VersionPinStrategy::Pin) {
        if (!target) {
            LogWarn("Pin strategy without target_version; no update will be proposed");
            return Ineligible("pin strategy has no target version");
        }
        if (CompareVersions(*cand, *cur) == 0) {
            return Ineligible("already running pinned version " + policy.target_version);
        }
        return Eligible("pinned version " + policy.target_version);
    }

    if (CompareVersions(*cand, *cur) <= 0) {
        return Ineligible("candidate " + candidate + " is not newer than " + running);
    }

    const bool major_bump = cand->major != cur->major;
    const bool same_line = !major_bump && cand->minor == cur->minor;
    switch (policy.strategy) {
        case VersionPinStrategy::Latest:
            if (major_bump && !policy.allow_major_upgrade) {
                return Ineligible("major upgrade to " + candidate + " not allowed");
            }
            return Eligible("newer version " + candidate);
        case VersionPinStrategy::Minor:
            if (!same_line && !policy.allow_major_upgrade) {
                return Ineligible("minor strategy only accepts " + std::to_string(cur->major) + "." +
                                  std::to_string(cur->minor) + ".x releases");
            }
            return Eligible("newer version " + candidate);
        case VersionPinStrategy::Patch:
            if (!same_line) {
                return Ineligible("patch strategy only accepts " + std::to_string(cur->major) + "." +
                                  std::to_string(cur->minor) + ".x releases");
            }
            return Eligible("newer patch release " + candidate);
        case VersionPinStrategy::Pin:
            break;
    }
    return Ineligible("unsupported strategy");
}

} // namespace updater
