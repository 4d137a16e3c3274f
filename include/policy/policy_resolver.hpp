#pragma once

#include "policy/policy_types.hpp"

#include <string>

namespace updater {

struct Eligibility {
    bool eligible = false;
    std::string reason;
};

class PolicyResolver {
public:
    // Never disables regardless of either policy; Local uses local;
    // Inherit uses fleet when present and falls back to local otherwise.
    static EffectivePolicy Resolve(AgentOverrideMode mode,
                                   const PolicySpec& local,
                                   const FleetUpdatePolicy* fleet);

    // Applies the pin strategy to a (running, candidate) pair. Misconfiguration
    // and unparseable versions come back as ineligible with a reason.
    static Eligibility CheckEligibility(const PolicySpec& policy,
                                        const std::string& running,
                                        const std::string& candidate);
};

} // namespace updater
