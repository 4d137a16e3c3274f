#pragma once

#include "policy/policy_types.hpp"

#include <shared_mutex>

namespace updater {

class IPolicyProvider {
public:
    virtual ~IPolicyProvider() = default;

    virtual AgentOverrideMode GetAutoUpdateMode() const = 0;
    virtual PolicySpec GetLocalPolicy() const = 0;
    // Null when no fleet policy has arrived.
    virtual FleetPolicyPtr GetFleetPolicy() const = 0;
};

class PolicyStore final : public IPolicyProvider {
public:
    PolicyStore(AgentOverrideMode mode, PolicySpec local);

    AgentOverrideMode GetAutoUpdateMode() const override;
    PolicySpec GetLocalPolicy() const override;
    FleetPolicyPtr GetFleetPolicy() const override;

    void SetAutoUpdateMode(AgentOverrideMode mode);
    void SetLocalPolicy(PolicySpec local);
    // Replaces the fleet policy wholesale; nullptr clears it.
    void SetFleetPolicy(FleetPolicyPtr fleet);

private:
    mutable std::shared_mutex mu_;
    AgentOverrideMode mode_;
    PolicySpec local_;
    FleetPolicyPtr fleet_;
};

} // namespace updater
