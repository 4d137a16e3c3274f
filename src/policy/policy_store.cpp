#include "policy/policy_store.hpp"

#include <mutex>

namespace updater {

PolicyStore::PolicyStore(AgentOverrideMode mode, PolicySpec local)
    : mode_(mode), local_(std::move(local)) {}

AgentOverrideMode PolicyStore::GetAutoUpdateMode() const {
    std::shared_lock lock(mu_);
    return mode_;
}

PolicySpec PolicyStore::GetLocalPolicy() const {
    std::shared_lock lock(mu_);
    return local_;
}

FleetPolicyPtr PolicyStore::GetFleetPolicy() const {
    std::shared_lock lock(mu_);
    return fleet_;
}

void PolicyStore::SetAutoUpdateMode(AgentOverrideMode mode) {
    std::unique_lock lock(mu_);
    mode_ = mode;
}

void PolicyStore::SetLocalPolicy(PolicySpec local) {
    std::unique_lock lock(mu_);
    local_ = std::move(local);
}

void PolicyStore::SetFleetPolicy(FleetPolicyPtr fleet) {
    std::unique_lock lock(mu_);
    fleet_ = std::move(fleet);
}

} // namespace updater
