#pragma once

#include "policy/policy_types.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <string>

namespace updater {

// Missing keys keep the values already in base; wrong types and unknown
// strategy names are errors.
std::expected<PolicySpec, std::string> ParsePolicySpec(const nlohmann::json& j,
                                                      PolicySpec base = {});
std::expected<MaintenanceWindow, std::string> ParseMaintenanceWindow(const nlohmann::json& j);
std::expected<FleetUpdatePolicy, std::string> ParseFleetPolicy(const nlohmann::json& j);

nlohmann::json ToJson(const MaintenanceWindow& w);
nlohmann::json ToJson(const PolicySpec& spec);
nlohmann::json ToJson(const FleetUpdatePolicy& policy);

} // namespace updater
