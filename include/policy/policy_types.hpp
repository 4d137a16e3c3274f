#pragma once

#include "util/clock.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace updater {

enum class AgentOverrideMode {
    Inherit,
    Local,
    Never,
};

enum class VersionPinStrategy {
    Latest,
    Minor,
    Patch,
    Pin,
};

enum class PolicySource {
    Fleet,
    Local,
    Fallback,
    Disabled,
};

// Accepts "inherit", "local", "never" and the legacy alias "disabled".
std::expected<AgentOverrideMode, std::string> ParseOverrideMode(std::string_view name);
// Accepts "latest", "minor", "patch", "pin" and the legacy alias "major".
std::expected<VersionPinStrategy, std::string> ParsePinStrategy(std::string_view name);

const char* ToString(AgentOverrideMode mode);
const char* ToString(VersionPinStrategy strategy);
const char* ToString(PolicySource source);

// Daily window in the IANA zone named by timezone, or in the process's local
// time when it is empty or unknown. end before start wraps past midnight;
// start == end covers the whole day. Empty days_of_week means every day
// (0 = Sunday), matched against the day the window opened.
struct MaintenanceWindow {
    bool enabled = false;
    int start_hour = 0;
    int start_min = 0;
    int end_hour = 0;
    int end_min = 0;
    std::vector<int> days_of_week;
    std::string timezone;

    bool Contains(TimePoint when) const;

    bool operator==(const MaintenanceWindow&) const = default;
};

struct PolicySpec {
    int update_check_days = 7;
    VersionPinStrategy strategy = VersionPinStrategy::Latest;
    bool allow_major_upgrade = false;
    std::string target_version;
    bool collect_telemetry = true;
    MaintenanceWindow maintenance_window;

    bool operator==(const PolicySpec&) const = default;
};

struct FleetUpdatePolicy {
    PolicySpec spec;
    std::string tenant_id;
    std::string updated_at;
};

using FleetPolicyPtr = std::shared_ptr<const FleetUpdatePolicy>;

struct EffectivePolicy {
    bool enabled = false;
    PolicySource source = PolicySource::Disabled;
    PolicySpec spec;

    bool operator==(const EffectivePolicy&) const = default;
};

} // namespace updater
