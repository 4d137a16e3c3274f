#include "policy/policy_json.hpp"

#include "util/json_utils.hpp"

namespace updater {

using json_utils::GetBoolIfPresent;
using json_utils::GetIntIfPresent;
using json_utils::GetStringIfPresent;

namespace {

bool InRange(int v, int lo, int hi) { return v >= lo && v <= hi; }

} // namespace

std::expected<MaintenanceWindow, std::string> ParseMaintenanceWindow(const nlohmann::json& j) {
    if (!j.is_object()) return std::unexpected("maintenance_window must be an object");

    MaintenanceWindow w;
    std::string err;
    if (!GetBoolIfPresent(j, "enabled", w.enabled, err) ||
        !GetIntIfPresent(j, "start_hour", w.start_hour, err) ||
        !GetIntIfPresent(j, "start_min", w.start_min, err) ||
        !GetIntIfPresent(j, "end_hour", w.end_hour, err) ||
        !GetIntIfPresent(j, "end_min", w.end_min, err) ||
        !GetStringIfPresent(j, "timezone", w.timezone, err)) {
        return std::unexpected("maintenance_window: " + err);
    }
    if (!InRange(w.start_hour, 0, 23) || !InRange(w.end_hour, 0, 23) ||
        !InRange(w.start_min, 0, 59) || !InRange(w.end_min, 0, 59)) {
        return std::unexpected("maintenance_window: hour/minute out of range");
    }

    if (auto it = j.find("days_of_week"); it != j.end()) {
        if (!it->is_array()) return std::unexpected("maintenance_window: days_of_week must be an array");
        for (const auto& d : *it) {
            if (!d.is_number_integer()) {
                return std::unexpected("maintenance_window: days_of_week entries must be integers");
            }
            const int day = d.get<int>();
            if (!InRange(day, 0, 6)) {
                return std::unexpected("maintenance_window: day " + std::to_string(day) + " out of range");
            }
            w.days_of_week.push_back(day);
        }
    }
    return w;
}

std::expected<PolicySpec, std::string> ParsePolicySpec(const nlohmann::json& j, PolicySpec base) {
    if (!j.is_object()) return std::unexpected("policy must be a JSON object");

    PolicySpec spec = std::move(base);
    std::string err;
    if (!GetIntIfPresent(j, "update_check_days", spec.update_check_days, err) ||
        !GetBoolIfPresent(j, "allow_major_upgrade", spec.allow_major_upgrade, err) ||
        !GetStringIfPresent(j, "target_version", spec.target_version, err) ||
        !GetBoolIfPresent(j, "collect_telemetry", spec.collect_telemetry, err)) {
        return std::unexpected(err);
    }
    if (spec.update_check_days < 0) {
        return std::unexpected("update_check_days must not be negative");
    }

    std::string strategy;
    if (!GetStringIfPresent(j, "version_pin_strategy", strategy, err)) return std::unexpected(err);
    if (!strategy.empty()) {
        auto parsed = ParsePinStrategy(strategy);
        if (!parsed) return std::unexpected(parsed.error());
        spec.strategy = *parsed;
    }

    if (auto it = j.find("maintenance_window"); it != j.end() && !it->is_null()) {
        auto window = ParseMaintenanceWindow(*it);
        if (!window) return std::unexpected(window.error());
        spec.maintenance_window = std::move(*window);
    }
    return spec;
}

std::expected<FleetUpdatePolicy, std::string> ParseFleetPolicy(const nlohmann::json& j) {
    auto spec = ParsePolicySpec(j);
    if (!spec) return std::unexpected("fleet policy: " + spec.error());

    FleetUpdatePolicy policy;
    policy.spec = std::move(*spec);
    std::string err;
    if (!GetStringIfPresent(j, "tenant_id", policy.tenant_id, err) ||
        !GetStringIfPresent(j, "updated_at", policy.updated_at, err)) {
        return std::unexpected("fleet policy: " + err);
    }
    return policy;
}

nlohmann::json ToJson(const MaintenanceWindow& w) {
    nlohmann::json j{
        {"enabled", w.enabled},
        {"start_hour", w.start_hour},
        {"start_min", w.start_min},
        {"end_hour", w.end_hour},
        {"end_min", w.end_min},
        {"days_of_week", w.days_of_week},
    };
    if (!w.timezone.empty()) j["timezone"] = w.timezone;
    return j;
}

nlohmann::json ToJson(const PolicySpec& spec) {
    return nlohmann::json{
        {"update_check_days", spec.update_check_days},
        {"version_pin_strategy", ToString(spec.strategy)},
        {"allow_major_upgrade", spec.allow_major_upgrade},
        {"target_version", spec.target_version},
        {"collect_telemetry", spec.collect_telemetry},
        {"maintenance_window", ToJson(spec.maintenance_window)},
    };
}

nlohmann::json ToJson(const FleetUpdatePolicy& policy) {
    auto j = ToJson(policy.spec);
    j["tenant_id"] = policy.tenant_id;
    j["updated_at"] = policy.updated_at;
    return j;
}

} // namespace updater
