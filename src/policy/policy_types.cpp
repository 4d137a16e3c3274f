#include "policy/policy_types.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <stdexcept>

namespace updater {

std::expected<AgentOverrideMode, std::string> ParseOverrideMode(std::string_view name) {
    if (name == "inherit") return AgentOverrideMode::Inherit;
    if (name == "local") return AgentOverrideMode::Local;
    if (name == "never" || name == "disabled") return AgentOverrideMode::Never;
    return std::unexpected("unrecognized auto-update mode: '" + std::string(name) + "'");
}

std::expected<VersionPinStrategy, std::string> ParsePinStrategy(std::string_view name) {
    if (name == "latest" || name == "major") return VersionPinStrategy::Latest;
    if (name == "minor") return VersionPinStrategy::Minor;
    if (name == "patch") return VersionPinStrategy::Patch;
    if (name == "pin") return VersionPinStrategy::Pin;
    return std::unexpected("unrecognized version pin strategy: '" + std::string(name) + "'");
}

const char* ToString(AgentOverrideMode mode) {
    switch (mode) {
        case AgentOverrideMode::Inherit: return "inherit";
        case AgentOverrideMode::Local:   return "local";
        case AgentOverrideMode::Never:   return "never";
    }
    return "unknown";
}

const char* ToString(VersionPinStrategy strategy) {
    switch (strategy) {
        case VersionPinStrategy::Latest: return "latest";
        case VersionPinStrategy::Minor:  return "minor";
        case VersionPinStrategy::Patch:  return "patch";
        case VersionPinStrategy::Pin:    return "pin";
    }
    return "unknown";
}

const char* ToString(PolicySource source) {
    switch (source) {
        case PolicySource::Fleet:    return "fleet";
        case PolicySource::Local:    return "local";
        case PolicySource::Fallback: return "fallback";
        case PolicySource::Disabled: return "disabled";
    }
    return "unknown";
}

namespace {

struct WallClock {
    int minute_of_day = 0;
    int weekday = 0;
};

bool LocalWallClock(TimePoint when, WallClock& out) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    if (localtime_r(&t, &tm) == nullptr) return false;
    out = {.minute_of_day = tm.tm_hour * 60 + tm.tm_min, .weekday = tm.tm_wday};
    return true;
}

bool ZonedWallClock(TimePoint when, const std::string& zone_name, WallClock& out) {
    const std::chrono::time_zone* zone = nullptr;
    try {
        zone = std::chrono::locate_zone(zone_name);
    } catch (const std::runtime_error& e) {
        LogWarn("Unknown maintenance window timezone '%s' (%s); using local time", zone_name.c_str(),
                e.what());
        return LocalWallClock(when, out);
    }

    const std::chrono::zoned_time zt{zone, std::chrono::floor<std::chrono::seconds>(when)};
    const auto local = zt.get_local_time();
    const auto day = std::chrono::floor<std::chrono::days>(local);
    const std::chrono::hh_mm_ss hms{local - day};
    out = {.minute_of_day = static_cast<int>(hms.hours().count() * 60 + hms.minutes().count()),
           .weekday = static_cast<int>(std::chrono::weekday(day).c_encoding())};
    return true;
}

} // namespace

bool MaintenanceWindow::Contains(TimePoint when) const {
    if (!enabled) return true;

    WallClock wall;
    const bool ok = timezone.empty() ? LocalWallClock(when, wall) : ZonedWallClock(when, timezone, wall);
    if (!ok) return false;

    const int now_min = wall.minute_of_day;
    const int start = start_hour * 60 + start_min;
    const int end = end_hour * 60 + end_min;

    int opened_on = wall.weekday;
    bool inside = false;
    if (start == end) {
        inside = true;
    } else if (start < end) {
        inside = now_min >= start && now_min < end;
    } else if (now_min >= start) {
        inside = true;
    } else if (now_min < end) {
        inside = true;
        opened_on = (wall.weekday + 6) % 7;
    }
    if (!inside) return false;

    if (days_of_week.empty()) return true;
    return std::find(days_of_week.begin(), days_of_week.end(), opened_on) != days_of_week.end();
}

} // namespace updater
