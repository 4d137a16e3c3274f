#pragma once

#include "policy/policy_types.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace updater::config {

class UpdaterConfig {
public:
    std::string data_dir = "/var/lib/agent-updater";
    std::string current_version;
    std::string channel = "stable";
    std::string platform = "linux";
    std::string arch;
    std::string binary_path;
    std::string repository_dir;
    std::string status_file;
    std::string telemetry_file;
    std::string log_level = "info";
    // "exec" re-executes binary_path; "none" leaves the restart to the service manager.
    std::string restart_mode = "exec";
    int failed_version_cooldown_hours = 72;
    // Floor for the free-space check before a download.
    std::uint64_t min_free_space_mb = 200;
    std::uint64_t progress_queue_capacity = 64;

    AgentOverrideMode mode = AgentOverrideMode::Inherit;
    PolicySpec local_policy;

    UpdaterConfig();

    static Result LoadFromFile(const std::string& path, UpdaterConfig& out);
    static Result LoadFromJson(const nlohmann::json& j, UpdaterConfig& out);

    // <data_dir>/autoupdate
    std::string StateDir() const;
    // <data_dir>/autoupdate/downloads
    std::string DownloadDir() const;
};

// Maps uname's machine name to the release naming (x86_64 -> amd64, aarch64 -> arm64).
std::string DefaultArch();

} // namespace updater::config
