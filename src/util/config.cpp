#include "util/config.hpp"

#include "policy/policy_json.hpp"
#include "util/json_utils.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <filesystem>
#include <sys/utsname.h>

#ifndef AGENT_UPDATER_VERSION
#define AGENT_UPDATER_VERSION "0.0.0"
#endif

namespace updater::config {

using json_utils::GetIntIfPresent;
using json_utils::GetStringIfPresent;
using json_utils::GetU64IfPresent;

std::string DefaultArch() {
    utsname u{};
    if (::uname(&u) != 0) return "amd64";
    const std::string machine = u.machine;
    if (machine == "x86_64") return "amd64";
    if (machine == "aarch64") return "arm64";
    if (machine == "i686" || machine == "i386") return "386";
    if (machine.rfind("armv7", 0) == 0) return "armv7";
    return machine;
}

UpdaterConfig::UpdaterConfig() : current_version(AGENT_UPDATER_VERSION), arch(DefaultArch()) {}

std::string UpdaterConfig::StateDir() const {
    return (std::filesystem::path(data_dir) / "autoupdate").string();
}

std::string UpdaterConfig::DownloadDir() const {
    return (std::filesystem::path(StateDir()) / "downloads").string();
}

Result UpdaterConfig::LoadFromJson(const nlohmann::json& j, UpdaterConfig& out) {
    out = UpdaterConfig{};
    if (!j.is_object()) return Result::Fail(EINVAL, "config root must be a JSON object");

    std::string err;
    if (!GetStringIfPresent(j, "data_dir", out.data_dir, err) ||
        !GetStringIfPresent(j, "current_version", out.current_version, err) ||
        !GetStringIfPresent(j, "channel", out.channel, err) ||
        !GetStringIfPresent(j, "platform", out.platform, err) ||
        !GetStringIfPresent(j, "arch", out.arch, err) ||
        !GetStringIfPresent(j, "binary_path", out.binary_path, err) ||
        !GetStringIfPresent(j, "repository_dir", out.repository_dir, err) ||
        !GetStringIfPresent(j, "status_file", out.status_file, err) ||
        !GetStringIfPresent(j, "telemetry_file", out.telemetry_file, err) ||
        !GetStringIfPresent(j, "log_level", out.log_level, err) ||
        !GetStringIfPresent(j, "restart_mode", out.restart_mode, err) ||
        !GetIntIfPresent(j, "failed_version_cooldown_hours", out.failed_version_cooldown_hours, err) ||
        !GetU64IfPresent(j, "min_free_space_mb", out.min_free_space_mb, err) ||
        !GetU64IfPresent(j, "progress_queue_capacity", out.progress_queue_capacity, err)) {
        return Result::Fail(EINVAL, err);
    }

    if (out.data_dir.empty()) return Result::Fail(EINVAL, "data_dir must not be empty");
    if (out.channel.empty()) return Result::Fail(EINVAL, "channel must not be empty");
    if (!ParseLogLevel(out.log_level)) {
        return Result::Fail(EINVAL, "unrecognized log_level: '" + out.log_level + "'");
    }
    if (out.restart_mode != "exec" && out.restart_mode != "none") {
        return Result::Fail(EINVAL, "unrecognized restart_mode: '" + out.restart_mode + "'");
    }
    if (out.failed_version_cooldown_hours < 0) {
        return Result::Fail(EINVAL, "failed_version_cooldown_hours must not be negative");
    }
    if (out.progress_queue_capacity == 0) {
        return Result::Fail(EINVAL, "progress_queue_capacity must be positive");
    }

    if (auto it = j.find("auto_update"); it != j.end()) {
        if (!it->is_object()) return Result::Fail(EINVAL, "auto_update must be an object");

        std::string mode;
        if (!GetStringIfPresent(*it, "mode", mode, err)) return Result::Fail(EINVAL, "auto_update: " + err);
        if (!mode.empty()) {
            auto parsed = ParseOverrideMode(mode);
            if (!parsed) return Result::Fail(EINVAL, parsed.error());
            out.mode = *parsed;
        }

        auto spec = ParsePolicySpec(*it, out.local_policy);
        if (!spec) return Result::Fail(EINVAL, "auto_update: " + spec.error());
        out.local_policy = std::move(*spec);
    }

    return Result::Ok();
}

Result UpdaterConfig::LoadFromFile(const std::string& path, UpdaterConfig& out) {
    nlohmann::json j;
    std::string err;
    if (!json_utils::LoadJsonObjectFromFile(path, j, err)) {
        return Result::Fail(EINVAL, err);
    }
    auto r = LoadFromJson(j, out);
    if (!r.is_ok()) return Result::Fail(r.err, r.msg + " in " + path);
    LogDebug("Loaded config %s", path.c_str());
    return Result::Ok();
}

} // namespace updater::config
