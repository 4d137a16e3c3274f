#include "update/rollback_marker.hpp"

#include "io/durable_file.hpp"
#include "util/json_utils.hpp"

#include <cerrno>
#include <filesystem>

namespace updater {

RollbackMarkerStore::RollbackMarkerStore(std::string path) : path_(std::move(path)) {}

Result RollbackMarkerStore::Write(const RollbackMarker& marker) {
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        auto dir_res = EnsureDirectory(parent.string());
        if (!dir_res.is_ok()) return dir_res;
    }

    const nlohmann::json j{
        {"previous_version", marker.previous_version},
        {"expected_new_version", marker.expected_new_version},
        {"timestamp", ToUnixSeconds(marker.timestamp)},
        {"run_id", marker.run_id},
    };
    return WriteFileDurably(path_, j.dump() + "\n");
}

std::expected<std::optional<RollbackMarker>, std::string> RollbackMarkerStore::Load() const {
    std::string text;
    auto r = ReadFileToString(path_, text);
    if (!r.is_ok()) {
        if (r.err == ENOENT) return std::optional<RollbackMarker>{};
        return std::unexpected("cannot read rollback marker: " + r.msg);
    }

    nlohmann::json j;
    std::string err;
    if (!json_utils::ParseJsonObject(text, j, err)) {
        return std::unexpected("rollback marker: " + err);
    }

    RollbackMarker m;
    std::uint64_t ts = 0;
    if (!json_utils::GetStringIfPresent(j, "previous_version", m.previous_version, err) ||
        !json_utils::GetStringIfPresent(j, "expected_new_version", m.expected_new_version, err) ||
        !json_utils::GetStringIfPresent(j, "run_id", m.run_id, err) ||
        !json_utils::GetU64IfPresent(j, "timestamp", ts, err)) {
        return std::unexpected("rollback marker: " + err);
    }
    if (m.previous_version.empty() || m.expected_new_version.empty()) {
        return std::unexpected("rollback marker: missing version fields");
    }
    m.timestamp = FromUnixSeconds(static_cast<std::int64_t>(ts));
    return std::optional<RollbackMarker>(std::move(m));
}

Result RollbackMarkerStore::Clear() { return RemoveFileDurably(path_); }

} // namespace updater
