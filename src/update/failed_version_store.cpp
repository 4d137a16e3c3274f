#include "update/failed_version_store.hpp"

#include "io/durable_file.hpp"
#include "util/json_utils.hpp"
#include "util/logger.hpp"
#include "util/version.hpp"

#include <cerrno>
#include <filesystem>

namespace updater {

FailedVersionStore::FailedVersionStore(std::string path, Clock clock)
    : path_(std::move(path)), clock_(std::move(clock)) {}

void FailedVersionStore::Load() {
    std::lock_guard lock(mu_);
    record_.reset();

    std::string text;
    auto r = ReadFileToString(path_, text);
    if (!r.is_ok()) {
        if (r.err != ENOENT) LogWarn("Failed-version record unreadable: %s", r.msg.c_str());
        return;
    }

    nlohmann::json j;
    std::string err;
    FailedVersionRecord rec;
    std::uint64_t failed_at = 0;
    std::uint64_t until = 0;
    if (!json_utils::ParseJsonObject(text, j, err) ||
        !json_utils::GetStringIfPresent(j, "version", rec.version, err) ||
        !json_utils::GetStringIfPresent(j, "reason", rec.reason, err) ||
        !json_utils::GetU64IfPresent(j, "failed_at", failed_at, err) ||
        !json_utils::GetU64IfPresent(j, "excluded_until", until, err) || rec.version.empty()) {
        LogWarn("Ignoring corrupt failed-version record %s: %s", path_.c_str(),
                err.empty() ? "missing version" : err.c_str());
        return;
    }
    rec.failed_at = FromUnixSeconds(static_cast<std::int64_t>(failed_at));
    rec.excluded_until = FromUnixSeconds(static_cast<std::int64_t>(until));
    record_ = std::move(rec);
}

Result FailedVersionStore::Record(const std::string& version,
                                  const std::string& reason,
                                  std::chrono::hours cooldown) {
    const TimePoint now = clock_();
    FailedVersionRecord rec{
        .version = version,
        .failed_at = now,
        .excluded_until = now + cooldown,
        .reason = reason,
    };

    const nlohmann::json j{
        {"version", rec.version},
        {"failed_at", ToUnixSeconds(rec.failed_at)},
        {"excluded_until", ToUnixSeconds(rec.excluded_until)},
        {"reason", rec.reason},
    };

    std::lock_guard lock(mu_);
    record_ = rec;

    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        auto dir_res = EnsureDirectory(parent.string());
        if (!dir_res.is_ok()) return dir_res;
    }
    return WriteFileDurably(path_, j.dump() + "\n");
}

bool FailedVersionStore::IsExcluded(const std::string& version) const {
    std::lock_guard lock(mu_);
    if (!record_ || clock_() >= record_->excluded_until) return false;
    return VersionComparator::Compare(record_->version, version) == 0;
}

std::optional<FailedVersionRecord> FailedVersionStore::Active() const {
    std::lock_guard lock(mu_);
    if (!record_ || clock_() >= record_->excluded_until) return std::nullopt;
    return record_;
}

Result FailedVersionStore::ClearFor(const std::string& version) {
    std::lock_guard lock(mu_);
    if (!record_ || VersionComparator::Compare(record_->version, version) != 0) return Result::Ok();
    return ClearLocked();
}

Result FailedVersionStore::Clear() {
    std::lock_guard lock(mu_);
    return ClearLocked();
}

Result FailedVersionStore::ClearLocked() {
    record_.reset();
    return RemoveFileDurably(path_);
}

} // namespace updater
