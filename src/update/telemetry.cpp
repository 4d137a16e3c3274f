#include "update/telemetry.hpp"

#include "io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace updater {

nlohmann::json ToJson(const TelemetryPayload& p) {
    nlohmann::json j{
        {"status", ToString(p.status)},
        {"current_version", p.current_version},
        {"timestamp", ToUnixSeconds(p.timestamp)},
    };
    if (!p.run_id.empty()) j["run_id"] = p.run_id;
    if (!p.target_version.empty()) j["target_version"] = p.target_version;
    if (p.download_time_ms > 0) j["download_time_ms"] = p.download_time_ms;
    if (p.size_bytes > 0) j["size_bytes"] = p.size_bytes;
    if (!p.error_code.empty()) j["error_code"] = p.error_code;
    if (!p.error_message.empty()) j["error_message"] = p.error_message;
    if (!p.reason.empty()) j["reason"] = p.reason;
    return j;
}

FileTelemetrySink::FileTelemetrySink(std::string path) : path_(std::move(path)) {}

Result FileTelemetrySink::ReportUpdateStatus(const TelemetryPayload& payload) {
    const std::string line = ToJson(payload).dump() + "\n";

    std::lock_guard lock(mu_);
    Fd fd(::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
    if (!fd.Valid()) {
        return Result::FromErrno("open failed: " + path_);
    }
    size_t off = 0;
    while (off < line.size()) {
        const ssize_t n = ::write(fd.Get(), line.data() + off, line.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::FromErrno("write failed: " + path_);
        }
        off += static_cast<size_t>(n);
    }
    return fd.CloseChecked();
}

} // namespace updater
