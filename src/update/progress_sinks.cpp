#include "update/progress_sinks.hpp"

#include "io/durable_file.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <string>

namespace updater {

StatusFileSink::StatusFileSink(std::string path) : path_(std::move(path)) {}

void StatusFileSink::OnProgress(const ProgressEvent& e) {
    auto r = WriteFileDurably(path_, ToJson(e).dump() + "\n");
    if (!r.is_ok()) {
        LogWarn("Status file not updated: %s", r.msg.c_str());
    }
}

void LogProgressSink::OnProgress(const ProgressEvent& e) {
    const char* target = e.target_version.empty() ? "-" : e.target_version.c_str();
    if (!e.error.empty()) {
        LogError("update %s target=%s: %s (%s)",
                 ToString(e.status), target, e.message.c_str(), e.error.c_str());
        return;
    }
    if (e.status == UpdateStatus::Downloading) {
        LogDebug("update %s target=%s %d%%", ToString(e.status), target, e.progress);
        return;
    }
    LogInfo("update %s target=%s %d%%: %s", ToString(e.status), target, e.progress, e.message.c_str());
}

JsonLinesChannel::JsonLinesChannel(std::FILE* out) : out_(out) {}

Result JsonLinesChannel::Send(const ProgressEvent& e) {
    auto j = ToJson(e);
    j["type"] = "update_progress";
    return WriteJson(j);
}

Result JsonLinesChannel::WriteJson(const nlohmann::json& j) {
    const std::string line = j.dump() + "\n";

    std::lock_guard lock(mu_);
    if (std::fwrite(line.data(), 1, line.size(), out_) != line.size() || std::fflush(out_) != 0) {
        return Result::Fail(errno, "write of progress line failed");
    }
    return Result::Ok();
}

} // namespace updater
