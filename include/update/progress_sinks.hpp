#pragma once

#include "update/progress.hpp"

#include <cstdio>
#include <mutex>
#include <string>

namespace updater {

// Atomically rewrites path with the last event as a JSON object.
class StatusFileSink final : public IProgress {
public:
    explicit StatusFileSink(std::string path);

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string path_;
};

class LogProgressSink final : public IProgress {
public:
    LogProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;
};

// One JSON object per line, tagged {"type":"update_progress", ...}.
class JsonLinesChannel final : public IProgressChannel {
public:
    explicit JsonLinesChannel(std::FILE* out);

    Result Send(const ProgressEvent& e) override;

    // Writes any JSON object as one line, serialized with Send.
    Result WriteJson(const nlohmann::json& j);

private:
    std::mutex mu_;
    std::FILE* out_;
};

} // namespace updater
