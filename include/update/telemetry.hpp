#pragma once

#include "update/update_status.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <string>

namespace updater {

struct TelemetryPayload {
    std::string run_id;
    UpdateStatus status = UpdateStatus::Idle;
    std::string current_version;
    std::string target_version;
    std::int64_t download_time_ms = 0;
    std::uint64_t size_bytes = 0;
    std::string error_code;
    std::string error_message;
    std::string reason;
    TimePoint timestamp{};
};

nlohmann::json ToJson(const TelemetryPayload& p);

// Best effort: the manager logs failures and never retries.
class ITelemetrySink {
public:
    virtual ~ITelemetrySink() = default;
    virtual Result ReportUpdateStatus(const TelemetryPayload& payload) = 0;
};

// Appends one JSON object per report.
class FileTelemetrySink final : public ITelemetrySink {
public:
    explicit FileTelemetrySink(std::string path);

    Result ReportUpdateStatus(const TelemetryPayload& payload) override;

private:
    std::mutex mu_;
    std::string path_;
};

} // namespace updater
