#include "update/progress.hpp"

namespace updater {

nlohmann::json ToJson(const ProgressEvent& e) {
    nlohmann::json j{
        {"status", ToString(e.status)},
        {"progress", e.progress},
        {"message", e.message},
    };
    if (!e.target_version.empty()) j["target_version"] = e.target_version;
    if (!e.error.empty()) j["error"] = e.error;
    return j;
}

} // namespace updater
