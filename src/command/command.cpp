#include "command/command.hpp"

#include "util/logger.hpp"

namespace updater {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

std::expected<Command, std::string> ParseCommand(std::string_view name, const nlohmann::json& data) {
    if (name == "check_update") return CheckUpdateCommand{};
    if (name == "cancel_update") return CancelUpdateCommand{};
    if (name == "force_update") {
        ForceUpdateCommand cmd;
        if (data.is_object()) {
            if (auto it = data.find("reason"); it != data.end() && !it->is_null()) {
                if (it->is_string()) {
                    cmd.reason = it->get<std::string>();
                } else {
                    LogWarn("force_update: ignoring non-string reason (%s)", it->type_name());
                }
            }
        }
        return cmd;
    }
    return std::unexpected("unknown command: '" + std::string(name) + "'");
}

const char* CommandName(const Command& cmd) {
    return std::visit(Overloaded{
                          [](const CheckUpdateCommand&) { return "check_update"; },
                          [](const CancelUpdateCommand&) { return "cancel_update"; },
                          [](const ForceUpdateCommand&) { return "force_update"; },
                      },
                      cmd);
}

} // namespace updater
