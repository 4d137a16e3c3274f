#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <variant>

namespace updater {

struct CheckUpdateCommand {};

struct CancelUpdateCommand {};

struct ForceUpdateCommand {
    std::string reason;
};

using Command = std::variant<CheckUpdateCommand, CancelUpdateCommand, ForceUpdateCommand>;

// Wire names: check_update, cancel_update, force_update. data may be null.
// A non-string force_update reason is logged and treated as empty.
std::expected<Command, std::string> ParseCommand(std::string_view name, const nlohmann::json& data);

const char* CommandName(const Command& cmd);

} // namespace updater
