#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace updater::json_utils {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool ParseJsonObject(std::string_view text, nlohmann::json& out, std::string& err);

// The Get*IfPresent helpers leave out untouched when key is missing and
// return false (with err set) only when the key holds the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err);
bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err);
bool GetIntIfPresent(const nlohmann::json& j, const char* key, int& out, std::string& err);
bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err);

} // namespace updater::json_utils
