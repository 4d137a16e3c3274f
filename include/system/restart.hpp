#pragma once

#include "util/result.hpp"

#include <functional>
#include <string>
#include <vector>

namespace updater {

// Replaces the process image with binary_path, passing args as argv.
// Returns only on failure.
Result ExecSelf(const std::string& binary_path, const std::vector<std::string>& args);

// "exec" returns a hook that runs before_exec and then ExecSelf; "none"
// returns an empty hook.
std::function<Result()> MakeRestartHook(const std::string& mode,
                                        std::string binary_path,
                                        std::vector<std::string> args,
                                        std::function<void()> before_exec);

} // namespace updater
