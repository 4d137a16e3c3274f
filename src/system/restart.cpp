#include "system/restart.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace updater {

Result ExecSelf(const std::string& binary_path, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    LogInfo("Restarting into %s", binary_path.c_str());
    ::execv(binary_path.c_str(), argv.data());
    const int err = errno;
    return Result::Fail(err, "execv " + binary_path + " failed: " + std::strerror(err));
}

std::function<Result()> MakeRestartHook(const std::string& mode,
                                        std::string binary_path,
                                        std::vector<std::string> args,
                                        std::function<void()> before_exec) {
    if (mode != "exec") return {};
    return [binary_path = std::move(binary_path), args = std::move(args),
            before_exec = std::move(before_exec)]() -> Result {
        if (before_exec) before_exec();
        return ExecSelf(binary_path, args);
    };
}

} // namespace updater
