#pragma once

#include <cstdarg>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace updater {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// "debug", "info", "warn"/"warning", "error", "none".
std::optional<LogLevel> ParseLogLevel(std::string_view name);
const char* ToString(LogLevel lvl);

struct LogRecord {
    LogLevel level = LogLevel::Info;
    const char* file = nullptr;
    int line = 0;
    std::string message;
};

/*
    Process-wide logger. Lines go to stderr as

        [2026-10-19 08:00:00] [WARN] [update_manager.cpp:120] message

    because stdout is the progress channel. A hook, when set, receives every
    record that passes the level filter instead of stderr.
*/
class Logger {
public:
    using Hook = std::function<void(const LogRecord&)>;

    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Pass an empty hook to restore stderr output.
    void SetHook(Hook hook);

    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::updater::Logger::Instance().LogWithSource(::updater::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::updater::Logger::Instance().LogWithSource(::updater::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::updater::Logger::Instance().LogWithSource(::updater::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::updater::Logger::Instance().LogWithSource(::updater::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace updater
