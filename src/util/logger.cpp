#include "util/logger.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace updater {

namespace {

std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
Logger::Hook g_hook;

std::string FormatMessage(const char* fmt, va_list ap) {
    va_list copy;
    va_copy(copy, ap);
    const int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n <= 0) return {};

    std::string out(static_cast<size_t>(n) + 1, '\0');
    std::vsnprintf(out.data(), out.size(), fmt, ap);
    out.resize(static_cast<size_t>(n));
    return out;
}

std::string Timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) return {};
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}

} // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "none") return LogLevel::None;
    return std::nullopt;
}

const char* ToString(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None:  break;
    }
    return "LOG";
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_level;
}

void Logger::SetHook(Hook hook) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_hook = std::move(hook);
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    {
        std::lock_guard<std::mutex> lk(g_mu);
        if (lvl < g_level) return;
    }

    LogRecord rec{.level = lvl, .file = BaseName(file), .line = line, .message = FormatMessage(fmt, ap)};

    std::lock_guard<std::mutex> lk(g_mu);
    if (g_hook) {
        g_hook(rec);
        return;
    }

    std::string prefix;
    if (const std::string ts = Timestamp(); !ts.empty()) prefix = "[" + ts + "] ";
    prefix += "[" + std::string(ToString(lvl)) + "] ";
    if (rec.file && line > 0) prefix += "[" + std::string(rec.file) + ":" + std::to_string(line) + "] ";
    std::fprintf(stderr, "%s%s\n", prefix.c_str(), rec.message.c_str());
}

} // namespace updater
