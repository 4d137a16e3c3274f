#include "command/command_dispatcher.hpp"
#include "io/durable_file.hpp"
#include "policy/policy_json.hpp"
#include "policy/policy_store.hpp"
#include "system/restart.hpp"
#include "system/signals.hpp"
#include "update/file_repository_source.hpp"
#include "update/progress_hub.hpp"
#include "update/progress_sinks.hpp"
#include "update/telemetry.hpp"
#include "update/update_manager.hpp"
#include "util/config.hpp"
#include "util/json_utils.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <poll.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/agent-updater/updater.json";
constexpr int kPollIntervalMs = 250;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-v] [--check-now]\n"
        "\n"
        "Reads newline-delimited JSON messages on stdin and writes progress events to stdout.\n"
        "\n"
        "Options:\n"
        "  -c, --config       Config file (default %s)\n"
        "  -v, --verbose      Debug logging\n"
        "      --check-now    Run one update check right after startup\n"
        "  -h, --help         Show this help\n",
        argv, kDefaultConfigPath);
}

struct Daemon {
    updater::PolicyStore &store;
    updater::UpdateManager &manager;
    updater::CommandDispatcher &dispatcher;
    updater::JsonLinesChannel &out;
};

void HandleLine(Daemon &d, const std::string &line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) return;

    nlohmann::json j;
    std::string err;
    if (!updater::json_utils::ParseJsonObject(line, j, err)) {
        LogWarn("Ignoring input line: %s", err.c_str());
        return;
    }

    std::string type;
    if (!updater::json_utils::GetStringIfPresent(j, "type", type, err)) {
        LogWarn("Ignoring input line: %s", err.c_str());
        return;
    }

    if (type == "fleet_policy") {
        auto it = j.find("policy");
        if (it == j.end() || it->is_null()) {
            d.store.SetFleetPolicy(nullptr);
            LogInfo("Fleet policy cleared");
        } else {
            auto policy = updater::ParseFleetPolicy(*it);
            if (!policy) {
                LogWarn("Rejected fleet policy: %s", policy.error().c_str());
                return;
            }
            d.store.SetFleetPolicy(std::make_shared<const updater::FleetUpdatePolicy>(std::move(*policy)));
        }
        d.manager.NotifyPolicyChanged();
        return;
    }

    if (type == "status") {
        auto status = updater::ToJson(d.manager.Status());
        status["type"] = "update_status";
        if (auto r = d.out.WriteJson(status); !r.is_ok()) {
            LogWarn("Status reply not written: %s", r.msg.c_str());
        }
        return;
    }

    if (auto r = d.dispatcher.HandleWireMessage(line); !r.is_ok()) {
        LogWarn("Ignoring message: %s", r.msg.c_str());
    }
}

// Returns false once stdin reached EOF or failed.
bool PumpStdin(Daemon &d, std::string &pending) {
    pollfd pfd{.fd = STDIN_FILENO, .events = POLLIN, .revents = 0};
    const int rc = ::poll(&pfd, 1, kPollIntervalMs);
    if (rc < 0) {
        if (errno == EINTR) return true;
        LogError("poll on stdin failed: %s", std::strerror(errno));
        return false;
    }
    if (rc == 0) return true;

    char buf[4096];
    const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return true;
        LogError("read on stdin failed: %s", std::strerror(errno));
        return false;
    }
    if (n == 0) {
        if (!pending.empty()) HandleLine(d, pending);
        pending.clear();
        return false;
    }

    pending.append(buf, static_cast<size_t>(n));
    size_t pos = 0;
    while ((pos = pending.find('\n')) != std::string::npos) {
        const std::string line = pending.substr(0, pos);
        pending.erase(0, pos + 1);
        HandleLine(d, line);
    }
    return true;
}

} // namespace

int main(int argc, char **argv) {
    updater::InstallSignalHandlers();

    std::string config_path = kDefaultConfigPath;
    bool verbose = false;
    bool check_now = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"check-now", no_argument, nullptr, 'n'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvc:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            case 'n':
                check_now = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    updater::config::UpdaterConfig cfg;
    if (auto r = updater::config::UpdaterConfig::LoadFromFile(config_path, cfg); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: cannot load config: %s\n", r.msg.c_str());
        return 1;
    }

    auto &logger = updater::Logger::Instance();
    logger.SetLevel(verbose ? updater::LogLevel::Debug
                            : updater::ParseLogLevel(cfg.log_level).value_or(updater::LogLevel::Info));

    if (auto r = updater::EnsureDirectory(cfg.StateDir()); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    updater::PolicyStore store(cfg.mode, cfg.local_policy);

    updater::FileRepositorySource source(updater::FileRepositorySource::Options{
        .repository_dir = cfg.repository_dir,
        .download_dir = cfg.DownloadDir(),
        .binary_path = cfg.binary_path,
    });

    auto channel = std::make_shared<updater::JsonLinesChannel>(stdout);
    updater::ProgressHub hub(channel, cfg.progress_queue_capacity);

    updater::LogProgressSink log_sink;
    hub.AddObserver(&log_sink);

    std::unique_ptr<updater::StatusFileSink> status_sink;
    if (!cfg.status_file.empty()) {
        status_sink = std::make_unique<updater::StatusFileSink>(cfg.status_file);
        hub.AddObserver(status_sink.get());
    }

    std::unique_ptr<updater::FileTelemetrySink> telemetry;
    if (!cfg.telemetry_file.empty()) {
        telemetry = std::make_unique<updater::FileTelemetrySink>(cfg.telemetry_file);
    }

    std::vector<std::string> args(argv, argv + argc);

    updater::UpdateManager::Options opts;
    opts.current_version = cfg.current_version;
    opts.channel = cfg.channel;
    opts.platform = cfg.platform;
    opts.arch = cfg.arch;
    opts.state_dir = cfg.StateDir();
    opts.failed_version_cooldown = std::chrono::hours(cfg.failed_version_cooldown_hours);
    opts.min_free_space_bytes = cfg.min_free_space_mb * 1024 * 1024;
    opts.restart_hook = updater::MakeRestartHook(cfg.restart_mode, cfg.binary_path, args,
                                                 [&hub] { hub.Flush(); });

    updater::UpdateManager manager(opts, store, source, hub, telemetry.get());
    updater::CommandDispatcher dispatcher(manager);

    LogInfo("agent-updater %s starting (channel=%s %s-%s, policy=%s)", cfg.current_version.c_str(),
            cfg.channel.c_str(), cfg.platform.c_str(), cfg.arch.c_str(),
            updater::ToString(manager.CurrentPolicy().source));

    std::stop_source shutdown;
    manager.Start(shutdown.get_token());

    if (check_now) dispatcher.Dispatch(updater::CheckUpdateCommand{});

    Daemon daemon{store, manager, dispatcher, *channel};
    std::string pending;
    bool stdin_open = true;
    while (!updater::g_shutdown.load(std::memory_order_relaxed)) {
        if (stdin_open) {
            stdin_open = PumpStdin(daemon, pending);
            if (!stdin_open) LogInfo("stdin closed; waiting for a signal to stop");
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
        }
    }

    LogInfo("Shutting down");
    shutdown.request_stop();
    dispatcher.Shutdown();
    manager.Stop();
    hub.Flush();
    hub.Shutdown();
    return 0;
}
