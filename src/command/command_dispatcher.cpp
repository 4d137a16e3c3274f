#include "command/command_dispatcher.hpp"

#include "util/json_utils.hpp"
#include "util/logger.hpp"

#include <cerrno>

namespace updater {

namespace {

void LogOutcome(const char* name, const Result& r) {
    if (r.is_ok()) {
        LogInfo("%s finished", name);
    } else if (r.busy()) {
        LogInfo("%s ignored: %s", name, r.msg.c_str());
    } else if (r.cancelled()) {
        LogInfo("%s cancelled", name);
    } else {
        LogWarn("%s failed: %s", name, r.msg.c_str());
    }
}

} // namespace

CommandDispatcher::CommandDispatcher(IUpdateController& controller) : controller_(controller) {}

CommandDispatcher::~CommandDispatcher() { Shutdown(); }

void CommandDispatcher::Dispatch(const Command& cmd) {
    if (std::holds_alternative<CancelUpdateCommand>(cmd)) {
        if (controller_.Cancel()) {
            LogInfo("cancel_update: session cancelled");
        } else {
            LogInfo("cancel_update: nothing cancellable in progress");
        }
        return;
    }
    Spawn(cmd);
}

void CommandDispatcher::HandleCommand(std::string_view name, const nlohmann::json& data) {
    auto cmd = ParseCommand(name, data);
    if (!cmd) {
        LogWarn("Ignoring command: %s", cmd.error().c_str());
        return;
    }
    LogInfo("Received command %s", CommandName(*cmd));
    Dispatch(*cmd);
}

Result CommandDispatcher::HandleWireMessage(std::string_view raw) {
    nlohmann::json j;
    std::string err;
    if (!json_utils::ParseJsonObject(raw, j, err)) {
        return Result::Fail(EINVAL, err);
    }

    std::string type;
    if (!json_utils::GetStringIfPresent(j, "type", type, err)) return Result::Fail(EINVAL, err);
    if (!type.empty() && type != "command") {
        return Result::Fail(EINVAL, "not a command message: type '" + type + "'");
    }

    std::string name;
    if (!json_utils::GetStringIfPresent(j, "command", name, err)) return Result::Fail(EINVAL, err);
    if (name.empty()) return Result::Fail(EINVAL, "command message without command name");

    const auto it = j.find("data");
    HandleCommand(name, it != j.end() ? *it : nlohmann::json());
    return Result::Ok();
}

void CommandDispatcher::Spawn(const Command& cmd) {
    std::lock_guard lock(mu_);
    if (shutdown_) {
        LogWarn("%s dropped: dispatcher shutting down", CommandName(cmd));
        return;
    }
    ReapLocked();

    auto done = std::make_shared<std::atomic_bool>(false);
    std::jthread thread([this, cmd, done](std::stop_token stop) {
        const char* name = CommandName(cmd);
        Result r;
        if (const auto* force = std::get_if<ForceUpdateCommand>(&cmd)) {
            r = controller_.ForceInstallLatest(stop, force->reason);
        } else {
            r = controller_.CheckNow(stop);
        }
        LogOutcome(name, r);
        done->store(true, std::memory_order_release);
    });
    tasks_.push_back(Task{std::move(thread), std::move(done)});
}

void CommandDispatcher::ReapLocked() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->done->load(std::memory_order_acquire)) {
            it->thread.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void CommandDispatcher::Drain() {
    std::list<Task> tasks;
    {
        std::lock_guard lock(mu_);
        tasks.swap(tasks_);
    }
    for (auto& t : tasks) {
        if (t.thread.joinable()) t.thread.join();
    }
}

void CommandDispatcher::Shutdown() {
    std::list<Task> tasks;
    {
        std::lock_guard lock(mu_);
        shutdown_ = true;
        tasks.swap(tasks_);
    }
    for (auto& t : tasks) t.thread.request_stop();
    for (auto& t : tasks) {
        if (t.thread.joinable()) t.thread.join();
    }
}

size_t CommandDispatcher::InFlight() {
    std::lock_guard lock(mu_);
    ReapLocked();
    return tasks_.size();
}

} // namespace updater
