#pragma once

#include "command/command.hpp"
#include "update/update_manager.hpp"
#include "util/result.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

namespace updater {

/*
  Turns server commands into manager calls.

  check_update and force_update run on their own threads and report only
  through progress events; cancel_update runs inline.
*/
class CommandDispatcher {
public:
    explicit CommandDispatcher(IUpdateController& controller);
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    void Dispatch(const Command& cmd);

    // Unknown names are logged and ignored.
    void HandleCommand(std::string_view name, const nlohmann::json& data);

    // {"type":"command","command":"<name>","data":{...}} or a bare {"command":...}.
    Result HandleWireMessage(std::string_view raw);

    // Waits for in-flight tasks without cancelling them.
    void Drain();

    // Requests stop on in-flight tasks and joins them. Later commands are dropped.
    void Shutdown();

    size_t InFlight();

private:
    struct Task {
        std::jthread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    void Spawn(const Command& cmd);
    void ReapLocked();

    IUpdateController& controller_;

    std::mutex mu_;
    std::list<Task> tasks_;
    bool shutdown_ = false;
};

} // namespace updater
