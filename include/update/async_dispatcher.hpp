#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace updater {

/*
    Single background worker draining a bounded task queue.

    Post never blocks: when the queue is full the oldest queued task is
    dropped. Exceptions thrown by a task are logged and the worker moves on.
*/
class AsyncDispatcher {
public:
    using Task = std::function<void()>;

    AsyncDispatcher(std::string name, std::size_t capacity);
    ~AsyncDispatcher();

    AsyncDispatcher(const AsyncDispatcher&) = delete;
    AsyncDispatcher& operator=(const AsyncDispatcher&) = delete;

    // Returns false once Shutdown has been called.
    bool Post(Task task);

    // Blocks until the queue is empty and no task is running.
    void WaitIdle();

    // Runs what is already queued, then joins the worker. Idempotent.
    void Shutdown();

    std::uint64_t Dropped() const;

private:
    void Run();

    const std::string name_;
    const std::size_t capacity_;

    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Task>        queue_;
    bool                    shutdown_ = false;
    bool                    busy_ = false;
    std::uint64_t           dropped_ = 0;

    std::thread thread_;
};

} // namespace updater
