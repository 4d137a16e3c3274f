#include "update/async_dispatcher.hpp"

#include "util/logger.hpp"

namespace updater {

AsyncDispatcher::AsyncDispatcher(std::string name, std::size_t capacity)
        : name_(std::move(name)), capacity_(capacity == 0 ? 1 : capacity) {
    thread_ = std::thread(&AsyncDispatcher::Run, this);
}

AsyncDispatcher::~AsyncDispatcher() { Shutdown(); }

bool AsyncDispatcher::Post(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) return false;
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
            LogWarn("%s: queue full (%zu), dropped oldest entry", name_.c_str(), capacity_);
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void AsyncDispatcher::WaitIdle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [&] { return queue_.empty() && !busy_; });
}

void AsyncDispatcher::Shutdown() {
    {
        std::lock_guard lock(mutex_);
        shutdown_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
}

std::uint64_t AsyncDispatcher::Dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

void AsyncDispatcher::Run() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
            if (shutdown_ && queue_.empty()) break;
            task = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LogError("%s: task failed: %s", name_.c_str(), e.what());
        }

        {
            std::lock_guard lock(mutex_);
            busy_ = false;
            if (queue_.empty()) idle_cv_.notify_all();
        }
    }

    std::lock_guard lock(mutex_);
    idle_cv_.notify_all();
}

} // namespace updater
