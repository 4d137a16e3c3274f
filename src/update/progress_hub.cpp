#include "update/progress_hub.hpp"

#include "util/logger.hpp"

#include <algorithm>

namespace updater {

ProgressHub::ProgressHub(std::shared_ptr<IProgressChannel> channel, std::size_t queue_capacity)
    : channel_(std::move(channel)), remote_("progress-remote", queue_capacity) {}

ProgressHub::~ProgressHub() { Shutdown(); }

void ProgressHub::AddObserver(IProgress* observer) {
    if (!observer) return;
    std::lock_guard lock(mu_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
        observers_.push_back(observer);
}

void ProgressHub::RemoveObserver(IProgress* observer) {
    std::lock_guard lock(mu_);
    std::erase(observers_, observer);
}

void ProgressHub::SetChannel(std::shared_ptr<IProgressChannel> channel) {
    std::lock_guard lock(mu_);
    channel_ = std::move(channel);
}

void ProgressHub::Publish(const ProgressEvent& e) {
    std::vector<IProgress*> observers;
    std::shared_ptr<IProgressChannel> channel;
    {
        std::lock_guard lock(mu_);
        observers = observers_;
        channel = channel_;
    }

    for (IProgress* o : observers) {
        try {
            o->OnProgress(e);
        } catch (const std::exception& ex) {
            LogError("Progress observer threw on '%s': %s", ToString(e.status), ex.what());
        }
    }

    if (!channel) return;
    const bool queued = remote_.Post([channel, e] {
        auto r = channel->Send(e);
        if (!r.is_ok()) {
            LogWarn("Progress send failed (%s): %s", ToString(e.status), r.msg.c_str());
        }
    });
    if (!queued) {
        LogDebug("Progress hub shut down; '%s' not sent", ToString(e.status));
    }
}

void ProgressHub::Flush() { remote_.WaitIdle(); }

void ProgressHub::Shutdown() { remote_.Shutdown(); }

std::uint64_t ProgressHub::DroppedRemoteEvents() const { return remote_.Dropped(); }

} // namespace updater
