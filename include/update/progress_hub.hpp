#pragma once

#include "update/async_dispatcher.hpp"
#include "update/progress.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace updater {

// Fans each event out to local observers (synchronously, in registration
// order) and to an optional remote channel (through a bounded queue).
class ProgressHub {
public:
    explicit ProgressHub(std::shared_ptr<IProgressChannel> channel = nullptr,
                         std::size_t queue_capacity = 64);
    ~ProgressHub();

    ProgressHub(const ProgressHub&) = delete;
    ProgressHub& operator=(const ProgressHub&) = delete;

    // Observers must outlive their registration and must not call back into
    // operations that publish.
    void AddObserver(IProgress* observer);
    void RemoveObserver(IProgress* observer);

    void SetChannel(std::shared_ptr<IProgressChannel> channel);

    void Publish(const ProgressEvent& e);

    // Waits until every queued remote event has been handed to the channel.
    void Flush();
    void Shutdown();

    std::uint64_t DroppedRemoteEvents() const;

private:
    mutable std::mutex mu_;
    std::vector<IProgress*> observers_;
    std::shared_ptr<IProgressChannel> channel_;
    AsyncDispatcher remote_;
};

} // namespace updater
