#pragma once

#include <chrono>
#include <condition_variable>
#include <core/model/service_event.h>
#include <deque>
#include <mutex>
#include <optional>

namespace wledbackup::core {

// Hands service events from the browser's io thread to the collecting thread.
class EventChannel {
public:
    void Push(ServiceEvent event);

    // Waits at most `timeout` for the next event. Returns nullopt on timeout or
    // once the channel is closed and drained.
    std::optional<ServiceEvent> Receive(std::chrono::milliseconds timeout);

    void Close();
    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ServiceEvent> events_;
    bool closed_ = false;
};

} // namespace wledbackup::core
