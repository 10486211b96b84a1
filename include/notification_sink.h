// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "sdcp_types.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

namespace sdcpwatch {

/// Receives notification events produced by status monitors.
/// Called from monitor threads; implementations must be thread-safe.
class INotificationSink {
  public:
    virtual ~INotificationSink() = default;

    virtual void notify(const DeviceDescriptor& device, const NotificationEvent& event) = 0;
};

/// Hands events to a single delivery thread so a slow inner sink never blocks a monitor.
/// Events are delivered in the order notify() was called.
class AsyncNotificationSink : public INotificationSink {
  public:
    explicit AsyncNotificationSink(std::shared_ptr<INotificationSink> inner);
    ~AsyncNotificationSink() override;

    AsyncNotificationSink(const AsyncNotificationSink&) = delete;
    AsyncNotificationSink& operator=(const AsyncNotificationSink&) = delete;

    /// Non-blocking: queues the event for the delivery thread
    void notify(const DeviceDescriptor& device, const NotificationEvent& event) override;

    /// Start the delivery thread
    void start();

    /// Deliver everything still queued, then stop the thread (blocks until joined)
    void shutdown();

    /// Events queued but not yet delivered
    size_t pending() const;

  private:
    struct Pending {
        DeviceDescriptor device;
        NotificationEvent event;
    };

    void delivery_loop();

    std::shared_ptr<INotificationSink> inner_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<Pending> queue_;

    std::atomic<bool> running_{false};
    std::thread delivery_thread_;
};

} // namespace sdcpwatch
