// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notification_sink.h"

#include "spdlog/spdlog.h"

namespace sdcpwatch {

AsyncNotificationSink::AsyncNotificationSink(std::shared_ptr<INotificationSink> inner)
    : inner_(std::move(inner)) {}

AsyncNotificationSink::~AsyncNotificationSink() {
    shutdown();
}

void AsyncNotificationSink::notify(const DeviceDescriptor& device, const NotificationEvent& event) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push({device, event});
    queue_cv_.notify_one();
}

void AsyncNotificationSink::start() {
    if (running_.load())
        return;
    running_.store(true);
    delivery_thread_ = std::thread(&AsyncNotificationSink::delivery_loop, this);
    spdlog::debug("[Notification Sink] started delivery thread");
}

void AsyncNotificationSink::shutdown() {
    if (!running_.load())
        return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_.store(false);
    }
    queue_cv_.notify_one();
    if (delivery_thread_.joinable()) {
        delivery_thread_.join();
    }
    spdlog::debug("[Notification Sink] shutdown complete");
}

size_t AsyncNotificationSink::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void AsyncNotificationSink::delivery_loop() {
    while (true) {
        Pending item;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });
            if (queue_.empty()) {
                // Stopped and drained
                return;
            }
            item = std::move(queue_.front());
            queue_.pop();
        }

        if (!inner_) {
            continue;
        }
        try {
            inner_->notify(item.device, item.event);
        } catch (const std::exception& e) {
            spdlog::error("[Notification Sink] delivery for {} failed: {}", item.device.id,
                          e.what());
        }
    }
}

} // namespace sdcpwatch
