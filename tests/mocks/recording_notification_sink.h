// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef RECORDING_NOTIFICATION_SINK_H
#define RECORDING_NOTIFICATION_SINK_H

#include "notification_sink.h"

#include <mutex>
#include <vector>

using namespace sdcpwatch;

/// Keeps every delivered event for later inspection
class RecordingNotificationSink : public INotificationSink {
  public:
    struct Record {
        DeviceDescriptor device;
        NotificationEvent event;
    };

    void notify(const DeviceDescriptor& device, const NotificationEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back({device, event});
    }

    std::vector<Record> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<Record> records_;
};

#endif // RECORDING_NOTIFICATION_SINK_H
