// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "monitor_set.h"

#include "spdlog/spdlog.h"

namespace sdcpwatch {

MonitorSet::MonitorSet(DeviceRegistry& registry, std::shared_ptr<INotificationSink> sink,
                       ClientFactory factory, BackoffPolicy backoff) {
    monitors_.reserve(registry.size());
    for (const std::string& id : registry.ids()) {
        const DeviceDescriptor& device = registry.descriptor(id);
        monitors_.push_back(std::make_unique<StatusMonitor>(device, registry, sink,
                                                            factory(device), backoff));
    }
}

MonitorSet::~MonitorSet() {
    stop_all();
}

void MonitorSet::start_all() {
    spdlog::info("[Monitor Set] Starting {} monitor(s)", monitors_.size());
    for (auto& monitor : monitors_) {
        monitor->start();
    }
}

void MonitorSet::stop_all() {
    for (auto& monitor : monitors_) {
        monitor->stop();
    }
}

StatusMonitor* MonitorSet::monitor(const std::string& id) const {
    for (const auto& monitor : monitors_) {
        if (monitor->device().id == id) {
            return monitor.get();
        }
    }
    return nullptr;
}

} // namespace sdcpwatch
