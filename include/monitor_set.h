// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "backoff_policy.h"
#include "device_registry.h"
#include "notification_sink.h"
#include "status_monitor.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sdcpwatch {

/**
 * @brief One StatusMonitor per registered device, started and stopped together
 *
 * Each monitor gets its own client (and therefore its own event loop thread), so a
 * printer that hangs or drops never stalls the others.
 */
class MonitorSet {
  public:
    /// Builds the transport for one device
    using ClientFactory = std::function<std::unique_ptr<SdcpClient>(const DeviceDescriptor&)>;

    MonitorSet(DeviceRegistry& registry, std::shared_ptr<INotificationSink> sink,
               ClientFactory factory, BackoffPolicy backoff = {});
    ~MonitorSet();

    MonitorSet(const MonitorSet&) = delete;
    MonitorSet& operator=(const MonitorSet&) = delete;

    void start_all();

    /// Stop every monitor; safe to call more than once
    void stop_all();

    size_t size() const { return monitors_.size(); }

    /// @return nullptr for an unknown id
    StatusMonitor* monitor(const std::string& id) const;

  private:
    std::vector<std::unique_ptr<StatusMonitor>> monitors_;
};

} // namespace sdcpwatch
