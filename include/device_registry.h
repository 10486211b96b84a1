// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "sdcp_types.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sdcpwatch {

/**
 * @brief Known devices and their last two status snapshots
 *
 * Created once after discovery; the key set never changes afterwards, so lookups need
 * no registry-wide lock. Each entry has a small mutex so diagnostics can read an entry
 * while its monitor writes it. Only the owning StatusMonitor calls record_snapshot().
 *
 * Unknown ids are programmer errors and throw std::out_of_range.
 */
class DeviceRegistry {
  public:
    explicit DeviceRegistry(const std::vector<DeviceDescriptor>& devices);

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    bool contains(const std::string& id) const;
    size_t size() const { return entries_.size(); }

    /// Ids in discovery order
    const std::vector<std::string>& ids() const { return order_; }

    const DeviceDescriptor& descriptor(const std::string& id) const;

    /// Copy of the entry (descriptor + snapshots)
    DeviceEntry entry(const std::string& id) const;

    /**
     * @brief Store a new snapshot and return the pair to diff
     *
     * Atomically: previous <- current, current <- snapshot. The returned pair is the
     * one the caller must evaluate; it never mixes values from two different updates.
     *
     * @return previous is empty on the first call for this device
     */
    SnapshotPair record_snapshot(const std::string& id, const StatusSnapshot& snapshot);

  private:
    struct Slot {
        DeviceDescriptor descriptor;
        mutable std::mutex mutex;
        std::optional<StatusSnapshot> previous;
        std::optional<StatusSnapshot> current;
    };

    Slot& slot(const std::string& id) const;

    std::map<std::string, std::unique_ptr<Slot>> entries_;
    std::vector<std::string> order_;
};

} // namespace sdcpwatch
