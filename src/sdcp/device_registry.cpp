// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_registry.h"

#include "spdlog/spdlog.h"

#include <stdexcept>

namespace sdcpwatch {

DeviceRegistry::DeviceRegistry(const std::vector<DeviceDescriptor>& devices) {
    for (const auto& device : devices) {
        auto it = entries_.find(device.id);
        if (it != entries_.end()) {
            // Last reply wins, first-seen order kept
            it->second->descriptor = device;
            continue;
        }
        auto slot = std::make_unique<Slot>();
        slot->descriptor = device;
        entries_.emplace(device.id, std::move(slot));
        order_.push_back(device.id);
    }
    spdlog::debug("[Registry] Created with {} device(s)", entries_.size());
}

bool DeviceRegistry::contains(const std::string& id) const {
    return entries_.find(id) != entries_.end();
}

DeviceRegistry::Slot& DeviceRegistry::slot(const std::string& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        throw std::out_of_range("DeviceRegistry: unknown device id '" + id + "'");
    }
    return *it->second;
}

const DeviceDescriptor& DeviceRegistry::descriptor(const std::string& id) const {
    return slot(id).descriptor;
}

DeviceEntry DeviceRegistry::entry(const std::string& id) const {
    Slot& s = slot(id);
    std::lock_guard<std::mutex> lock(s.mutex);
    return DeviceEntry{s.descriptor, s.previous, s.current};
}

SnapshotPair DeviceRegistry::record_snapshot(const std::string& id,
                                             const StatusSnapshot& snapshot) {
    Slot& s = slot(id);
    std::lock_guard<std::mutex> lock(s.mutex);
    s.previous = s.current;
    s.current = snapshot;
    return SnapshotPair{s.previous, snapshot};
}

} // namespace sdcpwatch
