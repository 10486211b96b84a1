// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sdcp_types.h"

namespace sdcpwatch {

std::string DeviceDescriptor::websocket_url() const {
    return "ws://" + host + ":" + std::to_string(port) + "/websocket";
}

const char* severity_name(Severity severity) {
    switch (severity) {
    case Severity::NONE:
        return "none";
    case Severity::INFO:
        return "info";
    case Severity::ALERT_RED:
        return "alert-red";
    case Severity::ALERT_GREEN:
        return "alert-green";
    }
    return "unknown";
}

} // namespace sdcpwatch
