// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "console_notification_sink.h"

#include <spdlog/fmt/fmt.h>

namespace sdcpwatch {

namespace {

constexpr const char* BELL = "\a";
constexpr const char* RESET = "\033[0m";

const char* severity_color(Severity severity) {
    switch (severity) {
    case Severity::ALERT_RED:
        return "\033[41m\033[37m";
    case Severity::ALERT_GREEN:
        return "\033[42m\033[37m";
    case Severity::INFO:
        return "\033[93m";
    case Severity::NONE:
        break;
    }
    return "";
}

bool is_idle_or_complete(int print_phase) {
    return print_phase == static_cast<int>(PrintPhase::IDLE) ||
           print_phase == static_cast<int>(PrintPhase::COMPLETE);
}

} // namespace

ConsoleNotificationSink::ConsoleNotificationSink(std::ostream& out, bool color, bool bell)
    : out_(out), color_(color), bell_(bell) {}

std::string ConsoleNotificationSink::format_line(const DeviceDescriptor& device,
                                                 const NotificationEvent& event) const {
    std::string prefix;
    if (bell_ && event.attention) {
        prefix += BELL;
    }
    if (color_) {
        prefix += severity_color(event.severity);
    }

    std::string detail =
        is_idle_or_complete(event.print_phase) ? "bed " + event.detail : event.detail;

    return fmt::format("{}{:<24} @ {:<16} {:<20} {}{}", prefix, device.name, device.host,
                       event.phase_label, detail, color_ ? RESET : "");
}

void ConsoleNotificationSink::notify(const DeviceDescriptor& device,
                                     const NotificationEvent& event) {
    std::string line = format_line(device, event);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::endl;
}

} // namespace sdcpwatch
