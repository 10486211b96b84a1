// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "notification_sink.h"

#include <mutex>
#include <ostream>
#include <string>

namespace sdcpwatch {

/**
 * @brief Prints one aligned, colored status line per notification
 *
 *   <cue><name 24> @ <host 16> <label 20> <detail><reset>
 *
 * The cue is the terminal bell (when attention is set) followed by the severity color:
 * inverted red for pause/stop, inverted green for complete/cooled, yellow for printing.
 */
class ConsoleNotificationSink : public INotificationSink {
  public:
    explicit ConsoleNotificationSink(std::ostream& out, bool color = true, bool bell = true);

    void notify(const DeviceDescriptor& device, const NotificationEvent& event) override;

    /// The line notify() writes, without the trailing newline
    std::string format_line(const DeviceDescriptor& device, const NotificationEvent& event) const;

  private:
    std::ostream& out_;
    bool color_;
    bool bell_;
    std::mutex mutex_;
};

} // namespace sdcpwatch
