// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file status_diff.h
 * @brief Decides whether a status update is worth a notification
 *
 * Turns the noisy per-second status stream into sparse events:
 * - active jobs notify on phase change or a 5% progress step
 * - idle/complete notify on phase change or a bed temperature on a 5°C boundary
 * - the first snapshot of a device only establishes a baseline
 *
 * All functions are pure; the caller supplies both snapshots.
 */

#pragma once

#include "sdcp_types.h"

#include <optional>
#include <string>

namespace sdcpwatch::diff {

/// Bed temperature at or below which a completed job counts as cooled
constexpr int COOLED_BED_THRESHOLD_C = 40;

/// Idle/complete temperature changes are reported only on multiples of this step
constexpr int BED_TEMP_STEP_C = 5;

/// Progress granularity in percent
constexpr int JOB_PERCENT_STEP = 5;

/**
 * @brief Job progress rounded to the nearest 5%
 *
 * Computed as round(current * 20 / total) * 5, ties to even. 0 when total_ticks is 0.
 */
int job_percent(const StatusSnapshot& snapshot);

/// Hotbed temperature rounded to whole degrees (ties to even)
int bed_temperature(const StatusSnapshot& snapshot);

/// Pausing, paused, stopping or stopped
bool is_paused_or_stopped(int print_phase);

/// Anything other than idle(0) and complete(9)
bool is_active_job(int print_phase);

/// "Idle", "Print", ... or the number for unknown values
std::string machine_status_label(int current_status);

/// "IDLE", "PRINTING", ... or the number for unknown values
std::string print_phase_label(int print_phase);

/// "<machine status>:<print phase>", e.g. "Print:PAUSED"
std::string phase_label(const StatusSnapshot& snapshot);

/**
 * @brief Evaluate one update for a device
 *
 * @param device Device the snapshots belong to
 * @param previous Snapshot before this update; nullopt on the first update
 * @param current Snapshot just received
 * @return Event to dispatch, or nullopt when nothing significant changed
 */
std::optional<NotificationEvent> evaluate(const DeviceDescriptor& device,
                                          const std::optional<StatusSnapshot>& previous,
                                          const StatusSnapshot& current);

} // namespace sdcpwatch::diff
