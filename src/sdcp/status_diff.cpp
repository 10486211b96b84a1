// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "status_diff.h"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cmath>

namespace sdcpwatch::diff {

namespace {

constexpr int PHASE_IDLE = static_cast<int>(PrintPhase::IDLE);
constexpr int PHASE_COMPLETE = static_cast<int>(PrintPhase::COMPLETE);

// std::nearbyint honours the default FE_TONEAREST mode: halves go to the even neighbour
int round_half_even(double value) {
    return static_cast<int>(std::nearbyint(value));
}

Severity select_severity(const std::optional<StatusSnapshot>& previous,
                         const StatusSnapshot& current, bool& attention) {
    attention = false;

    if (is_paused_or_stopped(current.print_phase)) {
        if (!previous || !is_paused_or_stopped(previous->print_phase)) {
            attention = true;
        }
        return Severity::ALERT_RED;
    }

    if (current.print_phase == PHASE_COMPLETE) {
        bool phase_changed = !previous || previous->print_phase != PHASE_COMPLETE;
        bool cooled = bed_temperature(current) <= COOLED_BED_THRESHOLD_C && previous &&
                      bed_temperature(*previous) > COOLED_BED_THRESHOLD_C;
        if (phase_changed || cooled) {
            attention = true;
            return Severity::ALERT_GREEN;
        }
        return Severity::NONE;
    }

    if (current.current_status == static_cast<int>(MachineStatus::PRINTING)) {
        return Severity::INFO;
    }
    return Severity::NONE;
}

} // namespace

int job_percent(const StatusSnapshot& snapshot) {
    if (snapshot.total_ticks <= 0.0) {
        return 0;
    }
    // Firmware occasionally overshoots total; cap far above 100% so the int cast stays defined
    double steps = std::min(snapshot.current_ticks * 20.0 / snapshot.total_ticks, 1.0e6);
    return round_half_even(steps) * JOB_PERCENT_STEP;
}

int bed_temperature(const StatusSnapshot& snapshot) {
    return round_half_even(std::clamp(snapshot.hotbed_temperature, -1.0e6, 1.0e6));
}

bool is_paused_or_stopped(int print_phase) {
    return print_phase >= static_cast<int>(PrintPhase::PAUSING) &&
           print_phase <= static_cast<int>(PrintPhase::STOPPED);
}

bool is_active_job(int print_phase) {
    return print_phase != PHASE_IDLE && print_phase != PHASE_COMPLETE;
}

std::string machine_status_label(int current_status) {
    switch (static_cast<MachineStatus>(current_status)) {
    case MachineStatus::IDLE:
        return "Idle";
    case MachineStatus::PRINTING:
        return "Print";
    case MachineStatus::FILE_TRANSFERRING:
        return "Upload";
    case MachineStatus::EXPOSURE_TESTING:
        return "Calib";
    case MachineStatus::DEVICES_TESTING:
        return "Test";
    }
    return std::to_string(current_status);
}

std::string print_phase_label(int print_phase) {
    switch (static_cast<PrintPhase>(print_phase)) {
    case PrintPhase::IDLE:
        return "IDLE";
    case PrintPhase::HOMING:
        return "HOMING";
    case PrintPhase::DROPPING:
        return "DROPPING";
    case PrintPhase::EXPOSING:
        return "EXPOSING";
    case PrintPhase::LIFTING:
        return "LIFTING";
    case PrintPhase::PAUSING:
        return "PAUSING";
    case PrintPhase::PAUSED:
        return "PAUSED";
    case PrintPhase::STOPPING:
        return "STOPPING";
    case PrintPhase::STOPPED:
        return "STOPPED";
    case PrintPhase::COMPLETE:
        return "COMPLETE";
    case PrintPhase::FILE_CHECKING:
        return "FILECHECK";
    case PrintPhase::PRINTING:
        return "PRINTING";
    case PrintPhase::HEATING:
        return "HEATING";
    }
    return std::to_string(print_phase);
}

std::string phase_label(const StatusSnapshot& snapshot) {
    return machine_status_label(snapshot.current_status) + ":" +
           print_phase_label(snapshot.print_phase);
}

std::optional<NotificationEvent> evaluate(const DeviceDescriptor& device,
                                          const std::optional<StatusSnapshot>& previous,
                                          const StatusSnapshot& current) {
    // First snapshot for this device: baseline only
    if (!previous) {
        return std::nullopt;
    }

    const int percent = job_percent(current);
    const int bed = bed_temperature(current);
    const bool phase_changed = previous->print_phase != current.print_phase;

    std::string detail;
    if (is_active_job(current.print_phase)) {
        if (!phase_changed && percent == job_percent(*previous)) {
            return std::nullopt;
        }
        detail = std::to_string(percent) + " %";
    } else {
        bool bed_step = bed != bed_temperature(*previous) && bed % BED_TEMP_STEP_C == 0;
        // Crossing the cooled threshold after completion is reported even off a 5° step
        bool cooled = current.print_phase == PHASE_COMPLETE && bed <= COOLED_BED_THRESHOLD_C &&
                      bed_temperature(*previous) > COOLED_BED_THRESHOLD_C;
        if (!phase_changed && !bed_step && !cooled) {
            return std::nullopt;
        }
        detail = std::to_string(bed) + "\xc2\xb0" "C";
    }

    NotificationEvent event;
    event.device_id = device.id;
    event.severity = select_severity(previous, current, event.attention);
    event.phase_label = phase_label(current);
    event.detail = std::move(detail);
    event.machine_status = current.current_status;
    event.print_phase = current.print_phase;
    event.job_percent = percent;
    event.bed_temperature = bed;

    spdlog::trace("[Status Diff] {}: {} {} severity={}{}", device.name, event.phase_label,
                  event.detail, severity_name(event.severity),
                  event.attention ? " (attention)" : "");
    return event;
}

} // namespace sdcpwatch::diff
