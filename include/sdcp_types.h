// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sdcpwatch {

/**
 * @brief Top-level machine state reported in Status.CurrentStatus[0]
 */
enum class MachineStatus : int {
    IDLE = 0,
    PRINTING = 1,
    FILE_TRANSFERRING = 2,
    EXPOSURE_TESTING = 3,
    DEVICES_TESTING = 4,
};

/**
 * @brief Sub-state of an active job reported in Status.PrintInfo.Status
 *
 * Firmware variants send values outside this list; snapshots keep the raw integer.
 */
enum class PrintPhase : int {
    IDLE = 0,
    HOMING = 1,
    DROPPING = 2,
    EXPOSING = 3,
    LIFTING = 4,
    PAUSING = 5,
    PAUSED = 6,
    STOPPING = 7,
    STOPPED = 8,
    COMPLETE = 9,
    FILE_CHECKING = 10,
    PRINTING = 13,
    HEATING = 16,
};

/// Port of the printer's WebSocket status channel
constexpr uint16_t SDCP_WEBSOCKET_PORT = 3030;

/**
 * @brief A printer found by the UDP discovery broadcast
 *
 * Immutable once discovered. Identity key is @ref id.
 */
struct DeviceDescriptor {
    std::string id;               ///< Protocol-assigned device id (reply "Id")
    std::string name;             ///< Display name (Data.Name)
    std::string host;             ///< Data.MainboardIP, or the reply's source IP
    uint16_t port = SDCP_WEBSOCKET_PORT; ///< WebSocket port
    std::string mainboard_id;     ///< Data.MainboardID (falls back to id)
    std::string firmware_version; ///< Data.FirmwareVersion, may be empty
    std::string source_address;   ///< IP address the discovery reply came from

    /// ws://<host>:<port>/websocket
    std::string websocket_url() const;

    bool operator==(const DeviceDescriptor& other) const {
        return id == other.id && name == other.name && host == other.host && port == other.port &&
               mainboard_id == other.mainboard_id && firmware_version == other.firmware_version;
    }
};

/**
 * @brief One decoded status message
 *
 * Replaced wholesale on every update, never merged.
 */
struct StatusSnapshot {
    int current_status = 0;
    int print_phase = 0;
    double hotbed_temperature = 0.0;
    double current_ticks = 0.0;
    double total_ticks = 0.0; ///< 0 means no active job

    bool operator==(const StatusSnapshot& other) const {
        return current_status == other.current_status && print_phase == other.print_phase &&
               hotbed_temperature == other.hotbed_temperature &&
               current_ticks == other.current_ticks && total_ticks == other.total_ticks;
    }
    bool operator!=(const StatusSnapshot& other) const { return !(*this == other); }
};

/**
 * @brief Registry entry: descriptor plus a depth-1 snapshot history
 */
struct DeviceEntry {
    DeviceDescriptor descriptor;
    std::optional<StatusSnapshot> previous;
    std::optional<StatusSnapshot> current;
};

/**
 * @brief Consistent (previous, current) pair returned by DeviceRegistry::record_snapshot()
 *
 * An empty @ref previous means this is the first snapshot seen for the device.
 */
struct SnapshotPair {
    std::optional<StatusSnapshot> previous;
    StatusSnapshot current;
};

enum class Severity {
    NONE,        ///< Default rendering
    INFO,        ///< Printing, attention color
    ALERT_RED,   ///< Pausing/paused/stopping/stopped
    ALERT_GREEN, ///< Complete, or bed cooled after completion
};

const char* severity_name(Severity severity);

/**
 * @brief A status change worth showing to the operator
 */
struct NotificationEvent {
    std::string device_id;
    Severity severity = Severity::NONE;
    std::string phase_label; ///< e.g. "Print:PRINTING"
    std::string detail;      ///< "50 %" for active jobs, "38°C" when idle/complete
    bool attention = false;  ///< Audible cue requested
    int machine_status = 0;
    int print_phase = 0;
    int job_percent = 0;
    int bed_temperature = 0;
};

} // namespace sdcpwatch
