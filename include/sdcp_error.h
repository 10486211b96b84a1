// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace sdcpwatch {

/**
 * @brief Error types for SDCP discovery and status handling
 */
enum class SdcpErrorType {
    NONE,              // No error
    MALFORMED_PAYLOAD, // Not JSON, or missing required envelope fields
    MALFORMED_STATUS,  // Status sub-fields missing or non-numeric
    CONNECTION_LOST,   // WebSocket transport closed
    NO_DEVICES_FOUND,  // Discovery window elapsed with nothing found
    SOCKET_ERROR,      // UDP socket could not be opened or used
};

/**
 * @brief Error information for SDCP operations
 *
 * MALFORMED_* errors drop a single message; the connection stays open.
 * NO_DEVICES_FOUND and SOCKET_ERROR stop the process before monitoring starts.
 */
struct SdcpError {
    SdcpErrorType type = SdcpErrorType::NONE;
    std::string message; // Human-readable error message
    std::string source;  // Peer address or device id the error relates to

    bool has_error() const { return type != SdcpErrorType::NONE; }

    std::string get_type_string() const {
        switch (type) {
        case SdcpErrorType::NONE:
            return "NONE";
        case SdcpErrorType::MALFORMED_PAYLOAD:
            return "MALFORMED_PAYLOAD";
        case SdcpErrorType::MALFORMED_STATUS:
            return "MALFORMED_STATUS";
        case SdcpErrorType::CONNECTION_LOST:
            return "CONNECTION_LOST";
        case SdcpErrorType::NO_DEVICES_FOUND:
            return "NO_DEVICES_FOUND";
        case SdcpErrorType::SOCKET_ERROR:
            return "SOCKET_ERROR";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Get a user-friendly error message
     */
    std::string user_message() const {
        if (type == SdcpErrorType::NO_DEVICES_FOUND) {
            return "No printers found";
        } else if (type == SdcpErrorType::CONNECTION_LOST) {
            return "Connection to printer lost";
        } else if (type == SdcpErrorType::SOCKET_ERROR) {
            return "Unable to open discovery socket: " + message;
        } else if (!message.empty()) {
            return message;
        }
        return "An unknown error occurred.";
    }

    static SdcpError malformed_payload(const std::string& what, const std::string& source = "") {
        SdcpError err;
        err.type = SdcpErrorType::MALFORMED_PAYLOAD;
        err.message = what;
        err.source = source;
        return err;
    }

    static SdcpError malformed_status(const std::string& what, const std::string& source = "") {
        SdcpError err;
        err.type = SdcpErrorType::MALFORMED_STATUS;
        err.message = what;
        err.source = source;
        return err;
    }

    static SdcpError connection_lost(const std::string& source = "") {
        SdcpError err;
        err.type = SdcpErrorType::CONNECTION_LOST;
        err.message = "WebSocket connection lost";
        err.source = source;
        return err;
    }

    static SdcpError no_devices_found() {
        SdcpError err;
        err.type = SdcpErrorType::NO_DEVICES_FOUND;
        err.message = "Discovery window elapsed with no SDCP replies";
        return err;
    }

    static SdcpError socket_error(const std::string& what) {
        SdcpError err;
        err.type = SdcpErrorType::SOCKET_ERROR;
        err.message = what;
        return err;
    }
};

} // namespace sdcpwatch
