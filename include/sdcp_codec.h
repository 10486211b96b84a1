// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file sdcp_codec.h
 * @brief Encoding and decoding of SDCP JSON envelopes
 *
 * Isolates the vendor wire format (field names, string-typed numbers, topic strings)
 * from the rest of the monitor. Everything here is stateless and thread-safe.
 */

#pragma once

#include "sdcp_error.h"
#include "sdcp_types.h"

#include <cstdint>
#include <string>

#include "hv/json.hpp" // libhv's nlohmann json (via cpputil/)

using json = nlohmann::json;

namespace sdcpwatch::codec {

/// Cmd value meaning "query status"
constexpr int CMD_STATUS_REQUEST = 0;

/// "From" value used by SDCP clients
constexpr int REQUEST_FROM_CLIENT = 0;

/// Topic prefix for outbound requests, followed by the MainboardID
constexpr const char* REQUEST_TOPIC_PREFIX = "sdcp/request/";

/**
 * @brief Which protocol the envelope came from
 *
 * Discovery replies must carry "Id" and a "Data" object. Status channel messages only
 * need to be a JSON object; those without "Status" are acknowledgements and are ignored.
 */
enum class EnvelopeKind { DISCOVERY_REPLY, STATUS_MESSAGE };

/**
 * @brief Result of decode_envelope()
 */
struct DecodeResult {
    json envelope;
    SdcpError error;

    bool ok() const { return !error.has_error(); }
};

/**
 * @brief Result of extract_status()
 *
 * has_status is false for valid non-status traffic (no "Status" field).
 */
struct StatusResult {
    bool has_status = false;
    StatusSnapshot snapshot;
    SdcpError error;

    bool ok() const { return !error.has_error(); }
};

/**
 * @brief Result of parse_discovery_reply()
 */
struct DiscoveryReply {
    DeviceDescriptor descriptor;
    SdcpError error;

    bool ok() const { return !error.has_error(); }
};

/**
 * @brief Generate a fresh request id: 8 random bytes as 16 lowercase hex digits
 */
std::string generate_request_id();

/**
 * @brief Build a "query status" request envelope
 *
 * @param device_id Device id from discovery
 * @param mainboard_id MainboardID, also used for the request topic
 * @param timestamp Unix time in seconds
 * @return Serialized JSON text frame
 */
std::string encode_status_request(const std::string& device_id, const std::string& mainboard_id,
                                  int64_t timestamp);

/// Same as above, stamped with the current Unix time
std::string encode_status_request(const std::string& device_id, const std::string& mainboard_id);

/**
 * @brief Parse a raw payload into a JSON envelope
 *
 * @return DecodeResult with MALFORMED_PAYLOAD when the bytes are not a JSON object or
 *         miss the fields required for @p kind
 */
DecodeResult decode_envelope(const std::string& bytes, EnvelopeKind kind);

/**
 * @brief Map the "Status" object of a status envelope into a StatusSnapshot
 *
 * Numeric-looking strings are coerced. CurrentStatus may be an array (first element
 * is used) or a bare number. Missing ticks default to 0.
 *
 * @return has_status=false when the envelope carries no "Status";
 *         MALFORMED_STATUS when CurrentStatus, PrintInfo.Status or TempOfHotbed is
 *         absent or non-numeric
 */
StatusResult extract_status(const json& envelope);

/**
 * @brief Decode a UDP discovery reply into a DeviceDescriptor
 *
 * @param bytes Datagram payload
 * @param source_ip Sender address, used when Data.MainboardIP is absent
 */
DiscoveryReply parse_discovery_reply(const std::string& bytes, const std::string& source_ip);

} // namespace sdcpwatch::codec
