// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file sdcp_codec.cpp
 * @brief SDCP envelope encode/decode
 *
 * @gotchas Printer firmware sends several numeric fields as strings ("25.3"), and
 *          CurrentStatus is an array on most firmware but a bare number on some
 */

#include "sdcp_codec.h"

#include "json_utils.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <chrono>
#include <climits>
#include <cstdio>
#include <mutex>
#include <random>

namespace sdcpwatch::codec {

namespace {

std::mutex g_rng_mutex;

std::mt19937_64& request_id_rng() {
    static std::mt19937_64 rng(std::random_device{}());
    return rng;
}

/// CurrentStatus is [n] on most firmware, n on some
std::optional<double> current_status_value(const json& status) {
    if (!status.contains("CurrentStatus")) {
        return std::nullopt;
    }
    const json& cs = status["CurrentStatus"];
    if (cs.is_array()) {
        if (cs.empty()) {
            return std::nullopt;
        }
        return json_util::to_number(cs[0]);
    }
    return json_util::to_number(cs);
}

/// Enum fields must fit an int; fractional values truncate
bool is_status_code(const std::optional<double>& v) {
    return v && *v >= static_cast<double>(INT_MIN) && *v <= static_cast<double>(INT_MAX);
}

} // namespace

std::string generate_request_id() {
    uint64_t value;
    {
        std::lock_guard<std::mutex> lock(g_rng_mutex);
        value = request_id_rng()();
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(value));
    return std::string(buf);
}

std::string encode_status_request(const std::string& device_id, const std::string& mainboard_id,
                                  int64_t timestamp) {
    json request = {{"Id", device_id},
                    {"Data",
                     {{"Cmd", CMD_STATUS_REQUEST},
                      {"Data", json::object()},
                      {"RequestID", generate_request_id()},
                      {"MainboardID", mainboard_id},
                      {"TimeStamp", timestamp},
                      {"From", REQUEST_FROM_CLIENT}}},
                    {"Topic", std::string(REQUEST_TOPIC_PREFIX) + mainboard_id}};
    return request.dump();
}

std::string encode_status_request(const std::string& device_id, const std::string& mainboard_id) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
    return encode_status_request(device_id, mainboard_id, static_cast<int64_t>(seconds.count()));
}

DecodeResult decode_envelope(const std::string& bytes, EnvelopeKind kind) {
    DecodeResult result;
    try {
        result.envelope = json::parse(bytes);
    } catch (const json::exception& e) {
        // parse_error for bad syntax, out_of_range for numbers that overflow a double
        result.error = SdcpError::malformed_payload(std::string("invalid JSON: ") + e.what());
        return result;
    }

    if (!result.envelope.is_object()) {
        result.error = SdcpError::malformed_payload("envelope is not a JSON object");
        return result;
    }

    if (kind == EnvelopeKind::DISCOVERY_REPLY) {
        const json& env = result.envelope;
        if (!env.contains("Id") || !env["Id"].is_string()) {
            result.error = SdcpError::malformed_payload("discovery reply has no string 'Id'");
        } else if (!env.contains("Data") || !env["Data"].is_object()) {
            result.error = SdcpError::malformed_payload("discovery reply has no 'Data' object");
        }
    }
    return result;
}

StatusResult extract_status(const json& envelope) {
    StatusResult result;
    if (!envelope.is_object() || !envelope.contains("Status")) {
        return result;
    }
    result.has_status = true;

    const json& status = envelope["Status"];
    if (!status.is_object()) {
        result.error = SdcpError::malformed_status("'Status' is not an object");
        return result;
    }

    auto current_status = current_status_value(status);
    if (!is_status_code(current_status)) {
        result.error = SdcpError::malformed_status("CurrentStatus missing or non-numeric");
        return result;
    }

    if (!status.contains("PrintInfo") || !status["PrintInfo"].is_object()) {
        result.error = SdcpError::malformed_status("PrintInfo missing");
        return result;
    }
    const json& print_info = status["PrintInfo"];

    auto phase = json_util::number_field(print_info, "Status");
    if (!is_status_code(phase)) {
        result.error = SdcpError::malformed_status("PrintInfo.Status missing or non-numeric");
        return result;
    }

    auto hotbed = json_util::number_field(status, "TempOfHotbed");
    if (!hotbed) {
        result.error = SdcpError::malformed_status("TempOfHotbed missing or non-numeric");
        return result;
    }

    StatusSnapshot& snap = result.snapshot;
    snap.current_status = static_cast<int>(*current_status);
    snap.print_phase = static_cast<int>(*phase);
    snap.hotbed_temperature = *hotbed;
    snap.current_ticks = std::max(0.0, json_util::safe_double(print_info, "CurrentTicks"));
    snap.total_ticks = std::max(0.0, json_util::safe_double(print_info, "TotalTicks"));
    return result;
}

DiscoveryReply parse_discovery_reply(const std::string& bytes, const std::string& source_ip) {
    DiscoveryReply reply;
    DecodeResult decoded = decode_envelope(bytes, EnvelopeKind::DISCOVERY_REPLY);
    if (!decoded.ok()) {
        reply.error = decoded.error;
        reply.error.source = source_ip;
        return reply;
    }

    const json& data = decoded.envelope["Data"];
    DeviceDescriptor& d = reply.descriptor;
    d.id = decoded.envelope["Id"].get<std::string>();
    d.name = json_util::safe_string(data, "Name", "?");
    d.firmware_version = json_util::safe_string(data, "FirmwareVersion");
    d.mainboard_id = json_util::safe_string(data, "MainboardID", d.id);
    d.host = json_util::safe_string(data, "MainboardIP", source_ip);
    d.source_address = source_ip;
    if (d.mainboard_id.empty()) {
        d.mainboard_id = d.id;
    }
    if (d.host.empty()) {
        d.host = source_ip;
    }

    if (d.host.empty()) {
        reply.error = SdcpError::malformed_payload("discovery reply has no usable address",
                                                   source_ip);
        return reply;
    }

    spdlog::trace("[Codec] Discovery reply from {}: id={} name={} mainboard={}", source_ip, d.id,
                  d.name, d.mainboard_id);
    return reply;
}

} // namespace sdcpwatch::codec
