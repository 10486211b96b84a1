// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file sdcp_discovery.cpp
 * @brief UDP broadcast discovery of SDCP printers
 *
 * @pattern Injected transport; blocking receive loop with an idle window
 * @threading Runs on the caller's thread, before monitors exist
 * @gotchas Printers answer each probe once, but busy networks deliver duplicates
 */

#include "sdcp_discovery.h"

#include "sdcp_codec.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <map>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace sdcpwatch {

namespace {

// SDCP discovery replies are a few hundred bytes
constexpr size_t RECV_BUFFER_SIZE = 4096;

std::string errno_string(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

// ============================================================================
// UdpBroadcastTransport
// ============================================================================

UdpBroadcastTransport::~UdpBroadcastTransport() {
    close();
}

SdcpError UdpBroadcastTransport::open() {
    close();

    sock_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_ < 0) {
        return SdcpError::socket_error(errno_string("socket"));
    }

    int enable = 1;
    if (setsockopt(sock_, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
        SdcpError err = SdcpError::socket_error(errno_string("SO_BROADCAST"));
        close();
        return err;
    }
    return {};
}

SdcpError UdpBroadcastTransport::send_probe(const std::string& message, uint16_t port) {
    if (sock_ < 0) {
        return SdcpError::socket_error("socket not open");
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_BROADCAST);

    ssize_t sent = ::sendto(sock_, message.data(), message.size(), 0,
                            reinterpret_cast<const struct sockaddr*>(&addr), sizeof(addr));
    if (sent < 0) {
        return SdcpError::socket_error(errno_string("sendto"));
    }
    return {};
}

std::optional<Datagram> UdpBroadcastTransport::receive(std::chrono::milliseconds timeout) {
    if (sock_ < 0) {
        return std::nullopt;
    }

    // A zero SO_RCVTIMEO blocks forever
    auto ms = std::max<long long>(timeout.count(), 1);
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
    if (setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        spdlog::warn("[Discovery] {}", errno_string("SO_RCVTIMEO"));
        return std::nullopt;
    }

    char buffer[RECV_BUFFER_SIZE];
    struct sockaddr_in from;

    while (true) {
        socklen_t from_len = sizeof(from);
        ssize_t n = ::recvfrom(sock_, buffer, sizeof(buffer), 0,
                               reinterpret_cast<struct sockaddr*>(&from), &from_len);
        if (n >= 0) {
            char ip[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip));
            return Datagram{std::string(buffer, static_cast<size_t>(n)), std::string(ip)};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::warn("[Discovery] {}", errno_string("recvfrom"));
        }
        return std::nullopt;
    }
}

void UdpBroadcastTransport::close() {
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
}

// ============================================================================
// SdcpDiscovery
// ============================================================================

SdcpDiscovery::SdcpDiscovery(std::unique_ptr<IDiscoveryTransport> transport, uint16_t port)
    : transport_(std::move(transport)), port_(port) {}

DiscoveryOutcome SdcpDiscovery::discover(std::chrono::milliseconds idle_timeout,
                                         std::chrono::milliseconds max_duration) {
    DiscoveryOutcome outcome;
    malformed_replies_ = 0;

    SdcpError err = transport_->open();
    if (err.has_error()) {
        spdlog::error("[Discovery] {}", err.message);
        outcome.error = err;
        return outcome;
    }

    err = transport_->send_probe(SDCP_DISCOVERY_PROBE, port_);
    if (err.has_error()) {
        spdlog::error("[Discovery] Failed to send probe: {}", err.message);
        transport_->close();
        outcome.error = err;
        return outcome;
    }
    spdlog::debug("[Discovery] Sent probe '{}' to port {}", SDCP_DISCOVERY_PROBE, port_);

    std::map<std::string, size_t> index_by_id;
    const auto deadline = std::chrono::steady_clock::now() + max_duration;

    while (std::chrono::steady_clock::now() < deadline) {
        auto datagram = transport_->receive(idle_timeout);
        if (!datagram) {
            break; // idle window elapsed
        }

        codec::DiscoveryReply reply =
            codec::parse_discovery_reply(datagram->payload, datagram->source_ip);
        if (!reply.ok()) {
            ++malformed_replies_;
            spdlog::warn("[Discovery] Response from {} unrecognised as SDCP: {}",
                         datagram->source_ip, reply.error.message);
            continue;
        }

        const DeviceDescriptor& d = reply.descriptor;
        auto it = index_by_id.find(d.id);
        if (it != index_by_id.end()) {
            spdlog::debug("[Discovery] Duplicate reply for {} from {}", d.id, datagram->source_ip);
            outcome.devices[it->second] = d;
            continue;
        }

        index_by_id.emplace(d.id, outcome.devices.size());
        outcome.devices.push_back(d);
        spdlog::debug("[Discovery] {:<24} @ {:<16} firmware {}", d.name, d.host,
                     d.firmware_version.empty() ? "?" : d.firmware_version);
    }

    transport_->close();

    if (outcome.devices.empty()) {
        outcome.error = SdcpError::no_devices_found();
        spdlog::error("[Discovery] No printers found");
    } else {
        spdlog::debug("[Discovery] Found {} printer(s), {} malformed repl{}",
                      outcome.devices.size(), malformed_replies_,
                      malformed_replies_ == 1 ? "y" : "ies");
    }
    return outcome;
}

} // namespace sdcpwatch
