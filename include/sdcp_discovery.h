// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "sdcp_error.h"
#include "sdcp_types.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sdcpwatch {

/// Probe literal broadcast to find SDCP printers
constexpr const char* SDCP_DISCOVERY_PROBE = "M99999";

/// UDP port SDCP printers listen on for the probe
constexpr uint16_t SDCP_DISCOVERY_PORT = 3000;

/// Default idle window: stop after this long without a reply
constexpr std::chrono::milliseconds DEFAULT_DISCOVERY_IDLE_TIMEOUT{3000};

/// Hard cap on the whole discovery step, in case replies never stop
constexpr std::chrono::milliseconds DEFAULT_DISCOVERY_MAX_DURATION{30000};

/**
 * @brief One received datagram
 */
struct Datagram {
    std::string payload;
    std::string source_ip;
};

/**
 * @brief Abstract UDP transport for discovery
 *
 * Allows dependency injection of mock implementations for testing.
 */
class IDiscoveryTransport {
  public:
    virtual ~IDiscoveryTransport() = default;

    /// @return empty error on success
    virtual SdcpError open() = 0;

    /// Broadcast @p message to @p port
    virtual SdcpError send_probe(const std::string& message, uint16_t port) = 0;

    /// Wait up to @p timeout for one datagram; nullopt on timeout
    virtual std::optional<Datagram> receive(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

/**
 * @brief POSIX UDP broadcast socket
 *
 * Sends to 255.255.255.255 with SO_BROADCAST and receives unicast replies on the
 * ephemeral port the probe was sent from.
 */
class UdpBroadcastTransport : public IDiscoveryTransport {
  public:
    UdpBroadcastTransport() = default;
    ~UdpBroadcastTransport() override;

    // Non-copyable (owns socket)
    UdpBroadcastTransport(const UdpBroadcastTransport&) = delete;
    UdpBroadcastTransport& operator=(const UdpBroadcastTransport&) = delete;

    SdcpError open() override;
    SdcpError send_probe(const std::string& message, uint16_t port) override;
    std::optional<Datagram> receive(std::chrono::milliseconds timeout) override;
    void close() override;

  private:
    int sock_ = -1;
};

/**
 * @brief Outcome of one discovery run
 */
struct DiscoveryOutcome {
    std::vector<DeviceDescriptor> devices; ///< First-seen order, one per id
    SdcpError error;                       ///< NO_DEVICES_FOUND / SOCKET_ERROR

    bool ok() const { return !error.has_error(); }
};

/**
 * @brief Broadcast discovery of SDCP printers
 *
 * Runs once at startup, to completion, before any monitor starts.
 *
 * Usage:
 * @code
 * SdcpDiscovery discovery(std::make_unique<UdpBroadcastTransport>());
 * DiscoveryOutcome outcome = discovery.discover(std::chrono::seconds(3));
 * if (!outcome.ok()) {
 *     spdlog::error("{}", outcome.error.user_message());
 * }
 * @endcode
 */
class SdcpDiscovery {
  public:
    explicit SdcpDiscovery(std::unique_ptr<IDiscoveryTransport> transport,
                           uint16_t port = SDCP_DISCOVERY_PORT);

    /**
     * @brief Probe the network and collect replies
     *
     * Receives until one wait of @p idle_timeout passes with no datagram, or until
     * max_duration has elapsed in total. Duplicate ids overwrite the earlier
     * descriptor. Malformed replies are logged and skipped.
     *
     * @return devices, or NO_DEVICES_FOUND when none replied
     */
    DiscoveryOutcome discover(std::chrono::milliseconds idle_timeout,
                              std::chrono::milliseconds max_duration = DEFAULT_DISCOVERY_MAX_DURATION);

    /// Malformed replies skipped during the last discover()
    size_t malformed_replies() const { return malformed_replies_; }

  private:
    std::unique_ptr<IDiscoveryTransport> transport_;
    uint16_t port_;
    size_t malformed_replies_ = 0;
};

} // namespace sdcpwatch
