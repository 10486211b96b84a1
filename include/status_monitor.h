// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file status_monitor.h
 * @brief Per-printer connection state machine feeding the diff engine
 *
 * @pattern Explicit state machine; transport and retry timer injected through SdcpClient
 * @threading Callbacks arrive on the client's event loop thread; start()/stop() may be
 *            called from any thread
 * @gotchas The client must be the last member so it is destroyed (and its loop thread
 *          joined) while the rest of the monitor is still alive
 */

#pragma once

#include "backoff_policy.h"
#include "device_registry.h"
#include "notification_sink.h"
#include "sdcp_client.h"
#include "sdcp_error.h"
#include "sdcp_types.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace sdcpwatch {

enum class MonitorState {
    CONNECTING,   ///< WebSocket open in progress
    CONNECTED,    ///< Open, status request not yet sent
    STREAMING,    ///< Status request sent, consuming updates
    DISCONNECTED, ///< Waiting for the reconnect timer
    STOPPED,      ///< stop() was called; terminal
};

const char* monitor_state_name(MonitorState state);

/**
 * @brief Keeps one printer's status stream alive and turns updates into notifications
 *
 * On every (re)connect exactly one status request is sent; the printer then pushes
 * status messages until the socket closes. A close or failed connect schedules the next
 * attempt after the BackoffPolicy delay; the failure count resets once a connection opens.
 */
class StatusMonitor {
  public:
    StatusMonitor(DeviceDescriptor device, DeviceRegistry& registry,
                  std::shared_ptr<INotificationSink> sink, std::unique_ptr<SdcpClient> client,
                  BackoffPolicy backoff = {}, uint32_t seed = std::random_device{}());
    ~StatusMonitor();

    StatusMonitor(const StatusMonitor&) = delete;
    StatusMonitor& operator=(const StatusMonitor&) = delete;

    /// Begin the first connection attempt. No-op after stop().
    void start();

    /// Cancel any pending reconnect and close the socket. Idempotent.
    void stop();

    MonitorState state() const;
    const DeviceDescriptor& device() const { return device_; }

    /// Failed attempts since the last successful open
    uint32_t consecutive_failures() const;

    /// Most recent transport or decode error; NONE until something goes wrong
    SdcpError last_error() const;

    uint64_t connect_attempts() const { return connect_attempts_.load(); }
    uint64_t messages_received() const { return messages_received_.load(); }
    uint64_t decode_failures() const { return decode_failures_.load(); }
    uint64_t notifications_sent() const { return notifications_sent_.load(); }

  private:
    void begin_connect();
    void handle_open();
    void handle_message(const std::string& text);
    void handle_close();
    void record_decode_failure(SdcpError error);

    void set_state(MonitorState next);

    DeviceDescriptor device_;
    DeviceRegistry& registry_;
    std::shared_ptr<INotificationSink> sink_;
    BackoffPolicy backoff_;
    std::string log_prefix_;

    mutable std::mutex mutex_;
    MonitorState state_ = MonitorState::DISCONNECTED;
    bool started_ = false;
    bool stopped_ = false;
    uint32_t failures_ = 0;
    TimerHandle reconnect_timer_ = INVALID_TIMER_HANDLE;
    SdcpError last_error_;
    std::mt19937 rng_;

    std::atomic<uint64_t> connect_attempts_{0};
    std::atomic<uint64_t> messages_received_{0};
    std::atomic<uint64_t> decode_failures_{0};
    std::atomic<uint64_t> notifications_sent_{0};

    std::unique_ptr<SdcpClient> client_;
};

} // namespace sdcpwatch
