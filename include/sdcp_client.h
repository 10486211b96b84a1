// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/*
 * Copyright (C) 2025 356C LLC
 *
 * This file is part of SDCP Watch.
 *
 * SDCP Watch is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * SDCP Watch is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with SDCP Watch. If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include "hv/WebSocketClient.h"
#include "spdlog/spdlog.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace sdcpwatch {

/// Handle returned by SdcpClient::schedule()
using TimerHandle = uint64_t;

/** @brief Invalid timer handle constant */
constexpr TimerHandle INVALID_TIMER_HANDLE = 0;

/**
 * @brief WebSocket transport for one printer's SDCP status channel
 *
 * Thin wrapper around libhv's WebSocketClient: it owns the socket and an event loop
 * thread, and reports open/message/close through callbacks. It never reconnects on its
 * own; StatusMonitor decides when to call connect() again and uses schedule() to
 * run the retry on this client's loop.
 *
 * The transport methods are virtual so tests can substitute a mock without a network.
 */
class SdcpClient : public hv::WebSocketClient {
  public:
    using MessageCallback = std::function<void(const std::string&)>;

    /// Text frames larger than this are treated as a protocol failure
    static constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024;

    SdcpClient(hv::EventLoopPtr loop = nullptr);
    ~SdcpClient();

    // Prevent copying (WebSocket client should not be copied)
    SdcpClient(const SdcpClient&) = delete;
    SdcpClient& operator=(const SdcpClient&) = delete;

    /**
     * @brief Open the WebSocket
     *
     * Any previous connection is closed first. Callbacks run on the client's event loop
     * thread. on_close is also invoked when the connection attempt itself fails.
     *
     * @param url e.g. "ws://192.168.1.50:3030/websocket"
     * @return 0 if the attempt was started, non-zero on immediate failure
     */
    virtual int connect(const std::string& url, std::function<void()> on_open,
                        MessageCallback on_message, std::function<void()> on_close);

    /**
     * @brief Send one text frame
     *
     * @return number of bytes queued, or negative when not connected
     */
    virtual int send_text(const std::string& text);

    /**
     * @brief Close the connection and silence callbacks
     *
     * Safe to call multiple times (idempotent).
     */
    virtual void disconnect();

    /**
     * @brief Run @p fn once after @p delay_ms on this client's event loop
     *
     * @return handle for cancel(), or INVALID_TIMER_HANDLE if the loop is gone
     */
    virtual TimerHandle schedule(uint32_t delay_ms, std::function<void()> fn);

    /// Cancel a pending schedule() call; unknown handles are ignored
    virtual void cancel(TimerHandle handle);

    virtual bool is_open() const;

    void set_connection_timeout(uint32_t timeout_ms) { connection_timeout_ms_ = timeout_ms; }
    void set_keepalive_interval(uint32_t interval_ms) { keepalive_interval_ms_ = interval_ms; }

  protected:
    std::atomic<bool> is_destroying_{false};
    std::atomic<bool> open_{false};

  private:
    // Destroyed first in ~SdcpClient so in-flight callbacks see the client is gone
    std::shared_ptr<bool> lifetime_guard_ = std::make_shared<bool>(true);

    std::mutex timers_mutex_;
    std::set<TimerHandle> timers_;

    uint32_t connection_timeout_ms_ = 5000;
    uint32_t keepalive_interval_ms_ = 10000;
};

} // namespace sdcpwatch
