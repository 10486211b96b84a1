// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file sdcp_client.cpp
 * @brief WebSocket transport for the SDCP status channel
 *
 * @pattern libhv WebSocketClient with lifetime guard
 * @threading Callbacks and timers run on this client's libhv event loop thread
 * @gotchas Auto-reconnect is left disabled; StatusMonitor owns the retry schedule
 *
 * @see status_monitor.cpp
 */

#include "sdcp_client.h"

using namespace hv;

namespace sdcpwatch {

SdcpClient::SdcpClient(EventLoopPtr loop) : WebSocketClient(loop) {}

SdcpClient::~SdcpClient() {
    // Reset lifetime guard FIRST so callbacks already queued on the event loop
    // thread return early instead of touching a half-destroyed object.
    lifetime_guard_.reset();
    is_destroying_.store(true);

    setReconnect(nullptr);

    onopen = []() {};
    onmessage = [](const std::string&) {};
    onclose = []() {};
}

int SdcpClient::connect(const std::string& url, std::function<void()> on_open,
                        MessageCallback on_message, std::function<void()> on_close) {
    // Reset state from a previous attempt; close() is idempotent
    close();
    open_.store(false);

    setConnectTimeout(static_cast<int>(connection_timeout_ms_));

    spdlog::debug("[SDCP Client] WebSocket connecting to {}", url);

    onopen = [this, weak_guard = std::weak_ptr<bool>(lifetime_guard_), on_open, url]() {
        try {
            auto guard = weak_guard.lock();
            if (!guard || is_destroying_.load()) {
                return;
            }
            spdlog::debug("[SDCP Client] WebSocket connected to {}", url);
            open_.store(true);
            on_open();
        } catch (const std::exception& e) {
            spdlog::error("[SDCP Client] onopen callback threw exception: {}", e.what());
        }
    };

    onmessage = [this, weak_guard = std::weak_ptr<bool>(lifetime_guard_),
                 on_message](const std::string& msg) {
        spdlog::trace("[SDCP Client] onmessage received {} bytes", msg.size());
        try {
            auto guard = weak_guard.lock();
            if (!guard || is_destroying_.load()) {
                return;
            }

            if (msg.size() > MAX_MESSAGE_SIZE) {
                spdlog::error("[SDCP Client] Message too large: {} bytes (max: {})", msg.size(),
                              MAX_MESSAGE_SIZE);
                close();
                return;
            }

            on_message(msg);
        } catch (const std::exception& e) {
            // Do NOT re-throw: unwinding into libhv leaves the event loop in a bad state
            spdlog::error("[SDCP Client] onmessage callback threw exception: {}", e.what());
        }
    };

    onclose = [this, weak_guard = std::weak_ptr<bool>(lifetime_guard_), on_close]() {
        try {
            auto guard = weak_guard.lock();
            if (!guard || is_destroying_.load()) {
                return;
            }
            bool was_open = open_.exchange(false);
            if (was_open) {
                spdlog::debug("[SDCP Client] WebSocket connection closed");
            } else {
                spdlog::debug("[SDCP Client] WebSocket connection failed (printer not available)");
            }
            on_close();
        } catch (const std::exception& e) {
            spdlog::error("[SDCP Client] onclose callback threw exception: {}", e.what());
        }
    };

    setPingInterval(static_cast<int>(keepalive_interval_ms_));

    // No libhv auto-reconnect: the monitor schedules retries with its own backoff
    setReconnect(nullptr);

    http_headers headers;
    return open(url.c_str(), headers);
}

int SdcpClient::send_text(const std::string& text) {
    if (!open_.load()) {
        spdlog::debug("[SDCP Client] send_text while not connected");
        return -1;
    }
    return send(text);
}

void SdcpClient::disconnect() {
    setReconnect(nullptr);

    // Close before swapping callbacks so the guard checks in them still apply
    close();
    open_.store(false);

    onopen = []() { /* no-op */ };
    onmessage = [](const std::string&) { /* no-op */ };
    onclose = []() { /* no-op */ };

    std::set<TimerHandle> pending;
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        pending.swap(timers_);
    }
    for (TimerHandle handle : pending) {
        loop()->killTimer(handle);
    }
}

TimerHandle SdcpClient::schedule(uint32_t delay_ms, std::function<void()> fn) {
    if (is_destroying_.load() || !loop()) {
        return INVALID_TIMER_HANDLE;
    }

    // The callback removes its own handle. A timer that fires before the insert below leaves
    // a stale handle behind; killTimer() ignores unknown ids.
    auto weak_guard = std::weak_ptr<bool>(lifetime_guard_);
    TimerID id = loop()->setTimeout(
        static_cast<int>(delay_ms), [this, weak_guard, fn = std::move(fn)](TimerID timer_id) {
            auto guard = weak_guard.lock();
            if (!guard || is_destroying_.load()) {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(timers_mutex_);
                timers_.erase(timer_id);
            }
            try {
                fn();
            } catch (const std::exception& e) {
                spdlog::error("[SDCP Client] Timer callback threw exception: {}", e.what());
            }
        });

    std::lock_guard<std::mutex> lock(timers_mutex_);
    timers_.insert(id);
    return id;
}

void SdcpClient::cancel(TimerHandle handle) {
    if (handle == INVALID_TIMER_HANDLE) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        if (timers_.erase(handle) == 0) {
            return;
        }
    }
    loop()->killTimer(handle);
}

bool SdcpClient::is_open() const {
    return open_.load();
}

} // namespace sdcpwatch
