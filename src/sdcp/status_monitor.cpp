// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "status_monitor.h"

#include "sdcp_codec.h"
#include "spdlog/spdlog.h"
#include "status_diff.h"

namespace sdcpwatch {

const char* monitor_state_name(MonitorState state) {
    switch (state) {
    case MonitorState::CONNECTING:
        return "CONNECTING";
    case MonitorState::CONNECTED:
        return "CONNECTED";
    case MonitorState::STREAMING:
        return "STREAMING";
    case MonitorState::DISCONNECTED:
        return "DISCONNECTED";
    case MonitorState::STOPPED:
        return "STOPPED";
    }
    return "UNKNOWN";
}

StatusMonitor::StatusMonitor(DeviceDescriptor device, DeviceRegistry& registry,
                             std::shared_ptr<INotificationSink> sink,
                             std::unique_ptr<SdcpClient> client, BackoffPolicy backoff,
                             uint32_t seed)
    : device_(std::move(device)), registry_(registry), sink_(std::move(sink)), backoff_(backoff),
      log_prefix_("[Status Monitor " + device_.name + "]"), rng_(seed),
      client_(std::move(client)) {}

StatusMonitor::~StatusMonitor() {
    stop();
}

void StatusMonitor::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_ || stopped_) {
            return;
        }
        started_ = true;
    }
    spdlog::debug("{} Monitoring {} ({})", log_prefix_, device_.websocket_url(), device_.id);
    begin_connect();
}

void StatusMonitor::stop() {
    TimerHandle pending = INVALID_TIMER_HANDLE;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        pending = reconnect_timer_;
        reconnect_timer_ = INVALID_TIMER_HANDLE;
    }

    if (client_) {
        client_->cancel(pending);
        client_->disconnect();
    }
    set_state(MonitorState::STOPPED);
}

MonitorState StatusMonitor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint32_t StatusMonitor::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

SdcpError StatusMonitor::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void StatusMonitor::set_state(MonitorState next) {
    MonitorState prev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // STOPPED is terminal; late callbacks must not revive the monitor
        if (state_ == MonitorState::STOPPED || (stopped_ && next != MonitorState::STOPPED)) {
            return;
        }
        prev = state_;
        state_ = next;
    }
    if (prev != next) {
        spdlog::debug("{} {} -> {}", log_prefix_, monitor_state_name(prev),
                      monitor_state_name(next));
    }
}

void StatusMonitor::begin_connect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        reconnect_timer_ = INVALID_TIMER_HANDLE;
    }
    if (!client_) {
        spdlog::error("{} No transport", log_prefix_);
        return;
    }

    set_state(MonitorState::CONNECTING);
    connect_attempts_.fetch_add(1);

    int rc = client_->connect(
        device_.websocket_url(), [this]() { handle_open(); },
        [this](const std::string& text) { handle_message(text); }, [this]() { handle_close(); });
    if (rc != 0) {
        spdlog::warn("{} Failed to start connection to {} (rc={})", log_prefix_,
                     device_.websocket_url(), rc);
        handle_close();
    }
}

void StatusMonitor::handle_open() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        failures_ = 0;
    }
    set_state(MonitorState::CONNECTED);
    spdlog::info("{} Connected to {}", log_prefix_, device_.host);

    std::string request = codec::encode_status_request(device_.id, device_.mainboard_id);
    int sent = client_->send_text(request);
    if (sent < 0) {
        // The close callback follows and schedules the retry
        spdlog::warn("{} Failed to send status request", log_prefix_);
        return;
    }
    spdlog::trace("{} >> {}", log_prefix_, request);
    set_state(MonitorState::STREAMING);
}

void StatusMonitor::handle_message(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
    }
    messages_received_.fetch_add(1);
    spdlog::trace("{} << {}", log_prefix_, text);

    codec::DecodeResult decoded = codec::decode_envelope(text, codec::EnvelopeKind::STATUS_MESSAGE);
    if (!decoded.ok()) {
        record_decode_failure(decoded.error);
        return;
    }

    codec::StatusResult status = codec::extract_status(decoded.envelope);
    if (!status.ok()) {
        record_decode_failure(status.error);
        return;
    }
    if (!status.has_status) {
        // Request acknowledgements and attribute pushes carry no Status object
        spdlog::trace("{} Ignoring message without Status", log_prefix_);
        return;
    }

    SnapshotPair pair = registry_.record_snapshot(device_.id, status.snapshot);
    if (!pair.previous) {
        spdlog::debug("{} Baseline {} bed {:.1f}", log_prefix_, diff::phase_label(pair.current),
                      pair.current.hotbed_temperature);
        return;
    }

    std::optional<NotificationEvent> event = diff::evaluate(device_, pair.previous, pair.current);
    if (!event) {
        return;
    }

    spdlog::debug("{} {} {} ({})", log_prefix_, event->phase_label, event->detail,
                  severity_name(event->severity));
    if (sink_) {
        sink_->notify(device_, *event);
        notifications_sent_.fetch_add(1);
    }
}

void StatusMonitor::record_decode_failure(SdcpError error) {
    decode_failures_.fetch_add(1);
    error.source = device_.host;
    spdlog::warn("{} {}: {}", log_prefix_, error.get_type_string(), error.message);
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = std::move(error);
}

void StatusMonitor::handle_close() {
    uint32_t attempt = 0;
    uint32_t delay_ms = 0;
    SdcpError error = SdcpError::connection_lost(device_.host);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        attempt = ++failures_;
        delay_ms = backoff_.delay_for_attempt(attempt, rng_);
        last_error_ = error;
    }
    set_state(MonitorState::DISCONNECTED);

    if (attempt == 1) {
        spdlog::info("{} {} ({}), retrying", log_prefix_, error.user_message(), error.source);
    }
    spdlog::debug("{} Reconnect attempt {} in {}ms", log_prefix_, attempt, delay_ms);

    TimerHandle handle = client_->schedule(delay_ms, [this]() { begin_connect(); });
    if (handle == INVALID_TIMER_HANDLE) {
        spdlog::error("{} Could not schedule reconnect", log_prefix_);
        return;
    }

    bool cancel_now = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            cancel_now = true;
        } else {
            reconnect_timer_ = handle;
        }
    }
    if (cancel_now) {
        client_->cancel(handle);
    }
}

} // namespace sdcpwatch
