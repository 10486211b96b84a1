// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "console_notification_sink.h"
#include "notification_sink.h"

#include "../mocks/recording_notification_sink.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>

using namespace sdcpwatch;

namespace {

DeviceDescriptor make_device() {
    DeviceDescriptor d;
    d.id = "abc";
    d.name = "Saturn";
    d.host = "10.0.0.5";
    return d;
}

NotificationEvent make_event(Severity severity, int phase, const std::string& label,
                             const std::string& detail, bool attention = false) {
    NotificationEvent e;
    e.device_id = "abc";
    e.severity = severity;
    e.print_phase = phase;
    e.phase_label = label;
    e.detail = detail;
    e.attention = attention;
    return e;
}

/// Blocks inside notify() until released, to hold events in the async queue
class GateSink : public INotificationSink {
  public:
    void notify(const DeviceDescriptor& device, const NotificationEvent& event) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return open_; });
        }
        inner.notify(device, event);
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    RecordingNotificationSink inner;

  private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

} // namespace

// ============================================================================
// ConsoleNotificationSink
// ============================================================================

TEST_CASE("ConsoleNotificationSink: plain line layout", "[sink]") {
    std::ostringstream out;
    ConsoleNotificationSink sink(out, false, false);

    sink.notify(make_device(), make_event(Severity::INFO, 13, "Print:PRINTING", "50 %"));

    std::string expected = std::string("Saturn") + std::string(18, ' ') + " @ 10.0.0.5" +
                           std::string(8, ' ') + " Print:PRINTING" + std::string(6, ' ') +
                           " 50 %\n";
    REQUIRE(out.str() == expected);
}

TEST_CASE("ConsoleNotificationSink: idle and complete show the bed", "[sink]") {
    std::ostringstream out;
    ConsoleNotificationSink sink(out, false, false);

    std::string line = sink.format_line(
        make_device(), make_event(Severity::NONE, 0, "Idle:IDLE", "25\xc2\xb0" "C"));
    REQUIRE(line.size() > 8);
    REQUIRE(line.substr(line.size() - 9) == "bed 25\xc2\xb0" "C");
}

TEST_CASE("ConsoleNotificationSink: severity colors", "[sink]") {
    std::ostringstream out;
    ConsoleNotificationSink sink(out, true, true);
    auto device = make_device();

    SECTION("red alert with bell") {
        std::string line = sink.format_line(
            device, make_event(Severity::ALERT_RED, 6, "Print:PAUSED", "50 %", true));
        REQUIRE(line.rfind("\a\033[41m\033[37mSaturn", 0) == 0);
        REQUIRE(line.substr(line.size() - 4) == "\033[0m");
    }

    SECTION("green alert with bell") {
        std::string line = sink.format_line(
            device, make_event(Severity::ALERT_GREEN, 9, "Idle:COMPLETE", "38\xc2\xb0" "C", true));
        REQUIRE(line.rfind("\a\033[42m\033[37m", 0) == 0);
    }

    SECTION("info in yellow, no bell") {
        std::string line =
            sink.format_line(device, make_event(Severity::INFO, 13, "Print:PRINTING", "5 %"));
        REQUIRE(line.rfind("\033[93mSaturn", 0) == 0);
    }

    SECTION("plain severity has no color prefix") {
        std::string line =
            sink.format_line(device, make_event(Severity::NONE, 0, "Idle:IDLE", "25\xc2\xb0" "C"));
        REQUIRE(line.rfind("Saturn", 0) == 0);
    }
}

TEST_CASE("ConsoleNotificationSink: bell and color can be disabled", "[sink]") {
    std::ostringstream out;
    ConsoleNotificationSink sink(out, false, false);

    std::string line = sink.format_line(
        make_device(), make_event(Severity::ALERT_RED, 6, "Print:PAUSED", "50 %", true));
    REQUIRE(line.find('\a') == std::string::npos);
    REQUIRE(line.find('\033') == std::string::npos);
}

// ============================================================================
// AsyncNotificationSink
// ============================================================================

TEST_CASE("AsyncNotificationSink: delivers in order", "[sink]") {
    auto recording = std::make_shared<RecordingNotificationSink>();
    AsyncNotificationSink sink(recording);
    sink.start();

    for (int i = 0; i < 20; i++) {
        sink.notify(make_device(),
                    make_event(Severity::INFO, 13, "Print:PRINTING", std::to_string(i * 5) + " %"));
    }
    sink.shutdown();

    auto records = recording->records();
    REQUIRE(records.size() == 20);
    for (int i = 0; i < 20; i++) {
        CHECK(records[i].event.detail == std::to_string(i * 5) + " %");
    }
}

TEST_CASE("AsyncNotificationSink: notify does not wait for delivery", "[sink]") {
    auto gate = std::make_shared<GateSink>();
    AsyncNotificationSink sink(gate);
    sink.start();

    sink.notify(make_device(), make_event(Severity::INFO, 13, "Print:PRINTING", "5 %"));
    sink.notify(make_device(), make_event(Severity::INFO, 13, "Print:PRINTING", "10 %"));

    // The worker holds at most one event; the other is still queued
    REQUIRE(sink.pending() >= 1);
    REQUIRE(gate->inner.count() == 0);

    gate->open();
    sink.shutdown();

    REQUIRE(sink.pending() == 0);
    REQUIRE(gate->inner.count() == 2);
}

TEST_CASE("AsyncNotificationSink: shutdown is idempotent", "[sink]") {
    auto recording = std::make_shared<RecordingNotificationSink>();
    AsyncNotificationSink sink(recording);
    sink.start();
    sink.shutdown();
    sink.shutdown();
    REQUIRE(recording->count() == 0);
}
