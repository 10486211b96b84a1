// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "monitor_set.h"

#include "../mocks/mock_sdcp_client.h"
#include "../mocks/recording_notification_sink.h"

#include <catch2/catch_test_macros.hpp>

#include <map>

using namespace sdcpwatch;

namespace {

DeviceDescriptor device(const std::string& id, const std::string& host) {
    DeviceDescriptor d;
    d.id = id;
    d.name = "Printer " + id;
    d.host = host;
    d.mainboard_id = "mb-" + id;
    return d;
}

} // namespace

TEST_CASE("MonitorSet: one independent monitor per device", "[monitor]") {
    DeviceRegistry registry({device("a", "10.0.0.1"), device("b", "10.0.0.2")});
    auto sink = std::make_shared<RecordingNotificationSink>();
    std::map<std::string, std::shared_ptr<MockClientState>> states;

    MonitorSet monitors(registry, sink, [&states](const DeviceDescriptor& d) {
        auto state = std::make_shared<MockClientState>();
        states[d.id] = state;
        return std::make_unique<MockSdcpClient>(state);
    });

    REQUIRE(monitors.size() == 2);
    REQUIRE(states.size() == 2);
    REQUIRE(monitors.monitor("a") != nullptr);
    REQUIRE(monitors.monitor("a")->device().host == "10.0.0.1");
    REQUIRE(monitors.monitor("nope") == nullptr);

    monitors.start_all();
    REQUIRE(states["a"]->connected_urls == std::vector<std::string>{"ws://10.0.0.1:3030/websocket"});
    REQUIRE(states["b"]->connected_urls == std::vector<std::string>{"ws://10.0.0.2:3030/websocket"});

    SECTION("a failing device does not affect the others") {
        simulate_open(*states["b"]);
        simulate_close(*states["a"]);

        REQUIRE(monitors.monitor("a")->state() == MonitorState::DISCONNECTED);
        REQUIRE(monitors.monitor("b")->state() == MonitorState::STREAMING);
        REQUIRE(states["b"]->timers.empty());
    }

    SECTION("stop_all stops every monitor") {
        simulate_close(*states["a"]);
        monitors.stop_all();

        REQUIRE(monitors.monitor("a")->state() == MonitorState::STOPPED);
        REQUIRE(monitors.monitor("b")->state() == MonitorState::STOPPED);
        REQUIRE(states["a"]->timers.empty());
        REQUIRE(states["b"]->disconnect_calls == 1);

        monitors.stop_all();
        REQUIRE(states["b"]->disconnect_calls == 1);
    }
}
