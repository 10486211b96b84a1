// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "backoff_policy.h"
#include "cli_args.h"
#include "config.h"
#include "console_notification_sink.h"
#include "device_registry.h"
#include "logging_init.h"
#include "monitor_set.h"
#include "notification_sink.h"
#include "sdcp_client.h"
#include "sdcp_discovery.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <signal.h>
#include <thread>
#include <unistd.h>

using namespace sdcpwatch;

namespace {

constexpr int EXIT_NO_DEVICES = 1;
constexpr int EXIT_BAD_ARGUMENTS = 2;

volatile sig_atomic_t g_quit = 0;

void signal_handler(int) {
    g_quit = 1;
}

void setup_signal_handlers() {
    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);
}

constexpr int MAX_TIMEOUT_MS = 600000;

uint32_t config_ms(Config& cfg, const std::string& ptr, int min_ms, int fallback) {
    return static_cast<uint32_t>(cfg.get_int_in_range(ptr, min_ms, MAX_TIMEOUT_MS, fallback));
}

uint16_t config_port(Config& cfg, const std::string& ptr, int fallback) {
    return static_cast<uint16_t>(cfg.get_int_in_range(ptr, 1, 65535, fallback));
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help_requested ? 0 : EXIT_BAD_ARGUMENTS;
    }

    Config* cfg = Config::get_instance();
    cfg->init(args.config_path.empty() ? default_config_path() : args.config_path);

    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(args.verbosity, cfg->get<std::string>("/log/level", "info"));
    log_config.target = logging::parse_log_target(
        args.log_target.empty() ? cfg->get<std::string>("/log/target", "console")
                                : args.log_target);
    log_config.file_path =
        args.log_file.empty() ? cfg->get<std::string>("/log/file", "") : args.log_file;
    logging::init(log_config);

    // Colors only make sense on a terminal
    bool color = !args.no_color && cfg->get<bool>("/display/color", true) && isatty(STDOUT_FILENO);
    bool bell = !args.no_bell && cfg->get<bool>("/display/bell", true);

    setup_signal_handlers();

    // Discovery
    auto idle_timeout = std::chrono::milliseconds(
        args.discovery_timeout_ms > 0
            ? static_cast<uint32_t>(args.discovery_timeout_ms)
            : config_ms(*cfg, "/discovery/idle_timeout_ms", 100, 3000));
    auto max_duration =
        std::chrono::milliseconds(config_ms(*cfg, "/discovery/max_duration_ms", 100, 30000));
    uint16_t port = config_port(*cfg, "/discovery/port", SDCP_DISCOVERY_PORT);

    std::cout << "Searching for SDCP printers on local network..." << std::endl;

    SdcpDiscovery discovery(std::make_unique<UdpBroadcastTransport>(), port);
    DiscoveryOutcome outcome = discovery.discover(idle_timeout, max_duration);
    if (!outcome.ok()) {
        std::cout << outcome.error.user_message() << std::endl;
        logging::report_fatal(outcome.error.get_type_string() + ": " + outcome.error.message);
        spdlog::shutdown();
        return EXIT_NO_DEVICES;
    }

    uint16_t ws_port = config_port(*cfg, "/monitor/websocket_port", SDCP_WEBSOCKET_PORT);
    for (DeviceDescriptor& device : outcome.devices) {
        device.port = ws_port;
        std::cout << fmt::format("Found {:<24} @ {:<16} firmware {}", device.name, device.host,
                                 device.firmware_version.empty() ? "?" : device.firmware_version)
                  << std::endl;
    }

    DeviceRegistry registry(outcome.devices);

    auto console = std::make_shared<ConsoleNotificationSink>(std::cout, color, bell);
    auto sink = std::make_shared<AsyncNotificationSink>(console);
    sink->start();

    BackoffPolicy backoff;
    backoff.min_delay_ms = config_ms(*cfg, "/monitor/reconnect_min_ms", 1, 200);
    backoff.max_delay_ms = config_ms(*cfg, "/monitor/reconnect_max_ms", 1, 5000);

    uint32_t connect_timeout = config_ms(*cfg, "/monitor/connect_timeout_ms", 100, 5000);
    uint32_t ping_interval = config_ms(*cfg, "/monitor/ping_interval_ms", 0, 10000);

    {
        MonitorSet monitors(
            registry, sink,
            [connect_timeout, ping_interval](const DeviceDescriptor&) {
                auto client = std::make_unique<SdcpClient>();
                client->set_connection_timeout(connect_timeout);
                client->set_keepalive_interval(ping_interval);
                return client;
            },
            backoff);
        monitors.start_all();

        std::cout << "Monitoring " << registry.size() << " printer(s), Ctrl+C to quit"
                  << std::endl;

        while (!g_quit) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        spdlog::info("[Main] Shutting down");
        monitors.stop_all();
    }

    sink->shutdown();
    spdlog::shutdown();
    return 0;
}
