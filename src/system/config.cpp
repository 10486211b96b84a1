// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace sdcpwatch {

Config* Config::instance{nullptr};

Config::Config() : data(default_config()) {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::default_config() {
    return {{"discovery", {{"port", 3000}, {"idle_timeout_ms", 3000}, {"max_duration_ms", 30000}}},
            {"monitor",
             {{"websocket_port", 3030},
              {"reconnect_min_ms", 200},
              {"reconnect_max_ms", 5000},
              {"ping_interval_ms", 10000},
              {"connect_timeout_ms", 5000}}},
            {"log", {{"level", "info"}, {"target", "console"}, {"file", ""}}},
            {"display", {{"color", true}, {"bell", true}}}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    data = default_config();

    struct stat buffer;
    if (config_path.empty() || stat(config_path.c_str(), &buffer) != 0) {
        spdlog::debug("[Config] No config file at '{}', using defaults", config_path);
        return;
    }

    spdlog::info("[Config] Loading config from {}", config_path);
    try {
        std::ifstream in(config_path);
        json loaded = json::parse(in);
        if (!loaded.is_object()) {
            spdlog::error("[Config] {} is not a JSON object, using defaults", config_path);
            return;
        }
        // Null values would delete keys under merge_patch semantics
        data.merge_patch(loaded);
    } catch (const json::exception& e) {
        spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
        spdlog::warn("[Config] Using defaults");
        data = default_config();
    }

    spdlog::debug("[Config] initialized: discovery port={}, log level={}",
                  get<int>("/discovery/port", 3000), get<std::string>("/log/level", "info"));
}

std::string Config::get_path() {
    return path;
}

int Config::get_int_in_range(const std::string& json_ptr, int min_val, int max_val,
                             int default_value) {
    json::json_pointer ptr(json_ptr);
    if (!data.contains(ptr)) {
        return default_value;
    }
    const json& value = data[ptr];
    if (!value.is_number_integer()) {
        spdlog::warn("[Config] {} is not an integer, using {}", json_ptr, default_value);
        return default_value;
    }
    // Unsigned values above LLONG_MAX would wrap through get<long long>()
    bool too_big = value.is_number_unsigned() &&
                   (max_val < 0 ||
                    value.get<unsigned long long>() > static_cast<unsigned long long>(max_val));
    long long v = too_big ? 0 : value.get<long long>();
    if (too_big || v < min_val || v > max_val) {
        spdlog::warn("[Config] {} must be {}-{}, got {}; using {}", json_ptr, min_val, max_val,
                     value.dump(), default_value);
        return default_value;
    }
    return static_cast<int>(v);
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

void Config::reset_to_defaults() {
    spdlog::info("[Config] Resetting to defaults");
    data = default_config();
}

bool Config::save() {
    if (path.empty()) {
        spdlog::error("[Config] No config path set, cannot save");
        return false;
    }
    spdlog::trace("[Config] Saving config to {}", path);

    const std::string tmp_path = path + ".tmp";
    try {
        fs::path config_dir = fs::path(path).parent_path();
        if (!config_dir.empty()) {
            fs::create_directories(config_dir);
        }

        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;
        o.close();
        if (!o) {
            spdlog::error("[Config] Error writing to config file: {}", tmp_path);
            std::remove(tmp_path.c_str());
            return false;
        }

        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            spdlog::error("[Config] Failed to replace {}", path);
            std::remove(tmp_path.c_str());
            return false;
        }

        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace sdcpwatch
