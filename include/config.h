// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace sdcpwatch {

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads configuration from a JSON file merged over built-in defaults.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Initialized once at startup from the main thread,
 * read before any monitor starts.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/home/pi/.config/sdcp-watch/config.json");
 *
 * int port = cfg->get<int>("/discovery/port", 3000);
 * cfg->set<bool>("/display/bell", false);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Values in the file override the defaults; keys it omits keep their defaults.
     * A missing file is not created. An unparsable file is logged and ignored.
     *
     * @param config_path Path to JSON configuration file (may be empty)
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found or has the wrong type
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of another type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] {} has the wrong type, using default: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Get an integer that must lie in [min_val, max_val]
     *
     * Missing keys, non-integers and out-of-range values return default_value;
     * the latter two are logged.
     */
    int get_int_in_range(const std::string& json_ptr, int min_val, int max_val,
                         int default_value);

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Written atomically (temp file + rename).
     *
     * @return false if there is no path or the file could not be written
     */
    bool save();

    /// Discard loaded values and return to the built-in defaults (in memory)
    void reset_to_defaults();

    std::string get_path();

    /// Built-in defaults, also used as the base that a config file is merged over
    static json default_config();

    static Config* get_instance();
};

} // namespace sdcpwatch
