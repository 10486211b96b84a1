// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>

#include "hv/json.hpp"

namespace sdcpwatch::json_util {

/// Safely extract a string from a JSON field that may be null.
/// nlohmann .value("key", "") throws type_error.302 when the field is JSON null.
inline std::string safe_string(const nlohmann::json& j, const char* key,
                               const std::string& def = "") {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return def;
}

/// Strict numeric coercion: a JSON number, or a string that parses completely as one.
/// Booleans, null, objects, arrays and partial strings ("12abc") yield nullopt.
inline std::optional<double> to_number(const nlohmann::json& v) {
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        const std::string& s = v.get_ref<const std::string&>();
        if (s.empty()) {
            return std::nullopt;
        }
        const char* begin = s.c_str();
        char* end = nullptr;
        errno = 0;
        double d = std::strtod(begin, &end);
        if (end == begin || errno == ERANGE || !std::isfinite(d)) {
            return std::nullopt;
        }
        while (*end == ' ' || *end == '\t') {
            ++end;
        }
        if (*end != '\0') {
            return std::nullopt;
        }
        return d;
    }
    return std::nullopt;
}

/// Strict numeric lookup of an object member; nullopt when missing, null or non-numeric.
inline std::optional<double> number_field(const nlohmann::json& j, const char* key) {
    if (!j.is_object() || !j.contains(key)) {
        return std::nullopt;
    }
    return to_number(j[key]);
}

/// Safely extract a double from a JSON field that may be number, string, or null.
inline double safe_double(const nlohmann::json& j, const char* key, double def = 0.0) {
    auto v = number_field(j, key);
    return v ? *v : def;
}

} // namespace sdcpwatch::json_util
