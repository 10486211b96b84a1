// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "backoff_policy.h"

#include <algorithm>
#include <cmath>

namespace sdcpwatch {

uint32_t BackoffPolicy::base_delay_for_attempt(uint32_t attempt) const {
    const uint32_t floor_ms = std::min(min_delay_ms, max_delay_ms);
    if (attempt <= 1) {
        return floor_ms;
    }
    double delay = static_cast<double>(floor_ms) *
                   std::pow(std::max(multiplier, 1.0), static_cast<double>(attempt - 1));
    if (!std::isfinite(delay) || delay >= static_cast<double>(max_delay_ms)) {
        return max_delay_ms;
    }
    return static_cast<uint32_t>(delay);
}

uint32_t BackoffPolicy::delay_for_attempt(uint32_t attempt, std::mt19937& rng) const {
    uint32_t base = base_delay_for_attempt(attempt);
    if (jitter_ratio <= 0.0 || base == 0) {
        return base;
    }
    auto span = static_cast<uint32_t>(static_cast<double>(base) * std::min(jitter_ratio, 1.0));
    if (span == 0) {
        return base;
    }
    std::uniform_int_distribution<uint32_t> dist(0, span);
    return base + dist(rng);
}

} // namespace sdcpwatch
