// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <random>

namespace sdcpwatch {

/**
 * @brief Reconnect delay schedule for a status monitor
 *
 * delay(n) = min(min_delay_ms * multiplier^(n-1), max_delay_ms) plus up to
 * jitter_ratio * delay of random jitter. Attempt numbers start at 1.
 */
struct BackoffPolicy {
    uint32_t min_delay_ms = 200;
    uint32_t max_delay_ms = 5000;
    double multiplier = 2.0;
    double jitter_ratio = 0.2; ///< 0 disables jitter

    /// Delay before reconnect attempt @p attempt, without jitter
    uint32_t base_delay_for_attempt(uint32_t attempt) const;

    /// Delay before reconnect attempt @p attempt, jitter drawn from @p rng
    uint32_t delay_for_attempt(uint32_t attempt, std::mt19937& rng) const;
};

} // namespace sdcpwatch
