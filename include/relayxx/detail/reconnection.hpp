/*

reconnection.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <limits>

namespace relayxx::detail
{

/**
 * Reconnection policy for pooled connections.
 * Delay for attempt n (1-based) is initial_delay * backoff_multiplier^(n-1).
 */
struct reconnection_policy
{
    /// Reconnect after unexpected closes
    bool enabled = true;

    /// Maximum number of reconnection attempts per failure streak
    unsigned int max_attempts = 5;

    /// Delay before the first attempt
    std::chrono::milliseconds initial_delay{1000};

    /// Multiplier applied per attempt
    double backoff_multiplier = 2.0;

    static reconnection_policy disabled()
    {
        reconnection_policy policy;
        policy.enabled = false;
        return policy;
    }

    static reconnection_policy exponential_backoff(
        unsigned int max_attempts = 5,
        std::chrono::milliseconds initial = std::chrono::milliseconds{1000},
        double multiplier = 2.0)
    {
        reconnection_policy policy;
        policy.enabled = true;
        policy.max_attempts = max_attempts;
        policy.initial_delay = initial;
        policy.backoff_multiplier = multiplier;
        return policy;
    }

    /// True once attempts already made reach the ceiling
    [[nodiscard]] bool exhausted(unsigned int attempts_made) const noexcept
    {
        return attempts_made >= max_attempts;
    }

    /// Calculate delay for a specific attempt number (1-based)
    [[nodiscard]] std::chrono::milliseconds calculate_delay(unsigned int attempt) const noexcept
    {
        if (attempt <= 1)
            return initial_delay;

        constexpr double ceiling = static_cast<double>(std::numeric_limits<std::int64_t>::max() / 2);
        double delay_ms = static_cast<double>(initial_delay.count());
        for (unsigned int i = 1; i < attempt; ++i)
        {
            delay_ms *= backoff_multiplier;
            if (delay_ms > ceiling)
            {
                delay_ms = ceiling;
                break;
            }
        }
        return std::chrono::milliseconds(static_cast<std::int64_t>(delay_ms));
    }
};

} // namespace relayxx::detail
