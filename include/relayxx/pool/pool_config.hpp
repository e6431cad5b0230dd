/*

pool/pool_config.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

#include <relayxx/detail/reconnection.hpp>

namespace relayxx::pool
{

/// Load balancing strategies shipped with relayxx
enum class balancing_strategy
{
    round_robin,
    least_latency,
    least_load
};

[[nodiscard]] constexpr std::string_view to_string(balancing_strategy s) noexcept
{
    switch (s)
    {
        case balancing_strategy::round_robin: return "round-robin";
        case balancing_strategy::least_latency: return "least-latency";
        case balancing_strategy::least_load: return "least-load";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, balancing_strategy s)
{
    return os << to_string(s);
}


/**
 * Configuration for connection pools.
 */
struct pool_config
{
    /// Maximum number of named connections
    std::size_t max_connections = 3;

    /// Abort an open that has not completed its handshake after this long
    std::chrono::milliseconds connection_timeout{10000};

    /// Reconnection attempts before a connection is reported failed
    unsigned int max_reconnect_attempts = 5;

    /// Base delay for exponential reconnection backoff
    std::chrono::milliseconds reconnect_delay{1000};

    /// Health monitor tick
    std::chrono::milliseconds health_check_interval{30000};

    /// Strategy used to pick the connection for send()
    balancing_strategy load_balancing = balancing_strategy::least_latency;

    /// Reconnect after unexpected closes
    bool enable_failover = true;

    /// Ask the server for compressed frames (appends compression=true to the URL)
    bool compression_enabled = true;

    /// Outbound queue bound
    std::size_t max_queue_size = 1000;

    [[nodiscard]] detail::reconnection_policy reconnection() const
    {
        auto policy = detail::reconnection_policy::exponential_backoff(
            max_reconnect_attempts, reconnect_delay, 2.0);
        policy.enabled = enable_failover;
        return policy;
    }

    // ==================== Factory Methods ====================

    static pool_config defaults()
    {
        return pool_config{};
    }

    /// More parallel connections and a more patient reconnection streak
    static pool_config high_availability()
    {
        pool_config cfg;
        cfg.max_connections = 5;
        cfg.max_reconnect_attempts = 10;
        cfg.reconnect_delay = std::chrono::milliseconds{500};
        cfg.health_check_interval = std::chrono::milliseconds{15000};
        cfg.load_balancing = balancing_strategy::round_robin;
        return cfg;
    }

    /// Route every message to the fastest connection, probe often
    static pool_config low_latency()
    {
        pool_config cfg;
        cfg.connection_timeout = std::chrono::milliseconds{5000};
        cfg.health_check_interval = std::chrono::milliseconds{10000};
        cfg.load_balancing = balancing_strategy::least_latency;
        cfg.compression_enabled = false;
        return cfg;
    }
};


/**
 * Partial configuration update; unset fields keep their current value.
 */
struct pool_config_update
{
    std::optional<std::size_t> max_connections;
    std::optional<std::chrono::milliseconds> connection_timeout;
    std::optional<unsigned int> max_reconnect_attempts;
    std::optional<std::chrono::milliseconds> reconnect_delay;
    std::optional<std::chrono::milliseconds> health_check_interval;
    std::optional<balancing_strategy> load_balancing;
    std::optional<bool> enable_failover;
    std::optional<bool> compression_enabled;
    std::optional<std::size_t> max_queue_size;

    /// Apply this update to cfg
    void apply_to(pool_config& cfg) const
    {
        if (max_connections) cfg.max_connections = *max_connections;
        if (connection_timeout) cfg.connection_timeout = *connection_timeout;
        if (max_reconnect_attempts) cfg.max_reconnect_attempts = *max_reconnect_attempts;
        if (reconnect_delay) cfg.reconnect_delay = *reconnect_delay;
        if (health_check_interval) cfg.health_check_interval = *health_check_interval;
        if (load_balancing) cfg.load_balancing = *load_balancing;
        if (enable_failover) cfg.enable_failover = *enable_failover;
        if (compression_enabled) cfg.compression_enabled = *compression_enabled;
        if (max_queue_size) cfg.max_queue_size = *max_queue_size;
    }
};


/**
 * Rolling metrics of one connection.
 */
struct connection_metrics
{
    double latency = 0.0;                 ///< EMA of observed latency (ms)
    std::size_t messages_per_second = 0;  ///< Sends in the current health interval
    std::size_t error_rate = 0;           ///< Cumulative error count
    std::chrono::milliseconds uptime{0};  ///< Time since the last successful open
    std::size_t bytes_transferred = 0;    ///< Bytes sent and received
};


/**
 * Pool statistics snapshot.
 */
struct pool_statistics
{
    std::size_t total_connections = 0;
    std::size_t active_connections = 0;
    double average_latency = 0.0;         ///< Mean latency over connected entries
    std::size_t total_bytes_transferred = 0;
    std::size_t queued_messages = 0;
    bool network_available = true;
};

} // namespace relayxx::pool
