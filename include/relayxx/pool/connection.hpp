/*

pool/connection.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <relayxx/detail/asio_decl.hpp>
#include <relayxx/net/transport.hpp>
#include <relayxx/pool/pool_config.hpp>

namespace relayxx::pool
{

enum class connection_state
{
    connecting,
    connected,
    disconnected,
    error
};

[[nodiscard]] constexpr std::string_view to_string(connection_state s) noexcept
{
    switch (s)
    {
        case connection_state::connecting: return "connecting";
        case connection_state::connected: return "connected";
        case connection_state::disconnected: return "disconnected";
        case connection_state::error: return "error";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, connection_state s)
{
    return os << to_string(s);
}


/**
 * Copy of a connection's observable state, handed out by the pool accessors.
 */
struct connection_info
{
    std::string id;
    std::string url;
    connection_state state = connection_state::connecting;
    steady_clock::time_point last_activity{};
    unsigned int reconnect_attempts = 0;
    connection_metrics metrics;
    std::uint64_t generation = 0;
};


/**
 * One named transport and its lifecycle state.
 *
 * Only the pool calls the mutating members; everyone else sees
 * connection_info snapshots.
 */
class connection
{
public:
    /// Weight of a new latency sample in the moving average
    static constexpr double latency_smoothing = 0.2;

    connection(std::string id, std::string url,
               std::unique_ptr<net::transport> transport, std::uint64_t generation)
        : id_(std::move(id))
        , url_(std::move(url))
        , transport_(std::move(transport))
        , generation_(generation)
        , last_activity_(steady_clock::now())
    {
    }

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] connection_state state() const noexcept { return state_; }
    [[nodiscard]] bool is_connected() const noexcept { return state_ == connection_state::connected; }
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }
    [[nodiscard]] steady_clock::time_point last_activity() const noexcept { return last_activity_; }
    [[nodiscard]] unsigned int reconnect_attempts() const noexcept { return reconnect_attempts_; }
    [[nodiscard]] const connection_metrics& metrics() const noexcept { return metrics_; }

    [[nodiscard]] net::transport& transport() noexcept { return *transport_; }
    [[nodiscard]] const net::transport& transport() const noexcept { return *transport_; }

    [[nodiscard]] connection_info info() const
    {
        return connection_info{
            .id = id_,
            .url = url_,
            .state = state_,
            .last_activity = last_activity_,
            .reconnect_attempts = reconnect_attempts_,
            .metrics = metrics_,
            .generation = generation_
        };
    }

    // ==================== Transitions ====================

    void mark_open(steady_clock::time_point now) noexcept
    {
        state_ = connection_state::connected;
        connected_at_ = now;
        last_activity_ = now;
        reconnect_attempts_ = 0;
        metrics_.uptime = std::chrono::milliseconds{0};
    }

    void mark_closed() noexcept
    {
        state_ = connection_state::disconnected;
    }

    void mark_error() noexcept
    {
        state_ = connection_state::error;
        ++metrics_.error_rate;
    }

    /// Inbound frame; latency_ms is the sample carried by the frame, if any
    void record_inbound(std::size_t bytes, std::optional<double> latency_ms,
                        steady_clock::time_point now) noexcept
    {
        last_activity_ = now;
        metrics_.bytes_transferred += bytes;
        if (latency_ms)
        {
            metrics_.latency = metrics_.latency * (1.0 - latency_smoothing)
                + *latency_ms * latency_smoothing;
        }
    }

    void record_sent(std::size_t bytes, steady_clock::time_point now) noexcept
    {
        last_activity_ = now;
        metrics_.bytes_transferred += bytes;
        ++metrics_.messages_per_second;
    }

    /// Start a new health interval
    void begin_interval(steady_clock::time_point now) noexcept
    {
        metrics_.messages_per_second = 0;
        if (state_ == connection_state::connected)
        {
            metrics_.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(now - connected_at_);
        }
    }

    [[nodiscard]] bool is_stale(steady_clock::time_point now, std::chrono::milliseconds interval) const noexcept
    {
        return now - last_activity_ > 2 * interval;
    }

    /// Count a reconnection attempt and return its 1-based number
    unsigned int next_reconnect_attempt() noexcept
    {
        return ++reconnect_attempts_;
    }

    // ==================== Pending reconnection ====================

    [[nodiscard]] bool reconnect_pending() const noexcept
    {
        return static_cast<bool>(reconnect_timer_);
    }

    void set_reconnect_timer(std::shared_ptr<asio::steady_timer> timer) noexcept
    {
        reconnect_timer_ = std::move(timer);
    }

    [[nodiscard]] std::shared_ptr<asio::steady_timer> take_reconnect_timer() noexcept
    {
        return std::exchange(reconnect_timer_, nullptr);
    }

private:
    std::string id_;
    std::string url_;
    std::unique_ptr<net::transport> transport_;
    std::uint64_t generation_;

    connection_state state_ = connection_state::connecting;
    steady_clock::time_point last_activity_;
    steady_clock::time_point connected_at_{};
    unsigned int reconnect_attempts_ = 0;
    connection_metrics metrics_;

    std::shared_ptr<asio::steady_timer> reconnect_timer_;
};

} // namespace relayxx::pool
