/*

pool/events.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lifecycle event stream of a connection pool.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <relayxx/detail/listener_list.hpp>
#include <relayxx/detail/result.hpp>
#include <relayxx/detail/subscription.hpp>
#include <relayxx/pool/connection.hpp>

namespace relayxx::pool
{

enum class event_kind
{
    connection_added,
    connection_opened,
    connection_closed,
    connection_error,
    connection_reconnected,
    connection_failed,
    connection_removed,
    reconnect_scheduled,
    message,
    network_restored,
    network_lost,
    health_check_completed
};

[[nodiscard]] constexpr std::string_view to_string(event_kind kind) noexcept
{
    switch (kind)
    {
        case event_kind::connection_added: return "connection_added";
        case event_kind::connection_opened: return "connection_opened";
        case event_kind::connection_closed: return "connection_closed";
        case event_kind::connection_error: return "connection_error";
        case event_kind::connection_reconnected: return "connection_reconnected";
        case event_kind::connection_failed: return "connection_failed";
        case event_kind::connection_removed: return "connection_removed";
        case event_kind::reconnect_scheduled: return "reconnect_scheduled";
        case event_kind::message: return "message";
        case event_kind::network_restored: return "network_restored";
        case event_kind::network_lost: return "network_lost";
        case event_kind::health_check_completed: return "health_check_completed";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, event_kind kind)
{
    return os << to_string(kind);
}


struct close_details
{
    std::uint16_t code = 0;
    std::string reason;
};

struct reconnect_details
{
    unsigned int attempt = 0;
    std::chrono::milliseconds delay{0};
};

struct health_summary
{
    std::size_t total_connections = 0;
    std::size_t active_connections = 0;
    std::size_t queued_messages = 0;
};


/**
 * One lifecycle notification. Only the members relevant to kind are set:
 *
 * - connection_*: connection_id, connection
 * - connection_closed: close
 * - connection_error: err
 * - reconnect_scheduled: reconnect
 * - message: connection_id, data
 * - health_check_completed: health
 */
struct pool_event
{
    event_kind kind;
    std::string connection_id;
    std::optional<connection_info> connection;
    std::optional<close_details> close;
    std::optional<error> err;
    std::optional<reconnect_details> reconnect;
    std::optional<health_summary> health;
    std::string data;
};


/**
 * Explicit publish/subscribe channel for pool events.
 * Each current subscriber receives every event published after it subscribed.
 */
class event_bus
{
public:
    using callback_type = std::function<void(const pool_event&)>;

    [[nodiscard]] subscription subscribe(callback_type cb)
    {
        return listeners_.add(std::move(cb));
    }

    /// Subscribe to a single kind of event
    [[nodiscard]] subscription subscribe(event_kind kind, callback_type cb)
    {
        return listeners_.add([kind, cb = std::move(cb)](const pool_event& ev)
        {
            if (ev.kind == kind)
                cb(ev);
        });
    }

    void publish(const pool_event& ev) const
    {
        listeners_.notify(ev);
    }

    void clear()
    {
        listeners_.clear();
    }

    [[nodiscard]] std::size_t subscriber_count() const
    {
        return listeners_.size();
    }

private:
    detail::listener_list<pool_event> listeners_;
};

} // namespace relayxx::pool
