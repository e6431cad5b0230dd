/*

pool.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Connection pooling for realtime transports.

*/

#pragma once

#include <relayxx/pool/pool_config.hpp>
#include <relayxx/pool/connection.hpp>
#include <relayxx/pool/load_balancer.hpp>
#include <relayxx/pool/message_queue.hpp>
#include <relayxx/pool/envelope.hpp>
#include <relayxx/pool/events.hpp>
#include <relayxx/pool/connection_pool.hpp>

/**
 * @file pool.hpp
 * @brief Resilient pool of realtime connections.
 *
 * @section Overview
 *
 * A connection_pool keeps up to max_connections named transports open,
 * routes each outbound JSON message to one of them through a load balancing
 * strategy, and buffers messages in a bounded priority queue while nothing
 * can carry them. Unexpected closes are retried with exponential backoff;
 * a periodic health check pings idle connections and notices dead sockets.
 *
 * @section Usage
 *
 * @code
 * #include <relayxx/relayxx.hpp>
 *
 * asio::io_context ctx;
 * auto network = std::make_shared<relayxx::net::manual_reachability>();
 * auto pool = relayxx::pool::make_pool(ctx.get_executor(),
 *     relayxx::net::websocket_transport::factory(ctx.get_executor()),
 *     network, relayxx::pool::pool_config::high_availability());
 *
 * auto sub = pool->subscribe(relayxx::pool::event_kind::message,
 *     [](const relayxx::pool::pool_event& ev) { std::cout << ev.data << "\n"; });
 *
 * co_await pool->add_connection("primary", "wss://realtime.example.com/ws");
 * co_await pool->add_connection("backup", "wss://backup.example.com/ws");
 *
 * pool->send({{"type", "subscribe"}, {"channel", "ticker"}});
 * pool->send({{"type", "order"}, {"qty", 3}}, 5);    // higher priority when queued
 * @endcode
 *
 * @subsection Configuration Configuration Options
 *
 * @code
 * auto config = relayxx::pool::pool_config::low_latency();
 * config.max_connections = 4;
 *
 * // Later, at runtime
 * relayxx::pool::pool_config_update update;
 * update.load_balancing = relayxx::pool::balancing_strategy::round_robin;
 * pool->update_config(update);
 * @endcode
 *
 * @subsection Monitoring Monitoring
 *
 * @code
 * auto stats = pool->get_statistics();
 * std::cout << stats.active_connections << "/" << stats.total_connections
 *           << " connected, " << stats.queued_messages << " queued\n";
 * @endcode
 *
 * @section ThreadSafety Thread Safety
 *
 * - Pool operations are thread-safe (internally synchronized)
 * - Transport callbacks and timers are serialized on the pool strand
 * - Event listeners run outside the pool lock and may call back into it
 */

namespace relayxx::pool
{

/**
 * @brief Pool module version.
 */
inline constexpr struct
{
    int major = 1;
    int minor = 0;
    int patch = 0;
} version;

} // namespace relayxx::pool
