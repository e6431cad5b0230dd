/*

pool/connection_pool.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <relayxx/detail/asio_decl.hpp>
#include <relayxx/detail/log.hpp>
#include <relayxx/detail/result.hpp>
#include <relayxx/detail/subscription.hpp>
#include <relayxx/net/reachability.hpp>
#include <relayxx/net/transport.hpp>
#include <relayxx/pool/connection.hpp>
#include <relayxx/pool/envelope.hpp>
#include <relayxx/pool/events.hpp>
#include <relayxx/pool/load_balancer.hpp>
#include <relayxx/pool/message_queue.hpp>
#include <relayxx/pool/pool_config.hpp>

namespace relayxx::pool
{

/**
 * Exception thrown when a pool cannot be constructed.
 */
class pool_error : public std::runtime_error
{
public:
    explicit pool_error(const std::string& msg) : std::runtime_error(msg) {}
    explicit pool_error(const char* msg) : std::runtime_error(msg) {}
};


/// Outcome of connection_pool::send()
enum class send_status
{
    sent,       ///< Written to a connected transport
    queued,     ///< Buffered until a connection or the network comes back
    rejected    ///< Not a JSON object, or the pool is shut down
};

[[nodiscard]] constexpr std::string_view to_string(send_status s) noexcept
{
    switch (s)
    {
        case send_status::sent: return "sent";
        case send_status::queued: return "queued";
        case send_status::rejected: return "rejected";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, send_status s)
{
    return os << to_string(s);
}


/**
 * Keeps a set of named realtime connections alive and routes outbound
 * messages across them.
 *
 * All internal state changes run on a strand of the executor given at
 * construction; the public members may be called from any thread. Events
 * are published outside the internal lock, so a listener may call back into
 * the pool.
 *
 * Create pools with make_pool(), which also starts health monitoring and the
 * reachability subscription.
 */
class connection_pool : public std::enable_shared_from_this<connection_pool>
{
public:
    using strand_type = asio::strand<asio::any_io_executor>;

    /**
     * @param executor      Executor running timers and transport callbacks
     * @param factory       Creates one unopened transport per endpoint
     * @param reachability  Network availability input; nullptr means always available
     * @param config        Pool configuration
     * @throws pool_error if factory is empty or max_connections is zero
     */
    connection_pool(asio::any_io_executor executor,
                    net::transport_factory factory,
                    std::shared_ptr<net::reachability_source> reachability = nullptr,
                    pool_config config = {})
        : strand_(asio::make_strand(std::move(executor)))
        , factory_(std::move(factory))
        , reachability_(std::move(reachability))
        , config_(std::move(config))
        , balancer_(make_load_balancer(config_.load_balancing))
        , queue_(config_.max_queue_size)
    {
        if (!factory_)
            throw pool_error("Transport factory is required");
        if (config_.max_connections == 0)
            throw pool_error("max_connections must be at least 1");
    }

    ~connection_pool()
    {
        disconnect();
    }

    // Non-copyable, non-movable
    connection_pool(const connection_pool&) = delete;
    connection_pool& operator=(const connection_pool&) = delete;
    connection_pool(connection_pool&&) = delete;
    connection_pool& operator=(connection_pool&&) = delete;

    /**
     * Subscribe to reachability changes and start the health monitor.
     * Called by make_pool(); further calls do nothing.
     */
    void start()
    {
        if (started_.exchange(true, std::memory_order_acq_rel))
            return;

        if (reachability_)
        {
            auto sub = reachability_->subscribe(
                [weak = weak_from_this()](const bool& available)
                {
                    if (auto self = weak.lock())
                        self->on_reachability(available);
                });
            std::lock_guard lock(mutex_);
            reachability_sub_ = std::move(sub);
        }

        auto timer = std::make_shared<asio::steady_timer>(strand_);
        {
            std::lock_guard lock(mutex_);
            health_timer_ = timer;
        }
        asio::co_spawn(strand_, run_health_monitor(weak_from_this(), std::move(timer)), asio::detached);

        RELAYXX_LOG_INFO("POOL", "Connection pool started (strategy=" << balancer_name()
            << ", max_connections=" << config().max_connections << ")");
    }

    // ==================== Connections ====================

    /**
     * Open a named connection and register it once its handshake completes.
     *
     * Fails with pool_full, duplicate_connection or shut_down without opening
     * anything; with connection_timeout when the handshake does not complete
     * within connection_timeout; with the transport's error otherwise.
     */
    asio::awaitable<result_void> add_connection(std::string id, std::string url)
    {
        auto self = shared_from_this();
        co_return co_await asio::co_spawn(strand_,
            self->add_connection_on_strand(std::move(id), std::move(url)),
            asio::use_awaitable);
    }

    /**
     * Close and forget a connection, cancelling any pending reconnection.
     * @return false if no connection has this id
     */
    bool remove_connection(const std::string& id)
    {
        std::shared_ptr<connection> removed;
        std::shared_ptr<asio::steady_timer> timer;
        std::vector<std::shared_ptr<open_attempt>> reconnecting;
        {
            std::lock_guard lock(mutex_);
            auto it = find_locked(id);
            if (it == connections_.end())
                return false;
            removed = *it;
            connections_.erase(it);
            timer = removed->take_reconnect_timer();
            for (const auto& [generation, weak] : opening_)
            {
                auto attempt = weak.lock();
                if (attempt && attempt->reconnecting && attempt->id == id)
                    reconnecting.push_back(std::move(attempt));
            }
        }

        if (timer || !reconnecting.empty())
        {
            asio::post(strand_, [timer, reconnecting = std::move(reconnecting), id]()
            {
                if (timer)
                    timer->cancel();
                for (const auto& attempt : reconnecting)
                    attempt->abandon(fail(error_code::cancelled, "Connection " + id + " removed"));
            });
        }

        close_transport(*removed, "Connection removed");

        RELAYXX_LOG_INFO("POOL", "Removed connection " << id);
        events_.publish(make_event(event_kind::connection_removed, *removed));
        return true;
    }

    // ==================== Messaging ====================

    /**
     * Send a JSON object through the connection chosen by the load balancer.
     *
     * While the network is unavailable, when no connection is usable or when
     * the transport refuses the frame, the message is queued with the given
     * priority instead.
     */
    send_status send(const nlohmann::json& message, int priority = 1)
    {
        if (!message.is_object())
        {
            RELAYXX_LOG_WARN("POOL", "Rejected outbound message: payload must be a JSON object");
            return send_status::rejected;
        }

        std::lock_guard lock(mutex_);
        if (shut_down_.load(std::memory_order_acquire))
            return send_status::rejected;

        if (!network_.available())
        {
            enqueue_locked(message, priority);
            return send_status::queued;
        }

        if (transmit_locked(message))
            return send_status::sent;

        enqueue_locked(message, priority);
        return send_status::queued;
    }

    /**
     * Send directly on one connection, bypassing balancing and the queue.
     * Fails with unknown_connection, not_connected, invalid_payload or the
     * transport's send error.
     */
    result_void send_to_connection(const std::string& id, const nlohmann::json& message)
    {
        std::lock_guard lock(mutex_);
        auto it = find_locked(id);
        if (it == connections_.end())
            return fail(error_code::unknown_connection, "No connection named " + id);
        if (!(*it)->is_connected())
            return fail(error_code::not_connected, "Connection " + id + " is not connected");
        return send_frame_locked(**it, message);
    }

    // ==================== Observation ====================

    [[nodiscard]] pool_statistics get_statistics() const
    {
        std::lock_guard lock(mutex_);
        pool_statistics stats;
        stats.total_connections = connections_.size();
        stats.queued_messages = queue_.size();
        stats.network_available = network_.available();

        double latency_sum = 0.0;
        for (const auto& conn : connections_)
        {
            stats.total_bytes_transferred += conn->metrics().bytes_transferred;
            if (conn->is_connected())
            {
                ++stats.active_connections;
                latency_sum += conn->metrics().latency;
            }
        }
        if (stats.active_connections > 0)
            stats.average_latency = latency_sum / static_cast<double>(stats.active_connections);
        return stats;
    }

    [[nodiscard]] std::optional<connection_info> get_connection(const std::string& id) const
    {
        std::lock_guard lock(mutex_);
        auto it = find_locked(id);
        if (it == connections_.end())
            return std::nullopt;
        return (*it)->info();
    }

    /// Every registered connection, in insertion order
    [[nodiscard]] std::vector<connection_info> get_all_connections() const
    {
        std::lock_guard lock(mutex_);
        std::vector<connection_info> all;
        all.reserve(connections_.size());
        for (const auto& conn : connections_)
            all.push_back(conn->info());
        return all;
    }

    [[nodiscard]] std::map<std::string, connection_metrics> get_connection_metrics() const
    {
        std::lock_guard lock(mutex_);
        std::map<std::string, connection_metrics> metrics;
        for (const auto& conn : connections_)
            metrics.emplace(conn->id(), conn->metrics());
        return metrics;
    }

    [[nodiscard]] std::size_t queued_messages() const
    {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] bool network_available() const noexcept
    {
        return network_.available();
    }

    [[nodiscard]] bool is_shut_down() const noexcept
    {
        return shut_down_.load(std::memory_order_acquire);
    }

    // ==================== Configuration ====================

    [[nodiscard]] pool_config config() const
    {
        std::lock_guard lock(mutex_);
        return config_;
    }

    /**
     * Merge a partial configuration.
     * A new load_balancing value replaces the active strategy; a new
     * health_check_interval restarts the health monitor.
     */
    void update_config(const pool_config_update& update)
    {
        std::shared_ptr<asio::steady_timer> restart;
        {
            std::lock_guard lock(mutex_);
            const auto previous_interval = config_.health_check_interval;
            update.apply_to(config_);
            if (config_.max_connections == 0)
                config_.max_connections = 1;

            if (update.load_balancing)
                balancer_ = make_load_balancer(*update.load_balancing);

            if (update.max_queue_size)
            {
                const auto dropped = queue_.set_capacity(config_.max_queue_size);
                if (dropped > 0)
                    RELAYXX_LOG_WARN("QUEUE", "Queue bound lowered, dropped " << dropped << " message(s)");
            }

            if (config_.health_check_interval != previous_interval)
                restart = health_timer_;
        }

        if (restart)
            asio::post(strand_, [restart]() { restart->cancel(); });

        RELAYXX_LOG_INFO("POOL", "Configuration updated (strategy=" << balancer_name() << ")");
    }

    /// Install a custom strategy in place of the configured one
    void set_load_balancer(std::unique_ptr<load_balancer> balancer)
    {
        if (!balancer)
            return;
        std::lock_guard lock(mutex_);
        balancer_ = std::move(balancer);
    }

    // ==================== Events ====================

    [[nodiscard]] subscription subscribe(event_bus::callback_type cb)
    {
        return events_.subscribe(std::move(cb));
    }

    [[nodiscard]] subscription subscribe(event_kind kind, event_bus::callback_type cb)
    {
        return events_.subscribe(kind, std::move(cb));
    }

    // ==================== Shutdown ====================

    /**
     * Stop monitoring, cancel pending reconnections and in-flight opens,
     * close every transport with code 1000, drop the queue and every
     * listener. Safe to call more than once.
     */
    void disconnect()
    {
        if (shut_down_.exchange(true, std::memory_order_acq_rel))
            return;

        std::vector<std::shared_ptr<connection>> closing;
        std::vector<std::shared_ptr<asio::steady_timer>> timers;
        std::vector<std::shared_ptr<open_attempt>> attempts;
        subscription reachability_sub;
        {
            std::lock_guard lock(mutex_);
            closing.swap(connections_);
            for (const auto& conn : closing)
            {
                if (auto timer = conn->take_reconnect_timer())
                    timers.push_back(std::move(timer));
            }
            if (health_timer_)
                timers.push_back(std::exchange(health_timer_, nullptr));
            for (const auto& [generation, weak] : opening_)
            {
                if (auto attempt = weak.lock())
                    attempts.push_back(std::move(attempt));
            }
            opening_.clear();
            pending_ids_.clear();
            queue_.clear();
            reachability_sub = std::move(reachability_sub_);
        }

        reachability_sub.reset();

        asio::post(strand_, [timers = std::move(timers), attempts = std::move(attempts)]()
        {
            for (const auto& timer : timers)
                timer->cancel();
            for (const auto& attempt : attempts)
                attempt->abandon(fail(error_code::cancelled, "Connection pool shut down"));
        });

        for (const auto& conn : closing)
            close_transport(*conn, "Manager shutdown");

        events_.clear();
        RELAYXX_LOG_INFO("POOL", "Connection pool disconnected (" << closing.size() << " connection(s) closed)");
    }

private:
    /// Outcome slot of one open(), signalled by cancelling the timer
    struct open_attempt
    {
        open_attempt(const strand_type& executor, std::string conn_id, bool is_reconnect)
            : timer(executor)
            , id(std::move(conn_id))
            , reconnecting(is_reconnect)
        {
        }

        void settle(result_void outcome_value)
        {
            if (outcome)
                return;
            outcome = std::move(outcome_value);
            timer.cancel();
        }

        /// Give up on the open; later transport callbacks are ignored
        void abandon(result_void outcome_value)
        {
            abandoned = true;
            settle(std::move(outcome_value));
        }

        asio::steady_timer timer;
        std::optional<result_void> outcome;
        const std::string id;
        const bool reconnecting;
        bool abandoned = false;
    };

    using connection_list = std::vector<std::shared_ptr<connection>>;
    using event_list = std::vector<pool_event>;

    // ==================== Opening ====================

    asio::awaitable<result_void> add_connection_on_strand(std::string id, std::string url)
    {
        std::optional<error> refused;
        {
            std::lock_guard lock(mutex_);
            if (shut_down_.load(std::memory_order_acquire))
                refused = error(error_code::shut_down, "Connection pool is shut down");
            else if (find_locked(id) != connections_.end() || pending_ids_.contains(id))
                refused = error(error_code::duplicate_connection, "Connection " + id + " already exists");
            else if (connections_.size() + pending_ids_.size() >= config_.max_connections)
                refused = error(error_code::pool_full, "Maximum connections reached");
            else
                pending_ids_.insert(id);
        }
        if (refused)
        {
            RELAYXX_LOG_WARN("POOL", "Cannot add connection " << id << ": " << *refused);
            co_return fail(std::move(*refused));
        }

        auto opened = co_await open_connection(id, url, false);

        event_list events;
        bool flush = false;
        std::optional<error> failure;
        std::shared_ptr<connection> discarded;
        {
            std::lock_guard lock(mutex_);
            pending_ids_.erase(id);
            if (!opened)
            {
                failure = opened.error();
            }
            else if (shut_down_.load(std::memory_order_acquire))
            {
                failure = error(error_code::shut_down, "Connection pool is shut down");
                discarded = *opened;
            }
            else if (!(*opened)->is_connected())
            {
                failure = error(error_code::connection_closed, "Connection " + id + " closed right after opening");
            }
            else
            {
                connections_.push_back(*opened);
                events.push_back(make_event(event_kind::connection_added, **opened));
                flush = !queue_.empty();
            }
        }

        if (discarded)
            close_transport(*discarded, "Manager shutdown");

        if (failure)
        {
            RELAYXX_LOG_ERROR("POOL", "Failed to add connection " << id << ": " << *failure);
            co_return fail(std::move(*failure));
        }

        RELAYXX_LOG_INFO("POOL", "Added connection " << id);
        publish(events);
        if (flush)
            flush_queue();
        co_return ok();
    }

    /**
     * Create a transport for url, open it and wait for the handshake.
     * Runs on the strand. The returned connection is not registered.
     */
    asio::awaitable<result<std::shared_ptr<connection>>> open_connection(std::string id, std::string url,
                                                                        bool reconnecting)
    {
        std::uint64_t generation = 0;
        std::chrono::milliseconds timeout{};
        bool compression = false;
        {
            std::lock_guard lock(mutex_);
            generation = next_generation_++;
            timeout = config_.connection_timeout;
            compression = config_.compression_enabled;
        }

        const std::string endpoint = envelope::with_compression(url, compression);

        std::unique_ptr<net::transport> transport;
        std::string factory_error;
        try
        {
            transport = factory_(endpoint);
        }
        catch (const std::exception& e)
        {
            factory_error = e.what();
        }
        if (!transport)
        {
            if (factory_error.empty())
                factory_error = "transport factory returned no transport";
            co_return fail<std::shared_ptr<connection>>(error_code::connection_failed,
                "Cannot create transport for " + id + ": " + factory_error);
        }

        auto conn = std::make_shared<connection>(id, std::move(url), std::move(transport), generation);
        auto attempt = std::make_shared<open_attempt>(strand_, id, reconnecting);
        {
            std::lock_guard lock(mutex_);
            opening_[generation] = attempt;
        }

        RELAYXX_LOG_DEBUG("POOL", "Opening " << id << " at " << endpoint);
        conn->transport().open(make_handlers(conn, attempt));

        // Handlers are posted to this strand, so none has run before the wait starts
        attempt->timer.expires_after(timeout);
        asio::error_code ec;
        co_await attempt->timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));

        {
            std::lock_guard lock(mutex_);
            opening_.erase(generation);
        }

        if (!attempt->outcome)
            attempt->abandon(fail(error_code::connection_timeout, "Connection timeout for " + id));

        if (!*attempt->outcome)
        {
            close_transport(*conn, "Open failed");
            co_return fail<std::shared_ptr<connection>>(attempt->outcome->error());
        }
        co_return conn;
    }

    /**
     * Transport callbacks for conn. Each one re-posts onto the strand and
     * does nothing once the pool or the connection is gone.
     */
    net::transport_handlers make_handlers(const std::shared_ptr<connection>& conn,
                                          const std::shared_ptr<open_attempt>& attempt)
    {
        const auto strand = strand_;
        const std::weak_ptr<connection_pool> weak_self = weak_from_this();
        const std::weak_ptr<connection> weak_conn = conn;

        auto dispatch = [strand, weak_self, weak_conn](auto fn)
        {
            asio::post(strand, [weak_self, weak_conn, fn = std::move(fn)]() mutable
            {
                auto self = weak_self.lock();
                auto target = weak_conn.lock();
                if (self && target)
                    fn(*self, target);
            });
        };

        net::transport_handlers handlers;
        handlers.on_open = [dispatch, attempt]()
        {
            dispatch([attempt](connection_pool& self, const std::shared_ptr<connection>& c)
            {
                self.handle_open(c, *attempt);
            });
        };
        handlers.on_message = [dispatch](std::string_view frame)
        {
            dispatch([data = std::string(frame)](connection_pool& self, const std::shared_ptr<connection>& c)
            {
                self.handle_message(c, data);
            });
        };
        handlers.on_close = [dispatch, attempt](std::uint16_t code, std::string_view reason)
        {
            dispatch([attempt, code, text = std::string(reason)](connection_pool& self, const std::shared_ptr<connection>& c)
            {
                self.handle_close(c, *attempt, code, text);
            });
        };
        handlers.on_error = [dispatch, attempt](const error& err)
        {
            dispatch([attempt, err](connection_pool& self, const std::shared_ptr<connection>& c)
            {
                self.handle_error(c, *attempt, err);
            });
        };
        return handlers;
    }

    // ==================== Transport callbacks (strand) ====================

    void handle_open(const std::shared_ptr<connection>& conn, open_attempt& attempt)
    {
        if (attempt.abandoned)
        {
            RELAYXX_LOG_DEBUG("POOL", "Ignoring late open of " << conn->id());
            return;
        }

        event_list events;
        {
            std::lock_guard lock(mutex_);
            conn->mark_open(steady_clock::now());
            events.push_back(make_event(event_kind::connection_opened, *conn));
        }
        RELAYXX_LOG_INFO("POOL", "Connection " << conn->id() << " open");
        attempt.settle(ok());
        publish(events);
    }

    void handle_message(const std::shared_ptr<connection>& conn, const std::string& data)
    {
        RELAYXX_TRACE_RECV(conn->id(), data);
        const auto sample = envelope::latency_sample(data, envelope::epoch_ms());
        {
            std::lock_guard lock(mutex_);
            conn->record_inbound(data.size(), sample, steady_clock::now());
        }

        pool_event ev{.kind = event_kind::message};
        ev.connection_id = conn->id();
        ev.data = data;
        events_.publish(ev);
    }

    void handle_close(const std::shared_ptr<connection>& conn, open_attempt& attempt,
                      std::uint16_t code, const std::string& reason)
    {
        if (attempt.abandoned)
            return;
        attempt.settle(fail(error_code::connection_closed,
            "Connection " + conn->id() + " closed during handshake (code " + std::to_string(code) + ")"));

        event_list events;
        {
            std::lock_guard lock(mutex_);
            conn->mark_closed();

            auto ev = make_event(event_kind::connection_closed, *conn);
            ev.close = close_details{code, reason};
            events.push_back(std::move(ev));

            if (code != net::close_code::normal
                && config_.enable_failover
                && !shut_down_.load(std::memory_order_acquire)
                && is_registered_locked(*conn))
            {
                schedule_reconnect_locked(conn, events);
            }
        }
        RELAYXX_LOG_INFO("POOL", "Connection " << conn->id() << " closed: " << code << " " << reason);
        publish(events);
    }

    void handle_error(const std::shared_ptr<connection>& conn, open_attempt& attempt, const error& err)
    {
        if (attempt.abandoned)
            return;

        event_list events;
        {
            std::lock_guard lock(mutex_);
            conn->mark_error();
            auto ev = make_event(event_kind::connection_error, *conn);
            ev.err = err;
            events.push_back(std::move(ev));
        }
        RELAYXX_LOG_ERROR("POOL", "Connection " << conn->id() << " error: " << err);
        attempt.settle(fail(err));
        publish(events);
    }

    // ==================== Reconnection ====================

    /**
     * Arm the backoff timer for conn, or report it failed once the policy
     * is exhausted. Runs on the strand with the lock held.
     */
    void schedule_reconnect_locked(const std::shared_ptr<connection>& conn, event_list& events)
    {
        if (conn->reconnect_pending())
            return;

        const auto policy = config_.reconnection();
        if (policy.exhausted(conn->reconnect_attempts()))
        {
            RELAYXX_LOG_ERROR("RECONNECT", "Max reconnection attempts reached for " << conn->id());
            events.push_back(make_event(event_kind::connection_failed, *conn));
            return;
        }

        const unsigned int attempt = conn->next_reconnect_attempt();
        const auto delay = policy.calculate_delay(attempt);

        auto timer = std::make_shared<asio::steady_timer>(strand_);
        timer->expires_after(delay);
        conn->set_reconnect_timer(timer);

        RELAYXX_LOG_INFO("RECONNECT", "Reconnecting " << conn->id() << " in " << delay.count()
            << "ms (attempt " << attempt << "/" << policy.max_attempts << ")");

        auto ev = make_event(event_kind::reconnect_scheduled, *conn);
        ev.reconnect = reconnect_details{attempt, delay};
        events.push_back(std::move(ev));

        asio::co_spawn(strand_,
            run_reconnect(weak_from_this(), conn->id(), conn->generation(), std::move(timer)),
            asio::detached);
    }

    static asio::awaitable<void> run_reconnect(std::weak_ptr<connection_pool> weak, std::string id,
                                               std::uint64_t generation,
                                               std::shared_ptr<asio::steady_timer> timer)
    {
        asio::error_code ec;
        co_await timer->async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return;

        if (auto self = weak.lock())
            co_await self->reconnect(std::move(id), generation);
    }

    /**
     * Replace the connection of the given generation with a freshly opened
     * one. Stale timers (the id was removed, re-added or already replaced)
     * are discarded.
     */
    asio::awaitable<void> reconnect(std::string id, std::uint64_t generation)
    {
        std::string url;
        {
            std::lock_guard lock(mutex_);
            auto it = find_locked(id);
            if (shut_down_.load(std::memory_order_acquire) || it == connections_.end()
                || (*it)->generation() != generation)
            {
                RELAYXX_LOG_DEBUG("RECONNECT", "Discarding stale reconnection of " << id);
                co_return;
            }
            url = (*it)->url();
        }

        auto opened = co_await open_connection(id, url, true);

        event_list events;
        bool flush = false;
        bool reconnected = false;
        std::shared_ptr<connection> discarded;
        {
            std::lock_guard lock(mutex_);
            auto it = find_locked(id);
            const bool stale = shut_down_.load(std::memory_order_acquire) || it == connections_.end()
                || (*it)->generation() != generation;

            if (stale)
            {
                if (opened)
                    discarded = *opened;
            }
            else if (opened && (*opened)->is_connected())
            {
                (void)(*it)->take_reconnect_timer();
                *it = *opened;
                events.push_back(make_event(event_kind::connection_reconnected, **it));
                reconnected = true;
                flush = !queue_.empty();
            }
            else
            {
                std::shared_ptr<connection> previous = *it;
                (void)previous->take_reconnect_timer();
                RELAYXX_LOG_WARN("RECONNECT", "Reconnection of " << id << " failed: "
                    << (opened ? error(error_code::connection_closed) : opened.error()));
                schedule_reconnect_locked(previous, events);
            }
        }

        if (discarded)
        {
            RELAYXX_LOG_DEBUG("RECONNECT", "Connection " << id << " went away while reconnecting");
            close_transport(*discarded, "Connection removed");
            co_return;
        }

        if (reconnected)
            RELAYXX_LOG_INFO("RECONNECT", "Connection " << id << " reconnected");
        publish(events);
        if (flush)
            flush_queue();
    }

    // ==================== Health monitoring ====================

    static asio::awaitable<void> run_health_monitor(std::weak_ptr<connection_pool> weak,
                                                    std::shared_ptr<asio::steady_timer> timer)
    {
        for (;;)
        {
            {
                auto self = weak.lock();
                if (!self || self->is_shut_down())
                    co_return;
                timer->expires_after(self->config().health_check_interval);
            }

            asio::error_code ec;
            co_await timer->async_wait(asio::redirect_error(asio::use_awaitable, ec));

            auto self = weak.lock();
            if (!self || self->is_shut_down())
                co_return;
            // Cancelled without shutdown: the interval changed, re-arm
            if (ec == asio::error::operation_aborted)
                continue;
            self->perform_health_check();
        }
    }

    void perform_health_check()
    {
        event_list events;
        {
            std::lock_guard lock(mutex_);
            const auto now = steady_clock::now();
            const auto interval = config_.health_check_interval;
            health_summary summary;

            for (const auto& conn : connections_)
            {
                conn->begin_interval(now);
                if (!conn->is_connected())
                    continue;

                if (conn->transport().state() == net::ready_state::closed)
                {
                    RELAYXX_LOG_WARN("HEALTH", "Connection " << conn->id() << " is closed, scheduling reconnection");
                    conn->mark_closed();
                    if (config_.enable_failover)
                        schedule_reconnect_locked(conn, events);
                    continue;
                }

                if (conn->is_stale(now, interval))
                {
                    RELAYXX_LOG_WARN("HEALTH", "Connection " << conn->id() << " appears stale, sending ping");
                    send_ping_locked(*conn);
                }
            }

            summary.total_connections = connections_.size();
            summary.active_connections = static_cast<std::size_t>(std::count_if(
                connections_.begin(), connections_.end(),
                [](const auto& c) { return c->is_connected(); }));
            summary.queued_messages = queue_.size();

            pool_event ev{.kind = event_kind::health_check_completed};
            ev.health = summary;
            events.push_back(std::move(ev));
        }
        publish(events);
    }

    void send_ping_locked(connection& conn)
    {
        const auto frame = envelope::heartbeat(envelope::epoch_ms());
        auto sent = conn.transport().send(frame);
        if (!sent)
        {
            RELAYXX_LOG_WARN("HEALTH", "Ping on " << conn.id() << " failed: " << sent.error());
            return;
        }
        RELAYXX_TRACE_SEND(conn.id(), frame);
    }

    // ==================== Network availability ====================

    void on_reachability(bool available)
    {
        const auto transition = network_.update(available);
        if (transition == net::network_transition::none)
            return;

        asio::post(strand_, [weak = weak_from_this(), transition]()
        {
            if (auto self = weak.lock())
                self->handle_network_transition(transition);
        });
    }

    void handle_network_transition(net::network_transition transition)
    {
        if (shut_down_.load(std::memory_order_acquire))
            return;

        pool_event ev{.kind = event_kind::network_lost};
        if (transition == net::network_transition::restored)
        {
            RELAYXX_LOG_INFO("POOL", "Network restored, processing " << queued_messages() << " queued message(s)");
            flush_queue();
            ev.kind = event_kind::network_restored;
        }
        else
        {
            RELAYXX_LOG_WARN("POOL", "Network lost, queueing outbound messages");
        }
        events_.publish(ev);
    }

    // ==================== Outbound path ====================

    /// Send queued messages in order until one cannot be transmitted
    void flush_queue()
    {
        std::lock_guard lock(mutex_);
        if (!network_.available() || queue_.empty())
            return;

        const auto before = queue_.size();
        const auto remaining = queue_.drain([this](const queued_message& msg)
        {
            return transmit_locked(msg.payload);
        });
        RELAYXX_LOG_DEBUG("QUEUE", "Flushed " << (before - remaining) << " message(s), "
            << remaining << " still queued");
    }

    /// One transmission attempt through the balancer; never queues
    bool transmit_locked(const nlohmann::json& payload)
    {
        std::vector<selection_candidate> candidates;
        candidates.reserve(connections_.size());
        for (const auto& conn : connections_)
            candidates.push_back(selection_candidate{conn->id(), conn->state(), conn->metrics()});

        const auto index = balancer_->select(candidates);
        if (!index || *index >= connections_.size())
            return false;
        return send_frame_locked(*connections_[*index], payload).has_value();
    }

    result_void send_frame_locked(connection& conn, const nlohmann::json& payload)
    {
        auto frame = envelope::make(payload, envelope::epoch_ms());
        if (!frame)
        {
            RELAYXX_LOG_WARN("POOL", "Cannot frame message for " << conn.id() << ": " << frame.error());
            return fail(frame.error());
        }

        auto sent = conn.transport().send(*frame);
        if (!sent)
        {
            RELAYXX_LOG_WARN("POOL", "Failed to send message on " << conn.id() << ": " << sent.error());
            return sent;
        }

        RELAYXX_TRACE_SEND(conn.id(), *frame);
        conn.record_sent(frame->size(), steady_clock::now());
        return ok();
    }

    void enqueue_locked(const nlohmann::json& payload, int priority)
    {
        const auto dropped = queue_.enqueue(payload, priority);
        if (dropped > 0)
            RELAYXX_LOG_WARN("QUEUE", "Queue full, dropped " << dropped << " message(s)");
        RELAYXX_LOG_DEBUG("QUEUE", "Queued message (priority " << priority << ", "
            << queue_.size() << " queued)");
    }

    // ==================== Helpers ====================

    [[nodiscard]] connection_list::iterator find_locked(const std::string& id)
    {
        return std::find_if(connections_.begin(), connections_.end(),
            [&id](const auto& c) { return c->id() == id; });
    }

    [[nodiscard]] connection_list::const_iterator find_locked(const std::string& id) const
    {
        return std::find_if(connections_.begin(), connections_.end(),
            [&id](const auto& c) { return c->id() == id; });
    }

    [[nodiscard]] bool is_registered_locked(const connection& conn) const
    {
        auto it = find_locked(conn.id());
        return it != connections_.end() && it->get() == &conn;
    }

    [[nodiscard]] std::string balancer_name() const
    {
        std::lock_guard lock(mutex_);
        return std::string(balancer_->name());
    }

    static void close_transport(connection& conn, std::string_view reason)
    {
        const auto state = conn.transport().state();
        if (state == net::ready_state::closed || state == net::ready_state::closing)
            return;
        conn.transport().close(net::close_code::normal, reason);
    }

    [[nodiscard]] static pool_event make_event(event_kind kind, const connection& conn)
    {
        pool_event ev{.kind = kind};
        ev.connection_id = conn.id();
        ev.connection = conn.info();
        return ev;
    }

    void publish(const event_list& events) const
    {
        for (const auto& ev : events)
            events_.publish(ev);
    }

    strand_type strand_;
    net::transport_factory factory_;
    std::shared_ptr<net::reachability_source> reachability_;

    mutable std::mutex mutex_;
    pool_config config_;
    std::unique_ptr<load_balancer> balancer_;
    connection_list connections_;
    std::set<std::string> pending_ids_;
    std::map<std::uint64_t, std::weak_ptr<open_attempt>> opening_;
    message_queue queue_;
    std::uint64_t next_generation_ = 1;
    std::shared_ptr<asio::steady_timer> health_timer_;
    subscription reachability_sub_;

    net::network_monitor network_;
    event_bus events_;
    std::atomic<bool> started_{false};
    std::atomic<bool> shut_down_{false};
};


/**
 * Create a pool and start it.
 */
inline std::shared_ptr<connection_pool> make_pool(
    asio::any_io_executor executor,
    net::transport_factory factory,
    std::shared_ptr<net::reachability_source> reachability = nullptr,
    pool_config config = {})
{
    auto pool = std::make_shared<connection_pool>(
        std::move(executor), std::move(factory), std::move(reachability), std::move(config));
    pool->start();
    return pool;
}

} // namespace relayxx::pool
