/*

test_pool_health_check.cpp
--------------------------

Periodic health monitoring: interval reset, stale pings and dead sockets.

*/

#define BOOST_TEST_MODULE pool_health_check_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include <relayxx/pool/connection_pool.hpp>

#include "pool_fixture.hpp"

using namespace relayxx;
using namespace std::chrono_literals;
using relayxx::pool::event_kind;
using relayxx::test::pool_fixture;
using relayxx::test::sleep_for;

namespace
{

pool::pool_config monitored(std::chrono::milliseconds interval)
{
    auto cfg = pool_fixture::quiet_config();
    cfg.health_check_interval = interval;
    cfg.reconnect_delay = 5ms;
    return cfg;
}

bool is_ping(const std::string& frame)
{
    const auto parsed = nlohmann::json::parse(frame, nullptr, false);
    return parsed.is_object() && parsed.value("type", "") == "ping" && parsed.contains("timestamp");
}

} // namespace


BOOST_AUTO_TEST_CASE(tick_reports_pool_summary)
{
    pool_fixture f(monitored(30ms));
    f.run([&]() -> asio::awaitable<void>
    {
        (void)co_await f.pool->add_connection("a", "ws://a.test");
        (void)co_await f.pool->add_connection("b", "ws://b.test");
        f.network.latest("ws://b.test")->drop(net::close_code::normal);
        f.reachability->set_available(false);
        (void)f.pool->send({{"type", "held"}});
        co_await sleep_for(100ms);

        BOOST_TEST_REQUIRE(f.count(event_kind::health_check_completed) >= 1u);
        const pool::pool_event* last = nullptr;
        for (const auto& ev : f.events)
        {
            if (ev.kind == event_kind::health_check_completed)
                last = &ev;
        }
        BOOST_TEST_REQUIRE(last->health.has_value());
        BOOST_TEST(last->health->total_connections == 2u);
        BOOST_TEST(last->health->active_connections == 1u);
        BOOST_TEST(last->health->queued_messages == 1u);
    });
}

BOOST_AUTO_TEST_CASE(tick_resets_send_rate_and_updates_uptime)
{
    pool_fixture f(monitored(40ms));
    f.run([&]() -> asio::awaitable<void>
    {
        (void)co_await f.pool->add_connection("a", "ws://a.test");
        for (int i = 0; i < 3; ++i)
            (void)f.pool->send({{"i", i}});
        BOOST_TEST(f.pool->get_connection_metrics().at("a").messages_per_second == 3u);

        co_await sleep_for(70ms);

        const auto metrics = f.pool->get_connection_metrics().at("a");
        BOOST_TEST(metrics.messages_per_second == 0u);
        BOOST_TEST(metrics.uptime.count() >= 30);
    });
}

BOOST_AUTO_TEST_CASE(idle_connection_gets_pinged)
{
    pool_fixture f(monitored(20ms));
    f.run([&]() -> asio::awaitable<void>
    {
        (void)co_await f.pool->add_connection("a", "ws://a.test");
        auto a = f.network.latest("ws://a.test");
        co_await sleep_for(150ms);

        BOOST_TEST_REQUIRE(!a->sent.empty());
        BOOST_TEST(is_ping(a->sent.front()));
        // Pings are not user traffic
        BOOST_TEST(f.pool->get_connection_metrics().at("a").bytes_transferred == 0u);
    });
}

BOOST_AUTO_TEST_CASE(active_connection_is_not_pinged)
{
    pool_fixture f(monitored(40ms));
    f.run([&]() -> asio::awaitable<void>
    {
        (void)co_await f.pool->add_connection("a", "ws://a.test");
        auto a = f.network.latest("ws://a.test");

        for (int i = 0; i < 6; ++i)
        {
            a->deliver(R"({"type":"tick"})");
            co_await sleep_for(20ms);
        }

        for (const auto& frame : a->sent)
            BOOST_TEST(!is_ping(frame));
    });
}

BOOST_AUTO_TEST_CASE(silently_dead_socket_is_replaced)
{
    pool_fixture f(monitored(20ms));
    f.run([&]() -> asio::awaitable<void>
    {
        (void)co_await f.pool->add_connection("a", "ws://a.test");
        f.network.created.front()->die_silently();
        co_await sleep_for(120ms);

        BOOST_TEST(f.network.created.size() >= 2u);
        BOOST_TEST(f.count(event_kind::reconnect_scheduled) >= 1u);
        BOOST_TEST(f.count(event_kind::connection_reconnected) == 1u);
        auto info = f.pool->get_connection("a");
        BOOST_TEST_REQUIRE(info.has_value());
        BOOST_TEST((info->state == pool::connection_state::connected));
    });
}

BOOST_AUTO_TEST_CASE(interval_change_restarts_monitor)
{
    pool_fixture f(monitored(60000ms));
    f.run([&]() -> asio::awaitable<void>
    {
        (void)co_await f.pool->add_connection("a", "ws://a.test");
        co_await sleep_for(50ms);
        BOOST_TEST(f.count(event_kind::health_check_completed) == 0u);

        pool::pool_config_update update;
        update.health_check_interval = 20ms;
        f.pool->update_config(update);
        co_await sleep_for(100ms);

        BOOST_TEST(f.count(event_kind::health_check_completed) >= 2u);
        BOOST_TEST(f.pool->config().health_check_interval.count() == 20);
    });
}
