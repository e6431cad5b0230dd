/*

test_pool_lifecycle.cpp
-----------------------

Adding, removing and observing connections, and shutting the pool down.

*/

#define BOOST_TEST_MODULE pool_lifecycle_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include <relayxx/pool/connection_pool.hpp>
#include <relayxx/pool/envelope.hpp>

#include "pool_fixture.hpp"

using namespace relayxx;
using namespace std::chrono_literals;
using relayxx::pool::event_kind;
using relayxx::test::pool_fixture;


BOOST_AUTO_TEST_CASE(add_connection_registers_connected_entry)
{
    pool_fixture f;
    f.run([&]() -> asio::awaitable<void>
    {
        auto res = co_await f.pool->add_connection("alpha", "ws://alpha.test/feed");
        BOOST_TEST(res.has_value());

        auto info = f.pool->get_connection("alpha");
        BOOST_TEST_REQUIRE(info.has_value());
        BOOST_TEST((info->state == pool::connection_state::connected));
        BOOST_TEST(info->url == "ws://alpha.test/feed");
        BOOST_TEST(info->reconnect_attempts == 0u);

        const auto stats = f.pool->get_statistics();
        BOOST_TEST(stats.total_connections == 1u);
        BOOST_TEST(stats.active_connections == 1u);
        BOOST_TEST(stats.network_available);

        BOOST_TEST_REQUIRE(f.events.size() == 2u);
        BOOST_TEST((f.events[0].kind == event_kind::connection_opened));
        BOOST_TEST((f.events[1].kind == event_kind::connection_added));
        BOOST_TEST(f.events[1].connection_id == "alpha");
    });
}

BOOST_AUTO_TEST_CASE(compression_flag_reaches_the_dialed_url)
{
    auto cfg = pool_fixture::quiet_config();
    pool_fixture f(cfg);
    f.run([&]() -> asio::awaitable<void>
    {
        (void)co_await f.pool->add_connection("a", "ws://a.test/feed");
        (void)co_await f.pool->add_connection("b", "ws://b.test/feed?room=7");

        pool::pool_config_update update;
        update.compression_enabled = false;
        f.pool->update_config(update);
        (void)co_await f.pool->add_connection("c", "ws://c.test/feed");

        BOOST_TEST_REQUIRE(f.network.created.size() == 3u);
        BOOST_TEST(f.network.created[0]->url == "ws://a.test/feed?compression=true");
        BOOST_TEST(f.network.created[1]->url == "ws://b.test/feed?room=7&compression=true");
        BOOST_TEST(f.network.created[2]->url == "ws://c.test/feed");
    });
}

BOOST_AUTO_TEST_CASE(duplicate_ids_and_capacity_are_refused)
{
    auto cfg = pool_fixture::quiet_config();
    cfg.max_connections = 2;
    pool_fixture f(cfg);
    f.run([&]() -> asio::awaitable<void>
    {
        auto first = co_await f.pool->add_connection("a", "ws://a.test");
        BOOST_TEST(first.has_value());

        auto dup = co_await f.pool->add_connection("a", "ws://other.test");
        BOOST_TEST_REQUIRE(!dup.has_value());
        BOOST_TEST(dup.error().is(error_code::duplicate_connection));

        auto second = co_await f.pool->add_connection("b", "ws://b.test");
        BOOST_TEST(second.has_value());

        auto full = co_await f.pool->add_connection("c", "ws://c.test");
        BOOST_TEST_REQUIRE(!full.has_value());
        BOOST_TEST(full.error().is(error_code::pool_full));

        // Refusals open nothing
        BOOST_TEST(f.network.created.size() == 2u);
        BOOST_TEST(f.pool->get_all_connections().size() == 2u);
    });
}

BOOST_AUTO_TEST_CASE(open_that_never_completes_times_out)
{
    auto cfg = pool_fixture::quiet_config();
    cfg.connection_timeout = 30ms;
    pool_fixture f(cfg);
    f.network.script.push_back(test::open_behavior::hang);
    f.run([&]() -> asio::awaitable<void>
    {
        const auto started = std::chrono::steady_clock::now();
        auto res = co_await f.pool->add_connection("slow", "ws://slow.test");
        const auto elapsed = std::chrono::steady_clock::now() - started;

        BOOST_TEST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().is(error_code::connection_timeout));
        BOOST_TEST((elapsed >= 30ms));
        BOOST_TEST(!f.pool->get_connection("slow").has_value());

        // The abandoned socket is closed
        BOOST_TEST_REQUIRE(f.network.created.size() == 1u);
        BOOST_TEST(f.network.created[0]->closed_with.has_value());
        BOOST_TEST(f.count(event_kind::connection_added) == 0u);

        // The id is free again
        auto retry = co_await f.pool->add_connection("slow", "ws://slow.test");
        BOOST_TEST(retry.has_value());
    });
}

BOOST_AUTO_TEST_CASE(refused_open_reports_transport_error)
{
    pool_fixture f;
    f.network.script.push_back(test::open_behavior::reject);
    f.run([&]() -> asio::awaitable<void>
    {
        auto res = co_await f.pool->add_connection("down", "ws://down.test");
        BOOST_TEST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().is(error_code::connection_failed));
        BOOST_TEST(f.pool->get_all_connections().empty());
        BOOST_TEST(f.count(event_kind::connection_error) == 1u);

        co_await pool_fixture::settle();
        // Never registered, so no reconnection either
        BOOST_TEST(f.count(event_kind::reconnect_scheduled) == 0u);
    });
}

BOOST_AUTO_TEST_CASE(remove_connection_closes_normally)
{
    pool_fixture f;
    f.run([&]() -> asio::awaitable<void>
    {
        (void)co_await f.pool->add_connection("a", "ws://a.test");
        auto endpoint = f.network.latest("ws://a.test");
        BOOST_TEST_REQUIRE(endpoint != nullptr);

        BOOST_TEST(f.pool->remove_connection("a"));
        BOOST_TEST(!f.pool->remove_connection("a"));
        BOOST_TEST(!f.pool->remove_connection("never-added"));

        BOOST_TEST_REQUIRE(endpoint->closed_with.has_value());
        BOOST_TEST(*endpoint->closed_with == net::close_code::normal);
        BOOST_TEST(!f.pool->get_connection("a").has_value());
        BOOST_TEST(f.count(event_kind::connection_removed) == 1u);

        co_await pool_fixture::settle();
        BOOST_TEST(f.network.created.size() == 1u);
    });
}

BOOST_AUTO_TEST_CASE(inbound_frames_update_metrics_and_are_published)
{
    pool_fixture f;
    f.run([&]() -> asio::awaitable<void>
    {
        (void)co_await f.pool->add_connection("a", "ws://a.test");
        auto endpoint = f.network.latest("ws://a.test");

        const std::string frame = nlohmann::json{
            {"type", "pong"}, {"timestamp", pool::envelope::epoch_ms() - 100}}.dump();
        endpoint->deliver(frame);
        co_await pool_fixture::settle();

        const auto metrics = f.pool->get_connection_metrics();
        BOOST_TEST_REQUIRE(metrics.count("a") == 1u);
        // First sample weighs 0.2 against an initial 0
        BOOST_TEST(metrics.at("a").latency >= 19.0);
        BOOST_TEST(metrics.at("a").latency <= 60.0);
        BOOST_TEST(metrics.at("a").bytes_transferred == frame.size());

        BOOST_TEST_REQUIRE(f.count(event_kind::message) == 1u);
        const auto& ev = f.events.back();
        BOOST_TEST(ev.connection_id == "a");
        BOOST_TEST(ev.data == frame);

        // Frames without a timestamp count bytes only
        endpoint->deliver("plain text");
        co_await pool_fixture::settle();
        const auto after = f.pool->get_connection_metrics().at("a");
        BOOST_TEST(after.latency == metrics.at("a").latency);
        BOOST_TEST(after.bytes_transferred == frame.size() + 10);
    });
}

BOOST_AUTO_TEST_CASE(disconnect_shuts_everything_down_once)
{
    pool_fixture f;
    f.run([&]() -> asio::awaitable<void>
    {
        (void)co_await f.pool->add_connection("a", "ws://a.test");
        (void)co_await f.pool->add_connection("b", "ws://b.test");

        f.reachability->set_available(false);
        BOOST_TEST((f.pool->send({{"type", "later"}}) == pool::send_status::queued));
        BOOST_TEST(f.pool->queued_messages() == 1u);

        f.pool->disconnect();
        const auto events_at_shutdown = f.events.size();
        f.pool->disconnect();

        BOOST_TEST(f.pool->is_shut_down());
        for (const auto& endpoint : f.network.created)
        {
            BOOST_TEST_REQUIRE(endpoint->closed_with.has_value());
            BOOST_TEST(*endpoint->closed_with == net::close_code::normal);
        }
        BOOST_TEST(f.pool->queued_messages() == 0u);
        BOOST_TEST(f.pool->get_all_connections().empty());
        BOOST_TEST(f.reachability->subscriber_count() == 0u);

        auto refused = co_await f.pool->add_connection("c", "ws://c.test");
        BOOST_TEST_REQUIRE(!refused.has_value());
        BOOST_TEST(refused.error().is(error_code::shut_down));
        BOOST_TEST((f.pool->send({{"type", "late"}}) == pool::send_status::rejected));

        f.reachability->set_available(true);
        co_await pool_fixture::settle();
        BOOST_TEST(f.events.size() == events_at_shutdown);
    });
}

BOOST_AUTO_TEST_CASE(construction_requires_factory_and_capacity)
{
    asio::io_context ctx;
    BOOST_CHECK_THROW(pool::make_pool(ctx.get_executor(), net::transport_factory{}), pool::pool_error);

    test::mock_network network;
    pool::pool_config cfg;
    cfg.max_connections = 0;
    BOOST_CHECK_THROW(pool::make_pool(ctx.get_executor(), network.factory(), nullptr, cfg), pool::pool_error);
}

BOOST_AUTO_TEST_CASE(destroying_pool_closes_connections)
{
    asio::io_context ctx;
    test::mock_network network;
    auto pool = pool::make_pool(ctx.get_executor(), network.factory(), nullptr, pool_fixture::quiet_config());

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            (void)co_await pool->add_connection("a", "ws://a.test");
            pool.reset();
        },
        asio::detached);
    ctx.run_for(std::chrono::seconds{5});

    BOOST_TEST(!pool);
    BOOST_TEST_REQUIRE(network.created.size() == 1u);
    BOOST_TEST(network.created[0]->closed_with.has_value());
}
