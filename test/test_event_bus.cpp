/*

test_event_bus.cpp
------------------

Subscription lifetime and delivery of pool events.

*/

#define BOOST_TEST_MODULE event_bus_test

#include <boost/test/unit_test.hpp>

#include <memory>
#include <stdexcept>
#include <vector>

#include <relayxx/pool/events.hpp>

using namespace relayxx::pool;

namespace
{

pool_event event_of(event_kind kind, std::string id = {})
{
    pool_event ev{.kind = kind};
    ev.connection_id = std::move(id);
    return ev;
}

} // namespace


BOOST_AUTO_TEST_CASE(every_subscriber_receives_events)
{
    event_bus bus;
    std::vector<event_kind> first;
    std::vector<event_kind> second;

    auto a = bus.subscribe([&](const pool_event& ev) { first.push_back(ev.kind); });
    auto b = bus.subscribe([&](const pool_event& ev) { second.push_back(ev.kind); });

    bus.publish(event_of(event_kind::connection_added, "a"));
    bus.publish(event_of(event_kind::network_lost));

    BOOST_TEST(first.size() == 2u);
    BOOST_TEST(second.size() == 2u);
    BOOST_TEST((first.back() == event_kind::network_lost));
}

BOOST_AUTO_TEST_CASE(reset_unsubscribes)
{
    event_bus bus;
    int calls = 0;
    auto sub = bus.subscribe([&](const pool_event&) { ++calls; });

    bus.publish(event_of(event_kind::message));
    sub.reset();
    bus.publish(event_of(event_kind::message));

    BOOST_TEST(calls == 1);
    BOOST_TEST(!sub.active());
    BOOST_TEST(bus.subscriber_count() == 0u);
}

BOOST_AUTO_TEST_CASE(destroying_handle_unsubscribes)
{
    event_bus bus;
    int calls = 0;
    {
        auto sub = bus.subscribe([&](const pool_event&) { ++calls; });
        BOOST_TEST(bus.subscriber_count() == 1u);
    }
    bus.publish(event_of(event_kind::message));
    BOOST_TEST(calls == 0);
}

BOOST_AUTO_TEST_CASE(kind_filter)
{
    event_bus bus;
    std::vector<std::string> removed;
    auto sub = bus.subscribe(event_kind::connection_removed,
        [&](const pool_event& ev) { removed.push_back(ev.connection_id); });

    bus.publish(event_of(event_kind::connection_added, "a"));
    bus.publish(event_of(event_kind::connection_removed, "a"));

    BOOST_TEST(removed.size() == 1u);
    BOOST_TEST(removed.front() == "a");
}

BOOST_AUTO_TEST_CASE(throwing_listener_does_not_starve_others)
{
    event_bus bus;
    int calls = 0;
    auto bad = bus.subscribe([](const pool_event&) { throw std::runtime_error("listener failure"); });
    auto good = bus.subscribe([&](const pool_event&) { ++calls; });

    bus.publish(event_of(event_kind::health_check_completed));
    BOOST_TEST(calls == 1);
}

BOOST_AUTO_TEST_CASE(non_standard_throw_is_contained)
{
    event_bus bus;
    int calls = 0;
    auto bad = bus.subscribe([](const pool_event&) { throw 42; });
    auto good = bus.subscribe([&](const pool_event&) { ++calls; });

    BOOST_CHECK_NO_THROW(bus.publish(event_of(event_kind::network_lost)));
    BOOST_TEST(calls == 1);
}

BOOST_AUTO_TEST_CASE(listener_may_unsubscribe_while_notified)
{
    event_bus bus;
    int calls = 0;
    relayxx::subscription sub;
    sub = bus.subscribe([&](const pool_event&)
    {
        ++calls;
        sub.reset();
    });

    bus.publish(event_of(event_kind::message));
    bus.publish(event_of(event_kind::message));
    BOOST_TEST(calls == 1);
}

BOOST_AUTO_TEST_CASE(handle_may_outlive_bus)
{
    relayxx::subscription sub;
    {
        auto bus = std::make_unique<event_bus>();
        sub = bus->subscribe([](const pool_event&) {});
    }
    sub.reset();
    BOOST_TEST(!sub.active());
}

BOOST_AUTO_TEST_CASE(clear_drops_all_listeners)
{
    event_bus bus;
    int calls = 0;
    auto a = bus.subscribe([&](const pool_event&) { ++calls; });
    auto b = bus.subscribe(event_kind::message, [&](const pool_event&) { ++calls; });

    bus.clear();
    bus.publish(event_of(event_kind::message));
    BOOST_TEST(calls == 0);
    BOOST_TEST(bus.subscriber_count() == 0u);
}
