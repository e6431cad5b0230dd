/*

test_envelope.cpp
-----------------

Outbound framing, heartbeat frame and inbound latency samples.

*/

#define BOOST_TEST_MODULE envelope_test

#include <boost/test/unit_test.hpp>

#include <nlohmann/json.hpp>

#include <relayxx/pool/envelope.hpp>

namespace envelope = relayxx::pool::envelope;


BOOST_AUTO_TEST_CASE(envelope_adds_timestamp_and_keeps_fields)
{
    const nlohmann::json payload{{"type", "chat"}, {"text", "hi"}};
    const auto frame = envelope::make(payload, 1700000000123);
    BOOST_TEST_REQUIRE(frame.has_value());

    const auto parsed = nlohmann::json::parse(*frame);
    BOOST_TEST(parsed.at("type").get<std::string>() == "chat");
    BOOST_TEST(parsed.at("text").get<std::string>() == "hi");
    BOOST_TEST(parsed.at("timestamp").get<std::int64_t>() == 1700000000123);
}

BOOST_AUTO_TEST_CASE(envelope_overwrites_caller_timestamp)
{
    const nlohmann::json payload{{"timestamp", 1}};
    const auto frame = envelope::make(payload, 42);
    BOOST_TEST_REQUIRE(frame.has_value());
    BOOST_TEST(nlohmann::json::parse(*frame).at("timestamp").get<int>() == 42);
}

BOOST_AUTO_TEST_CASE(envelope_rejects_non_objects)
{
    const auto frame = envelope::make(nlohmann::json::array({1, 2}), 42);
    BOOST_TEST_REQUIRE(!frame.has_value());
    BOOST_TEST(frame.error().is(relayxx::error_code::invalid_payload));
}

BOOST_AUTO_TEST_CASE(heartbeat_is_a_ping)
{
    const auto parsed = nlohmann::json::parse(envelope::heartbeat(99));
    BOOST_TEST(parsed.at("type").get<std::string>() == "ping");
    BOOST_TEST(parsed.at("timestamp").get<int>() == 99);
}

BOOST_AUTO_TEST_CASE(latency_from_inbound_timestamp)
{
    const auto sample = envelope::latency_sample(R"({"type":"pong","timestamp":1000})", 1250);
    BOOST_TEST_REQUIRE(sample.has_value());
    BOOST_TEST(*sample == 250.0);
}

BOOST_AUTO_TEST_CASE(no_latency_without_usable_timestamp)
{
    BOOST_TEST(!envelope::latency_sample(R"({"type":"pong"})", 1250).has_value());
    BOOST_TEST(!envelope::latency_sample(R"({"timestamp":0})", 1250).has_value());
    BOOST_TEST(!envelope::latency_sample(R"({"timestamp":"yesterday"})", 1250).has_value());
    BOOST_TEST(!envelope::latency_sample("[1,2,3]", 1250).has_value());
    BOOST_TEST(!envelope::latency_sample("not json at all", 1250).has_value());
}

BOOST_AUTO_TEST_CASE(compression_query_parameter)
{
    BOOST_TEST(envelope::with_compression("wss://a.test/ws", true) == "wss://a.test/ws?compression=true");
    BOOST_TEST(envelope::with_compression("wss://a.test/ws?v=2", true) == "wss://a.test/ws?v=2&compression=true");
    BOOST_TEST(envelope::with_compression("wss://a.test/ws", false) == "wss://a.test/ws");
}
